#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "application/ThemeMigrationService.hpp"
#include "domain/Theme.hpp"
#include "infrastructure/OllamaThemeClassifier.hpp"

using namespace highlightdigest;

// In-memory store
class MemoryRepository : public domain::HighlightRepository {
public:
    std::vector<domain::Highlight> items;
    int saves = 0;

    std::vector<domain::Highlight> load() override { return items; }
    void save(const std::vector<domain::Highlight>& highlights) override {
        items = highlights;
        saves++;
    }
};

// Mock classifier
class StubClassifier : public domain::ThemeClassifier {
public:
    std::map<std::string, std::string> answers;
    std::map<std::string, int> calls;

    std::optional<std::string> classify(const std::string& title, const std::string& author) override {
        calls[title + "|" + author]++;
        auto it = answers.find(title);
        if (it == answers.end()) return std::nullopt;
        return it->second;
    }
};

namespace {

domain::Highlight Make(const std::string& title, const std::string& text) {
    domain::Highlight h;
    h.title = title;
    h.author = "Someone";
    h.text = text;
    return h;
}

void TestResolveTheme() {
    assert(domain::ResolveTheme("Philosophy", 0.9) == "Philosophy");
    assert(domain::ResolveTheme("Philosophy", 0.3) == "General");
    assert(domain::ResolveTheme("Philosophy", 0.31) == "Philosophy");
    assert(domain::ResolveTheme("Cooking", 0.99) == "General");
    assert(domain::ResolveTheme("History", 0.5, 0.6) == "General");
    assert(domain::Themes().size() == 10);
}

void TestInterpretAnswer() {
    using infrastructure::OllamaThemeClassifier;
    assert(OllamaThemeClassifier::InterpretAnswer(R"({"label": "Science", "score": 0.8})", 0.3) == "Science");
    assert(OllamaThemeClassifier::InterpretAnswer(R"({"label": "Science", "score": 0.1})", 0.3) == "General");
    assert(OllamaThemeClassifier::InterpretAnswer(R"({"label": "Science"})", 0.3) == "General");
    assert(OllamaThemeClassifier::InterpretAnswer("not json", 0.3) == "General");
    assert(OllamaThemeClassifier::InterpretAnswer("[1, 2]", 0.3) == "General");
}

void TestClassifiesEachBookOnce() {
    auto repo = std::make_shared<MemoryRepository>();
    repo->items = {Make("Meditations", "a"), Make("Meditations", "b"), Make("Deep Work", "c")};
    auto tagged = Make("Sapiens", "d");
    tagged.theme = "History";
    repo->items.push_back(tagged);

    auto classifier = std::make_shared<StubClassifier>();
    classifier->answers = {{"Meditations", "Philosophy"}, {"Deep Work", "Productivity"}};

    application::ThemeMigrationService service(repo, classifier);
    auto result = service.classifyMissing();

    assert(result.booksPending == 2);
    assert(result.booksClassified == 2);
    assert(result.highlightsUpdated == 3);
    assert(repo->saves == 1);
    assert(classifier->calls["Meditations|Someone"] == 1);
    assert(classifier->calls.count("Sapiens|Someone") == 0);
    assert(*repo->items[0].theme == "Philosophy");
    assert(*repo->items[1].theme == "Philosophy");
    assert(*repo->items[2].theme == "Productivity");
    assert(*repo->items[3].theme == "History");

    // Second run has nothing to do.
    auto again = service.classifyMissing();
    assert(again.booksPending == 0);
    assert(repo->saves == 1);
}

void TestUnavailableClassifierLeavesStoreAlone() {
    auto repo = std::make_shared<MemoryRepository>();
    repo->items = {Make("Unknown Book", "x")};
    auto classifier = std::make_shared<StubClassifier>();

    application::ThemeMigrationService service(repo, classifier);
    auto result = service.classifyMissing();
    assert(result.booksPending == 1);
    assert(result.booksClassified == 0);
    assert(result.highlightsUpdated == 0);
    assert(repo->saves == 0);
    assert(!repo->items[0].theme);
}

} // namespace

int main() {
    std::cout << "[Test] Starting ThemeMigration Test..." << std::endl;

    TestResolveTheme();
    TestInterpretAnswer();
    TestClassifiesEachBookOnce();
    TestUnavailableClassifierLeavesStoreAlone();

    std::cout << "[PASS] ThemeMigration Test." << std::endl;
    return 0;
}
