#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>

#include "application/ImportService.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/JsonHighlightRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

using namespace highlightdigest;

namespace {

const std::string kTestRoot = "test_import_root";

const char* kClippings =
    "Deep Work (Cal Newport)\n"
    "- Your Highlight on page 42 | location 812-815 | Added on Tuesday, January 1, 2024 1:00:00 PM\n"
    "\n"
    "Focus is the new IQ.\n"
    "==========\n"
    "Deep Work (Cal Newport)\n"
    "- Your Highlight on page 43 | location 820-822 | Added on Tuesday, January 1, 2024 1:05:00 PM\n"
    "\n"
    "Clarity about what matters provides clarity about what does not.\n"
    "==========\n"
    "Deep Work (Cal Newport)\n"
    "- Your Bookmark on page 44 | location 830 | Added on Tuesday, January 1, 2024 1:06:00 PM\n"
    "\n"
    "\n"
    "==========\n"
    "Meditations (Marcus Aurelius)\n"
    "- Your Note on Location 10 | Added on Wednesday, January 2, 2024 9:00:00 AM\n"
    "\n"
    "Reread book two.\n"
    "==========\n"
    "Meditations (Marcus Aurelius)\n"
    "- Your Highlight on Location 10-12 | Added on Wednesday, January 2, 2024 9:00:00 AM\n"
    "\n"
    "You have power over your mind.\n"
    "==========\n";

std::string WriteFile(const std::string& name, const std::string& content) {
    std::filesystem::path p = std::filesystem::path(kTestRoot) / name;
    std::filesystem::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary);
    out << content;
    return p.string();
}

std::string ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::shared_ptr<infrastructure::JsonHighlightRepository> MakeRepo(const std::string& storePath) {
    return std::make_shared<infrastructure::JsonHighlightRepository>(
        storePath, std::make_shared<infrastructure::PersistenceService>());
}

void TestImportTwiceIsIdempotent() {
    std::string clippings = WriteFile("My Clippings.txt", kClippings);
    std::string storePath = (std::filesystem::path(kTestRoot) / "data" / "highlights.json").string();
    auto repo = MakeRepo(storePath);
    application::ImportService service(repo, domain::HighlightMerger());

    auto first = service.importFile(clippings);
    assert(first.highlightsFound == 3);
    assert(first.bookmarksSkipped == 1);
    assert(first.notesSkipped == 1);
    assert(first.emptySkipped == 0);
    assert(first.existingCount == 0);
    assert(first.addedCount == 3);
    assert(first.totalCount == 3);
    assert(first.saved);

    assert(first.books.size() == 2);
    assert(first.books[0].title == "Deep Work" && first.books[0].count == 2);
    assert(first.books[1].title == "Meditations" && first.books[1].author == "Marcus Aurelius");

    auto storedAfterFirst = repo->load();

    auto second = service.importFile(clippings);
    assert(second.existingCount == 3);
    assert(second.addedCount == 0);
    assert(second.totalCount == 3);
    assert(repo->load() == storedAfterFirst);
}

void TestDryRunDoesNotTouchStore() {
    std::string clippings = WriteFile("dry.txt", kClippings);
    std::string storePath = (std::filesystem::path(kTestRoot) / "dry" / "highlights.json").string();
    application::ImportService service(MakeRepo(storePath), domain::HighlightMerger());

    auto result = service.importFile(clippings, true);
    assert(result.highlightsFound == 3);
    assert(!result.saved);
    assert(!std::filesystem::exists(storePath));
}

void TestNothingFoundLeavesStoreAlone() {
    std::string clippings = WriteFile("bookmarks.txt",
        "Book (A)\n- Your Bookmark on Location 1 | Added on Monday\n\n\n==========\n");
    std::string storePath = (std::filesystem::path(kTestRoot) / "none" / "highlights.json").string();
    application::ImportService service(MakeRepo(storePath), domain::HighlightMerger());

    auto result = service.importFile(clippings);
    assert(result.highlightsFound == 0);
    assert(result.bookmarksSkipped == 1);
    assert(!result.saved);
    assert(!std::filesystem::exists(storePath));
}

void TestCorruptStoreAbortsWithoutWriting() {
    std::string clippings = WriteFile("corrupt-run.txt", kClippings);
    std::string storePath = WriteFile("corrupt/highlights.json", "[{\"title\": ");
    application::ImportService service(MakeRepo(storePath), domain::HighlightMerger());

    bool threw = false;
    try {
        service.importFile(clippings);
    } catch (const domain::StoreCorruptError&) {
        threw = true;
    }
    assert(threw);
    assert(ReadFile(storePath) == "[{\"title\": ");
}

void TestMissingSourceIsFatal() {
    std::string storePath = (std::filesystem::path(kTestRoot) / "missing" / "highlights.json").string();
    application::ImportService service(MakeRepo(storePath), domain::HighlightMerger());

    bool threw = false;
    try {
        service.importFile((std::filesystem::path(kTestRoot) / "does-not-exist.txt").string());
    } catch (const domain::SourceUnreadableError&) {
        threw = true;
    }
    assert(threw);
    assert(!std::filesystem::exists(storePath));
}

void TestCountBooksOrdering() {
    std::vector<domain::Highlight> highlights(5);
    highlights[0].title = "B"; highlights[0].author = "x";
    highlights[1].title = "A"; highlights[1].author = "x";
    highlights[2].title = "C"; highlights[2].author = "x";
    highlights[3].title = "C"; highlights[3].author = "x";
    highlights[4].title = "C"; highlights[4].author = "y";

    auto books = application::ImportService::CountBooks(highlights);
    assert(books.size() == 4);
    assert(books[0].title == "C" && books[0].author == "x" && books[0].count == 2);
    assert(books[1].title == "A");
    assert(books[2].title == "B");
    assert(books[3].title == "C" && books[3].author == "y");
}

} // namespace

int main() {
    std::cout << "[Test] Starting ImportService Test..." << std::endl;
    std::filesystem::remove_all(kTestRoot);
    std::filesystem::create_directories(kTestRoot);

    TestImportTwiceIsIdempotent();
    TestDryRunDoesNotTouchStore();
    TestNothingFoundLeavesStoreAlone();
    TestCorruptStoreAbortsWithoutWriting();
    TestMissingSourceIsFatal();
    TestCountBooksOrdering();

    std::filesystem::remove_all(kTestRoot);
    std::cout << "[PASS] ImportService Test." << std::endl;
    return 0;
}
