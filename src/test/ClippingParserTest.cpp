#include <cassert>
#include <iostream>
#include <string>
#include <variant>

#include "domain/ClippingParser.hpp"
#include "domain/ClippingSplitter.hpp"

using namespace highlightdigest::domain;

namespace {

Highlight ExpectHighlight(const std::string& block) {
    ParseResult result = ClippingParser::Parse(RawBlock{block});
    assert(std::holds_alternative<Highlight>(result) && "Block should parse into a highlight.");
    return std::get<Highlight>(result);
}

SkipReason ExpectSkip(const std::string& block) {
    ParseResult result = ClippingParser::Parse(RawBlock{block});
    assert(std::holds_alternative<SkipReason>(result) && "Block should be skipped.");
    return std::get<SkipReason>(result);
}

void TestWellFormedHighlight() {
    const std::string content =
        "Deep Work (Cal Newport)\n"
        "- Your Highlight on page 42 | location 812-815 | Added on Tuesday, January 1, 2024 1:00:00 PM\n"
        "\n"
        "Focus is the new IQ.\n"
        "==========\n";

    ParseReport report = ClippingParser::ParseAll(content);
    assert(report.highlights.size() == 1);
    const Highlight& h = report.highlights[0];
    assert(h.title == "Deep Work");
    assert(h.author == "Cal Newport");
    assert(h.text == "Focus is the new IQ.");
    assert(h.location && *h.location == "812-815");
    assert(h.page && *h.page == "42");
    assert(h.addedAt.empty());
    assert(!h.theme);
    assert(report.skipped.empty());
}

void TestTitleLineVariants() {
    std::string title, author;

    ClippingParser::ParseTitleLine("Untitled Notes", title, author);
    assert(title == "Untitled Notes");
    assert(author == "Unknown Author");

    ClippingParser::ParseTitleLine("Book (Annotated) Edition (Jane Doe)  ", title, author);
    assert(title == "Book (Annotated) Edition");
    assert(author == "Jane Doe");

    ClippingParser::ParseTitleLine("Book (Annotated) Edition", title, author);
    assert(title == "Book (Annotated) Edition");
    assert(author == "Unknown Author");

    ClippingParser::ParseTitleLine("\xEF\xBB\xBFMeditations (Marcus Aurelius)", title, author);
    assert(title == "Meditations");
    assert(author == "Marcus Aurelius");

    ClippingParser::ParseTitleLine("Sapiens ( Yuval Noah Harari )", title, author);
    assert(title == "Sapiens");
    assert(author == "Yuval Noah Harari");
}

void TestMetadataVariants() {
    Highlight single = ExpectHighlight(
        "Book (Author)\n- Your Highlight on Location 120 | Added on Monday\n\nText");
    assert(single.location && *single.location == "120-120");
    assert(!single.page);

    Highlight pageOnly = ExpectHighlight(
        "Book (Author)\n- Your Highlight on page 7 | Added on Monday\n\nText");
    assert(!pageOnly.location);
    assert(pageOnly.page && *pageOnly.page == "7");

    // Locale-variant dates are carried as opaque text and never rejected.
    Highlight foreign = ExpectHighlight(
        "Libro (Autor)\n- La subrayado en la posici\xC3\xB3n 33 | A\xC3\xB1\x61\x64ido el lunes\n\nTexto");
    assert(foreign.text == "Texto");
    assert(!foreign.location);
}

void TestSkipReasons() {
    assert(ExpectSkip("Book (Author)\n- Your Bookmark on Location 100 | Added on Monday") == SkipReason::Bookmark);
    assert(ExpectSkip("Book (Author)\n- Your Bookmark on Location 100 | Added on Monday\n\n") == SkipReason::Bookmark);
    assert(ExpectSkip("Book (Author)\n- Your Note on Location 100 | Added on Monday\n\nMy own thought") == SkipReason::Note);
    assert(ExpectSkip("Book (Author)") == SkipReason::Empty);
    assert(ExpectSkip("Book (Author)\n- Your Highlight on Location 5") == SkipReason::Empty);
    assert(ExpectSkip("Book (Author)\n- Your Highlight on Location 5\n   \n  \n") == SkipReason::Empty);
}

void TestBodyNormalization() {
    Highlight multi = ExpectHighlight(
        "Book (Author)\n- Your Highlight on Location 1-2\n\n  First line  \n\n\tSecond line\n");
    assert(multi.text == "First line\nSecond line");

    // Legacy layout: body directly after the metadata line.
    Highlight legacy = ExpectHighlight(
        "Book (Author)\n- Your Highlight on Location 1-2\n  Legacy body  ");
    assert(legacy.text == "Legacy body");
}

void TestParseAllCounters() {
    const std::string content =
        "\xEF\xBB\xBF" "Deep Work (Cal Newport)\n"
        "- Your Highlight on page 42 | location 812-815 | Added on Tuesday\n"
        "\n"
        "Focus is the new IQ.\n"
        "==========\n"
        "Deep Work (Cal Newport)\n"
        "- Your Bookmark on page 50 | location 900 | Added on Tuesday\n"
        "\n"
        "\n"
        "==========\n"
        "Deep Work (Cal Newport)\n"
        "- Your Note on page 51 | location 901 | Added on Tuesday\n"
        "\n"
        "Remember this.\n"
        "==========\n"
        "Stray line\n"
        "==========\n"
        "\n"
        "==========\n"
        "Meditations (Marcus Aurelius)\n"
        "- Your Highlight on Location 10-12 | Added on Wednesday\n"
        "\n"
        "You have power over your mind.\n"
        "==========\n";

    ParseReport report = ClippingParser::ParseAll(content);
    assert(report.highlights.size() == 2);
    assert(report.highlights[0].title == "Deep Work");
    assert(report.highlights[1].title == "Meditations");
    assert(report.skippedCount(SkipReason::Bookmark) == 1);
    assert(report.skippedCount(SkipReason::Note) == 1);
    assert(report.skippedCount(SkipReason::Empty) == 1);
}

void TestSplitterKeepsOrderAndDropsBlanks() {
    auto blocks = ClippingSplitter::Split("A\n==========\n  \n==========\nB\r\n==========\r\nC");
    assert(blocks.size() == 3);
    assert(blocks[0].content == "A");
    assert(blocks[1].content == "B");
    assert(blocks[2].content == "C");

    assert(ClippingSplitter::Split("").empty());
    assert(ClippingSplitter::Split("==========\n==========\n").empty());
}

} // namespace

int main() {
    std::cout << "[Test] Starting ClippingParser Test..." << std::endl;

    TestWellFormedHighlight();
    TestTitleLineVariants();
    TestMetadataVariants();
    TestSkipReasons();
    TestBodyNormalization();
    TestParseAllCounters();
    TestSplitterKeepsOrderAndDropsBlanks();

    std::cout << "[PASS] ClippingParser Test." << std::endl;
    return 0;
}
