/**
 * @file ClippingParser.cpp
 * @brief Implementation of ClippingParser.
 */

#include "domain/ClippingParser.hpp"
#include "domain/TextUtils.hpp"
#include <regex>

namespace highlightdigest::domain {

namespace {
    constexpr const char* kUtf8Bom = "\xEF\xBB\xBF";
    constexpr const char* kBookmarkMarker = "Your Bookmark";
    constexpr const char* kNoteMarker = "Your Note";

    const std::regex& AuthorPattern() {
        static const std::regex pattern(R"(\(([^)]+)\)\s*$)");
        return pattern;
    }

    const std::regex& LocationPattern() {
        static const std::regex pattern(R"(location\s+(\d+)(?:-(\d+))?)", std::regex::icase);
        return pattern;
    }

    const std::regex& PagePattern() {
        static const std::regex pattern(R"(page\s+(\d+))", std::regex::icase);
        return pattern;
    }

    std::string StripBom(std::string line) {
        const std::string bom(kUtf8Bom);
        while (line.compare(0, bom.size(), bom) == 0) {
            line.erase(0, bom.size());
        }
        return line;
    }

    void ParseMetadata(const std::string& metadata, Highlight& out) {
        std::smatch match;
        if (std::regex_search(metadata, match, LocationPattern())) {
            std::string start = match[1].str();
            std::string end = match[2].matched ? match[2].str() : start;
            out.location = start + "-" + end;
        }
        if (std::regex_search(metadata, match, PagePattern())) {
            out.page = match[1].str();
        }
    }
}

void ClippingParser::ParseTitleLine(const std::string& line, std::string& titleOut, std::string& authorOut) {
    std::string cleaned = Trim(StripBom(Trim(line)));

    std::smatch match;
    if (std::regex_search(cleaned, match, AuthorPattern())) {
        authorOut = Trim(match[1].str());
        titleOut = Trim(cleaned.substr(0, static_cast<size_t>(match.position(0))));
    } else {
        authorOut = kUnknownAuthor;
        titleOut = cleaned;
    }
}

ParseResult ClippingParser::Parse(const RawBlock& block) {
    std::vector<std::string> lines = SplitLines(block.content);
    if (lines.size() < 2) {
        return SkipReason::Empty;
    }

    Highlight highlight;
    ParseTitleLine(lines[0], highlight.title, highlight.author);

    // A bookmark is recognized even when its block has no body line at all.
    std::string metadata = Trim(lines[1]);
    if (metadata.find(kBookmarkMarker) != std::string::npos) {
        return SkipReason::Bookmark;
    }
    if (metadata.find(kNoteMarker) != std::string::npos) {
        return SkipReason::Note;
    }

    if (lines.size() < 3) {
        return SkipReason::Empty;
    }

    ParseMetadata(metadata, highlight);

    std::string body;
    for (size_t i = 3; i < lines.size(); ++i) {
        std::string trimmed = Trim(lines[i]);
        if (trimmed.empty()) continue;
        if (!body.empty()) body += '\n';
        body += trimmed;
    }

    // Legacy exports put the text right after the metadata line.
    if (body.empty()) {
        body = Trim(lines[2]);
    }
    if (body.empty()) {
        return SkipReason::Empty;
    }

    highlight.text = body;
    return highlight;
}

ParseReport ClippingParser::ParseAll(const std::string& content) {
    ParseReport report;
    for (const auto& block : ClippingSplitter::Split(content)) {
        ParseResult result = Parse(block);
        if (auto* highlight = std::get_if<Highlight>(&result)) {
            report.highlights.push_back(std::move(*highlight));
        } else {
            report.skipped[std::get<SkipReason>(result)]++;
        }
    }
    return report;
}

} // namespace highlightdigest::domain
