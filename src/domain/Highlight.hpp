/**
 * @file Highlight.hpp
 * @brief Domain entity representing one imported reading-device highlight.
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace highlightdigest::domain {

/** @brief Author assigned when the title line carries no trailing "(Author)". */
inline constexpr const char* kUnknownAuthor = "Unknown Author";

/**
 * @enum SkipReason
 * @brief Why a clipping block did not become a Highlight.
 */
enum class SkipReason {
    Empty,      ///< Too few lines or no body text.
    Bookmark,   ///< Bookmarks carry no text.
    Note        ///< Personal notes are not highlights.
};

/**
 * @brief Helper to convert a skip reason to a string for logging.
 */
inline std::string SkipReasonToString(SkipReason reason) {
    switch (reason) {
        case SkipReason::Empty: return "Empty";
        case SkipReason::Bookmark: return "Bookmark";
        case SkipReason::Note: return "Note";
        default: return "Unknown";
    }
}

/**
 * @struct Highlight
 * @brief A parsed, normalized highlight as it lives in the store.
 *
 * The text is never empty once the highlight has been merged.
 */
struct Highlight {
    std::string title;                    ///< Book title without the author suffix.
    std::string author = kUnknownAuthor;  ///< Book author.
    std::string text;                     ///< Highlight body, one trimmed line per row.
    std::optional<std::string> location;  ///< "start-end".
    std::optional<std::string> page;      ///< Page digits.
    std::string addedAt;                  ///< ISO-8601, assigned at merge time.
    std::optional<std::string> theme;     ///< Filled by theme classification only.

    bool operator==(const Highlight& other) const {
        return title == other.title && author == other.author && text == other.text &&
               location == other.location && page == other.page &&
               addedAt == other.addedAt && theme == other.theme;
    }
    bool operator!=(const Highlight& other) const { return !(*this == other); }
};

/**
 * @struct ParseReport
 * @brief Accepted highlights of one clippings file plus per-reason skip counters.
 */
struct ParseReport {
    std::vector<Highlight> highlights;
    std::map<SkipReason, int> skipped;

    int skippedCount(SkipReason reason) const {
        auto it = skipped.find(reason);
        return it != skipped.end() ? it->second : 0;
    }
};

} // namespace highlightdigest::domain
