/**
 * @file Theme.hpp
 * @brief Value Object defining the fixed set of book themes.
 */

#pragma once
#include <algorithm>
#include <array>
#include <string>

namespace highlightdigest::domain {

/** @brief Fallback theme for low-confidence or unknown labels. */
inline constexpr const char* kGeneralTheme = "General";

/** @brief Minimum confidence (exclusive) for a label to be accepted. */
inline constexpr double kDefaultThemeThreshold = 0.3;

inline const std::array<std::string, 10>& Themes() {
    static const std::array<std::string, 10> themes = {
        "Philosophy",
        "Psychology",
        "Finance & Investing",
        "Software Engineering",
        "Productivity",
        "History",
        "Science",
        "Business",
        "Fiction",
        "Biography",
    };
    return themes;
}

inline bool IsKnownTheme(const std::string& label) {
    const auto& themes = Themes();
    return std::find(themes.begin(), themes.end(), label) != themes.end();
}

/**
 * @brief Maps a classifier answer to a theme.
 * @return @p label if it is a known theme scored above @p threshold, else "General".
 */
inline std::string ResolveTheme(const std::string& label, double score,
                                double threshold = kDefaultThemeThreshold) {
    if (IsKnownTheme(label) && score > threshold) {
        return label;
    }
    return kGeneralTheme;
}

} // namespace highlightdigest::domain
