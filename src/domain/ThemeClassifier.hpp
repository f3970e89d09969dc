/**
 * @file ThemeClassifier.hpp
 * @brief Interface for assigning a theme to a book.
 */

#pragma once
#include <optional>
#include <string>

namespace highlightdigest::domain {

/**
 * @class ThemeClassifier
 * @brief Zero-shot book classification boundary.
 *
 * Constructed once by the caller and passed in, so tests can substitute a stub.
 */
class ThemeClassifier {
public:
    virtual ~ThemeClassifier() = default;

    /**
     * @brief Classifies a book.
     * @return One of Themes() or "General"; nullopt when the classifier is unavailable.
     */
    virtual std::optional<std::string> classify(const std::string& title, const std::string& author) = 0;
};

} // namespace highlightdigest::domain
