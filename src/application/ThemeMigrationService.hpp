/**
 * @file ThemeMigrationService.hpp
 * @brief Adds themes to stored highlights that do not have one yet.
 */

#pragma once
#include <memory>
#include "domain/HighlightRepository.hpp"
#include "domain/ThemeClassifier.hpp"

namespace highlightdigest::application {

class ThemeMigrationService {
public:
    ThemeMigrationService(std::shared_ptr<domain::HighlightRepository> repository,
                          std::shared_ptr<domain::ThemeClassifier> classifier);

    struct MigrationResult {
        int booksPending = 0;      ///< Distinct (title, author) pairs without a theme.
        int booksClassified = 0;   ///< Pairs the classifier answered for.
        int highlightsUpdated = 0;
    };

    /**
     * @brief Classifies each untagged book once and tags all of its highlights.
     * The store is saved only when something changed. Books the classifier cannot
     * answer for stay untagged and are retried on the next run.
     */
    MigrationResult classifyMissing();

private:
    std::shared_ptr<domain::HighlightRepository> m_repository;
    std::shared_ptr<domain::ThemeClassifier> m_classifier;
};

} // namespace highlightdigest::application
