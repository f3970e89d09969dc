/**
 * @file ThemeMigrationService.cpp
 * @brief Implementation of ThemeMigrationService.
 */

#include "application/ThemeMigrationService.hpp"
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace highlightdigest::application {

ThemeMigrationService::ThemeMigrationService(std::shared_ptr<domain::HighlightRepository> repository,
                                             std::shared_ptr<domain::ThemeClassifier> classifier)
    : m_repository(std::move(repository)), m_classifier(std::move(classifier)) {}

ThemeMigrationService::MigrationResult ThemeMigrationService::classifyMissing() {
    MigrationResult result;

    auto highlights = m_repository->load();
    if (highlights.empty()) {
        std::cout << "[ThemeMigrationService] No highlights found in the store." << std::endl;
        return result;
    }

    using BookKey = std::pair<std::string, std::string>;
    std::vector<BookKey> pending;
    std::map<BookKey, std::optional<std::string>> themes;
    for (const auto& h : highlights) {
        if (h.theme) continue;
        BookKey key{h.title, h.author};
        if (themes.emplace(key, std::nullopt).second) {
            pending.push_back(key);
        }
    }
    result.booksPending = static_cast<int>(pending.size());

    if (pending.empty()) {
        std::cout << "[ThemeMigrationService] All highlights already have themes." << std::endl;
        return result;
    }

    std::cout << "[ThemeMigrationService] Classifying " << pending.size() << " books..." << std::endl;
    for (const auto& key : pending) {
        auto theme = m_classifier->classify(key.first, key.second);
        if (!theme) {
            std::cerr << "[ThemeMigrationService] Skipped (classifier unavailable): " << key.first << std::endl;
            continue;
        }
        themes[key] = theme;
        result.booksClassified++;
        std::cout << "[ThemeMigrationService]   " << key.first << ": " << *theme << std::endl;
    }

    for (auto& h : highlights) {
        if (h.theme) continue;
        const auto& theme = themes[{h.title, h.author}];
        if (theme) {
            h.theme = theme;
            result.highlightsUpdated++;
        }
    }

    if (result.highlightsUpdated > 0) {
        m_repository->save(highlights);
    }
    return result;
}

} // namespace highlightdigest::application
