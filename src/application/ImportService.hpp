/**
 * @file ImportService.hpp
 * @brief Orchestrates importing a clippings export into the highlight store.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "domain/Highlight.hpp"
#include "domain/HighlightMerger.hpp"
#include "domain/HighlightRepository.hpp"

namespace highlightdigest::application {

/**
 * @struct BookCount
 * @brief Number of highlights found for one book.
 */
struct BookCount {
    std::string title;
    std::string author;
    int count = 0;
};

/**
 * @class ImportService
 * @brief read -> parse -> statistics -> load -> merge -> save.
 *
 * The store is written once, after the merge has been computed in memory.
 */
class ImportService {
public:
    ImportService(std::shared_ptr<domain::HighlightRepository> repository, domain::HighlightMerger merger);

    /**
     * @brief Result of an import run.
     */
    struct ImportResult {
        int highlightsFound = 0;
        int bookmarksSkipped = 0;
        int notesSkipped = 0;
        int emptySkipped = 0;
        std::vector<BookCount> books;  ///< Sorted by count, descending.
        int existingCount = 0;
        int addedCount = 0;
        int totalCount = 0;
        bool saved = false;
    };

    /**
     * @brief Imports a clippings file.
     * @param dryRun Parse and report only; the store is neither read nor written.
     *
     * Throws SourceUnreadableError, StoreCorruptError or StoreUnwritableError.
     * When no highlight is found the store is left untouched.
     */
    ImportResult importFile(const std::string& clippingsPath, bool dryRun = false);

    /**
     * @brief Imports already-decoded clippings text.
     * @see importFile
     */
    ImportResult importContent(const std::string& content, bool dryRun = false);

    /** @brief Highlight counts per "title by author", most highlighted first. */
    static std::vector<BookCount> CountBooks(const std::vector<domain::Highlight>& highlights);

private:
    std::shared_ptr<domain::HighlightRepository> m_repository;
    domain::HighlightMerger m_merger;
};

} // namespace highlightdigest::application
