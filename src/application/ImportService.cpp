/**
 * @file ImportService.cpp
 * @brief Implementation of ImportService.
 */

#include "application/ImportService.hpp"
#include "domain/ClippingParser.hpp"
#include "infrastructure/ClippingsFileReader.hpp"
#include <algorithm>
#include <iostream>
#include <map>

namespace highlightdigest::application {

ImportService::ImportService(std::shared_ptr<domain::HighlightRepository> repository, domain::HighlightMerger merger)
    : m_repository(std::move(repository)), m_merger(std::move(merger)) {}

std::vector<BookCount> ImportService::CountBooks(const std::vector<domain::Highlight>& highlights) {
    std::map<std::pair<std::string, std::string>, int> counts;
    for (const auto& h : highlights) {
        counts[{h.title, h.author}]++;
    }

    std::vector<BookCount> books;
    books.reserve(counts.size());
    for (const auto& [key, count] : counts) {
        books.push_back(BookCount{key.first, key.second, count});
    }
    // std::map already ordered ties by title/author; keep that order among equal counts.
    std::stable_sort(books.begin(), books.end(), [](const BookCount& a, const BookCount& b) {
        return a.count > b.count;
    });
    return books;
}

ImportService::ImportResult ImportService::importFile(const std::string& clippingsPath, bool dryRun) {
    std::cout << "[ImportService] Parsing: " << clippingsPath << std::endl;
    std::string content = infrastructure::ClippingsFileReader::Read(clippingsPath);
    return importContent(content, dryRun);
}

ImportService::ImportResult ImportService::importContent(const std::string& content, bool dryRun) {
    ImportResult result;

    domain::ParseReport report = domain::ClippingParser::ParseAll(content);
    result.highlightsFound = static_cast<int>(report.highlights.size());
    result.bookmarksSkipped = report.skippedCount(domain::SkipReason::Bookmark);
    result.notesSkipped = report.skippedCount(domain::SkipReason::Note);
    result.emptySkipped = report.skippedCount(domain::SkipReason::Empty);
    result.books = CountBooks(report.highlights);
    for (const auto& [reason, count] : report.skipped) {
        std::cout << "[ImportService] Skipped " << count << " entries: "
                  << domain::SkipReasonToString(reason) << std::endl;
    }

    if (report.highlights.empty()) {
        std::cerr << "[ImportService] No highlights found. Check the file format." << std::endl;
        return result;
    }
    if (dryRun) {
        std::cout << "[ImportService] Dry run - no changes made." << std::endl;
        return result;
    }

    std::vector<domain::Highlight> existing = m_repository->load();
    result.existingCount = static_cast<int>(existing.size());

    auto merge = m_merger.merge(existing, report.highlights);
    result.addedCount = merge.addedCount;
    result.totalCount = static_cast<int>(merge.merged.size());

    m_repository->save(merge.merged);
    result.saved = true;
    return result;
}

} // namespace highlightdigest::application
