/**
 * @file HighlightMerger.hpp
 * @brief Merges freshly parsed highlights into the existing store without duplicates.
 */

#pragma once
#include <functional>
#include <string>
#include <vector>
#include "domain/Highlight.hpp"

namespace highlightdigest::domain {

/**
 * @class HighlightMerger
 * @brief Signature-based, append-only merge.
 */
class HighlightMerger {
public:
    /** @brief Produces the timestamp stamped on accepted highlights. */
    using Clock = std::function<std::string()>;

    struct MergeResult {
        std::vector<Highlight> merged;
        int addedCount = 0;
    };

    /**
     * @brief Constructor for HighlightMerger.
     * @param clock Timestamp source; defaults to the local wall clock in ISO-8601.
     */
    explicit HighlightMerger(Clock clock = nullptr);

    /**
     * @brief Appends every incoming highlight whose signature is not yet known.
     *
     * Existing order is preserved and accepted items follow in incoming order.
     * All accepted items share the timestamp taken once at the start of the call.
     * A duplicate never replaces the first occurrence.
     */
    MergeResult merge(const std::vector<Highlight>& existing,
                      const std::vector<Highlight>& incoming) const;

    /** @brief Local time as "YYYY-MM-DDTHH:MM:SS.ffffff". */
    static std::string NowIso8601();

private:
    Clock m_clock;
};

} // namespace highlightdigest::domain
