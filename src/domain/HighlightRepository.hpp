/**
 * @file HighlightRepository.hpp
 * @brief Interface for loading and saving the highlight store.
 */

#pragma once
#include <vector>
#include "domain/Highlight.hpp"

namespace highlightdigest::domain {

/**
 * @class HighlightRepository
 * @brief Abstract persistence of the full, ordered highlight store.
 */
class HighlightRepository {
public:
    virtual ~HighlightRepository() = default;

    /**
     * @brief Loads every stored highlight in order.
     * An absent store is empty; a store that cannot be decoded throws StoreCorruptError.
     */
    virtual std::vector<Highlight> load() = 0;

    /**
     * @brief Rewrites the whole store.
     * Throws StoreUnwritableError when the write does not complete.
     */
    virtual void save(const std::vector<Highlight>& highlights) = 0;
};

} // namespace highlightdigest::domain
