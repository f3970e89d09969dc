/**
 * @file HighlightSampler.hpp
 * @brief Random selection of highlights that favours one highlight per book.
 */

#pragma once
#include <cstddef>
#include <random>
#include <vector>
#include "domain/Highlight.hpp"

namespace highlightdigest::domain {

/**
 * @class HighlightSampler
 * @brief Greedy diversity sampler.
 *
 * Titles are visited in random order and contribute one random highlight each;
 * any shortfall is filled uniformly from the highlights not yet chosen. With a
 * heavily skewed book distribution the result is only approximately
 * diversity-maximizing.
 */
class HighlightSampler {
public:
    /** @brief Seeds the engine from std::random_device. */
    HighlightSampler();

    /** @brief Uses a caller-provided engine, e.g. a fixed seed in tests. */
    explicit HighlightSampler(std::mt19937 engine);

    /**
     * @brief Selects min(count, pool.size()) distinct highlight instances.
     * @return The selection in random order.
     */
    std::vector<Highlight> sample(const std::vector<Highlight>& pool, std::size_t count);

private:
    std::mt19937 m_engine;
};

} // namespace highlightdigest::domain
