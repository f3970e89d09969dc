/**
 * @file HighlightSampler.cpp
 * @brief Implementation of HighlightSampler.
 */

#include "domain/HighlightSampler.hpp"
#include <algorithm>
#include <iterator>
#include <string>
#include <unordered_map>

namespace highlightdigest::domain {

HighlightSampler::HighlightSampler() : m_engine(std::random_device{}()) {}

HighlightSampler::HighlightSampler(std::mt19937 engine) : m_engine(std::move(engine)) {}

std::vector<Highlight> HighlightSampler::sample(const std::vector<Highlight>& pool, std::size_t count) {
    if (pool.size() <= count) {
        std::vector<Highlight> all = pool;
        std::shuffle(all.begin(), all.end(), m_engine);
        return all;
    }

    // Group indices by title; titles keep first-seen order before shuffling.
    std::vector<std::string> titles;
    std::unordered_map<std::string, std::vector<size_t>> groups;
    for (size_t i = 0; i < pool.size(); ++i) {
        auto& group = groups[pool[i].title];
        if (group.empty()) {
            titles.push_back(pool[i].title);
        }
        group.push_back(i);
    }
    std::shuffle(titles.begin(), titles.end(), m_engine);

    std::vector<size_t> picked;
    std::vector<bool> taken(pool.size(), false);

    for (const auto& title : titles) {
        if (picked.size() >= count) break;
        const auto& group = groups[title];
        std::uniform_int_distribution<size_t> dist(0, group.size() - 1);
        size_t index = group[dist(m_engine)];
        picked.push_back(index);
        taken[index] = true;
    }

    if (picked.size() < count) {
        std::vector<size_t> remaining;
        remaining.reserve(pool.size() - picked.size());
        for (size_t i = 0; i < pool.size(); ++i) {
            if (!taken[i]) remaining.push_back(i);
        }
        size_t needed = std::min(count - picked.size(), remaining.size());
        std::sample(remaining.begin(), remaining.end(), std::back_inserter(picked), needed, m_engine);
    }

    std::shuffle(picked.begin(), picked.end(), m_engine);

    std::vector<Highlight> selection;
    selection.reserve(picked.size());
    for (size_t index : picked) {
        selection.push_back(pool[index]);
    }
    return selection;
}

} // namespace highlightdigest::domain
