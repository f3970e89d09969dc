/**
 * @file DedupSignature.hpp
 * @brief Stable deduplication key of a highlight.
 */

#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include "domain/Highlight.hpp"

namespace highlightdigest::domain {

/**
 * @struct DedupSignature
 * @brief (title, first 100 characters of text).
 *
 * Location, page and anything past the prefix do not take part, so
 * re-exports of the same highlight collide.
 */
struct DedupSignature {
    static constexpr std::size_t kPrefixLength = 100;

    std::string title;
    std::string textPrefix;

    bool operator==(const DedupSignature& other) const {
        return title == other.title && textPrefix == other.textPrefix;
    }
    bool operator!=(const DedupSignature& other) const { return !(*this == other); }
};

/** @brief Derives the signature of a highlight. Pure and total. */
DedupSignature BuildSignature(const Highlight& highlight);

struct DedupSignatureHash {
    std::size_t operator()(const DedupSignature& sig) const {
        std::size_t h1 = std::hash<std::string>{}(sig.title);
        std::size_t h2 = std::hash<std::string>{}(sig.textPrefix);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

} // namespace highlightdigest::domain
