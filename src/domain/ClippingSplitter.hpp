/**
 * @file ClippingSplitter.hpp
 * @brief Splits a clippings export into candidate annotation blocks.
 */

#pragma once
#include <string>
#include <vector>

namespace highlightdigest::domain {

/**
 * @struct RawBlock
 * @brief Trimmed text between two separator lines.
 */
struct RawBlock {
    std::string content;
};

/**
 * @class ClippingSplitter
 * @brief Stateless splitter for the "==========" separated export format.
 */
class ClippingSplitter {
public:
    static constexpr const char* kSeparator = "==========";

    /**
     * @brief Splits content on separator lines, keeping document order.
     * Segments that are blank after trimming are dropped.
     */
    static std::vector<RawBlock> Split(const std::string& content);
};

} // namespace highlightdigest::domain
