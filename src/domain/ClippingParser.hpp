/**
 * @file ClippingParser.hpp
 * @brief Converts clipping blocks into structured highlights.
 */

#pragma once
#include <string>
#include <variant>
#include "domain/ClippingSplitter.hpp"
#include "domain/Highlight.hpp"

namespace highlightdigest::domain {

/**
 * @brief Either an accepted highlight or the reason the block was skipped.
 */
using ParseResult = std::variant<Highlight, SkipReason>;

/**
 * @class ClippingParser
 * @brief Stateless parser for a single clipping block.
 *
 * Block layout:
 * @code
 * Title (Author)
 * - Your Highlight on page P | location L-M | Added on <date>
 *
 * text...
 * @endcode
 * Malformed blocks never throw; they are reported as a SkipReason.
 */
class ClippingParser {
public:
    /**
     * @brief Parses one block.
     * @return A Highlight with addedAt and theme unset, or a SkipReason.
     */
    static ParseResult Parse(const RawBlock& block);

    /**
     * @brief Splits and parses a whole export, counting skips per reason.
     */
    static ParseReport ParseAll(const std::string& content);

    /**
     * @brief Splits a "Title (Author)" line.
     * Only a parenthesized group that ends the line is taken as the author.
     */
    static void ParseTitleLine(const std::string& line, std::string& titleOut, std::string& authorOut);
};

} // namespace highlightdigest::domain
