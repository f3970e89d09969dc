/**
 * @file TextUtils.hpp
 * @brief Small string helpers shared by the clipping pipeline.
 */

#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace highlightdigest::domain {

/** @brief Removes ASCII whitespace (including '\r') from both ends. */
std::string Trim(const std::string& s);

/** @brief Splits on '\n'. A trailing newline does not produce an extra empty element. */
std::vector<std::string> SplitLines(const std::string& s);

/** @brief True if the string is a well-formed UTF-8 byte sequence. */
bool IsValidUtf8(const std::string& s);

/**
 * @brief Returns the first @p maxChars code points of a UTF-8 string.
 * Never cuts a multi-byte sequence in half.
 */
std::string Utf8Prefix(const std::string& s, std::size_t maxChars);

} // namespace highlightdigest::domain
