/**
 * @file ClippingsFileReader.hpp
 * @brief Reads a clippings export and decodes it to UTF-8.
 */

#pragma once
#include <string>

namespace highlightdigest::infrastructure {

/**
 * @class ClippingsFileReader
 * @brief Two-stage decoding: UTF-8 when the bytes validate, Latin-1 otherwise.
 */
class ClippingsFileReader {
public:
    /**
     * @brief Reads and decodes a file.
     * @return UTF-8 text without BOM, with '\n' line endings.
     * Throws domain::SourceUnreadableError when the file cannot be read.
     */
    static std::string Read(const std::string& path);

    /** @brief Decodes raw bytes using the same rules as Read(). Never fails. */
    static std::string Decode(const std::string& bytes);

    /** @brief Maps every Latin-1 byte to its UTF-8 encoding. */
    static std::string Latin1ToUtf8(const std::string& bytes);
};

} // namespace highlightdigest::infrastructure
