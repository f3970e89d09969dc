/**
 * @file TextUtils.cpp
 * @brief Implementation of the text helpers.
 */

#include "domain/TextUtils.hpp"

namespace highlightdigest::domain {

namespace {
constexpr const char* kWhitespace = " \t\r\n\f\v";

// Length of the UTF-8 sequence introduced by a lead byte, 0 for an invalid lead.
std::size_t SequenceLength(unsigned char lead) {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}
}

std::string Trim(const std::string& s) {
    size_t first = s.find_first_not_of(kWhitespace);
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}

std::vector<std::string> SplitLines(const std::string& s) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < s.size()) {
        size_t end = s.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(s.substr(start));
            break;
        }
        lines.push_back(s.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

bool IsValidUtf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t len = SequenceLength(c);
        if (len == 0 || i + len > s.size()) return false;

        for (size_t k = 1; k < len; ++k) {
            unsigned char cont = static_cast<unsigned char>(s[i + k]);
            if ((cont & 0xC0) != 0x80) return false;
        }
        if (len >= 3) {
            unsigned char second = static_cast<unsigned char>(s[i + 1]);
            // Overlongs, UTF-16 surrogates and code points above U+10FFFF.
            if (c == 0xE0 && second < 0xA0) return false;
            if (c == 0xED && second > 0x9F) return false;
            if (c == 0xF0 && second < 0x90) return false;
            if (c == 0xF4 && second > 0x8F) return false;
        }
        i += len;
    }
    return true;
}

std::string Utf8Prefix(const std::string& s, std::size_t maxChars) {
    size_t pos = 0;
    size_t count = 0;
    while (pos < s.size() && count < maxChars) {
        size_t len = SequenceLength(static_cast<unsigned char>(s[pos]));
        if (len == 0) len = 1; // stray byte counts as one character
        pos += len;
        ++count;
    }
    if (pos > s.size()) pos = s.size();
    return s.substr(0, pos);
}

} // namespace highlightdigest::domain
