#include "infrastructure/ClippingsFileReader.hpp"
#include "domain/Errors.hpp"
#include "domain/TextUtils.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace highlightdigest::infrastructure {

namespace {
    const std::string kUtf8Bom = "\xEF\xBB\xBF";

    std::string NormalizeNewlines(const std::string& text) {
        std::string out;
        out.reserve(text.size());
        for (size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '\r') {
                out += '\n';
                if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
            } else {
                out += text[i];
            }
        }
        return out;
    }
}

std::string ClippingsFileReader::Read(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw domain::SourceUnreadableError(path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw domain::SourceUnreadableError(path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw domain::SourceUnreadableError(path);
    }

    return Decode(buffer.str());
}

std::string ClippingsFileReader::Decode(const std::string& bytes) {
    std::string text;
    if (domain::IsValidUtf8(bytes)) {
        text = bytes;
        if (text.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0) {
            text.erase(0, kUtf8Bom.size());
        }
    } else {
        std::cout << "[ClippingsFileReader] Input is not valid UTF-8, decoding as Latin-1." << std::endl;
        text = Latin1ToUtf8(bytes);
    }
    return NormalizeNewlines(text);
}

std::string ClippingsFileReader::Latin1ToUtf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (char ch : bytes) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back(static_cast<char>(0xC0 | (c >> 6)));
            out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return out;
}

} // namespace highlightdigest::infrastructure
