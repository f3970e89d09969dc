#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "domain/ClippingParser.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ClippingsFileReader.hpp"

using namespace highlightdigest;
using highlightdigest::infrastructure::ClippingsFileReader;

namespace {

const std::string kTestRoot = "test_reader_root";

std::string WriteBytes(const std::string& name, const std::string& bytes) {
    std::filesystem::path p = std::filesystem::path(kTestRoot) / name;
    std::ofstream out(p, std::ios::binary);
    out << bytes;
    return p.string();
}

void TestUtf8WithBomAndCrlf() {
    std::string path = WriteBytes("utf8.txt",
        "\xEF\xBB\xBF" "Caf\xC3\xA9 (Ana)\r\n"
        "- Your Highlight on Location 1-2 | Added on Monday\r\n"
        "\r\n"
        "Bonjour\r\n"
        "==========\r\n");

    std::string text = ClippingsFileReader::Read(path);
    assert(text.compare(0, 3, "Caf") == 0);
    assert(text.find('\r') == std::string::npos);

    auto report = domain::ClippingParser::ParseAll(text);
    assert(report.highlights.size() == 1);
    assert(report.highlights[0].title == "Caf\xC3\xA9");
    assert(report.highlights[0].text == "Bonjour");
}

void TestLatin1Fallback() {
    // 0xE9 alone is invalid UTF-8; as Latin-1 it is "é".
    std::string path = WriteBytes("latin1.txt",
        "Caf\xE9 (Ana)\n"
        "- Your Highlight on Location 1-2 | Added on Monday\n"
        "\n"
        "Cr\xE8me br\xFBl\xE9\x65\n"
        "==========\n");

    std::string text = ClippingsFileReader::Read(path);
    auto report = domain::ClippingParser::ParseAll(text);
    assert(report.highlights.size() == 1);
    assert(report.highlights[0].title == "Caf\xC3\xA9");
    assert(report.highlights[0].text == "Cr\xC3\xA8me br\xC3\xBBl\xC3\xA9" "e");
}

void TestDecodeHelpers() {
    assert(ClippingsFileReader::Latin1ToUtf8("A\xFF") == "A\xC3\xBF");
    assert(ClippingsFileReader::Decode("a\rb\r\nc\n") == "a\nb\nc\n");
    assert(ClippingsFileReader::Decode("") == "");
}

void TestMissingFileIsUnreadable() {
    bool threw = false;
    try {
        ClippingsFileReader::Read((std::filesystem::path(kTestRoot) / "nope.txt").string());
    } catch (const domain::SourceUnreadableError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        ClippingsFileReader::Read(kTestRoot); // a directory
    } catch (const domain::SourceUnreadableError&) {
        threw = true;
    }
    assert(threw);
}

} // namespace

int main() {
    std::cout << "[Test] Starting ClippingsFileReader Test..." << std::endl;
    std::filesystem::remove_all(kTestRoot);
    std::filesystem::create_directories(kTestRoot);

    TestUtf8WithBomAndCrlf();
    TestLatin1Fallback();
    TestDecodeHelpers();
    TestMissingFileIsUnreadable();

    std::filesystem::remove_all(kTestRoot);
    std::cout << "[PASS] ClippingsFileReader Test." << std::endl;
    return 0;
}
