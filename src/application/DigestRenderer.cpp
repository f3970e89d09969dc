/**
 * @file DigestRenderer.cpp
 * @brief Implementation of DigestRenderer.
 */

#include "application/DigestRenderer.hpp"
#include <iomanip>
#include <sstream>

namespace highlightdigest::application {

namespace {

constexpr const char* kStyle = R"(    <style>
        body {
            font-family: Georgia, 'Times New Roman', serif;
            line-height: 1.6;
            max-width: 600px;
            margin: 0 auto;
            padding: 20px;
            background-color: #fafafa;
            color: #333;
        }
        .header {
            text-align: center;
            padding-bottom: 20px;
            border-bottom: 2px solid #e0e0e0;
            margin-bottom: 30px;
        }
        .header h1 { font-size: 24px; color: #2c3e50; margin: 0; }
        .header p { color: #7f8c8d; margin: 5px 0 0 0; font-size: 14px; }
        .highlight {
            background: white;
            border-left: 4px solid #3498db;
            padding: 20px;
            margin-bottom: 25px;
            box-shadow: 0 1px 3px rgba(0,0,0,0.1);
        }
        .highlight-text { font-size: 16px; font-style: italic; color: #2c3e50; margin: 0 0 15px 0; }
        .highlight-source { font-size: 13px; color: #7f8c8d; margin: 0; }
        .highlight-source strong { color: #34495e; }
        .theme { display: inline-block; font-size: 11px; color: #3498db; margin-left: 6px; }
        .footer {
            text-align: center;
            padding-top: 20px;
            border-top: 1px solid #e0e0e0;
            font-size: 12px;
            color: #95a5a6;
        }
    </style>
)";

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

std::string FormatDate(const std::tm& date, const char* format) {
    std::ostringstream ss;
    ss << std::put_time(&date, format);
    return ss.str();
}

// Multi-line highlight bodies keep their line structure.
std::string EscapeWithBreaks(const std::string& text) {
    std::string escaped = DigestRenderer::EscapeHtml(text);
    std::string out;
    out.reserve(escaped.size());
    for (char c : escaped) {
        if (c == '\n') out += "<br>";
        else out += c;
    }
    return out;
}

} // namespace

std::string DigestRenderer::EscapeHtml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c; break;
        }
    }
    return out;
}

DigestDocument DigestRenderer::Render(const std::vector<domain::Highlight>& selection) {
    return Render(selection, ToLocalTime(std::time(nullptr)));
}

DigestDocument DigestRenderer::Render(const std::vector<domain::Highlight>& selection, const std::tm& date) {
    DigestDocument doc;
    doc.subject = "\xF0\x9F\x93\x9A Your Daily Kindle Highlights - " + FormatDate(date, "%B %d");

    std::stringstream ss;
    ss << "<!DOCTYPE html>\n<html>\n<head>\n    <meta charset=\"utf-8\">\n"
       << kStyle
       << "</head>\n<body>\n"
       << "    <div class=\"header\">\n"
       << "        <h1>\xF0\x9F\x93\x9A Your Daily Highlights</h1>\n"
       << "        <p>" << FormatDate(date, "%B %d, %Y") << "</p>\n"
       << "    </div>\n";

    for (const auto& h : selection) {
        ss << "    <div class=\"highlight\">\n"
           << "        <p class=\"highlight-text\">&ldquo;" << EscapeWithBreaks(h.text) << "&rdquo;</p>\n"
           << "        <p class=\"highlight-source\">&mdash; <strong>" << EscapeHtml(h.title)
           << "</strong> by " << EscapeHtml(h.author);
        if (h.theme) {
            ss << "<span class=\"theme\">" << EscapeHtml(*h.theme) << "</span>";
        }
        ss << "</p>\n"
           << "    </div>\n";
    }

    ss << "    <div class=\"footer\">\n"
       << "        <p>Powered by your personal Kindle Highlights system</p>\n"
       << "    </div>\n"
       << "</body>\n</html>\n";

    doc.html = ss.str();
    return doc;
}

} // namespace highlightdigest::application
