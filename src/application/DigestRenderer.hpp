/**
 * @file DigestRenderer.hpp
 * @brief Formats a highlight selection as an HTML e-mail.
 */

#pragma once

#include <ctime>
#include <string>
#include <vector>
#include "domain/Highlight.hpp"

namespace highlightdigest::application {

/**
 * @struct DigestDocument
 * @brief Rendered digest ready to be handed to a sender.
 */
struct DigestDocument {
    std::string subject;
    std::string html;
};

class DigestRenderer {
public:
    /**
     * @brief Renders every highlight of the selection, in order.
     * An empty selection still produces the header and footer.
     * @param date Date shown in the header and the subject.
     */
    static DigestDocument Render(const std::vector<domain::Highlight>& selection, const std::tm& date);

    /** @brief Renders with today's local date. */
    static DigestDocument Render(const std::vector<domain::Highlight>& selection);

    /** @brief Escapes &, <, >, " and ' for HTML text and attributes. */
    static std::string EscapeHtml(const std::string& text);
};

} // namespace highlightdigest::application
