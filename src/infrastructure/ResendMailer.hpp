/**
 * @file ResendMailer.hpp
 * @brief DigestSender that posts to the Resend e-mail API.
 */

#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "domain/DigestSender.hpp"

namespace highlightdigest::infrastructure {

/**
 * @class ResendMailer
 * @brief Sends digests through https://api.resend.com/emails.
 */
class ResendMailer : public domain::DigestSender {
public:
    explicit ResendMailer(std::string apiKey, std::string host = "api.resend.com");

    /** @see domain::DigestSender::send */
    std::string send(const domain::DigestMessage& message) override;

    /** @brief Request body for a message. */
    static nlohmann::json BuildPayload(const domain::DigestMessage& message);

private:
    std::string m_apiKey;
    std::string m_host;
};

} // namespace highlightdigest::infrastructure
