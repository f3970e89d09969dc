#include "infrastructure/ResendMailer.hpp"
#include "domain/Errors.hpp"
#include <httplib.h>
#include <iostream>

using json = nlohmann::json;

namespace highlightdigest::infrastructure {

namespace {
constexpr int kTimeoutSeconds = 30;
}

ResendMailer::ResendMailer(std::string apiKey, std::string host)
    : m_apiKey(std::move(apiKey)), m_host(std::move(host)) {}

json ResendMailer::BuildPayload(const domain::DigestMessage& message) {
    return {
        {"from", message.from},
        {"to", json::array({message.to})},
        {"subject", message.subject},
        {"html", message.html}
    };
}

std::string ResendMailer::send(const domain::DigestMessage& message) {
    httplib::SSLClient cli(m_host, 443);
    cli.set_connection_timeout(kTimeoutSeconds);
    cli.set_read_timeout(kTimeoutSeconds);
    cli.set_bearer_token_auth(m_apiKey);

    auto res = cli.Post("/emails", BuildPayload(message).dump(), "application/json");
    if (!res) {
        throw domain::DeliveryFailedError("connection to " + m_host + " failed (error " + std::to_string(static_cast<int>(res.error())) + ")");
    }
    if (res->status < 200 || res->status >= 300) {
        throw domain::DeliveryFailedError("HTTP " + std::to_string(res->status) + ": " + res->body);
    }

    try {
        auto body = json::parse(res->body);
        if (body.contains("id") && body["id"].is_string()) {
            return body["id"].get<std::string>();
        }
    } catch (const json::exception& e) {
        std::cerr << "[ResendMailer] Unreadable response body: " << e.what() << std::endl;
    }
    return "unknown";
}

} // namespace highlightdigest::infrastructure
