/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <optional>
#include <string>

namespace highlightdigest::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434);

    /** @brief Sends a POST request to /api/generate with deterministic sampling options. */
    std::optional<std::string> generate(const std::string& model,
                                        const std::string& system,
                                        const std::string& prompt,
                                        bool forceJson = false);

private:
    std::string m_host;
    int m_port;
};

} // namespace highlightdigest::infrastructure
