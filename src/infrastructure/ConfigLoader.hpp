/**
 * @file ConfigLoader.hpp
 * @brief Loads application settings from settings.json and the environment.
 */

#pragma once

#include <optional>
#include <string>

namespace highlightdigest::infrastructure {

/**
 * @struct AppConfig
 * @brief Effective settings for one run.
 */
struct AppConfig {
    std::string storePath;
    std::optional<std::string> toEmail;
    std::string fromEmail = "Kindle Highlights <onboarding@resend.dev>";
    int highlightsCount = 5;
    std::optional<std::string> resendApiKey;
    std::string ollamaHost = "localhost";
    int ollamaPort = 11434;
    std::string classifierModel = "qwen2.5:7b";
    double themeThreshold = 0.3;
};

class ConfigLoader {
public:
    /**
     * @brief Builds the configuration: defaults, then settings.json keys, then environment.
     * @param settingsPath settings.json to read; a missing file is not an error.
     *
     * Recognized environment variables: TO_EMAIL, FROM_EMAIL, HIGHLIGHTS_COUNT,
     * RESEND_API_KEY, HIGHLIGHTS_STORE, OLLAMA_HOST, OLLAMA_PORT.
     */
    static AppConfig Load(const std::string& settingsPath);

    /**
     * @brief Ensures everything needed to send a digest is present.
     * Throws domain::ConfigMissingError naming the first missing key.
     */
    static void RequireDeliverySettings(const AppConfig& config);
};

} // namespace highlightdigest::infrastructure
