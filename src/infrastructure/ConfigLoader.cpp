/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include "domain/Errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace highlightdigest::infrastructure {

namespace {

std::optional<std::string> GetEnv(const char* key) {
    const char* value = std::getenv(key);
    if (value && *value) {
        return std::string(value);
    }
    return std::nullopt;
}

std::optional<int> ParsePositiveInt(const std::string& raw, const char* key) {
    try {
        size_t consumed = 0;
        int value = std::stoi(raw, &consumed);
        if (consumed == raw.size() && value >= 0) {
            return value;
        }
    } catch (const std::exception&) {
    }
    std::cerr << "[ConfigLoader] Ignoring invalid " << key << ": " << raw << std::endl;
    return std::nullopt;
}

void ApplySettingsFile(const std::string& settingsPath, AppConfig& config) {
    if (settingsPath.empty() || !std::filesystem::exists(settingsPath)) {
        return;
    }

    try {
        std::ifstream f(settingsPath);
        nlohmann::json j;
        f >> j;

        if (j.contains("store_path")) config.storePath = j["store_path"].get<std::string>();
        if (j.contains("to_email")) config.toEmail = j["to_email"].get<std::string>();
        if (j.contains("from_email")) config.fromEmail = j["from_email"].get<std::string>();
        if (j.contains("highlights_count")) config.highlightsCount = j["highlights_count"].get<int>();
        if (j.contains("resend_api_key")) config.resendApiKey = j["resend_api_key"].get<std::string>();
        if (j.contains("ollama_host")) config.ollamaHost = j["ollama_host"].get<std::string>();
        if (j.contains("ollama_port")) config.ollamaPort = j["ollama_port"].get<int>();
        if (j.contains("classifier_model")) config.classifierModel = j["classifier_model"].get<std::string>();
        if (j.contains("theme_threshold")) config.themeThreshold = j["theme_threshold"].get<double>();
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << settingsPath << ": " << e.what() << std::endl;
    }
}

void ApplyEnvironment(AppConfig& config) {
    if (auto v = GetEnv("HIGHLIGHTS_STORE")) config.storePath = *v;
    if (auto v = GetEnv("TO_EMAIL")) config.toEmail = *v;
    if (auto v = GetEnv("FROM_EMAIL")) config.fromEmail = *v;
    if (auto v = GetEnv("RESEND_API_KEY")) config.resendApiKey = *v;
    if (auto v = GetEnv("OLLAMA_HOST")) config.ollamaHost = *v;
    if (auto v = GetEnv("HIGHLIGHTS_COUNT")) {
        if (auto n = ParsePositiveInt(*v, "HIGHLIGHTS_COUNT")) config.highlightsCount = *n;
    }
    if (auto v = GetEnv("OLLAMA_PORT")) {
        if (auto n = ParsePositiveInt(*v, "OLLAMA_PORT")) config.ollamaPort = *n;
    }
}

} // namespace

AppConfig ConfigLoader::Load(const std::string& settingsPath) {
    AppConfig config;
    config.storePath = PathUtils::GetDefaultStorePath().string();
    ApplySettingsFile(settingsPath, config);
    ApplyEnvironment(config);
    if (config.highlightsCount < 0) {
        config.highlightsCount = 0;
    }
    return config;
}

void ConfigLoader::RequireDeliverySettings(const AppConfig& config) {
    if (!config.toEmail || config.toEmail->empty()) {
        throw domain::ConfigMissingError("TO_EMAIL");
    }
    if (!config.resendApiKey || config.resendApiKey->empty()) {
        throw domain::ConfigMissingError("RESEND_API_KEY");
    }
}

} // namespace highlightdigest::infrastructure
