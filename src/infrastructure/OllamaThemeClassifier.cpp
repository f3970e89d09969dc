/**
 * @file OllamaThemeClassifier.cpp
 * @brief Implementation of OllamaThemeClassifier.
 */

#include "infrastructure/OllamaThemeClassifier.hpp"
#include "domain/Theme.hpp"
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace highlightdigest::infrastructure {

OllamaThemeClassifier::OllamaThemeClassifier(std::shared_ptr<OllamaClient> client, std::string model, double threshold)
    : m_client(std::move(client)), m_model(std::move(model)), m_threshold(threshold) {}

std::string OllamaThemeClassifier::buildSystemPrompt() const {
    std::stringstream ss;
    ss << "You are a zero-shot book classifier.\n"
       << "Pick the single best label for the book from this list:\n";
    for (const auto& theme : domain::Themes()) {
        ss << "- " << theme << "\n";
    }
    ss << "\nAnswer with JSON only, in the form {\"label\": \"<label>\", \"score\": <confidence between 0 and 1>}.\n"
       << "The label must be copied exactly from the list.";
    return ss.str();
}

std::optional<std::string> OllamaThemeClassifier::classify(const std::string& title, const std::string& author) {
    std::string text = title + " by " + author;
    auto answer = m_client->generate(m_model, buildSystemPrompt(), text, true);
    if (!answer) {
        std::cerr << "[OllamaThemeClassifier] No answer for: " << text << std::endl;
        return std::nullopt;
    }
    return InterpretAnswer(*answer, m_threshold);
}

std::string OllamaThemeClassifier::InterpretAnswer(const std::string& answer, double threshold) {
    try {
        auto body = json::parse(answer);
        if (!body.is_object()) {
            return domain::kGeneralTheme;
        }
        std::string label = body.value("label", std::string());
        double score = 0.0;
        if (body.contains("score") && body["score"].is_number()) {
            score = body["score"].get<double>();
        }
        return domain::ResolveTheme(label, score, threshold);
    } catch (const json::exception& e) {
        std::cerr << "[OllamaThemeClassifier] Unreadable answer: " << e.what() << std::endl;
    }
    return domain::kGeneralTheme;
}

} // namespace highlightdigest::infrastructure
