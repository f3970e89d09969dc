/**
 * @file OllamaThemeClassifier.hpp
 * @brief ThemeClassifier backed by a local Ollama model.
 */

#pragma once
#include <memory>
#include <string>
#include "domain/ThemeClassifier.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace highlightdigest::infrastructure {

/**
 * @class OllamaThemeClassifier
 * @brief Zero-shot classification through a JSON-mode prompt.
 *
 * The model answers {"label": ..., "score": ...}; the answer is mapped through
 * domain::ResolveTheme so low confidence falls back to "General".
 */
class OllamaThemeClassifier : public domain::ThemeClassifier {
public:
    OllamaThemeClassifier(std::shared_ptr<OllamaClient> client, std::string model, double threshold);

    /** @see domain::ThemeClassifier::classify */
    std::optional<std::string> classify(const std::string& title, const std::string& author) override;

    /** @brief Parses a model answer. Malformed answers resolve to "General". */
    static std::string InterpretAnswer(const std::string& answer, double threshold);

private:
    std::string buildSystemPrompt() const;

    std::shared_ptr<OllamaClient> m_client;
    std::string m_model;
    double m_threshold;
};

} // namespace highlightdigest::infrastructure
