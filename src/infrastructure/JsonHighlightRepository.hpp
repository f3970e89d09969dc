/**
 * @file JsonHighlightRepository.hpp
 * @brief JSON file implementation of the HighlightRepository.
 */

#pragma once
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/HighlightRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace highlightdigest::infrastructure {

/**
 * @class JsonHighlightRepository
 * @brief Stores the highlight list as a pretty-printed JSON array.
 *
 * Record fields: title, author, text, location?, page?, added_at, theme?.
 * Optional fields are omitted rather than written as null.
 */
class JsonHighlightRepository : public domain::HighlightRepository {
public:
    /**
     * @brief Constructor for JsonHighlightRepository.
     * @param path Store file, e.g. data/highlights.json.
     * @param persistence Writer used for atomic saves.
     */
    JsonHighlightRepository(std::string path, std::shared_ptr<PersistenceService> persistence);

    /** @see domain::HighlightRepository::load */
    std::vector<domain::Highlight> load() override;

    /** @see domain::HighlightRepository::save */
    void save(const std::vector<domain::Highlight>& highlights) override;

    const std::string& path() const { return m_path; }

    static nlohmann::json ToJson(const domain::Highlight& highlight);

    /** @brief Throws std::invalid_argument when a required field is missing or mistyped. */
    static domain::Highlight FromJson(const nlohmann::json& j);

private:
    std::string m_path;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace highlightdigest::infrastructure
