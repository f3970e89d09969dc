/**
 * @file JsonHighlightRepository.cpp
 * @brief Implementation of JsonHighlightRepository.
 */

#include "infrastructure/JsonHighlightRepository.hpp"
#include "domain/Errors.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace highlightdigest::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

std::string RequiredString(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) {
        throw std::invalid_argument(std::string("missing or non-string field '") + key + "'");
    }
    return j[key].get<std::string>();
}

std::optional<std::string> OptionalString(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    if (!j[key].is_string()) {
        throw std::invalid_argument(std::string("non-string field '") + key + "'");
    }
    return j[key].get<std::string>();
}

} // namespace

JsonHighlightRepository::JsonHighlightRepository(std::string path, std::shared_ptr<PersistenceService> persistence)
    : m_path(std::move(path)), m_persistence(std::move(persistence)) {}

json JsonHighlightRepository::ToJson(const domain::Highlight& highlight) {
    json j = {
        {"title", highlight.title},
        {"author", highlight.author},
        {"text", highlight.text}
    };
    if (highlight.location) j["location"] = *highlight.location;
    if (highlight.page) j["page"] = *highlight.page;
    j["added_at"] = highlight.addedAt;
    if (highlight.theme) j["theme"] = *highlight.theme;
    return j;
}

domain::Highlight JsonHighlightRepository::FromJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("record is not an object");
    }
    domain::Highlight h;
    h.title = RequiredString(j, "title");
    h.text = RequiredString(j, "text");
    h.author = OptionalString(j, "author").value_or(domain::kUnknownAuthor);
    h.location = OptionalString(j, "location");
    h.page = OptionalString(j, "page");
    h.addedAt = OptionalString(j, "added_at").value_or("");
    h.theme = OptionalString(j, "theme");
    return h;
}

std::vector<domain::Highlight> JsonHighlightRepository::load() {
    std::error_code ec;
    if (!fs::exists(m_path, ec)) {
        return {};
    }

    std::ifstream f(m_path);
    if (!f.is_open()) {
        throw domain::StoreCorruptError(m_path, "file exists but cannot be opened");
    }

    json root;
    try {
        root = json::parse(f);
    } catch (const json::parse_error& e) {
        throw domain::StoreCorruptError(m_path, e.what());
    }

    if (!root.is_array()) {
        throw domain::StoreCorruptError(m_path, "root is not an array");
    }

    std::vector<domain::Highlight> highlights;
    highlights.reserve(root.size());
    for (size_t i = 0; i < root.size(); ++i) {
        try {
            highlights.push_back(FromJson(root[i]));
        } catch (const std::invalid_argument& e) {
            throw domain::StoreCorruptError(m_path, "record " + std::to_string(i) + ": " + e.what());
        }
    }
    return highlights;
}

void JsonHighlightRepository::save(const std::vector<domain::Highlight>& highlights) {
    json root = json::array();
    for (const auto& h : highlights) {
        root.push_back(ToJson(h));
    }

    std::string content;
    try {
        content = root.dump(2) + "\n";
    } catch (const json::type_error& e) {
        throw domain::StoreUnwritableError(m_path, e.what());
    }

    std::string error;
    if (!m_persistence->writeTextAtomic(m_path, content, error)) {
        throw domain::StoreUnwritableError(m_path, error);
    }
    std::cout << "[JsonHighlightRepository] Saved " << highlights.size() << " highlights to " << m_path << std::endl;
}

} // namespace highlightdigest::infrastructure
