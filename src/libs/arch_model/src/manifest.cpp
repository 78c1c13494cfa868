#include <arch_model/manifest.hpp>
#include <algorithm>

namespace arch_model {

bool Manifest::has_layer(const std::string& layer) const {
    return std::find(layers.begin(), layers.end(), layer) != layers.end();
}

bool Manifest::declare_layer(const std::string& layer) {
    if (has_layer(layer)) return false;
    layers.push_back(layer);
    return true;
}

nlohmann::json manifest_to_json(const Manifest& manifest) {
    nlohmann::json j;
    j["name"] = manifest.name;
    j["version"] = manifest.version;
    j["description"] = manifest.description;
    j["layers"] = manifest.layers;
    j["metadata"] = manifest.metadata.is_object() ? manifest.metadata : nlohmann::json::object();

    nlohmann::json history = nlohmann::json::array();
    for (const auto& h : manifest.history) {
        history.push_back({
            {"id", h.id},
            {"name", h.name},
            {"committed_at", h.committed_at},
            {"changes", h.changes},
        });
    }
    j["changeset_history"] = std::move(history);
    return j;
}

std::optional<Manifest> manifest_from_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    if (!j.contains("name") || !j["name"].is_string()) return std::nullopt;

    Manifest m;
    m.name = j["name"].get<std::string>();
    if (j.contains("version") && j["version"].is_string()) m.version = j["version"].get<std::string>();
    if (j.contains("description") && j["description"].is_string())
        m.description = j["description"].get<std::string>();
    if (j.contains("layers") && j["layers"].is_array()) {
        for (const auto& l : j["layers"]) {
            if (l.is_string()) m.declare_layer(l.get<std::string>());
        }
    }
    if (j.contains("metadata") && j["metadata"].is_object()) m.metadata = j["metadata"];
    if (j.contains("changeset_history") && j["changeset_history"].is_array()) {
        for (const auto& h : j["changeset_history"]) {
            if (!h.is_object() || !h.contains("id") || !h["id"].is_string()) continue;
            HistoryEntry entry;
            entry.id = h["id"].get<std::string>();
            if (h.contains("name") && h["name"].is_string()) entry.name = h["name"].get<std::string>();
            if (h.contains("committed_at") && h["committed_at"].is_string())
                entry.committed_at = h["committed_at"].get<std::string>();
            if (h.contains("changes") && h["changes"].is_number_unsigned())
                entry.changes = h["changes"].get<std::size_t>();
            m.history.push_back(std::move(entry));
        }
    }
    return m;
}

} // namespace arch_model
