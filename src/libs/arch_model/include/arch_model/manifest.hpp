#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace arch_model {

// One committed changeset, appended by commit and never rewritten.
struct HistoryEntry {
    std::string id;
    std::string name;
    std::string committed_at;
    std::size_t changes = 0;

    bool operator==(const HistoryEntry& o) const {
        return id == o.id && name == o.name && committed_at == o.committed_at && changes == o.changes;
    }
};

struct Manifest {
    std::string name;
    std::string version = "1.0.0";
    std::string description;
    std::vector<std::string> layers;   // declaration order
    nlohmann::json metadata = nlohmann::json::object();
    std::vector<HistoryEntry> history;

    bool has_layer(const std::string& layer) const;
    // Appends the layer if it is not declared yet. Returns true if added.
    bool declare_layer(const std::string& layer);

    bool operator==(const Manifest& o) const {
        return name == o.name && version == o.version && description == o.description && layers == o.layers &&
            metadata == o.metadata && history == o.history;
    }
};

nlohmann::json manifest_to_json(const Manifest& manifest);
std::optional<Manifest> manifest_from_json(const nlohmann::json& j);

} // namespace arch_model
