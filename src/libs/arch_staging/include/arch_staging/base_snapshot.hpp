#pragma once

#include <arch_model/graph_view.hpp>
#include <arch_model/manifest.hpp>
#include <arch_storage/model.hpp>
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace arch_staging {

struct ElementDigest {
    std::string layer;
    std::string digest;

    bool operator==(const ElementDigest& o) const {
        return layer == o.layer && digest == o.digest;
    }
    bool operator!=(const ElementDigest& o) const { return !(*this == o); }
};

// Hash of a model state plus the per-element digests needed to say what
// moved when the hash no longer matches.
struct SnapshotDetail {
    std::string hash;             // sha256:<hex>
    std::string manifest_digest;
    std::map<std::string, ElementDigest> elements;

    bool operator==(const SnapshotDetail& o) const {
        return hash == o.hash && manifest_digest == o.manifest_digest && elements == o.elements;
    }
};

enum class DriftKind { Added, Modified, Deleted };

const char* drift_kind_name(DriftKind kind);

struct DriftedElement {
    std::string id;
    std::string layer;
    DriftKind kind = DriftKind::Modified;
};

struct DriftReport {
    bool drifted = false;
    std::string base_hash;
    std::string current_hash;
    bool manifest_changed = false;
    std::vector<std::string> affected_layers;     // sorted
    std::vector<DriftedElement> elements;         // sorted by id
    std::vector<std::string> warnings;
};

class BaseSnapshotManager {
public:
    // Covers the canonical manifest, every layer's nodes sorted by id and
    // every edge sorted by (source, destination, predicate).
    SnapshotDetail capture(const arch_model::Manifest& manifest, const arch_model::GraphView& graph) const;
    SnapshotDetail capture(const arch_storage::Model& model) const;

    // Itemizes the drift when `base_detail` matches `base_hash`; otherwise
    // only the hashes are compared and a warning says why.
    DriftReport detect_drift(const std::string& base_hash, const arch_storage::Model& model,
        const SnapshotDetail* base_detail = nullptr) const;

    static bool compare(const std::string& a, const std::string& b) { return a == b; }
};

nlohmann::json snapshot_detail_to_json(const SnapshotDetail& detail);
std::optional<SnapshotDetail> snapshot_detail_from_json(const nlohmann::json& j);

} // namespace arch_staging
