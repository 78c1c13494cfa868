#include <arch_staging/base_snapshot.hpp>
#include <arch_staging/sha256.hpp>
#include <arch_model/element_json.hpp>
#include <set>

namespace arch_staging {

const char* drift_kind_name(DriftKind kind) {
    switch (kind) {
        case DriftKind::Added: return "added";
        case DriftKind::Modified: return "modified";
        case DriftKind::Deleted: return "deleted";
    }
    return "";
}

SnapshotDetail BaseSnapshotManager::capture(const arch_model::Manifest& manifest,
    const arch_model::GraphView& graph) const
{
    SnapshotDetail detail;
    Sha256 total;

    // Records are newline-framed so adjacent documents cannot run together.
    const std::string manifest_doc = arch_model::manifest_to_json(manifest).dump();
    detail.manifest_digest = Sha256::hash_hex(manifest_doc);
    total.update("manifest\n");
    total.update(manifest_doc);
    total.update("\n");

    std::set<std::string> layers(manifest.layers.begin(), manifest.layers.end());
    for (const auto& l : graph.layer_names()) layers.insert(l);

    for (const auto& layer : layers) {
        total.update("layer " + layer + "\n");
        for (const auto& node : graph.nodes_by_layer(layer)) {
            const std::string node_doc = arch_model::node_to_json(node).dump();
            total.update(node_doc);
            total.update("\n");

            Sha256 element;
            element.update(node_doc);
            for (const auto& e : graph.edges_from(node.id)) {
                element.update("\n");
                element.update(arch_model::edge_to_json(e).dump());
            }
            detail.elements[node.id] = ElementDigest{layer, element.final_hex()};
        }
    }

    total.update("edges\n");
    for (const auto& e : graph.all_edges()) {
        total.update(arch_model::edge_to_json(e).dump());
        total.update("\n");
    }

    detail.hash = "sha256:" + total.final_hex();
    return detail;
}

SnapshotDetail BaseSnapshotManager::capture(const arch_storage::Model& model) const {
    return capture(model.manifest(), model.graph());
}

DriftReport BaseSnapshotManager::detect_drift(const std::string& base_hash, const arch_storage::Model& model,
    const SnapshotDetail* base_detail) const
{
    const SnapshotDetail current = capture(model);

    DriftReport report;
    report.base_hash = base_hash;
    report.current_hash = current.hash;
    report.drifted = !compare(base_hash, current.hash);
    if (!report.drifted) return report;

    std::set<std::string> layers;
    if (!base_detail || base_detail->hash != base_hash) {
        report.warnings.push_back("no element digests recorded for " + base_hash + "; drift cannot be itemized");
        for (const auto& name : model.layer_names()) layers.insert(name);
        report.affected_layers.assign(layers.begin(), layers.end());
        return report;
    }

    report.manifest_changed = base_detail->manifest_digest != current.manifest_digest;

    // Both maps are ordered by id, so a merge walk yields a sorted result.
    auto b = base_detail->elements.begin();
    auto c = current.elements.begin();
    while (b != base_detail->elements.end() || c != current.elements.end()) {
        if (c == current.elements.end() || (b != base_detail->elements.end() && b->first < c->first)) {
            report.elements.push_back(DriftedElement{b->first, b->second.layer, DriftKind::Deleted});
            layers.insert(b->second.layer);
            ++b;
        } else if (b == base_detail->elements.end() || c->first < b->first) {
            report.elements.push_back(DriftedElement{c->first, c->second.layer, DriftKind::Added});
            layers.insert(c->second.layer);
            ++c;
        } else {
            if (b->second != c->second) {
                report.elements.push_back(DriftedElement{c->first, c->second.layer, DriftKind::Modified});
                layers.insert(b->second.layer);
                layers.insert(c->second.layer);
            }
            ++b;
            ++c;
        }
    }
    report.affected_layers.assign(layers.begin(), layers.end());
    return report;
}

nlohmann::json snapshot_detail_to_json(const SnapshotDetail& detail) {
    nlohmann::json elements = nlohmann::json::object();
    for (const auto& [id, d] : detail.elements) elements[id] = {{"layer", d.layer}, {"digest", d.digest}};

    nlohmann::json j;
    j["hash"] = detail.hash;
    j["manifest_digest"] = detail.manifest_digest;
    j["elements"] = std::move(elements);
    return j;
}

std::optional<SnapshotDetail> snapshot_detail_from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("hash") || !j["hash"].is_string()) return std::nullopt;

    SnapshotDetail detail;
    detail.hash = j["hash"].get<std::string>();
    if (j.contains("manifest_digest") && j["manifest_digest"].is_string())
        detail.manifest_digest = j["manifest_digest"].get<std::string>();
    if (j.contains("elements") && j["elements"].is_object()) {
        for (const auto& item : j["elements"].items()) {
            const auto& e = item.value();
            if (!e.is_object() || !e.contains("digest") || !e["digest"].is_string()) return std::nullopt;
            ElementDigest d;
            d.digest = e["digest"].get<std::string>();
            if (e.contains("layer") && e["layer"].is_string()) d.layer = e["layer"].get<std::string>();
            detail.elements.emplace(item.key(), std::move(d));
        }
    }
    return detail;
}

} // namespace arch_staging
