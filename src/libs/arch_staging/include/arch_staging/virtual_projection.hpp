#pragma once

#include <arch_model/graph_view.hpp>
#include <arch_model/types.hpp>
#include <arch_staging/changeset.hpp>
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace arch_staging {

// Overlay over a read-only base graph. Writes land in the overlay maps or as
// tombstones; the base is never touched and must outlive the projection.
class ProjectedModel : public arch_model::MutableGraph {
public:
    explicit ProjectedModel(const arch_model::GraphView& base);

    const arch_model::GraphView& base() const { return *base_; }

    const arch_model::Node* find_node(const std::string& id) const override;
    const arch_model::Edge* find_edge(const std::string& id) const override;
    std::vector<arch_model::Node> nodes_by_layer(const std::string& layer) const override;
    std::vector<arch_model::Edge> edges_from(const std::string& node_id, std::string_view predicate = {}) const override;
    std::vector<arch_model::Edge> edges_to(const std::string& node_id, std::string_view predicate = {}) const override;
    std::vector<arch_model::Node> all_nodes() const override;
    std::vector<arch_model::Edge> all_edges() const override;
    std::vector<std::string> layer_names() const override;

    void insert_node(arch_model::Node node) override;
    void replace_node(arch_model::Node node) override;
    bool erase_node(const std::string& id) override;
    void insert_edge(arch_model::Edge edge) override;
    bool erase_edge(const std::string& id) override;

    std::size_t overlay_node_count() const { return nodes_.size(); }
    std::size_t tombstone_count() const { return removed_nodes_.size() + removed_edges_.size(); }

private:
    bool visible_base_node(const std::string& id) const;
    bool visible_base_edge(const std::string& id) const;
    template <typename Pred>
    std::vector<arch_model::Edge> merged_edges(std::vector<arch_model::Edge> from_base, Pred keep_overlay) const;

    const arch_model::GraphView* base_;
    std::map<std::string, arch_model::Node> nodes_;
    std::map<std::string, arch_model::Edge> edges_;
    std::set<std::string> removed_nodes_;
    std::set<std::string> removed_edges_;
};

struct ElementChange {
    std::string id;
    std::string layer;
    nlohmann::json before;   // null for additions
    nlohmann::json after;    // null for deletions
};

struct ModelDiff {
    std::vector<ElementChange> additions;
    std::vector<ElementChange> modifications;
    std::vector<ElementChange> deletions;

    bool empty() const { return additions.empty() && modifications.empty() && deletions.empty(); }
    std::size_t total() const { return additions.size() + modifications.size() + deletions.size(); }
};

class VirtualProjectionEngine {
public:
    explicit VirtualProjectionEngine(const arch_model::GraphView& base);

    // Replays the changeset in sequence order onto a fresh overlay.
    ProjectedModel project_changes(const Changeset& changeset) const;
    ProjectedModel project_changes(const std::vector<ChangeRecord>& records) const;

    std::optional<arch_model::Element> project_element(const Changeset& changeset, const std::string& id) const;
    std::vector<arch_model::Element> project_layer(const Changeset& changeset, const std::string& layer) const;

    // Element-level before/after for everything the changeset touches,
    // including elements that lose relationships to deleted targets.
    ModelDiff compute_diff(const Changeset& changeset) const;

private:
    const arch_model::GraphView* base_;
};

nlohmann::json model_diff_to_json(const ModelDiff& diff);

} // namespace arch_staging
