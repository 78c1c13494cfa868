#pragma once

#include <arch_model/graph_view.hpp>
#include <arch_model/types.hpp>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace arch_model {

enum class AddMode { Insert, Replace };

// In-memory node/edge store with layer, type, source, destination and
// predicate indices. Single source of truth for committed state.
//
// Every mutation drops stale index entries before inserting new ones, so an
// index never points at a removed or relocated object.
class GraphModel : public MutableGraph {
public:
    GraphModel() = default;

    void add_node(Node node, AddMode mode = AddMode::Insert);
    bool remove_node(const std::string& id);
    void update_node(const std::string& id, const ElementPatch& patch);

    void add_edge(Edge edge);
    bool remove_edge(const std::string& id);
    void update_edge(const std::string& id, const std::string& predicate, const nlohmann::json& properties);

    const Node* find_node(const std::string& id) const override;
    const Edge* find_edge(const std::string& id) const override;

    std::vector<Node> nodes_by_layer(const std::string& layer) const override;
    std::vector<Node> nodes_by_type(const std::string& type) const;
    std::vector<Edge> edges_from(const std::string& node_id, std::string_view predicate = {}) const override;
    std::vector<Edge> edges_to(const std::string& node_id, std::string_view predicate = {}) const override;
    std::vector<Edge> edges_between(const std::string& source, const std::string& destination,
        std::string_view predicate = {}) const;

    // Breadth-first walk over outgoing edges, start node included.
    std::vector<Node> traverse(const std::string& start_id, std::string_view predicate = {},
        std::size_t max_depth = std::numeric_limits<std::size_t>::max()) const;

    std::vector<Node> all_nodes() const override;
    std::vector<Edge> all_edges() const override;
    std::vector<std::string> layer_names() const override;

    std::size_t node_count() const { return nodes_.size(); }
    std::size_t edge_count() const { return edges_.size(); }
    void clear();

    // Takes over the content of a saved copy. The version still moves forward
    // so caches built on the discarded state cannot match again.
    void restore(const GraphModel& saved);

    // Bumped by every mutating call; dependents compare it to detect staleness.
    std::uint64_t version() const { return version_; }

    // Index entries that disagree with storage. Empty when consistent.
    std::vector<std::string> check_indices() const;

    // MutableGraph
    void insert_node(Node node) override;
    void replace_node(Node node) override;
    bool erase_node(const std::string& id) override;
    void insert_edge(Edge edge) override;
    bool erase_edge(const std::string& id) override;

private:
    using Index = std::unordered_map<std::string, std::set<std::string>>;

    static void index_add(Index& index, const std::string& key, const std::string& id);
    static void index_remove(Index& index, const std::string& key, const std::string& id);

    void unindex_node(const Node& node);
    void unindex_edge(const Edge& edge);
    std::vector<Node> collect_nodes(const Index& index, const std::string& key) const;
    std::vector<Edge> collect_edges(const Index& index, const std::string& key, std::string_view predicate) const;

    std::unordered_map<std::string, Node> nodes_;
    std::unordered_map<std::string, Edge> edges_;
    Index nodes_by_layer_;
    Index nodes_by_type_;
    Index edges_by_source_;
    Index edges_by_destination_;
    Index edges_by_predicate_;
    std::uint64_t version_ = 0;
};

} // namespace arch_model
