#pragma once

#include <arch_model/types.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace arch_model {

// Read side shared by the committed graph and by projections of it.
// Collections come back ordered: nodes by id, edges by
// (source, destination, predicate).
class GraphView {
public:
    virtual ~GraphView() = default;

    virtual const Node* find_node(const std::string& id) const = 0;
    virtual const Edge* find_edge(const std::string& id) const = 0;

    virtual std::vector<Node> nodes_by_layer(const std::string& layer) const = 0;
    virtual std::vector<Edge> edges_from(const std::string& node_id, std::string_view predicate = {}) const = 0;
    virtual std::vector<Edge> edges_to(const std::string& node_id, std::string_view predicate = {}) const = 0;

    virtual std::vector<Node> all_nodes() const = 0;
    virtual std::vector<Edge> all_edges() const = 0;
    virtual std::vector<std::string> layer_names() const = 0;

    bool has_node(const std::string& id) const { return find_node(id) != nullptr; }
};

// Write side used by the change merge algorithm. Implemented by GraphModel
// and by the projection overlay, so preview and commit run the same code.
class MutableGraph : public GraphView {
public:
    // Throws DuplicateError if the id is taken.
    virtual void insert_node(Node node) = 0;
    // Throws NotFoundError if the id is absent.
    virtual void replace_node(Node node) = 0;
    // Removes the node and every incident edge.
    virtual bool erase_node(const std::string& id) = 0;
    // Throws ReferenceError for a missing endpoint, DuplicateError for a taken id.
    virtual void insert_edge(Edge edge) = 0;
    virtual bool erase_edge(const std::string& id) = 0;
};

bool edge_order_less(const Edge& a, const Edge& b);

} // namespace arch_model
