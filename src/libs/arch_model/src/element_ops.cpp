#include <arch_model/element_ops.hpp>
#include <arch_model/errors.hpp>
#include <set>
#include <stdexcept>
#include <vector>

namespace arch_model {

namespace {

std::vector<Edge> relationship_edges(const std::string& source, const std::vector<Relationship>& rels) {
    std::vector<Edge> out;
    std::set<std::string> seen;
    for (const auto& r : rels) {
        Edge e;
        e.source = source;
        e.destination = r.target_id;
        e.predicate = r.predicate;
        e.properties = r.properties.is_object() ? r.properties : nlohmann::json::object();
        e.id = make_edge_id(e.source, e.predicate, e.destination);
        if (!seen.insert(e.id).second)
            throw std::invalid_argument("relationship '" + e.id + "' listed twice");
        out.push_back(std::move(e));
    }
    return out;
}

// Targets must resolve before any write happens; a self-loop is fine.
void check_targets(const GraphView& graph, const std::string& source, const std::vector<Edge>& edges) {
    for (const auto& e : edges) {
        if (e.destination == source) continue;
        if (!graph.has_node(e.destination))
            throw ReferenceError("relationship target '" + e.destination + "' of '" + source + "' does not exist",
                e.destination);
    }
}

} // namespace

std::optional<Element> read_element(const GraphView& graph, const std::string& id) {
    const Node* node = graph.find_node(id);
    if (!node) return std::nullopt;
    return to_element(*node, graph.edges_from(id));
}

void insert_element(MutableGraph& graph, const Element& element) {
    if (graph.has_node(element.id))
        throw DuplicateError("element '" + element.id + "' already exists", element.id);
    const auto edges = relationship_edges(element.id, element.relationships);
    check_targets(graph, element.id, edges);

    graph.insert_node(to_node(element));
    for (const auto& e : edges) graph.insert_edge(e);
}

void merge_element(MutableGraph& graph, const std::string& id, const ElementPatch& patch) {
    const Node* current = graph.find_node(id);
    if (!current) throw NotFoundError("element '" + id + "' not found", id);

    std::vector<Edge> edges;
    if (patch.relationships) {
        edges = relationship_edges(id, *patch.relationships);
        check_targets(graph, id, edges);
    }

    Node updated = *current;
    apply_node_patch(updated, patch);
    graph.replace_node(std::move(updated));

    if (!patch.relationships) return;

    // An edge whose (predicate, target) survives keeps its id and category.
    std::vector<bool> matched(edges.size(), false);
    for (const auto& old : graph.edges_from(id)) {
        std::size_t i = 0;
        while (i < edges.size() &&
               (matched[i] || edges[i].predicate != old.predicate || edges[i].destination != old.destination))
            ++i;
        if (i == edges.size()) {
            graph.erase_edge(old.id);
            continue;
        }
        matched[i] = true;
        if (old.properties == edges[i].properties) continue;
        Edge kept = old;
        kept.properties = edges[i].properties;
        graph.erase_edge(old.id);
        graph.insert_edge(std::move(kept));
    }
    for (std::size_t i = 0; i < edges.size(); ++i)
        if (!matched[i]) graph.insert_edge(std::move(edges[i]));
}

bool erase_element(MutableGraph& graph, const std::string& id) {
    return graph.erase_node(id);
}

} // namespace arch_model
