#include <arch_model/graph_model.hpp>
#include <arch_model/errors.hpp>
#include <algorithm>
#include <deque>
#include <stdexcept>
#include <unordered_set>

namespace arch_model {

bool edge_order_less(const Edge& a, const Edge& b) {
    if (a.source != b.source) return a.source < b.source;
    if (a.destination != b.destination) return a.destination < b.destination;
    if (a.predicate != b.predicate) return a.predicate < b.predicate;
    return a.id < b.id;
}

void GraphModel::index_add(Index& index, const std::string& key, const std::string& id) {
    index[key].insert(id);
}

void GraphModel::index_remove(Index& index, const std::string& key, const std::string& id) {
    const auto it = index.find(key);
    if (it == index.end()) return;
    it->second.erase(id);
    if (it->second.empty()) index.erase(it);
}

void GraphModel::unindex_node(const Node& node) {
    index_remove(nodes_by_layer_, node.layer, node.id);
    index_remove(nodes_by_type_, node.type, node.id);
}

void GraphModel::unindex_edge(const Edge& edge) {
    index_remove(edges_by_source_, edge.source, edge.id);
    index_remove(edges_by_destination_, edge.destination, edge.id);
    index_remove(edges_by_predicate_, edge.predicate, edge.id);
}

void GraphModel::add_node(Node node, AddMode mode) {
    if (node.id.empty()) throw std::invalid_argument("node id must not be empty");
    if (!node.properties.is_object()) node.properties = nlohmann::json::object();

    auto it = nodes_.find(node.id);
    if (it != nodes_.end()) {
        if (mode != AddMode::Replace)
            throw DuplicateError("node '" + node.id + "' already exists", node.id);
        // Old layer/type entries go first; the replacement may live elsewhere.
        unindex_node(it->second);
        it->second = std::move(node);
    } else {
        const std::string id = node.id;
        it = nodes_.emplace(id, std::move(node)).first;
    }
    index_add(nodes_by_layer_, it->second.layer, it->first);
    index_add(nodes_by_type_, it->second.type, it->first);
    ++version_;
}

bool GraphModel::remove_node(const std::string& id) {
    const auto it = nodes_.find(id);
    if (it == nodes_.end()) return false;

    std::set<std::string> incident;
    if (const auto s = edges_by_source_.find(id); s != edges_by_source_.end())
        incident.insert(s->second.begin(), s->second.end());
    if (const auto d = edges_by_destination_.find(id); d != edges_by_destination_.end())
        incident.insert(d->second.begin(), d->second.end());
    for (const auto& edge_id : incident) {
        const auto eit = edges_.find(edge_id);
        if (eit == edges_.end()) continue;
        unindex_edge(eit->second);
        edges_.erase(eit);
    }

    unindex_node(it->second);
    nodes_.erase(it);
    ++version_;
    return true;
}

void GraphModel::update_node(const std::string& id, const ElementPatch& patch) {
    const auto it = nodes_.find(id);
    if (it == nodes_.end()) throw NotFoundError("node '" + id + "' not found", id);

    Node updated = it->second;
    apply_node_patch(updated, patch);
    unindex_node(it->second);
    it->second = std::move(updated);
    index_add(nodes_by_layer_, it->second.layer, id);
    index_add(nodes_by_type_, it->second.type, id);
    ++version_;
}

void GraphModel::add_edge(Edge edge) {
    if (!nodes_.count(edge.source))
        throw ReferenceError("edge source '" + edge.source + "' does not exist", edge.source);
    if (!nodes_.count(edge.destination))
        throw ReferenceError("edge destination '" + edge.destination + "' does not exist", edge.destination);
    if (edge.predicate.empty()) throw std::invalid_argument("edge predicate must not be empty");
    if (edge.id.empty()) edge.id = make_edge_id(edge.source, edge.predicate, edge.destination);
    if (edges_.count(edge.id))
        throw DuplicateError("edge '" + edge.id + "' already exists", edge.id);
    if (!edge.properties.is_object()) edge.properties = nlohmann::json::object();

    const std::string id = edge.id;
    const auto& stored = edges_.emplace(id, std::move(edge)).first->second;
    index_add(edges_by_source_, stored.source, id);
    index_add(edges_by_destination_, stored.destination, id);
    index_add(edges_by_predicate_, stored.predicate, id);
    ++version_;
}

bool GraphModel::remove_edge(const std::string& id) {
    const auto it = edges_.find(id);
    if (it == edges_.end()) return false;
    unindex_edge(it->second);
    edges_.erase(it);
    ++version_;
    return true;
}

void GraphModel::update_edge(const std::string& id, const std::string& predicate,
    const nlohmann::json& properties)
{
    const auto it = edges_.find(id);
    if (it == edges_.end()) throw NotFoundError("edge '" + id + "' not found", id);

    // Source and destination are fixed; re-point by remove + add.
    if (!predicate.empty() && predicate != it->second.predicate) {
        index_remove(edges_by_predicate_, it->second.predicate, id);
        it->second.predicate = predicate;
        index_add(edges_by_predicate_, predicate, id);
    }
    if (properties.is_object()) it->second.properties = properties;
    ++version_;
}

const Node* GraphModel::find_node(const std::string& id) const {
    const auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

const Edge* GraphModel::find_edge(const std::string& id) const {
    const auto it = edges_.find(id);
    return it == edges_.end() ? nullptr : &it->second;
}

std::vector<Node> GraphModel::collect_nodes(const Index& index, const std::string& key) const {
    std::vector<Node> out;
    const auto it = index.find(key);
    if (it == index.end()) return out;
    out.reserve(it->second.size());
    for (const auto& id : it->second) {
        // Stale entries are skipped rather than dereferenced.
        if (const Node* n = find_node(id)) out.push_back(*n);
    }
    return out;
}

std::vector<Edge> GraphModel::collect_edges(const Index& index, const std::string& key,
    std::string_view predicate) const
{
    std::vector<Edge> out;
    const auto it = index.find(key);
    if (it == index.end()) return out;
    for (const auto& id : it->second) {
        const Edge* e = find_edge(id);
        if (!e) continue;
        if (!predicate.empty() && e->predicate != predicate) continue;
        out.push_back(*e);
    }
    std::sort(out.begin(), out.end(), edge_order_less);
    return out;
}

std::vector<Node> GraphModel::nodes_by_layer(const std::string& layer) const {
    return collect_nodes(nodes_by_layer_, layer);
}

std::vector<Node> GraphModel::nodes_by_type(const std::string& type) const {
    return collect_nodes(nodes_by_type_, type);
}

std::vector<Edge> GraphModel::edges_from(const std::string& node_id, std::string_view predicate) const {
    return collect_edges(edges_by_source_, node_id, predicate);
}

std::vector<Edge> GraphModel::edges_to(const std::string& node_id, std::string_view predicate) const {
    return collect_edges(edges_by_destination_, node_id, predicate);
}

std::vector<Edge> GraphModel::edges_between(const std::string& source, const std::string& destination,
    std::string_view predicate) const
{
    std::vector<Edge> out = edges_from(source, predicate);
    out.erase(std::remove_if(out.begin(), out.end(),
        [&](const Edge& e) { return e.destination != destination; }), out.end());
    return out;
}

std::vector<Node> GraphModel::traverse(const std::string& start_id, std::string_view predicate,
    std::size_t max_depth) const
{
    std::vector<Node> out;
    std::unordered_set<std::string> visited;
    std::deque<std::pair<std::string, std::size_t>> queue;
    queue.emplace_back(start_id, 0);

    while (!queue.empty()) {
        auto [id, depth] = queue.front();
        queue.pop_front();
        if (depth > max_depth || !visited.insert(id).second) continue;

        const Node* node = find_node(id);
        if (!node) continue;
        out.push_back(*node);

        for (const auto& e : edges_from(id, predicate)) {
            if (!visited.count(e.destination)) queue.emplace_back(e.destination, depth + 1);
        }
    }
    return out;
}

std::vector<Node> GraphModel::all_nodes() const {
    std::vector<Node> out;
    out.reserve(nodes_.size());
    for (const auto& kv : nodes_) out.push_back(kv.second);
    std::sort(out.begin(), out.end(), [](const Node& a, const Node& b) { return a.id < b.id; });
    return out;
}

std::vector<Edge> GraphModel::all_edges() const {
    std::vector<Edge> out;
    out.reserve(edges_.size());
    for (const auto& kv : edges_) out.push_back(kv.second);
    std::sort(out.begin(), out.end(), edge_order_less);
    return out;
}

std::vector<std::string> GraphModel::layer_names() const {
    std::vector<std::string> out;
    out.reserve(nodes_by_layer_.size());
    for (const auto& kv : nodes_by_layer_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

void GraphModel::clear() {
    nodes_.clear();
    edges_.clear();
    nodes_by_layer_.clear();
    nodes_by_type_.clear();
    edges_by_source_.clear();
    edges_by_destination_.clear();
    edges_by_predicate_.clear();
    ++version_;
}

void GraphModel::restore(const GraphModel& saved) {
    const std::uint64_t next = std::max(version_, saved.version_) + 1;
    *this = saved;
    version_ = next;
}

std::vector<std::string> GraphModel::check_indices() const {
    std::vector<std::string> problems;

    const auto check_node_index = [&](const Index& index, const char* name, auto field) {
        for (const auto& [key, ids] : index) {
            for (const auto& id : ids) {
                const Node* n = find_node(id);
                if (!n) problems.push_back(std::string(name) + ": '" + id + "' has no node");
                else if (field(*n) != key) problems.push_back(std::string(name) + ": '" + id + "' filed under stale key '" + key + "'");
            }
        }
    };
    const auto check_edge_index = [&](const Index& index, const char* name, auto field) {
        for (const auto& [key, ids] : index) {
            for (const auto& id : ids) {
                const Edge* e = find_edge(id);
                if (!e) problems.push_back(std::string(name) + ": '" + id + "' has no edge");
                else if (field(*e) != key) problems.push_back(std::string(name) + ": '" + id + "' filed under stale key '" + key + "'");
            }
        }
    };

    check_node_index(nodes_by_layer_, "layer index", [](const Node& n) { return n.layer; });
    check_node_index(nodes_by_type_, "type index", [](const Node& n) { return n.type; });
    check_edge_index(edges_by_source_, "source index", [](const Edge& e) { return e.source; });
    check_edge_index(edges_by_destination_, "destination index", [](const Edge& e) { return e.destination; });
    check_edge_index(edges_by_predicate_, "predicate index", [](const Edge& e) { return e.predicate; });

    for (const auto& [id, n] : nodes_) {
        const auto lit = nodes_by_layer_.find(n.layer);
        if (lit == nodes_by_layer_.end() || !lit->second.count(id))
            problems.push_back("layer index: node '" + id + "' missing");
        const auto tit = nodes_by_type_.find(n.type);
        if (tit == nodes_by_type_.end() || !tit->second.count(id))
            problems.push_back("type index: node '" + id + "' missing");
    }
    for (const auto& [id, e] : edges_) {
        if (!nodes_.count(e.source) || !nodes_.count(e.destination))
            problems.push_back("edge '" + id + "' is dangling");
    }
    return problems;
}

void GraphModel::insert_node(Node node) {
    add_node(std::move(node), AddMode::Insert);
}

void GraphModel::replace_node(Node node) {
    if (!nodes_.count(node.id)) throw NotFoundError("node '" + node.id + "' not found", node.id);
    add_node(std::move(node), AddMode::Replace);
}

bool GraphModel::erase_node(const std::string& id) {
    return remove_node(id);
}

void GraphModel::insert_edge(Edge edge) {
    add_edge(std::move(edge));
}

bool GraphModel::erase_edge(const std::string& id) {
    return remove_edge(id);
}

} // namespace arch_model
