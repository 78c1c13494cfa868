#include <arch_staging/virtual_projection.hpp>
#include <arch_staging/change_apply.hpp>
#include <arch_model/element_json.hpp>
#include <arch_model/element_ops.hpp>
#include <arch_model/errors.hpp>
#include <algorithm>
#include <stdexcept>

namespace arch_staging {

using arch_model::Edge;
using arch_model::Node;

ProjectedModel::ProjectedModel(const arch_model::GraphView& base) : base_(&base) {}

bool ProjectedModel::visible_base_node(const std::string& id) const {
    return !removed_nodes_.count(id) && !nodes_.count(id);
}

bool ProjectedModel::visible_base_edge(const std::string& id) const {
    return !removed_edges_.count(id) && !edges_.count(id);
}

const Node* ProjectedModel::find_node(const std::string& id) const {
    if (const auto it = nodes_.find(id); it != nodes_.end()) return &it->second;
    if (removed_nodes_.count(id)) return nullptr;
    return base_->find_node(id);
}

const Edge* ProjectedModel::find_edge(const std::string& id) const {
    if (const auto it = edges_.find(id); it != edges_.end()) return &it->second;
    if (removed_edges_.count(id)) return nullptr;
    return base_->find_edge(id);
}

std::vector<Node> ProjectedModel::nodes_by_layer(const std::string& layer) const {
    std::vector<Node> out;
    for (auto& n : base_->nodes_by_layer(layer)) {
        if (visible_base_node(n.id)) out.push_back(std::move(n));
    }
    for (const auto& [id, n] : nodes_) {
        if (n.layer == layer) out.push_back(n);
    }
    std::sort(out.begin(), out.end(), [](const Node& a, const Node& b) { return a.id < b.id; });
    return out;
}

template <typename Pred>
std::vector<Edge> ProjectedModel::merged_edges(std::vector<Edge> from_base, Pred keep_overlay) const {
    std::vector<Edge> out;
    for (auto& e : from_base) {
        if (visible_base_edge(e.id)) out.push_back(std::move(e));
    }
    for (const auto& [id, e] : edges_) {
        if (keep_overlay(e)) out.push_back(e);
    }
    std::sort(out.begin(), out.end(), arch_model::edge_order_less);
    return out;
}

std::vector<Edge> ProjectedModel::edges_from(const std::string& node_id, std::string_view predicate) const {
    return merged_edges(base_->edges_from(node_id, predicate), [&](const Edge& e) {
        return e.source == node_id && (predicate.empty() || e.predicate == predicate);
    });
}

std::vector<Edge> ProjectedModel::edges_to(const std::string& node_id, std::string_view predicate) const {
    return merged_edges(base_->edges_to(node_id, predicate), [&](const Edge& e) {
        return e.destination == node_id && (predicate.empty() || e.predicate == predicate);
    });
}

std::vector<Node> ProjectedModel::all_nodes() const {
    std::vector<Node> out;
    for (auto& n : base_->all_nodes()) {
        if (visible_base_node(n.id)) out.push_back(std::move(n));
    }
    for (const auto& [id, n] : nodes_) out.push_back(n);
    std::sort(out.begin(), out.end(), [](const Node& a, const Node& b) { return a.id < b.id; });
    return out;
}

std::vector<Edge> ProjectedModel::all_edges() const {
    return merged_edges(base_->all_edges(), [](const Edge&) { return true; });
}

std::vector<std::string> ProjectedModel::layer_names() const {
    std::set<std::string> layers;
    for (const auto& n : all_nodes()) layers.insert(n.layer);
    return {layers.begin(), layers.end()};
}

void ProjectedModel::insert_node(Node node) {
    if (node.id.empty()) throw std::invalid_argument("node id must not be empty");
    if (find_node(node.id)) throw arch_model::DuplicateError("node '" + node.id + "' already exists", node.id);
    if (!node.properties.is_object()) node.properties = nlohmann::json::object();
    const std::string id = node.id;
    nodes_.insert_or_assign(id, std::move(node));
}

void ProjectedModel::replace_node(Node node) {
    if (!find_node(node.id)) throw arch_model::NotFoundError("node '" + node.id + "' not found", node.id);
    if (!node.properties.is_object()) node.properties = nlohmann::json::object();
    const std::string id = node.id;
    nodes_.insert_or_assign(id, std::move(node));
}

bool ProjectedModel::erase_node(const std::string& id) {
    if (!find_node(id)) return false;
    for (const auto& e : edges_from(id)) erase_edge(e.id);
    for (const auto& e : edges_to(id)) erase_edge(e.id);
    nodes_.erase(id);
    if (base_->has_node(id)) removed_nodes_.insert(id);
    return true;
}

void ProjectedModel::insert_edge(Edge edge) {
    if (!find_node(edge.source))
        throw arch_model::ReferenceError("edge source '" + edge.source + "' does not exist", edge.source);
    if (!find_node(edge.destination))
        throw arch_model::ReferenceError("edge destination '" + edge.destination + "' does not exist",
            edge.destination);
    if (edge.predicate.empty()) throw std::invalid_argument("edge predicate must not be empty");
    if (edge.id.empty()) edge.id = arch_model::make_edge_id(edge.source, edge.predicate, edge.destination);
    if (find_edge(edge.id)) throw arch_model::DuplicateError("edge '" + edge.id + "' already exists", edge.id);
    if (!edge.properties.is_object()) edge.properties = nlohmann::json::object();
    const std::string id = edge.id;
    edges_.insert_or_assign(id, std::move(edge));
}

bool ProjectedModel::erase_edge(const std::string& id) {
    if (!find_edge(id)) return false;
    edges_.erase(id);
    if (base_->find_edge(id)) removed_edges_.insert(id);
    return true;
}

VirtualProjectionEngine::VirtualProjectionEngine(const arch_model::GraphView& base) : base_(&base) {}

ProjectedModel VirtualProjectionEngine::project_changes(const Changeset& changeset) const {
    return project_changes(changeset.changes());
}

ProjectedModel VirtualProjectionEngine::project_changes(const std::vector<ChangeRecord>& records) const {
    ProjectedModel projected(*base_);
    apply_changes(projected, records);
    return projected;
}

std::optional<arch_model::Element> VirtualProjectionEngine::project_element(const Changeset& changeset,
    const std::string& id) const
{
    const auto projected = project_changes(changeset);
    return arch_model::read_element(projected, id);
}

std::vector<arch_model::Element> VirtualProjectionEngine::project_layer(const Changeset& changeset,
    const std::string& layer) const
{
    const auto projected = project_changes(changeset);
    std::vector<arch_model::Element> out;
    for (const auto& n : projected.nodes_by_layer(layer))
        out.push_back(arch_model::to_element(n, projected.edges_from(n.id)));
    return out;
}

ModelDiff VirtualProjectionEngine::compute_diff(const Changeset& changeset) const {
    const auto projected = project_changes(changeset);

    std::set<std::string> touched;
    for (const auto& r : changeset.changes()) {
        touched.insert(r.element_id());
        if (r.type() != ChangeType::Delete) continue;
        // Sources of edges into a deleted element lose a relationship.
        for (const auto& e : base_->edges_to(r.element_id())) touched.insert(e.source);
    }

    ModelDiff diff;
    for (const auto& id : touched) {
        const auto before = arch_model::read_element(*base_, id);
        const auto after = arch_model::read_element(projected, id);
        if (!before && !after) continue;
        if (!before) {
            diff.additions.push_back({id, after->layer, nullptr, arch_model::element_to_json(*after)});
        } else if (!after) {
            diff.deletions.push_back({id, before->layer, arch_model::element_to_json(*before), nullptr});
        } else if (!(*before == *after)) {
            diff.modifications.push_back({id, after->layer, arch_model::element_to_json(*before),
                arch_model::element_to_json(*after)});
        }
    }
    return diff;
}

nlohmann::json model_diff_to_json(const ModelDiff& diff) {
    const auto list = [](const std::vector<ElementChange>& changes) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& c : changes)
            arr.push_back({{"id", c.id}, {"layer", c.layer}, {"before", c.before}, {"after", c.after}});
        return arr;
    };
    nlohmann::json j;
    j["additions"] = list(diff.additions);
    j["modifications"] = list(diff.modifications);
    j["deletions"] = list(diff.deletions);
    return j;
}

} // namespace arch_staging
