#include <arch_model/layer.hpp>
#include <arch_model/element_id.hpp>
#include <arch_model/element_json.hpp>
#include <arch_model/element_ops.hpp>
#include <arch_model/errors.hpp>
#include <stdexcept>

namespace arch_model {

Layer::Layer(std::string name, GraphModel& graph)
    : name_(std::move(name)), graph_(&graph) {}

const std::vector<Element>& Layer::elements() const {
    if (cache_version_ && *cache_version_ == graph_->version()) return cache_;

    cache_.clear();
    for (const auto& node : graph_->nodes_by_layer(name_))
        cache_.push_back(to_element(node, graph_->edges_from(node.id)));
    cache_version_ = graph_->version();
    return cache_;
}

std::optional<Element> Layer::find_element(const std::string& id) const {
    const Node* node = graph_->find_node(id);
    if (!node || node->layer != name_) return std::nullopt;
    return to_element(*node, graph_->edges_from(id));
}

void Layer::add_element(const Element& element) {
    if (!element_id_in_layer(element.id, name_))
        throw std::invalid_argument("element id '" + element.id + "' does not belong to layer '" + name_ + "'");
    if (element.layer != name_)
        throw std::invalid_argument("element '" + element.id + "' declares layer '" + element.layer + "'");
    insert_element(*graph_, element);
}

void Layer::update_element(const std::string& id, const ElementPatch& patch) {
    const Node* node = graph_->find_node(id);
    if (!node || node->layer != name_)
        throw NotFoundError("element '" + id + "' not found in layer '" + name_ + "'", id);
    merge_element(*graph_, id, patch);
}

bool Layer::delete_element(const std::string& id) {
    const Node* node = graph_->find_node(id);
    if (!node || node->layer != name_) return false;
    return erase_element(*graph_, id);
}

nlohmann::json Layer::to_document() const {
    nlohmann::json doc;
    doc["layer"] = name_;
    doc["metadata"] = metadata_;
    nlohmann::json elements = nlohmann::json::array();
    for (const auto& node : graph_->nodes_by_layer(name_)) elements.push_back(node_to_json(node));
    doc["elements"] = std::move(elements);
    return doc;
}

std::size_t Layer::load_document(const nlohmann::json& doc) {
    if (!doc.is_object()) throw std::invalid_argument("layer document must be an object");
    if (doc.contains("layer") && doc["layer"].is_string() && doc["layer"].get<std::string>() != name_)
        throw std::invalid_argument("layer document is for '" + doc["layer"].get<std::string>() + "'");
    if (doc.contains("metadata") && doc["metadata"].is_object()) metadata_ = doc["metadata"];
    if (!doc.contains("elements")) return 0;
    if (!doc["elements"].is_array()) throw std::invalid_argument("'elements' must be an array");

    // Parse everything before touching the graph.
    std::vector<Node> nodes;
    for (const auto& e : doc["elements"]) {
        auto node = node_from_json(e);
        if (!node) throw std::invalid_argument("malformed element in layer '" + name_ + "'");
        if (node->layer != name_)
            throw std::invalid_argument("element '" + node->id + "' declares layer '" + node->layer + "'");
        nodes.push_back(std::move(*node));
    }
    for (const auto& n : nodes) {
        if (graph_->has_node(n.id)) throw DuplicateError("element '" + n.id + "' loaded twice", n.id);
    }
    for (auto& n : nodes) graph_->add_node(std::move(n));
    return nodes.size();
}

} // namespace arch_model
