#include <arch_model/types.hpp>

namespace arch_model {

std::string make_edge_id(const std::string& source, const std::string& predicate,
    const std::string& destination)
{
    return source + "--" + predicate + "->" + destination;
}

Node to_node(const Element& element) {
    Node node;
    node.id = element.id;
    node.layer = element.layer;
    node.type = element.type;
    node.name = element.name;
    node.description = element.description;
    node.properties = element.properties.is_object() ? element.properties : nlohmann::json::object();
    node.references = element.references;
    return node;
}

Element to_element(const Node& node, const std::vector<Edge>& outgoing) {
    Element element;
    element.id = node.id;
    element.layer = node.layer;
    element.type = node.type;
    element.name = node.name;
    element.description = node.description;
    element.properties = node.properties;
    element.references = node.references;
    for (const auto& e : outgoing) {
        if (e.source != node.id) continue;
        element.relationships.push_back(Relationship{e.predicate, e.destination, e.properties});
    }
    return element;
}

void apply_node_patch(Node& node, const ElementPatch& patch) {
    if (patch.name) node.name = *patch.name;
    if (patch.type) node.type = *patch.type;
    if (patch.description) node.description = *patch.description;
    else if (patch.clear_description) node.description.reset();
    if (patch.properties.is_object()) {
        if (!node.properties.is_object()) node.properties = nlohmann::json::object();
        node.properties.merge_patch(patch.properties);
    }
    if (patch.references) node.references = *patch.references;
}

const char* edge_category_name(EdgeCategory category) {
    switch (category) {
        case EdgeCategory::Structural: return "structural";
        case EdgeCategory::Behavioral: return "behavioral";
        case EdgeCategory::None: break;
    }
    return "";
}

EdgeCategory edge_category_from_string(const std::string& s) {
    if (s == "structural") return EdgeCategory::Structural;
    if (s == "behavioral") return EdgeCategory::Behavioral;
    return EdgeCategory::None;
}

} // namespace arch_model
