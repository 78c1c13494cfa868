#include <arch_model/element_json.hpp>

namespace arch_model {

namespace {

std::string string_or(const nlohmann::json& j, const char* key, const std::string& fallback = {}) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : fallback;
}

nlohmann::json object_or_empty(const nlohmann::json& j, const char* key) {
    return j.contains(key) && j[key].is_object() ? j[key] : nlohmann::json::object();
}

std::vector<Reference> parse_references(const nlohmann::json& arr) {
    std::vector<Reference> out;
    for (const auto& r : arr) {
        if (auto ref = reference_from_json(r)) out.push_back(std::move(*ref));
    }
    return out;
}

std::vector<Relationship> parse_relationships(const nlohmann::json& arr) {
    std::vector<Relationship> out;
    for (const auto& r : arr) {
        if (!r.is_object()) continue;
        Relationship rel;
        rel.predicate = string_or(r, "predicate");
        rel.target_id = string_or(r, "target");
        if (rel.predicate.empty() || rel.target_id.empty()) continue;
        rel.properties = object_or_empty(r, "properties");
        out.push_back(std::move(rel));
    }
    return out;
}

nlohmann::json references_to_json(const std::vector<Reference>& refs) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : refs) arr.push_back(reference_to_json(r));
    return arr;
}

} // namespace

nlohmann::json reference_to_json(const Reference& ref) {
    nlohmann::json j;
    j["target"] = ref.target_id;
    j["type"] = ref.type;
    if (!ref.description.empty()) j["description"] = ref.description;
    return j;
}

nlohmann::json node_to_json(const Node& node) {
    nlohmann::json j;
    j["id"] = node.id;
    j["layer"] = node.layer;
    j["type"] = node.type;
    j["name"] = node.name;
    if (node.description) j["description"] = *node.description;
    j["properties"] = node.properties.is_object() ? node.properties : nlohmann::json::object();
    j["references"] = references_to_json(node.references);
    return j;
}

nlohmann::json edge_to_json(const Edge& edge) {
    nlohmann::json j;
    j["id"] = edge.id;
    j["source"] = edge.source;
    j["destination"] = edge.destination;
    j["predicate"] = edge.predicate;
    if (edge.properties.is_object() && !edge.properties.empty()) j["properties"] = edge.properties;
    if (edge.category != EdgeCategory::None) j["category"] = edge_category_name(edge.category);
    return j;
}

nlohmann::json element_to_json(const Element& element) {
    nlohmann::json j = node_to_json(to_node(element));
    nlohmann::json rels = nlohmann::json::array();
    for (const auto& r : element.relationships) {
        nlohmann::json rj;
        rj["predicate"] = r.predicate;
        rj["target"] = r.target_id;
        if (r.properties.is_object() && !r.properties.empty()) rj["properties"] = r.properties;
        rels.push_back(std::move(rj));
    }
    j["relationships"] = std::move(rels);
    return j;
}

std::optional<Reference> reference_from_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    if (!j.contains("target") || !j["target"].is_string()) return std::nullopt;
    Reference ref;
    ref.target_id = j["target"].get<std::string>();
    ref.type = string_or(j, "type");
    ref.description = string_or(j, "description");
    return ref;
}

std::optional<Node> node_from_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    if (!j.contains("id") || !j["id"].is_string()) return std::nullopt;
    if (!j.contains("layer") || !j["layer"].is_string()) return std::nullopt;
    if (!j.contains("type") || !j["type"].is_string()) return std::nullopt;

    Node node;
    node.id = j["id"].get<std::string>();
    node.layer = j["layer"].get<std::string>();
    node.type = j["type"].get<std::string>();
    node.name = string_or(j, "name", node.id);
    if (j.contains("description") && j["description"].is_string())
        node.description = j["description"].get<std::string>();
    node.properties = object_or_empty(j, "properties");
    if (j.contains("references") && j["references"].is_array())
        node.references = parse_references(j["references"]);
    return node;
}

std::optional<Edge> edge_from_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    if (!j.contains("source") || !j["source"].is_string()) return std::nullopt;
    if (!j.contains("destination") || !j["destination"].is_string()) return std::nullopt;
    if (!j.contains("predicate") || !j["predicate"].is_string()) return std::nullopt;

    Edge edge;
    edge.source = j["source"].get<std::string>();
    edge.destination = j["destination"].get<std::string>();
    edge.predicate = j["predicate"].get<std::string>();
    edge.id = string_or(j, "id", make_edge_id(edge.source, edge.predicate, edge.destination));
    edge.properties = object_or_empty(j, "properties");
    edge.category = edge_category_from_string(string_or(j, "category"));
    return edge;
}

std::optional<Element> element_from_json(const nlohmann::json& j) {
    const auto node = node_from_json(j);
    if (!node) return std::nullopt;

    Element element;
    element.id = node->id;
    element.layer = node->layer;
    element.type = node->type;
    element.name = node->name;
    element.description = node->description;
    element.properties = node->properties;
    element.references = node->references;
    if (j.contains("relationships") && j["relationships"].is_array())
        element.relationships = parse_relationships(j["relationships"]);
    return element;
}

ElementPatch patch_from_json(const nlohmann::json& j) {
    ElementPatch patch;
    if (!j.is_object()) return patch;
    if (j.contains("name") && j["name"].is_string()) patch.name = j["name"].get<std::string>();
    if (j.contains("type") && j["type"].is_string()) patch.type = j["type"].get<std::string>();
    if (j.contains("description") && j["description"].is_string())
        patch.description = j["description"].get<std::string>();
    else if (j.contains("description") && j["description"].is_null())
        patch.clear_description = true;
    if (j.contains("properties") && j["properties"].is_object()) patch.properties = j["properties"];
    if (j.contains("references") && j["references"].is_array())
        patch.references = parse_references(j["references"]);
    if (j.contains("relationships") && j["relationships"].is_array())
        patch.relationships = parse_relationships(j["relationships"]);
    return patch;
}

} // namespace arch_model
