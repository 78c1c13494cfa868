#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace arch_model {

// Typed cross-layer reference held on an element (e.g. an application
// component that "realizes" a business service).
struct Reference {
    std::string target_id;
    std::string type;
    std::string description;

    bool operator==(const Reference& o) const {
        return target_id == o.target_id && type == o.type && description == o.description;
    }
};

struct Node {
    std::string id;     // <layer>.<type>.<name>
    std::string layer;
    std::string type;
    std::string name;
    std::optional<std::string> description;
    nlohmann::json properties = nlohmann::json::object();
    std::vector<Reference> references;

    bool operator==(const Node& o) const {
        return id == o.id && layer == o.layer && type == o.type && name == o.name &&
            description == o.description && properties == o.properties && references == o.references;
    }
    bool operator!=(const Node& o) const { return !(*this == o); }
};

enum class EdgeCategory { None, Structural, Behavioral };

struct Edge {
    std::string id;
    std::string source;
    std::string destination;
    std::string predicate;
    nlohmann::json properties = nlohmann::json::object();
    EdgeCategory category = EdgeCategory::None;

    bool operator==(const Edge& o) const {
        return id == o.id && source == o.source && destination == o.destination && predicate == o.predicate &&
            properties == o.properties && category == o.category;
    }
};

// Outgoing edge as seen from its source element.
struct Relationship {
    std::string predicate;
    std::string target_id;
    nlohmann::json properties = nlohmann::json::object();

    bool operator==(const Relationship& o) const {
        return predicate == o.predicate && target_id == o.target_id && properties == o.properties;
    }
};

// Element view: a node plus the relationships derived from its outgoing edges.
struct Element {
    std::string id;
    std::string layer;
    std::string type;
    std::string name;
    std::optional<std::string> description;
    nlohmann::json properties = nlohmann::json::object();
    std::vector<Reference> references;
    std::vector<Relationship> relationships;

    bool operator==(const Element& o) const {
        return id == o.id && layer == o.layer && type == o.type && name == o.name &&
            description == o.description && properties == o.properties && references == o.references &&
            relationships == o.relationships;
    }
    bool operator!=(const Element& o) const { return !(*this == o); }
};

// Partial update of an element. Absent fields keep their value.
// `properties` is an RFC 7386 merge patch (null value removes a key);
// a null `properties` leaves the map untouched. References and
// relationships are replaced wholesale when present. A null
// description in JSON sets `clear_description`.
struct ElementPatch {
    std::optional<std::string> name;
    std::optional<std::string> type;
    std::optional<std::string> description;
    bool clear_description = false;
    nlohmann::json properties;
    std::optional<std::vector<Reference>> references;
    std::optional<std::vector<Relationship>> relationships;
};

std::string make_edge_id(const std::string& source, const std::string& predicate,
    const std::string& destination);

Node to_node(const Element& element);
Element to_element(const Node& node, const std::vector<Edge>& outgoing);

// Applies the node facets of a patch (everything except relationships).
void apply_node_patch(Node& node, const ElementPatch& patch);

const char* edge_category_name(EdgeCategory category);
EdgeCategory edge_category_from_string(const std::string& s);

} // namespace arch_model
