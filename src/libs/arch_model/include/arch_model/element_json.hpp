#pragma once

#include <arch_model/types.hpp>
#include <nlohmann/json.hpp>
#include <optional>

namespace arch_model {

nlohmann::json reference_to_json(const Reference& ref);
nlohmann::json node_to_json(const Node& node);
nlohmann::json edge_to_json(const Edge& edge);
nlohmann::json element_to_json(const Element& element);

// Loaders return nullopt when a required field is missing or mistyped.
std::optional<Reference> reference_from_json(const nlohmann::json& j);
std::optional<Node> node_from_json(const nlohmann::json& j);
std::optional<Edge> edge_from_json(const nlohmann::json& j);
std::optional<Element> element_from_json(const nlohmann::json& j);

// Reads the mergeable fields of an element document. Fields that are absent
// stay unset in the patch.
ElementPatch patch_from_json(const nlohmann::json& j);

} // namespace arch_model
