#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace arch_model {

struct ElementIdParts {
    std::string layer;
    std::string type;
    std::string name;
};

// "Order Service" -> "order-service"
std::string to_kebab_case(std::string_view text);

// <layer>.<type>.<kebab-name>
std::string make_element_id(const std::string& layer, const std::string& type, const std::string& name);

// nullopt unless the id has a non-empty layer, type and name segment.
std::optional<ElementIdParts> parse_element_id(const std::string& id);

bool element_id_in_layer(const std::string& id, const std::string& layer);

} // namespace arch_model
