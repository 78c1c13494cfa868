#include <arch_model/element_id.hpp>
#include <cctype>

namespace arch_model {

std::string to_kebab_case(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    bool pending_dash = false;
    for (const char raw : text) {
        const auto c = static_cast<unsigned char>(raw);
        if (std::isalnum(c)) {
            if (pending_dash && !out.empty()) out.push_back('-');
            pending_dash = false;
            out.push_back(static_cast<char>(std::tolower(c)));
        } else {
            pending_dash = true;
        }
    }
    return out;
}

std::string make_element_id(const std::string& layer, const std::string& type, const std::string& name) {
    return layer + "." + type + "." + to_kebab_case(name);
}

std::optional<ElementIdParts> parse_element_id(const std::string& id) {
    const auto first = id.find('.');
    if (first == std::string::npos || first == 0) return std::nullopt;
    const auto second = id.find('.', first + 1);
    if (second == std::string::npos || second == first + 1 || second + 1 >= id.size()) return std::nullopt;

    ElementIdParts parts;
    parts.layer = id.substr(0, first);
    parts.type = id.substr(first + 1, second - first - 1);
    parts.name = id.substr(second + 1);
    return parts;
}

bool element_id_in_layer(const std::string& id, const std::string& layer) {
    const auto parts = parse_element_id(id);
    return parts && parts->layer == layer;
}

} // namespace arch_model
