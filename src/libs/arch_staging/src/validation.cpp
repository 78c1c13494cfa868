#include <arch_staging/validation.hpp>
#include <arch_model/element_id.hpp>
#include <algorithm>

namespace arch_staging {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Error: return "error";
        case Severity::Warning: return "warning";
        case Severity::Info: return "info";
    }
    return "";
}

bool has_errors(const std::vector<Violation>& violations) {
    return std::any_of(violations.begin(), violations.end(),
        [](const Violation& v) { return v.severity == Severity::Error; });
}

std::vector<Violation> check_reference_integrity(const arch_model::GraphView& view) {
    std::vector<Violation> out;
    for (const auto& node : view.all_nodes()) {
        const auto parts = arch_model::parse_element_id(node.id);
        if (!parts) {
            out.push_back({Severity::Error, node.layer, node.id, "element id is not <layer>.<type>.<name>"});
        } else if (parts->layer != node.layer) {
            out.push_back({Severity::Error, node.layer, node.id,
                "element id names layer '" + parts->layer + "' but element is in '" + node.layer + "'"});
        }
        for (const auto& ref : node.references) {
            if (!view.has_node(ref.target_id))
                out.push_back({Severity::Error, node.layer, node.id,
                    "reference to missing element '" + ref.target_id + "'"});
        }
        if (node.name.empty()) out.push_back({Severity::Warning, node.layer, node.id, "element has no name"});
    }
    for (const auto& edge : view.all_edges()) {
        if (!view.has_node(edge.source) || !view.has_node(edge.destination)) {
            const auto* src = view.find_node(edge.source);
            out.push_back({Severity::Error, src ? src->layer : std::string(), edge.source,
                "relationship '" + edge.id + "' has a missing endpoint"});
        }
    }
    return out;
}

Validator reference_validator() {
    return [](const arch_model::GraphView& view) { return check_reference_integrity(view); };
}

} // namespace arch_staging
