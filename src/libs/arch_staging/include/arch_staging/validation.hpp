#pragma once

#include <arch_model/graph_view.hpp>
#include <functional>
#include <string>
#include <vector>

namespace arch_staging {

enum class Severity { Error, Warning, Info };

const char* severity_name(Severity severity);

struct Violation {
    Severity severity = Severity::Error;
    std::string layer;
    std::string element_id;
    std::string message;
};

// Runs over a projected view; any Error blocks a commit.
using Validator = std::function<std::vector<Violation>(const arch_model::GraphView&)>;

bool has_errors(const std::vector<Violation>& violations);

// Element ids must be well formed and sit in their layer; every typed
// reference must resolve inside the view.
std::vector<Violation> check_reference_integrity(const arch_model::GraphView& view);

Validator reference_validator();

} // namespace arch_staging
