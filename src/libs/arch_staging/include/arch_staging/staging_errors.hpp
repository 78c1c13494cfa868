#pragma once

#include <arch_model/errors.hpp>
#include <arch_staging/base_snapshot.hpp>
#include <arch_staging/validation.hpp>
#include <string>
#include <utility>
#include <vector>

namespace arch_staging {

// The base moved since the changeset was created.
class DriftError : public arch_model::ModelError {
public:
    DriftError(const std::string& what, DriftReport report)
        : ModelError(what), report_(std::move(report)) {}
    const DriftReport& report() const { return report_; }

private:
    DriftReport report_;
};

// The projected state failed validation. Carries every finding, not only
// the errors.
class ValidationError : public arch_model::ModelError {
public:
    ValidationError(const std::string& what, std::vector<Violation> violations)
        : ModelError(what), violations_(std::move(violations)) {}
    const std::vector<Violation>& violations() const { return violations_; }

private:
    std::vector<Violation> violations_;
};

} // namespace arch_staging
