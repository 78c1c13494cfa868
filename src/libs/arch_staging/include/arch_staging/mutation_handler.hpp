#pragma once

#include <arch_model/types.hpp>
#include <arch_staging/change_record.hpp>
#include <arch_staging/staging_area.hpp>
#include <arch_storage/model.hpp>
#include <functional>
#include <optional>
#include <string>

namespace arch_staging {

// Edits the working copy of an element. Runs exactly once per operation.
using ElementMutator = std::function<void(arch_model::Element&)>;

struct MutationResult {
    ChangeRecord record;
    bool staged = false;
    std::optional<std::string> changeset_id;
};

// Single entry point for element edits. With an active changeset the change
// is staged; otherwise it is applied to the graph through the same merge
// algorithm commit uses and persisted inside a ModelTransaction.
class MutationHandler {
public:
    MutationHandler(arch_storage::Model& model, StagingAreaManager& staging);

    MutationResult execute_add(arch_model::Element element, const ElementMutator& mutator = {});
    MutationResult execute_update(const std::string& id, const ElementMutator& mutator);
    MutationResult execute_delete(const std::string& id);

private:
    // Current state of an element as edits would see it: the projection of
    // the active changeset when there is one, the graph otherwise.
    std::optional<arch_model::Element> current_element(const std::optional<Changeset>& active,
        const std::string& id) const;
    MutationResult route(ChangeRecord record, const std::optional<Changeset>& active);

    arch_storage::Model& model_;
    StagingAreaManager& staging_;
};

} // namespace arch_staging
