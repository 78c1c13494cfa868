#include <arch_staging/mutation_handler.hpp>
#include <arch_staging/change_apply.hpp>
#include <arch_staging/virtual_projection.hpp>
#include <arch_storage/log.hpp>
#include <arch_storage/model_transaction.hpp>
#include <arch_model/element_id.hpp>
#include <arch_model/element_json.hpp>
#include <arch_model/element_ops.hpp>
#include <arch_model/errors.hpp>
#include <stdexcept>

namespace arch_staging {

using arch_model::Element;
using arch_storage::logger;

MutationHandler::MutationHandler(arch_storage::Model& model, StagingAreaManager& staging)
    : model_(model), staging_(staging) {}

std::optional<Element> MutationHandler::current_element(const std::optional<Changeset>& active,
    const std::string& id) const
{
    if (!active) return arch_model::read_element(model_.graph(), id);
    return VirtualProjectionEngine(model_.graph()).project_element(*active, id);
}

MutationResult MutationHandler::execute_add(Element element, const ElementMutator& mutator) {
    if (mutator) mutator(element);
    if (element.layer.empty()) throw std::invalid_argument("element needs a layer");
    if (element.type.empty()) throw std::invalid_argument("element needs a type");
    if (element.id.empty()) {
        if (element.name.empty()) throw std::invalid_argument("element needs an id or a name");
        element.id = arch_model::make_element_id(element.layer, element.type, element.name);
    }
    if (!arch_model::element_id_in_layer(element.id, element.layer))
        throw std::invalid_argument("element id '" + element.id + "' does not belong to layer '" + element.layer + "'");
    if (element.name.empty()) element.name = arch_model::parse_element_id(element.id)->name;

    const auto active = staging_.active();
    if (current_element(active, element.id))
        throw arch_model::DuplicateError("element '" + element.id + "' already exists", element.id);

    auto record = ChangeRecord::make_add(element.id, element.layer, arch_model::element_to_json(element));
    return route(std::move(record), active);
}

MutationResult MutationHandler::execute_update(const std::string& id, const ElementMutator& mutator) {
    const auto active = staging_.active();
    const auto current = current_element(active, id);
    if (!current) {
        if (active) {
            const auto records = active->records_for(id);
            if (!records.empty() && records.back()->type() == ChangeType::Delete)
                throw arch_model::ConflictError("'" + id + "' is deleted in the active changeset", id);
        }
        throw arch_model::NotFoundError("element '" + id + "' not found", id);
    }

    // One working copy: the mutator edits it and the after state is read
    // back from the same object.
    Element working = *current;
    if (mutator) mutator(working);
    if (working.id != current->id || working.layer != current->layer)
        throw std::invalid_argument("an update cannot change the id or layer of '" + id + "'");

    nlohmann::json after = arch_model::element_to_json(working);
    // Dropped property keys become explicit nulls so the merge removes them.
    for (const auto& item : current->properties.items()) {
        if (!working.properties.contains(item.key())) after["properties"][item.key()] = nullptr;
    }
    if (current->description && !working.description) after["description"] = nullptr;

    auto record = ChangeRecord::make_update(id, current->layer, arch_model::element_to_json(*current),
        std::move(after));
    return route(std::move(record), active);
}

MutationResult MutationHandler::execute_delete(const std::string& id) {
    const auto active = staging_.active();
    const auto current = current_element(active, id);
    if (!current) throw arch_model::NotFoundError("element '" + id + "' not found", id);

    auto record = ChangeRecord::make_delete(id, current->layer, arch_model::element_to_json(*current));
    return route(std::move(record), active);
}

MutationResult MutationHandler::route(ChangeRecord record, const std::optional<Changeset>& active) {
    if (active) {
        auto staged = staging_.stage(std::move(record));
        return MutationResult{std::move(staged), true, active->id()};
    }

    arch_storage::ModelTransaction tx(model_);
    apply_change(model_.graph(), record);

    arch_storage::PersistPlan plan;
    plan.layers.insert(record.layer());
    plan.relationships = true;
    tx.commit(plan);

    logger()->info("element_{} id={} layer={}", change_type_name(record.type()), record.element_id(),
        record.layer());
    return MutationResult{std::move(record), false, std::nullopt};
}

} // namespace arch_staging
