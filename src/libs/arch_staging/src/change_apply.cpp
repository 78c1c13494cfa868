#include <arch_staging/change_apply.hpp>
#include <arch_model/element_json.hpp>
#include <arch_model/element_ops.hpp>
#include <arch_model/errors.hpp>
#include <algorithm>
#include <stdexcept>

namespace arch_staging {

using arch_model::ConflictError;
using arch_model::NotFoundError;

void apply_change(arch_model::MutableGraph& graph, const ChangeRecord& record, ReplayState& state) {
    const auto& id = record.element_id();
    switch (record.type()) {
        case ChangeType::Add: {
            if (graph.has_node(id)) throw ConflictError("cannot add '" + id + "': element already exists", id);
            auto element = arch_model::element_from_json(record.after());
            if (!element) throw std::invalid_argument("add of '" + id + "' carries a malformed element");
            arch_model::insert_element(graph, *element);
            state.deleted.erase(id);
            break;
        }
        case ChangeType::Update: {
            if (!graph.has_node(id)) {
                if (state.deleted.count(id))
                    throw ConflictError("cannot update '" + id + "': deleted earlier in this changeset", id);
                throw NotFoundError("cannot update '" + id + "': element not found", id);
            }
            arch_model::merge_element(graph, id, arch_model::patch_from_json(record.after()));
            break;
        }
        case ChangeType::Delete: {
            if (!graph.has_node(id)) {
                if (state.deleted.count(id))
                    throw ConflictError("cannot delete '" + id + "': deleted earlier in this changeset", id);
                throw NotFoundError("cannot delete '" + id + "': element not found", id);
            }
            arch_model::erase_element(graph, id);
            state.deleted.insert(id);
            break;
        }
    }
}

void apply_change(arch_model::MutableGraph& graph, const ChangeRecord& record) {
    ReplayState state;
    apply_change(graph, record, state);
}

void apply_changes(arch_model::MutableGraph& graph, const std::vector<ChangeRecord>& records) {
    std::vector<const ChangeRecord*> ordered;
    ordered.reserve(records.size());
    for (const auto& r : records) ordered.push_back(&r);
    std::stable_sort(ordered.begin(), ordered.end(),
        [](const ChangeRecord* a, const ChangeRecord* b) { return a->sequence_number() < b->sequence_number(); });

    ReplayState state;
    for (const auto* r : ordered) apply_change(graph, *r, state);
}

} // namespace arch_staging
