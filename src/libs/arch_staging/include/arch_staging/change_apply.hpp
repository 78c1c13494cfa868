#pragma once

#include <arch_model/graph_view.hpp>
#include <arch_staging/change_record.hpp>
#include <set>
#include <string>
#include <vector>

namespace arch_staging {

// Elements removed so far in one replay.
struct ReplayState {
    std::set<std::string> deleted;
};

// The one merge algorithm. Projection and commit both replay through it.
//   add:    inserts the after document; ConflictError if the element exists.
//   update: merges the after document (properties as merge patch, references
//           and relationships replaced); NotFoundError if absent,
//           ConflictError if deleted earlier in the same replay.
//   delete: removes the element and its edges; NotFoundError if absent.
void apply_change(arch_model::MutableGraph& graph, const ChangeRecord& record, ReplayState& state);
void apply_change(arch_model::MutableGraph& graph, const ChangeRecord& record);

// Replays in sequence-number order.
void apply_changes(arch_model::MutableGraph& graph, const std::vector<ChangeRecord>& records);

} // namespace arch_staging
