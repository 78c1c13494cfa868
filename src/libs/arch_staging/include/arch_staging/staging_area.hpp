#pragma once

#include <arch_staging/base_snapshot.hpp>
#include <arch_staging/change_record.hpp>
#include <arch_staging/changeset.hpp>
#include <arch_staging/changeset_storage.hpp>
#include <arch_staging/validation.hpp>
#include <arch_staging/virtual_projection.hpp>
#include <arch_storage/model.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace arch_staging {

struct CommitOptions {
    bool skip_validation = false;
    bool skip_drift_check = false;
    bool dry_run = false;   // stop after validation and report
};

struct CommitResult {
    std::string changeset_id;
    bool dry_run = false;
    ChangesetStats applied;
    std::vector<std::string> affected_layers;
    std::string base_hash;      // model hash before the commit
    std::string new_hash;       // empty for a dry run
    ModelDiff diff;
    std::vector<Violation> findings;   // non-blocking validation output
};

// Latest record of one element in each of two changesets.
struct ElementComparison {
    std::string element_id;
    std::string layer;
    std::optional<ChangeType> in_a;
    std::optional<ChangeType> in_b;
};

// Elements touched by two changesets, sorted by id. An element changed by
// both conflicts unless both end in the same operation with the same
// after state (two deletes never conflict).
struct ChangesetComparison {
    std::string changeset_a;
    std::string changeset_b;
    std::vector<ElementComparison> only_in_a;
    std::vector<ElementComparison> only_in_b;
    std::vector<ElementComparison> conflicting;
    std::vector<ElementComparison> same_in_both;

    bool has_conflicts() const { return !conflicting.empty(); }
};

struct StagingStatistics {
    std::size_t changesets = 0;
    std::size_t draft = 0;
    std::size_t staged = 0;
    std::size_t committed = 0;
    std::size_t discarded = 0;
    std::size_t open_changes = 0;   // records held by draft and staged changesets
    std::optional<std::string> active;
};

struct ChangesetStatusReport {
    Changeset changeset;
    bool active = false;
    std::optional<DriftReport> drift;   // only for open changesets
};

// Owns the changeset lifecycle for one model root, including the single
// persisted active pointer.
class StagingAreaManager {
public:
    explicit StagingAreaManager(arch_storage::Model& model, Validator validator = reference_validator());

    arch_storage::Model& model() { return model_; }
    const ChangesetStorage& storage() const { return storage_; }
    void set_validator(Validator validator) { validator_ = std::move(validator); }

    // Captures the base snapshot and persists an empty draft.
    Changeset create(const std::string& name, const std::string& description = {});
    // Id first, then unique name.
    Changeset load(const std::string& id_or_name) const;
    std::vector<Changeset> list(std::optional<ChangesetStatus> status = std::nullopt) const;
    void remove(const std::string& id_or_name);

    // Only draft or staged changesets can be activated.
    void set_active(const std::string& id_or_name);
    std::optional<Changeset> active() const;
    std::optional<std::string> active_id() const;
    void clear_active();

    // Appends to the active changeset; InvalidStateError if none is active.
    // Nothing is saved unless the extended log replays on the model, so a
    // record that does not apply throws the replay error (NotFoundError,
    // ReferenceError, ...) and leaves the changeset as it was.
    ChangeRecord stage(ChangeRecord record);
    // Removes every record for the element from the active changeset.
    std::size_t unstage(const std::string& element_id);
    void discard(const std::string& id_or_name);

    ChangesetStatusReport status(const std::string& id_or_name) const;
    ProjectedModel preview(const std::string& id_or_name) const;
    ModelDiff diff(const std::string& id_or_name) const;
    ChangesetComparison compare(const std::string& a, const std::string& b) const;
    StagingStatistics statistics() const;

    // load -> require staged -> drift check -> validate projection ->
    // (dry run stops) -> apply to graph -> persist model + changeset as one
    // batch -> committed. Any failure leaves graph, manifest and changeset
    // as they were.
    CommitResult commit(const std::string& id_or_name, const CommitOptions& options = {});

    // Stores an externally produced changeset under a fresh id.
    Changeset adopt(const std::string& name, const std::string& description, const std::string& base_snapshot,
        std::vector<ChangeRecord> records, const std::optional<nlohmann::json>& snapshot_detail);

private:
    std::string allocate_id() const;
    Changeset require_active() const;

    arch_storage::Model& model_;
    ChangesetStorage storage_;
    BaseSnapshotManager snapshots_;
    Validator validator_;
};

nlohmann::json changeset_comparison_to_json(const ChangesetComparison& comparison);
nlohmann::json staging_statistics_to_json(const StagingStatistics& statistics);

} // namespace arch_staging
