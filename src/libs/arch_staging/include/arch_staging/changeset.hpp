#pragma once

#include <arch_staging/change_record.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace arch_staging {

enum class ChangesetStatus { Draft, Staged, Committed, Discarded };

const char* changeset_status_name(ChangesetStatus status);
std::optional<ChangesetStatus> changeset_status_from_string(const std::string& s);

// Always derived from the log by update_stats().
struct ChangesetStats {
    std::size_t additions = 0;
    std::size_t modifications = 0;
    std::size_t deletions = 0;

    std::size_t total() const { return additions + modifications + deletions; }
    bool operator==(const ChangesetStats& o) const {
        return additions == o.additions && modifications == o.modifications && deletions == o.deletions;
    }
};

// Named, ordered log of changes plus the base hash it branched from.
//
// Status: draft -> staged -> committed | discarded, and draft -> discarded.
// Sequence numbers are 0..n-1 in log order at all times.
class Changeset {
public:
    Changeset(std::string id, std::string name, std::string description, std::string base_snapshot,
        std::string created_at = {});

    // Rebuilds a stored changeset. The log is renumbered in the given order.
    static Changeset restore(std::string id, std::string name, std::string description, std::string base_snapshot,
        ChangesetStatus status, std::string created_at, std::string modified_at, std::vector<ChangeRecord> log);

    const std::string& id() const { return id_; }
    const std::string& name() const { return name_; }
    const std::string& description() const { return description_; }
    const std::string& base_snapshot() const { return base_snapshot_; }
    ChangesetStatus status() const { return status_; }
    const std::string& created_at() const { return created_at_; }
    const std::string& modified_at() const { return modified_at_; }
    const std::vector<ChangeRecord>& changes() const { return changes_; }
    const ChangesetStats& stats() const { return stats_; }

    // Draft or staged.
    bool is_open() const;

    // Numbers the record and appends it; the first append moves a draft to
    // staged. ConflictError for an update/delete after a delete of the same
    // element, or an add after an add/update of it.
    const ChangeRecord& append(ChangeRecord record);
    // Drops every record for the element and renumbers. Returns the count.
    std::size_t remove_element(const std::string& element_id);

    std::vector<const ChangeRecord*> records_for(const std::string& element_id) const;
    // Sorted, unique.
    std::vector<std::string> affected_layers() const;
    std::vector<std::string> affected_elements() const;

    void update_stats();

    void mark_staged();
    void mark_committed();
    void mark_discarded();

private:
    void touch();
    void renumber();

    std::string id_;
    std::string name_;
    std::string description_;
    std::string base_snapshot_;
    ChangesetStatus status_ = ChangesetStatus::Draft;
    std::string created_at_;
    std::string modified_at_;
    std::vector<ChangeRecord> changes_;
    ChangesetStats stats_;
};

nlohmann::json changeset_metadata_to_json(const Changeset& changeset);
nlohmann::json change_log_to_json(const Changeset& changeset);
// std::invalid_argument on malformed documents.
Changeset changeset_from_json(const nlohmann::json& metadata, const nlohmann::json& log);

} // namespace arch_staging
