#include <arch_staging/changeset.hpp>
#include <arch_model/errors.hpp>
#include <algorithm>
#include <set>
#include <stdexcept>

namespace arch_staging {

using arch_model::ConflictError;
using arch_model::InvalidStateError;

const char* changeset_status_name(ChangesetStatus status) {
    switch (status) {
        case ChangesetStatus::Draft: return "draft";
        case ChangesetStatus::Staged: return "staged";
        case ChangesetStatus::Committed: return "committed";
        case ChangesetStatus::Discarded: return "discarded";
    }
    return "";
}

std::optional<ChangesetStatus> changeset_status_from_string(const std::string& s) {
    if (s == "draft") return ChangesetStatus::Draft;
    if (s == "staged") return ChangesetStatus::Staged;
    if (s == "committed") return ChangesetStatus::Committed;
    if (s == "discarded") return ChangesetStatus::Discarded;
    return std::nullopt;
}

Changeset::Changeset(std::string id, std::string name, std::string description, std::string base_snapshot,
    std::string created_at)
    : id_(std::move(id))
    , name_(std::move(name))
    , description_(std::move(description))
    , base_snapshot_(std::move(base_snapshot))
    , created_at_(created_at.empty() ? utc_timestamp() : std::move(created_at))
{
    if (id_.empty()) throw std::invalid_argument("changeset id must not be empty");
    if (name_.empty()) throw std::invalid_argument("changeset name must not be empty");
    modified_at_ = created_at_;
}

Changeset Changeset::restore(std::string id, std::string name, std::string description, std::string base_snapshot,
    ChangesetStatus status, std::string created_at, std::string modified_at, std::vector<ChangeRecord> log)
{
    Changeset cs(std::move(id), std::move(name), std::move(description), std::move(base_snapshot),
        std::move(created_at));
    cs.status_ = status;
    cs.changes_ = std::move(log);
    cs.renumber();
    cs.update_stats();
    if (!modified_at.empty()) cs.modified_at_ = std::move(modified_at);
    return cs;
}

bool Changeset::is_open() const {
    return status_ == ChangesetStatus::Draft || status_ == ChangesetStatus::Staged;
}

const ChangeRecord& Changeset::append(ChangeRecord record) {
    if (!is_open())
        throw InvalidStateError("changeset '" + name_ + "' is " + changeset_status_name(status_)
            + " and cannot take changes");

    const auto& id = record.element_id();
    const auto last = std::find_if(changes_.rbegin(), changes_.rend(),
        [&](const ChangeRecord& r) { return r.element_id() == id; });
    if (last != changes_.rend()) {
        if (last->type() == ChangeType::Delete && record.type() != ChangeType::Add)
            throw ConflictError(std::string(change_type_name(record.type())) + " of '" + id
                + "' after it was deleted in this changeset", id);
        if (last->type() != ChangeType::Delete && record.type() == ChangeType::Add)
            throw ConflictError("add of '" + id + "' which this changeset already adds or updates", id);
    }

    record.sequence_number_ = changes_.size();
    changes_.push_back(std::move(record));
    if (status_ == ChangesetStatus::Draft) status_ = ChangesetStatus::Staged;
    update_stats();
    touch();
    return changes_.back();
}

std::size_t Changeset::remove_element(const std::string& element_id) {
    if (!is_open())
        throw InvalidStateError("changeset '" + name_ + "' is " + changeset_status_name(status_));
    const auto before = changes_.size();
    changes_.erase(std::remove_if(changes_.begin(), changes_.end(),
        [&](const ChangeRecord& r) { return r.element_id() == element_id; }), changes_.end());
    const auto removed = before - changes_.size();
    if (removed == 0) return 0;
    renumber();
    update_stats();
    touch();
    return removed;
}

std::vector<const ChangeRecord*> Changeset::records_for(const std::string& element_id) const {
    std::vector<const ChangeRecord*> out;
    for (const auto& r : changes_) {
        if (r.element_id() == element_id) out.push_back(&r);
    }
    return out;
}

std::vector<std::string> Changeset::affected_layers() const {
    std::set<std::string> layers;
    for (const auto& r : changes_) layers.insert(r.layer());
    return {layers.begin(), layers.end()};
}

std::vector<std::string> Changeset::affected_elements() const {
    std::set<std::string> ids;
    for (const auto& r : changes_) ids.insert(r.element_id());
    return {ids.begin(), ids.end()};
}

void Changeset::update_stats() {
    stats_ = ChangesetStats{};
    for (const auto& r : changes_) {
        switch (r.type()) {
            case ChangeType::Add: ++stats_.additions; break;
            case ChangeType::Update: ++stats_.modifications; break;
            case ChangeType::Delete: ++stats_.deletions; break;
        }
    }
}

void Changeset::mark_staged() {
    if (status_ != ChangesetStatus::Draft)
        throw InvalidStateError("cannot stage changeset '" + name_ + "' from " + changeset_status_name(status_));
    status_ = ChangesetStatus::Staged;
    touch();
}

void Changeset::mark_committed() {
    if (status_ != ChangesetStatus::Staged)
        throw InvalidStateError("cannot commit changeset '" + name_ + "' from " + changeset_status_name(status_));
    status_ = ChangesetStatus::Committed;
    touch();
}

void Changeset::mark_discarded() {
    if (!is_open())
        throw InvalidStateError("cannot discard changeset '" + name_ + "' from " + changeset_status_name(status_));
    status_ = ChangesetStatus::Discarded;
    touch();
}

void Changeset::touch() {
    modified_at_ = utc_timestamp();
}

void Changeset::renumber() {
    for (std::size_t i = 0; i < changes_.size(); ++i) changes_[i].sequence_number_ = i;
}

nlohmann::json changeset_metadata_to_json(const Changeset& changeset) {
    nlohmann::json j;
    j["id"] = changeset.id();
    j["name"] = changeset.name();
    j["description"] = changeset.description();
    j["status"] = changeset_status_name(changeset.status());
    j["base_snapshot"] = changeset.base_snapshot();
    j["created_at"] = changeset.created_at();
    j["modified_at"] = changeset.modified_at();
    j["stats"] = {
        {"additions", changeset.stats().additions},
        {"modifications", changeset.stats().modifications},
        {"deletions", changeset.stats().deletions},
    };
    return j;
}

nlohmann::json change_log_to_json(const Changeset& changeset) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : changeset.changes()) arr.push_back(change_record_to_json(r));
    nlohmann::json j;
    j["changes"] = std::move(arr);
    return j;
}

Changeset changeset_from_json(const nlohmann::json& metadata, const nlohmann::json& log) {
    if (!metadata.is_object()) throw std::invalid_argument("changeset metadata must be an object");
    const auto str = [&](const char* key) {
        return metadata.contains(key) && metadata[key].is_string() ? metadata[key].get<std::string>() : std::string();
    };
    const auto status = changeset_status_from_string(str("status"));
    if (!status) throw std::invalid_argument("changeset metadata has no valid status");

    std::vector<std::pair<ChangeRecord, std::size_t>> entries;
    if (log.is_object() && log.contains("changes")) {
        if (!log["changes"].is_array()) throw std::invalid_argument("'changes' must be an array");
        for (const auto& c : log["changes"]) entries.push_back(change_record_from_json(c));
    }
    std::stable_sort(entries.begin(), entries.end(),
        [](const auto& a, const auto& b) { return a.second < b.second; });

    std::vector<ChangeRecord> records;
    records.reserve(entries.size());
    for (auto& e : entries) records.push_back(std::move(e.first));

    return Changeset::restore(str("id"), str("name"), str("description"), str("base_snapshot"), *status,
        str("created_at"), str("modified_at"), std::move(records));
}

} // namespace arch_staging
