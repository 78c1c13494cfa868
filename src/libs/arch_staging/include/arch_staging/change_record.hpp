#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace arch_staging {

enum class ChangeType { Add, Update, Delete };

const char* change_type_name(ChangeType type);
std::optional<ChangeType> change_type_from_string(const std::string& s);

// Current time as ISO-8601 UTC, millisecond precision.
std::string utc_timestamp();

// One delta against one element. Built only through the factories, which
// reject records missing the fields their type needs; the sequence number
// is handed out by the owning Changeset.
class ChangeRecord {
public:
    // `after` is the full element document.
    static ChangeRecord make_add(std::string element_id, std::string layer, nlohmann::json after,
        std::string timestamp = {});
    // `after` carries the fields to merge; its properties are a merge patch.
    static ChangeRecord make_update(std::string element_id, std::string layer, nlohmann::json before,
        nlohmann::json after, std::string timestamp = {});
    static ChangeRecord make_delete(std::string element_id, std::string layer, nlohmann::json before,
        std::string timestamp = {});

    ChangeType type() const { return type_; }
    const std::string& element_id() const { return element_id_; }
    const std::string& layer() const { return layer_; }
    std::size_t sequence_number() const { return sequence_number_; }
    const nlohmann::json& before() const { return before_; }
    const nlohmann::json& after() const { return after_; }
    const std::string& timestamp() const { return timestamp_; }

    bool operator==(const ChangeRecord& o) const {
        return type_ == o.type_ && element_id_ == o.element_id_ && layer_ == o.layer_ &&
            sequence_number_ == o.sequence_number_ && before_ == o.before_ && after_ == o.after_ &&
            timestamp_ == o.timestamp_;
    }

private:
    friend class Changeset;

    ChangeRecord(ChangeType type, std::string element_id, std::string layer, nlohmann::json before,
        nlohmann::json after, std::string timestamp);

    ChangeType type_ = ChangeType::Add;
    std::string element_id_;
    std::string layer_;
    std::size_t sequence_number_ = 0;
    nlohmann::json before_;
    nlohmann::json after_;
    std::string timestamp_;
};

nlohmann::json change_record_to_json(const ChangeRecord& record);
// Rebuilds through the factories; std::invalid_argument on a bad record.
// The stored sequence number is returned separately so the log can be
// ordered before the Changeset renumbers it.
std::pair<ChangeRecord, std::size_t> change_record_from_json(const nlohmann::json& j);

} // namespace arch_staging
