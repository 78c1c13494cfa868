#include <arch_staging/change_record.hpp>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace arch_staging {

const char* change_type_name(ChangeType type) {
    switch (type) {
        case ChangeType::Add: return "add";
        case ChangeType::Update: return "update";
        case ChangeType::Delete: return "delete";
    }
    return "";
}

std::optional<ChangeType> change_type_from_string(const std::string& s) {
    if (s == "add") return ChangeType::Add;
    if (s == "update") return ChangeType::Update;
    if (s == "delete") return ChangeType::Delete;
    return std::nullopt;
}

std::string utc_timestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t t = system_clock::to_time_t(now);
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
    return out;
}

namespace {

void require_ids(const std::string& element_id, const std::string& layer) {
    if (element_id.empty()) throw std::invalid_argument("change record needs an element id");
    if (layer.empty()) throw std::invalid_argument("change record for '" + element_id + "' needs a layer");
}

void require_state(const nlohmann::json& state, const char* which, const std::string& element_id,
    const std::string& layer)
{
    if (!state.is_object())
        throw std::invalid_argument(std::string("change record for '") + element_id + "' needs an " + which + " state");
    if (state.contains("id") && (!state["id"].is_string() || state["id"].get<std::string>() != element_id))
        throw std::invalid_argument(std::string(which) + " state id does not match '" + element_id + "'");
    if (state.contains("layer") && (!state["layer"].is_string() || state["layer"].get<std::string>() != layer))
        throw std::invalid_argument(std::string(which) + " state layer does not match '" + layer + "'");
}

} // namespace

ChangeRecord::ChangeRecord(ChangeType type, std::string element_id, std::string layer, nlohmann::json before,
    nlohmann::json after, std::string timestamp)
    : type_(type)
    , element_id_(std::move(element_id))
    , layer_(std::move(layer))
    , before_(std::move(before))
    , after_(std::move(after))
    , timestamp_(timestamp.empty() ? utc_timestamp() : std::move(timestamp))
{}

ChangeRecord ChangeRecord::make_add(std::string element_id, std::string layer, nlohmann::json after,
    std::string timestamp)
{
    require_ids(element_id, layer);
    require_state(after, "after", element_id, layer);
    if (!after.contains("id")) after["id"] = element_id;
    if (!after.contains("layer")) after["layer"] = layer;
    return ChangeRecord(ChangeType::Add, std::move(element_id), std::move(layer), nullptr, std::move(after),
        std::move(timestamp));
}

ChangeRecord ChangeRecord::make_update(std::string element_id, std::string layer, nlohmann::json before,
    nlohmann::json after, std::string timestamp)
{
    require_ids(element_id, layer);
    require_state(after, "after", element_id, layer);
    if (!before.is_null()) require_state(before, "before", element_id, layer);
    return ChangeRecord(ChangeType::Update, std::move(element_id), std::move(layer), std::move(before),
        std::move(after), std::move(timestamp));
}

ChangeRecord ChangeRecord::make_delete(std::string element_id, std::string layer, nlohmann::json before,
    std::string timestamp)
{
    require_ids(element_id, layer);
    if (!before.is_null()) require_state(before, "before", element_id, layer);
    return ChangeRecord(ChangeType::Delete, std::move(element_id), std::move(layer), std::move(before), nullptr,
        std::move(timestamp));
}

nlohmann::json change_record_to_json(const ChangeRecord& record) {
    nlohmann::json j;
    j["type"] = change_type_name(record.type());
    j["element_id"] = record.element_id();
    j["layer"] = record.layer();
    j["sequence_number"] = record.sequence_number();
    j["before"] = record.before();
    j["after"] = record.after();
    j["timestamp"] = record.timestamp();
    return j;
}

std::pair<ChangeRecord, std::size_t> change_record_from_json(const nlohmann::json& j) {
    if (!j.is_object()) throw std::invalid_argument("change record must be an object");
    if (!j.contains("type") || !j["type"].is_string()) throw std::invalid_argument("change record has no type");
    const auto type = change_type_from_string(j["type"].get<std::string>());
    if (!type) throw std::invalid_argument("unknown change type '" + j["type"].get<std::string>() + "'");

    const auto str = [&](const char* key) {
        return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : std::string();
    };
    const auto state = [&](const char* key) {
        return j.contains(key) ? j[key] : nlohmann::json();
    };
    std::size_t seq = 0;
    if (j.contains("sequence_number") && j["sequence_number"].is_number_unsigned())
        seq = j["sequence_number"].get<std::size_t>();

    switch (*type) {
        case ChangeType::Add:
            return {ChangeRecord::make_add(str("element_id"), str("layer"), state("after"), str("timestamp")), seq};
        case ChangeType::Update:
            return {ChangeRecord::make_update(str("element_id"), str("layer"), state("before"), state("after"),
                str("timestamp")), seq};
        case ChangeType::Delete:
            return {ChangeRecord::make_delete(str("element_id"), str("layer"), state("before"), str("timestamp")), seq};
    }
    throw std::invalid_argument("unknown change type");
}

} // namespace arch_staging
