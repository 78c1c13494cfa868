#include <arch_storage/config.hpp>
#include <arch_storage/log.hpp>
#include <nlohmann/json.hpp>
#include <fstream>

namespace arch_storage {

namespace {

void read_string(const nlohmann::json& j, const char* key, std::string& out) {
    if (j.contains(key) && j[key].is_string()) out = j[key].get<std::string>();
}

} // namespace

std::optional<StoreConfig> load_store_config_file(const std::filesystem::path& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        logger()->warn("config_parse_failed file={} error={}", path.string(), e.what());
        return std::nullopt;
    }
    if (!j.is_object()) return std::nullopt;

    StoreConfig config;
    read_string(j, "model_dir", config.model_dir);
    read_string(j, "log_level", config.log_level);
    read_string(j, "log_file", config.log_file);
    read_string(j, "changeset_id_prefix", config.changeset_id_prefix);
    if (config.model_dir.empty()) config.model_dir = StoreConfig{}.model_dir;
    if (config.changeset_id_prefix.empty()) config.changeset_id_prefix = StoreConfig{}.changeset_id_prefix;
    return config;
}

StoreConfig load_store_config(const std::filesystem::path& root) {
    const auto path = root / config_file_name;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return StoreConfig{};
    if (auto config = load_store_config_file(path)) return *config;
    logger()->warn("config_ignored file={} using defaults", path.string());
    return StoreConfig{};
}

std::optional<std::filesystem::path> find_model_root(const std::filesystem::path& start,
    const std::string& model_dir)
{
    std::error_code ec;
    std::filesystem::path p = std::filesystem::absolute(start, ec);
    if (ec) p = start;
    for (int i = 0; i < 32; ++i) {
        if (std::filesystem::exists(p / model_dir / "manifest.json", ec)) return p;
        if (!p.has_parent_path() || p.parent_path() == p) break;
        p = p.parent_path();
    }
    return std::nullopt;
}

} // namespace arch_storage
