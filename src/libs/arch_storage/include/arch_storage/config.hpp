#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace arch_storage {

inline constexpr const char* config_file_name = "archstage.json";

struct StoreConfig {
    std::string model_dir = "archmodel";
    std::string log_level = "info";
    std::string log_file;                       // empty: console only
    std::string changeset_id_prefix = "changeset";
};

// nullopt when the file is missing or not a JSON object.
std::optional<StoreConfig> load_store_config_file(const std::filesystem::path& path);

// Reads <root>/archstage.json; missing file gives defaults, a malformed one
// gives defaults plus a warning.
StoreConfig load_store_config(const std::filesystem::path& root);

// Walks up from `start` looking for a directory that holds a model.
std::optional<std::filesystem::path> find_model_root(const std::filesystem::path& start,
    const std::string& model_dir = StoreConfig{}.model_dir);

} // namespace arch_storage
