#pragma once

#include <arch_staging/changeset.hpp>
#include <arch_staging/staging_area.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace arch_staging {

inline constexpr const char* exchange_format = "archstage-changeset";
inline constexpr int exchange_version = 1;

struct CompatibilityReport {
    bool compatible = true;
    bool base_snapshot_match = true;
    std::vector<std::string> missing_elements;   // updated or deleted but not in the model
    std::vector<std::string> affected_layers;
    std::vector<std::string> warnings;
};

// Moves changesets between model roots as a single JSON document.
class ChangesetExporter {
public:
    explicit ChangesetExporter(StagingAreaManager& staging);

    nlohmann::json export_changeset(const std::string& id_or_name) const;
    void export_to_file(const std::string& id_or_name, const std::filesystem::path& path) const;

    // Stored under a new id; base snapshot kept, status staged when the log
    // is not empty. std::invalid_argument for a document of another format.
    Changeset import_changeset(const nlohmann::json& doc);
    Changeset import_from_file(const std::filesystem::path& path);

    CompatibilityReport check_compatibility(const Changeset& changeset) const;

private:
    StagingAreaManager& staging_;
};

nlohmann::json compatibility_report_to_json(const CompatibilityReport& report);

} // namespace arch_staging
