#pragma once

#include <arch_staging/changeset.hpp>
#include <arch_storage/document_batch.hpp>
#include <arch_storage/file_system.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace arch_staging {

// On-disk home of changesets:
//   <dir>/<id>/metadata.json   id, name, status, base snapshot, stats, timestamps
//   <dir>/<id>/changes.json    ordered change log
//   <dir>/<id>/snapshot.json   per-element digests of the base
//   <dir>/.active              id of the active changeset, empty when none
class ChangesetStorage {
public:
    ChangesetStorage(arch_storage::FileSystem& fs, std::filesystem::path dir);

    const std::filesystem::path& dir() const { return dir_; }
    std::filesystem::path changeset_dir(const std::string& id) const;
    std::filesystem::path active_path() const;

    bool exists(const std::string& id) const;
    // NotFoundError when absent, PersistenceError when unreadable.
    Changeset load(const std::string& id) const;
    std::vector<std::string> list_ids() const;

    // Metadata and log land together.
    void save(const Changeset& changeset);
    // Also writes the snapshot detail when one is given.
    void save(const Changeset& changeset, const nlohmann::json& snapshot_detail);
    void add_to_batch(arch_storage::DocumentBatch& batch, const Changeset& changeset) const;
    std::optional<nlohmann::json> load_snapshot_detail(const std::string& id) const;
    void remove(const std::string& id);

    std::optional<std::string> read_active() const;
    void write_active(const std::string& id);
    void clear_active();
    void add_active_to_batch(arch_storage::DocumentBatch& batch, const std::string& id) const;

private:
    arch_storage::FileSystem& fs_;
    std::filesystem::path dir_;
};

} // namespace arch_staging
