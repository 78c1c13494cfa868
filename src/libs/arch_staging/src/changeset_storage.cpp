#include <arch_staging/changeset_storage.hpp>
#include <arch_model/errors.hpp>
#include <stdexcept>

namespace arch_staging {

namespace fs = std::filesystem;
using arch_model::PersistenceError;

namespace {

const char* const metadata_file = "metadata.json";
const char* const changes_file = "changes.json";
const char* const snapshot_file = "snapshot.json";

bool is_valid_id(const std::string& id) {
    if (id.empty() || id.front() == '.') return false;
    return id.find('/') == std::string::npos && id.find('\\') == std::string::npos;
}

std::string trim(std::string s) {
    const auto ws = " \t\r\n";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // namespace

ChangesetStorage::ChangesetStorage(arch_storage::FileSystem& fs, fs::path dir)
    : fs_(fs), dir_(std::move(dir)) {}

fs::path ChangesetStorage::changeset_dir(const std::string& id) const {
    if (!is_valid_id(id)) throw std::invalid_argument("invalid changeset id '" + id + "'");
    return dir_ / id;
}

fs::path ChangesetStorage::active_path() const {
    return dir_ / ".active";
}

bool ChangesetStorage::exists(const std::string& id) const {
    if (!is_valid_id(id)) return false;
    return fs_.exists(dir_ / id / metadata_file);
}

Changeset ChangesetStorage::load(const std::string& id) const {
    if (!exists(id)) throw arch_model::NotFoundError("changeset '" + id + "' not found", id);

    const auto base = changeset_dir(id);
    const auto metadata = arch_storage::read_document(fs_, base / metadata_file);
    nlohmann::json log = nlohmann::json::object();
    if (fs_.exists(base / changes_file)) log = arch_storage::read_document(fs_, base / changes_file);
    try {
        return changeset_from_json(metadata, log);
    } catch (const std::invalid_argument& e) {
        throw PersistenceError("malformed changeset '" + base.string() + "': " + e.what(), base.string());
    }
}

std::vector<std::string> ChangesetStorage::list_ids() const {
    std::vector<std::string> out;
    for (const auto& name : fs_.list_directory(dir_)) {
        if (exists(name)) out.push_back(name);
    }
    return out;
}

void ChangesetStorage::add_to_batch(arch_storage::DocumentBatch& batch, const Changeset& changeset) const {
    const auto base = changeset_dir(changeset.id());
    batch.put(base / metadata_file, changeset_metadata_to_json(changeset));
    batch.put(base / changes_file, change_log_to_json(changeset));
}

void ChangesetStorage::save(const Changeset& changeset) {
    arch_storage::DocumentBatch batch(fs_);
    add_to_batch(batch, changeset);
    batch.commit();
}

void ChangesetStorage::save(const Changeset& changeset, const nlohmann::json& snapshot_detail) {
    arch_storage::DocumentBatch batch(fs_);
    add_to_batch(batch, changeset);
    batch.put(changeset_dir(changeset.id()) / snapshot_file, snapshot_detail);
    batch.commit();
}

std::optional<nlohmann::json> ChangesetStorage::load_snapshot_detail(const std::string& id) const {
    const auto path = changeset_dir(id) / snapshot_file;
    if (!fs_.exists(path)) return std::nullopt;
    return arch_storage::read_document(fs_, path);
}

void ChangesetStorage::remove(const std::string& id) {
    if (!exists(id)) throw arch_model::NotFoundError("changeset '" + id + "' not found", id);
    fs_.remove_all(changeset_dir(id));
}

std::optional<std::string> ChangesetStorage::read_active() const {
    if (!fs_.exists(active_path())) return std::nullopt;
    auto id = trim(fs_.read_file(active_path()));
    if (id.empty()) return std::nullopt;
    return id;
}

void ChangesetStorage::write_active(const std::string& id) {
    arch_storage::DocumentBatch batch(fs_);
    add_active_to_batch(batch, id);
    batch.commit();
}

void ChangesetStorage::clear_active() {
    if (!fs_.exists(active_path())) return;
    write_active({});
}

void ChangesetStorage::add_active_to_batch(arch_storage::DocumentBatch& batch, const std::string& id) const {
    batch.put_text(active_path(), id.empty() ? std::string() : id + "\n");
}

} // namespace arch_staging
