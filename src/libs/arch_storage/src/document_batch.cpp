#include <arch_storage/document_batch.hpp>
#include <arch_storage/log.hpp>
#include <arch_model/errors.hpp>
#include <algorithm>

namespace arch_storage {

namespace fs = std::filesystem;
using arch_model::PersistenceError;

DocumentBatch::DocumentBatch(FileSystem& fs) : fs_(fs) {}

fs::path DocumentBatch::temp_path(const fs::path& path) {
    return fs::path(path.string() + ".tmp");
}

fs::path DocumentBatch::backup_path(const fs::path& path) {
    return fs::path(path.string() + ".bak");
}

void DocumentBatch::put(const fs::path& path, const nlohmann::json& doc) {
    put_text(path, dump_document(doc));
}

void DocumentBatch::put_text(const fs::path& path, std::string content) {
    // Last write to a path wins.
    for (auto& e : entries_) {
        if (e.path == path) {
            e.content = std::move(content);
            return;
        }
    }
    entries_.push_back(Entry{path, std::move(content)});
}

std::vector<fs::path> DocumentBatch::paths() const {
    std::vector<fs::path> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.path);
    return out;
}

void DocumentBatch::commit() {
    auto log = logger();
    std::vector<bool> backed_up(entries_.size(), false);

    std::size_t staged = 0;
    try {
        for (; staged < entries_.size(); ++staged) {
            const auto& e = entries_[staged];
            if (e.path.has_parent_path()) fs_.create_directories(e.path.parent_path());
            fs_.write_file(temp_path(e.path), e.content);
        }
    } catch (const PersistenceError& err) {
        // The entry that failed may have left a partial temp file.
        roll_back(std::min(staged + 1, entries_.size()), backed_up, 0);
        log->warn("batch_rolled_back phase=stage documents={} error={}", entries_.size(), err.what());
        throw;
    }

    std::size_t swapped = 0;
    try {
        for (; swapped < entries_.size(); ++swapped) {
            const auto& e = entries_[swapped];
            if (fs_.exists(e.path)) {
                fs_.rename(e.path, backup_path(e.path));
                backed_up[swapped] = true;
            }
            fs_.rename(temp_path(e.path), e.path);
        }
    } catch (const PersistenceError& err) {
        roll_back(entries_.size(), backed_up, swapped);
        log->warn("batch_rolled_back phase=swap documents={} error={}", entries_.size(), err.what());
        throw;
    }

    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (backed_up[i]) fs_.remove(backup_path(entries_[i].path));
    }
    log->debug("batch_committed documents={}", entries_.size());
}

void DocumentBatch::roll_back(std::size_t staged, const std::vector<bool>& backed_up, std::size_t swapped) {
    auto log = logger();

    // Entry `swapped` may have been parked without its replacement moving in.
    const std::size_t parked = std::min(swapped + 1, entries_.size());
    for (std::size_t i = parked; i-- > 0;) {
        const auto& path = entries_[i].path;
        if (i < swapped) fs_.remove(path);
        if (!backed_up[i]) continue;
        try {
            fs_.rename(backup_path(path), path);
        } catch (const PersistenceError& e) {
            log->error("restore_failed path={} error={}", path.string(), e.what());
        }
    }
    for (std::size_t i = 0; i < staged; ++i) fs_.remove(temp_path(entries_[i].path));
}

} // namespace arch_storage
