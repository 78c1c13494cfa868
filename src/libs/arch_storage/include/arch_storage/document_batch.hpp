#pragma once

#include <arch_storage/file_system.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace arch_storage {

// Multi-file write that lands all documents or none of them.
//
// commit() stages every document as "<path>.tmp", then swaps each into place,
// parking the previous version as "<path>.bak". A failure in either phase
// removes the temp files, puts the parked versions back and throws
// PersistenceError. Backups are dropped only after every swap succeeded.
class DocumentBatch {
public:
    explicit DocumentBatch(FileSystem& fs);

    void put(const std::filesystem::path& path, const nlohmann::json& doc);
    void put_text(const std::filesystem::path& path, std::string content);

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    std::vector<std::filesystem::path> paths() const;

    void commit();

private:
    struct Entry {
        std::filesystem::path path;
        std::string content;
    };

    static std::filesystem::path temp_path(const std::filesystem::path& path);
    static std::filesystem::path backup_path(const std::filesystem::path& path);

    void roll_back(std::size_t staged, const std::vector<bool>& backed_up, std::size_t swapped);

    FileSystem& fs_;
    std::vector<Entry> entries_;
};

} // namespace arch_storage
