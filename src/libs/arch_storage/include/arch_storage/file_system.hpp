#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace arch_storage {

// Every byte the store reads or writes goes through this seam. Failures are
// reported as arch_model::PersistenceError naming the path.
class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual bool exists(const std::filesystem::path& path) const = 0;
    virtual std::string read_file(const std::filesystem::path& path) const = 0;
    virtual void write_file(const std::filesystem::path& path, const std::string& content) = 0;
    // Replaces `to` if it exists.
    virtual void rename(const std::filesystem::path& from, const std::filesystem::path& to) = 0;
    virtual bool remove(const std::filesystem::path& path) = 0;
    virtual void remove_all(const std::filesystem::path& path) = 0;
    virtual void create_directories(const std::filesystem::path& path) = 0;
    // Names of the direct children, sorted.
    virtual std::vector<std::string> list_directory(const std::filesystem::path& path) const = 0;
};

class LocalFileSystem : public FileSystem {
public:
    bool exists(const std::filesystem::path& path) const override;
    std::string read_file(const std::filesystem::path& path) const override;
    void write_file(const std::filesystem::path& path, const std::string& content) override;
    void rename(const std::filesystem::path& from, const std::filesystem::path& to) override;
    bool remove(const std::filesystem::path& path) override;
    void remove_all(const std::filesystem::path& path) override;
    void create_directories(const std::filesystem::path& path) override;
    std::vector<std::string> list_directory(const std::filesystem::path& path) const override;
};

// Documents are written pretty-printed, 2-space indent, keys sorted.
std::string dump_document(const nlohmann::json& doc);

// Throws PersistenceError naming the file when it cannot be read or parsed.
nlohmann::json read_document(const FileSystem& fs, const std::filesystem::path& path);

} // namespace arch_storage
