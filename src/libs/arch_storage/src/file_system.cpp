#include <arch_storage/file_system.hpp>
#include <arch_model/errors.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace arch_storage {

namespace fs = std::filesystem;
using arch_model::PersistenceError;

bool LocalFileSystem::exists(const fs::path& path) const {
    std::error_code ec;
    return fs::exists(path, ec);
}

std::string LocalFileSystem::read_file(const fs::path& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw PersistenceError("cannot open '" + path.string() + "' for reading", path.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) throw PersistenceError("read failed for '" + path.string() + "'", path.string());
    return ss.str();
}

void LocalFileSystem::write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw PersistenceError("cannot open '" + path.string() + "' for writing", path.string());
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) throw PersistenceError("write failed for '" + path.string() + "'", path.string());
}

void LocalFileSystem::rename(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec)
        throw PersistenceError("cannot rename '" + from.string() + "' to '" + to.string() + "': " + ec.message(),
            to.string());
}

bool LocalFileSystem::remove(const fs::path& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

void LocalFileSystem::remove_all(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) throw PersistenceError("cannot remove '" + path.string() + "': " + ec.message(), path.string());
}

void LocalFileSystem::create_directories(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) throw PersistenceError("cannot create '" + path.string() + "': " + ec.message(), path.string());
}

std::vector<std::string> LocalFileSystem::list_directory(const fs::path& path) const {
    std::vector<std::string> out;
    std::error_code ec;
    if (!fs::is_directory(path, ec)) return out;
    for (const auto& entry : fs::directory_iterator(path, ec)) out.push_back(entry.path().filename().string());
    if (ec) throw PersistenceError("cannot list '" + path.string() + "': " + ec.message(), path.string());
    std::sort(out.begin(), out.end());
    return out;
}

std::string dump_document(const nlohmann::json& doc) {
    return doc.dump(2) + "\n";
}

nlohmann::json read_document(const FileSystem& fs, const fs::path& path) {
    const std::string text = fs.read_file(path);
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw PersistenceError("malformed document '" + path.string() + "': " + e.what(), path.string());
    }
}

} // namespace arch_storage
