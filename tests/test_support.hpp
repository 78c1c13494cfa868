#pragma once

#include <arch_model/element_json.hpp>
#include <arch_model/errors.hpp>
#include <arch_model/types.hpp>
#include <arch_staging/change_record.hpp>
#include <arch_storage/file_system.hpp>
#include <arch_storage/log.hpp>
#include <arch_storage/model.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace archstage_test {

inline arch_model::Node make_node(const std::string& layer, const std::string& type, const std::string& name) {
    arch_model::Node n;
    n.id = layer + "." + type + "." + name;
    n.layer = layer;
    n.type = type;
    n.name = name;
    return n;
}

inline arch_model::Element make_element(const std::string& layer, const std::string& type, const std::string& name) {
    arch_model::Element e;
    e.id = layer + "." + type + "." + name;
    e.layer = layer;
    e.type = type;
    e.name = name;
    return e;
}

inline arch_staging::ChangeRecord add_record(const arch_model::Element& e) {
    return arch_staging::ChangeRecord::make_add(e.id, e.layer, arch_model::element_to_json(e));
}

inline arch_staging::ChangeRecord update_record(const std::string& id, const std::string& layer,
    nlohmann::json after)
{
    after["id"] = id;
    after["layer"] = layer;
    return arch_staging::ChangeRecord::make_update(id, layer, nullptr, std::move(after));
}

inline arch_staging::ChangeRecord delete_record(const std::string& id, const std::string& layer) {
    return arch_staging::ChangeRecord::make_delete(id, layer, nullptr);
}

// Unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path()
            / ("archstage_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Forwards to a real file system, failing the Nth write or rename once armed.
class FailingFileSystem : public arch_storage::FileSystem {
public:
    explicit FailingFileSystem(arch_storage::FileSystem& inner) : inner_(inner) {}

    // Fails the `n`th mutating call (1-based) from now on; 0 disarms.
    void fail_on(int n) {
        fail_at_ = n;
        calls_ = 0;
    }
    int calls() const { return calls_; }

    bool exists(const std::filesystem::path& path) const override { return inner_.exists(path); }
    std::string read_file(const std::filesystem::path& path) const override { return inner_.read_file(path); }
    void write_file(const std::filesystem::path& path, const std::string& content) override {
        tick(path);
        inner_.write_file(path, content);
    }
    void rename(const std::filesystem::path& from, const std::filesystem::path& to) override {
        tick(to);
        inner_.rename(from, to);
    }
    bool remove(const std::filesystem::path& path) override { return inner_.remove(path); }
    void remove_all(const std::filesystem::path& path) override { inner_.remove_all(path); }
    void create_directories(const std::filesystem::path& path) override { inner_.create_directories(path); }
    std::vector<std::string> list_directory(const std::filesystem::path& path) const override {
        return inner_.list_directory(path);
    }

private:
    void tick(const std::filesystem::path& path) {
        ++calls_;
        if (fail_at_ > 0 && calls_ == fail_at_) {
            fail_at_ = 0;
            throw arch_model::PersistenceError("injected failure on '" + path.string() + "'", path.string());
        }
    }

    arch_storage::FileSystem& inner_;
    int fail_at_ = 0;
    int calls_ = 0;
};

// Initialized model on disk with a business and an application layer:
//   business.service.billing, business.service.payments (billing -serves-> payments)
//   application.component.api (references billing)
class ModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        arch_storage::logger()->set_level(spdlog::level::warn);
        model = std::make_unique<arch_storage::Model>(fs, dir.path());

        arch_model::Manifest manifest;
        manifest.name = "test-model";
        manifest.declare_layer("business");
        manifest.declare_layer("application");
        model->initialize(manifest);

        auto billing = make_node("business", "service", "billing");
        billing.properties = {{"owner", "finance"}, {"tier", 1}};
        model->graph().add_node(billing);
        model->graph().add_node(make_node("business", "service", "payments"));
        auto api = make_node("application", "component", "api");
        api.references.push_back(arch_model::Reference{"business.service.billing", "realizes", ""});
        model->graph().add_node(api);

        arch_model::Edge e;
        e.source = "business.service.billing";
        e.destination = "business.service.payments";
        e.predicate = "serves";
        model->graph().add_edge(e);
        model->save_all();
    }

    // Fresh in-memory copy of what is on disk.
    std::unique_ptr<arch_storage::Model> reload() {
        auto m = std::make_unique<arch_storage::Model>(fs, dir.path());
        m->load();
        return m;
    }

    TempDir dir;
    arch_storage::LocalFileSystem fs;
    std::unique_ptr<arch_storage::Model> model;
};

} // namespace archstage_test
