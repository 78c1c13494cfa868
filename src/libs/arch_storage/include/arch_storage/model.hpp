#pragma once

#include <arch_model/graph_model.hpp>
#include <arch_model/layer.hpp>
#include <arch_model/manifest.hpp>
#include <arch_storage/config.hpp>
#include <arch_storage/document_batch.hpp>
#include <arch_storage/file_system.hpp>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace arch_storage {

// Which documents one logical write touches.
struct PersistPlan {
    std::set<std::string> layers;
    bool relationships = false;
    bool manifest = false;

    bool empty() const { return layers.empty() && !relationships && !manifest; }
};

// Lets a caller add its own documents (changeset metadata, the active
// pointer) to the batch that carries the model write.
using BatchExtension = std::function<void(DocumentBatch&)>;

// A model root on disk and its in-memory state:
//   <root>/<model_dir>/manifest.json
//   <root>/<model_dir>/layers/<layer>.json
//   <root>/<model_dir>/relationships.json
//   <root>/<model_dir>/changesets/...
class Model {
public:
    Model(FileSystem& fs, std::filesystem::path root, StoreConfig config = {});
    Model(const Model&) = delete;
    Model& operator=(const Model&) = delete;

    bool exists() const;
    // Writes a fresh, empty model. InvalidStateError if one is already there.
    void initialize(arch_model::Manifest manifest);
    // Replaces in-memory state with what is on disk. PersistenceError names
    // the offending file.
    void load();

    const std::filesystem::path& root() const { return root_; }
    std::filesystem::path model_dir() const;
    std::filesystem::path manifest_path() const;
    std::filesystem::path layer_path(const std::string& layer) const;
    std::filesystem::path relationships_path() const;
    std::filesystem::path changesets_dir() const;

    const StoreConfig& config() const { return config_; }
    FileSystem& fs() const { return *fs_; }

    arch_model::GraphModel& graph() { return graph_; }
    const arch_model::GraphModel& graph() const { return graph_; }
    arch_model::Manifest& manifest() { return manifest_; }
    const arch_model::Manifest& manifest() const { return manifest_; }

    arch_model::Layer& layer(const std::string& name);
    const arch_model::Layer* find_layer(const std::string& name) const;
    // Manifest order first, then layers only the graph knows about.
    std::vector<std::string> layer_names() const;

    void save_layer(const std::string& name);
    void save_relationships();
    void save_manifest();
    void save_all();

    // The single write routine. Undeclared layers in the plan are added to
    // the manifest, which is then written too.
    void persist(const PersistPlan& plan, const BatchExtension& extend = {});

private:
    nlohmann::json relationships_document() const;

    FileSystem* fs_;
    std::filesystem::path root_;
    StoreConfig config_;
    arch_model::GraphModel graph_;
    arch_model::Manifest manifest_;
    std::map<std::string, std::unique_ptr<arch_model::Layer>> layers_;
};

bool is_valid_layer_name(const std::string& name);

} // namespace arch_storage
