#include <arch_storage/model.hpp>
#include <arch_storage/log.hpp>
#include <arch_model/element_json.hpp>
#include <arch_model/errors.hpp>
#include <stdexcept>

namespace arch_storage {

namespace fs = std::filesystem;
using arch_model::PersistenceError;

bool is_valid_layer_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    for (const char c : name) {
        if (c == '/' || c == '\\' || c == '.') return false;
    }
    return true;
}

Model::Model(FileSystem& fs, fs::path root, StoreConfig config)
    : fs_(&fs), root_(std::move(root)), config_(std::move(config)) {}

fs::path Model::model_dir() const { return root_ / config_.model_dir; }
fs::path Model::manifest_path() const { return model_dir() / "manifest.json"; }
fs::path Model::layer_path(const std::string& layer) const { return model_dir() / "layers" / (layer + ".json"); }
fs::path Model::relationships_path() const { return model_dir() / "relationships.json"; }
fs::path Model::changesets_dir() const { return model_dir() / "changesets"; }

bool Model::exists() const {
    return fs_->exists(manifest_path());
}

void Model::initialize(arch_model::Manifest manifest) {
    if (exists()) throw arch_model::InvalidStateError("a model already exists at '" + model_dir().string() + "'");
    for (const auto& l : manifest.layers) {
        if (!is_valid_layer_name(l)) throw std::invalid_argument("invalid layer name '" + l + "'");
    }

    graph_.clear();
    layers_.clear();
    manifest_ = std::move(manifest);
    fs_->create_directories(changesets_dir());
    save_all();
    logger()->info("model_initialized root={} name={}", root_.string(), manifest_.name);
}

void Model::load() {
    if (!exists()) throw PersistenceError("no model at '" + model_dir().string() + "'", manifest_path().string());

    graph_.clear();
    layers_.clear();
    try {
        const auto manifest = arch_model::manifest_from_json(read_document(*fs_, manifest_path()));
        if (!manifest) throw PersistenceError("malformed manifest '" + manifest_path().string() + "'",
            manifest_path().string());
        manifest_ = *manifest;

        for (const auto& name : manifest_.layers) {
            if (!is_valid_layer_name(name))
                throw PersistenceError("invalid layer name '" + name + "' in manifest", manifest_path().string());
            const auto path = layer_path(name);
            if (!fs_->exists(path)) continue;
            const auto doc = read_document(*fs_, path);
            try {
                layer(name).load_document(doc);
            } catch (const std::invalid_argument& e) {
                throw PersistenceError("malformed layer '" + path.string() + "': " + e.what(), path.string());
            } catch (const arch_model::DuplicateError& e) {
                throw PersistenceError("malformed layer '" + path.string() + "': " + e.what(), path.string());
            }
        }

        const auto rel_path = relationships_path();
        if (fs_->exists(rel_path)) {
            const auto doc = read_document(*fs_, rel_path);
            if (!doc.is_object() || !doc.contains("relationships") || !doc["relationships"].is_array())
                throw PersistenceError("malformed relationships '" + rel_path.string() + "'", rel_path.string());
            for (const auto& e : doc["relationships"]) {
                auto edge = arch_model::edge_from_json(e);
                if (!edge) throw PersistenceError("malformed relationship in '" + rel_path.string() + "'",
                    rel_path.string());
                try {
                    graph_.add_edge(std::move(*edge));
                } catch (const arch_model::ModelError& err) {
                    throw PersistenceError("bad relationship in '" + rel_path.string() + "': " + err.what(),
                        rel_path.string());
                }
            }
        }
    } catch (const PersistenceError&) {
        graph_.clear();
        layers_.clear();
        throw;
    }
    logger()->info("model_loaded root={} layers={} nodes={} edges={}",
        root_.string(), manifest_.layers.size(), graph_.node_count(), graph_.edge_count());
}

arch_model::Layer& Model::layer(const std::string& name) {
    auto it = layers_.find(name);
    if (it == layers_.end())
        it = layers_.emplace(name, std::make_unique<arch_model::Layer>(name, graph_)).first;
    return *it->second;
}

const arch_model::Layer* Model::find_layer(const std::string& name) const {
    const auto it = layers_.find(name);
    return it == layers_.end() ? nullptr : it->second.get();
}

std::vector<std::string> Model::layer_names() const {
    std::vector<std::string> out = manifest_.layers;
    for (const auto& name : graph_.layer_names()) {
        if (!manifest_.has_layer(name)) out.push_back(name);
    }
    return out;
}

void Model::save_layer(const std::string& name) {
    PersistPlan plan;
    plan.layers.insert(name);
    persist(plan);
}

void Model::save_relationships() {
    PersistPlan plan;
    plan.relationships = true;
    persist(plan);
}

void Model::save_manifest() {
    PersistPlan plan;
    plan.manifest = true;
    persist(plan);
}

void Model::save_all() {
    PersistPlan plan;
    for (const auto& name : layer_names()) plan.layers.insert(name);
    plan.relationships = true;
    plan.manifest = true;
    persist(plan);
}

nlohmann::json Model::relationships_document() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& e : graph_.all_edges()) arr.push_back(arch_model::edge_to_json(e));
    nlohmann::json doc;
    doc["relationships"] = std::move(arr);
    return doc;
}

void Model::persist(const PersistPlan& plan, const BatchExtension& extend) {
    // New layers are declared on a copy that replaces the manifest only
    // once the batch has landed.
    arch_model::Manifest manifest = manifest_;
    bool write_manifest = plan.manifest;
    for (const auto& name : plan.layers) {
        if (!is_valid_layer_name(name)) throw std::invalid_argument("invalid layer name '" + name + "'");
        if (manifest.declare_layer(name)) write_manifest = true;
    }

    DocumentBatch batch(*fs_);
    for (const auto& name : plan.layers) batch.put(layer_path(name), layer(name).to_document());
    if (plan.relationships) batch.put(relationships_path(), relationships_document());
    if (write_manifest) batch.put(manifest_path(), arch_model::manifest_to_json(manifest));
    if (extend) extend(batch);
    if (batch.empty()) return;

    batch.commit();
    manifest_ = std::move(manifest);
    logger()->debug("model_persisted layers={} relationships={} manifest={} documents={}",
        plan.layers.size(), plan.relationships, write_manifest, batch.size());
}

} // namespace arch_storage
