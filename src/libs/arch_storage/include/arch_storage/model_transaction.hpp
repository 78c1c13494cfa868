#pragma once

#include <arch_model/graph_model.hpp>
#include <arch_model/manifest.hpp>
#include <arch_storage/model.hpp>

namespace arch_storage {

// Captures graph and manifest on construction. Unless commit() persists
// successfully, the destructor puts both back.
class ModelTransaction {
public:
    explicit ModelTransaction(Model& model);
    ~ModelTransaction();

    ModelTransaction(const ModelTransaction&) = delete;
    ModelTransaction& operator=(const ModelTransaction&) = delete;

    // Writes the plan through Model::persist. On PersistenceError the
    // in-memory state is restored before the error propagates.
    void commit(const PersistPlan& plan, const BatchExtension& extend = {});
    void roll_back();

    bool open() const { return !done_; }

private:
    Model& model_;
    arch_model::GraphModel saved_graph_;
    arch_model::Manifest saved_manifest_;
    bool done_ = false;
};

} // namespace arch_storage
