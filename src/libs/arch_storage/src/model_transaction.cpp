#include <arch_storage/model_transaction.hpp>
#include <arch_storage/log.hpp>
#include <arch_model/errors.hpp>
#include <exception>

namespace arch_storage {

ModelTransaction::ModelTransaction(Model& model)
    : model_(model), saved_graph_(model.graph()), saved_manifest_(model.manifest()) {}

ModelTransaction::~ModelTransaction() {
    if (done_) return;
    try {
        roll_back();
    } catch (const std::exception& e) {
        logger()->error("transaction_roll_back_failed error={}", e.what());
    }
}

void ModelTransaction::commit(const PersistPlan& plan, const BatchExtension& extend) {
    if (done_) throw arch_model::InvalidStateError("transaction already finished");
    try {
        model_.persist(plan, extend);
    } catch (const arch_model::PersistenceError&) {
        roll_back();
        throw;
    }
    done_ = true;
}

void ModelTransaction::roll_back() {
    if (done_) return;
    model_.graph().restore(saved_graph_);
    model_.manifest() = saved_manifest_;
    done_ = true;
    logger()->warn("transaction_rolled_back nodes={} edges={}",
        model_.graph().node_count(), model_.graph().edge_count());
}

} // namespace arch_storage
