#include "test_support.hpp"
#include <arch_storage/config.hpp>
#include <arch_storage/model_transaction.hpp>
#include <fstream>
#include <stdexcept>

using namespace archstage_test;

TEST_F(ModelTest, SaveAndLoadRoundTrip) {
    model->layer("business").set_metadata({{"owner", "arch"}});
    model->save_layer("business");

    const auto loaded = reload();
    EXPECT_EQ(loaded->manifest(), model->manifest());
    EXPECT_EQ(loaded->graph().all_nodes(), model->graph().all_nodes());
    EXPECT_EQ(loaded->graph().all_edges(), model->graph().all_edges());
    ASSERT_NE(loaded->find_layer("business"), nullptr);
    EXPECT_EQ(loaded->find_layer("business")->metadata()["owner"], "arch");
    EXPECT_TRUE(loaded->graph().check_indices().empty());
}

TEST_F(ModelTest, LayoutOnDisk) {
    EXPECT_TRUE(fs.exists(dir.path() / "archmodel" / "manifest.json"));
    EXPECT_TRUE(fs.exists(dir.path() / "archmodel" / "layers" / "business.json"));
    EXPECT_TRUE(fs.exists(dir.path() / "archmodel" / "layers" / "application.json"));
    EXPECT_TRUE(fs.exists(dir.path() / "archmodel" / "relationships.json"));

    const auto rel = arch_storage::read_document(fs, model->relationships_path());
    ASSERT_EQ(rel["relationships"].size(), 1u);
    EXPECT_EQ(rel["relationships"][0]["predicate"], "serves");
}

TEST_F(ModelTest, InitializeRefusesExistingModel) {
    arch_storage::Model again(fs, dir.path());
    arch_model::Manifest m;
    m.name = "again";
    EXPECT_THROW(again.initialize(m), arch_model::InvalidStateError);
}

TEST_F(ModelTest, NewLayerInPlanIsDeclared) {
    model->graph().add_node(make_node("technology", "node", "db"));
    model->save_layer("technology");

    EXPECT_TRUE(model->manifest().has_layer("technology"));
    const auto loaded = reload();
    EXPECT_TRUE(loaded->graph().has_node("technology.node.db"));
    EXPECT_EQ(loaded->layer_names(), (std::vector<std::string>{"business", "application", "technology"}));
}

TEST_F(ModelTest, DanglingRelationshipOnDiskIsPersistenceError) {
    nlohmann::json rel = {{"relationships", nlohmann::json::array({
        {{"source", "business.service.billing"}, {"destination", "business.service.ghost"}, {"predicate", "serves"}},
    })}};
    fs.write_file(model->relationships_path(), arch_storage::dump_document(rel));

    arch_storage::Model broken(fs, dir.path());
    try {
        broken.load();
        FAIL() << "expected PersistenceError";
    } catch (const arch_model::PersistenceError& e) {
        EXPECT_EQ(e.path(), model->relationships_path().string());
    }
    EXPECT_EQ(broken.graph().node_count(), 0u);
}

TEST_F(ModelTest, MissingModelIsPersistenceError) {
    TempDir empty;
    arch_storage::Model none(fs, empty.path());
    EXPECT_FALSE(none.exists());
    EXPECT_THROW(none.load(), arch_model::PersistenceError);
}

TEST_F(ModelTest, TransactionRestoresUnlessCommitted) {
    const auto nodes = model->graph().all_nodes();
    {
        arch_storage::ModelTransaction tx(*model);
        model->graph().remove_node("business.service.billing");
        model->manifest().description = "changed";
    }
    EXPECT_EQ(model->graph().all_nodes(), nodes);
    EXPECT_EQ(model->graph().edge_count(), 1u);
    EXPECT_TRUE(model->manifest().description.empty());

    {
        arch_storage::ModelTransaction tx(*model);
        model->graph().remove_node("business.service.payments");
        arch_storage::PersistPlan plan;
        plan.layers.insert("business");
        plan.relationships = true;
        tx.commit(plan);
    }
    EXPECT_FALSE(model->graph().has_node("business.service.payments"));
    EXPECT_FALSE(reload()->graph().has_node("business.service.payments"));
}

TEST_F(ModelTest, TransactionRestoresOnWriteFailure) {
    FailingFileSystem failing(fs);
    arch_storage::Model m(failing, dir.path());
    m.load();
    const auto nodes = m.graph().all_nodes();

    failing.fail_on(2);
    {
        arch_storage::ModelTransaction tx(m);
        m.graph().remove_node("business.service.payments");
        arch_storage::PersistPlan plan;
        plan.layers.insert("business");
        plan.relationships = true;
        EXPECT_THROW(tx.commit(plan), arch_model::PersistenceError);
        EXPECT_FALSE(tx.open());
    }
    EXPECT_EQ(m.graph().all_nodes(), nodes);
    EXPECT_TRUE(reload()->graph().has_node("business.service.payments"));
}

TEST_F(ModelTest, FailedSaveLeavesNewLayerUndeclared) {
    FailingFileSystem failing(fs);
    arch_storage::Model m(failing, dir.path());
    m.load();
    m.graph().add_node(make_node("technology", "node", "db"));

    failing.fail_on(1);
    EXPECT_THROW(m.save_layer("technology"), arch_model::PersistenceError);
    EXPECT_FALSE(m.manifest().has_layer("technology"));
    EXPECT_FALSE(reload()->manifest().has_layer("technology"));

    m.save_layer("technology");
    EXPECT_TRUE(m.manifest().has_layer("technology"));
    const auto loaded = reload();
    EXPECT_TRUE(loaded->manifest().has_layer("technology"));
    EXPECT_TRUE(loaded->graph().has_node("technology.node.db"));
}

TEST_F(ModelTest, TransactionRollsBackDuringUnwinding) {
    const auto nodes = model->graph().all_nodes();
    const auto run = [&] {
        arch_storage::ModelTransaction tx(*model);
        model->graph().remove_node("business.service.billing");
        model->manifest().declare_layer("technology");
        throw std::runtime_error("caller failed");
    };
    EXPECT_THROW(run(), std::runtime_error);
    EXPECT_EQ(model->graph().all_nodes(), nodes);
    EXPECT_FALSE(model->manifest().has_layer("technology"));

    arch_storage::ModelTransaction tx(*model);
    tx.roll_back();
    EXPECT_FALSE(tx.open());
    EXPECT_THROW(tx.commit(arch_storage::PersistPlan{}), arch_model::InvalidStateError);
}

TEST(StoreConfigTest, DefaultsWhenMissingOrMalformed) {
    arch_storage::logger()->set_level(spdlog::level::off);
    TempDir dir;
    EXPECT_EQ(arch_storage::load_store_config(dir.path()).model_dir, "archmodel");

    std::ofstream(dir.path() / arch_storage::config_file_name) << "{ broken";
    EXPECT_FALSE(arch_storage::load_store_config_file(dir.path() / arch_storage::config_file_name).has_value());
    EXPECT_EQ(arch_storage::load_store_config(dir.path()).changeset_id_prefix, "changeset");
}

TEST(StoreConfigTest, ReadsKnownKeys) {
    TempDir dir;
    std::ofstream(dir.path() / arch_storage::config_file_name)
        << R"({"model_dir": "model", "log_level": "debug", "changeset_id_prefix": "cs", "extra": 1})";
    const auto config = arch_storage::load_store_config(dir.path());
    EXPECT_EQ(config.model_dir, "model");
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.changeset_id_prefix, "cs");
    EXPECT_TRUE(config.log_file.empty());
}

TEST_F(ModelTest, FindModelRootWalksUp) {
    const auto nested = dir.path() / "a" / "b";
    std::filesystem::create_directories(nested);
    const auto found = arch_storage::find_model_root(nested);
    ASSERT_TRUE(found.has_value());
    EXPECT_TRUE(std::filesystem::equivalent(*found, dir.path()));
}
