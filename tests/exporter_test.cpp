#include "test_support.hpp"
#include <arch_staging/changeset_exporter.hpp>
#include <arch_staging/staging_errors.hpp>

using namespace archstage_test;
using arch_staging::ChangesetExporter;
using arch_staging::ChangesetStatus;
using arch_staging::StagingAreaManager;

class ExporterTest : public ModelTest {
protected:
    void SetUp() override {
        ModelTest::SetUp();
        staging = std::make_unique<StagingAreaManager>(*model);
        exporter = std::make_unique<ChangesetExporter>(*staging);

        auto cs = staging->create("c1", "pricing");
        id = cs.id();
        staging->set_active(id);
        staging->stage(add_record(make_element("business", "service", "pricing")));
        staging->stage(update_record("business.service.billing", "business", {{"description", "bills"}}));
        staging->stage(delete_record("business.service.payments", "business"));
    }

    // Second root holding the same committed state.
    std::unique_ptr<arch_storage::Model> clone_model(const TempDir& where) {
        auto other = std::make_unique<arch_storage::Model>(fs, where.path());
        other->initialize(model->manifest());
        other->graph() = model->graph();
        other->save_all();
        return other;
    }

    std::unique_ptr<StagingAreaManager> staging;
    std::unique_ptr<ChangesetExporter> exporter;
    std::string id;
};

TEST_F(ExporterTest, ExportDocumentShape) {
    const auto doc = exporter->export_changeset("c1");
    EXPECT_EQ(doc["format"], arch_staging::exchange_format);
    EXPECT_EQ(doc["version"], arch_staging::exchange_version);
    EXPECT_EQ(doc["changeset"]["id"], id);
    EXPECT_EQ(doc["changeset"]["status"], "staged");
    ASSERT_EQ(doc["changes"].size(), 3u);
    EXPECT_EQ(doc["changes"][0]["type"], "add");
    EXPECT_EQ(doc["changes"][2]["sequence_number"], 2);
    EXPECT_TRUE(doc.contains("snapshot"));
}

TEST_F(ExporterTest, ImportIntoMatchingModelCommits) {
    const auto file = dir.path() / "c1.json";
    exporter->export_to_file("c1", file);

    TempDir other_dir;
    auto other = clone_model(other_dir);
    StagingAreaManager other_staging(*other);
    ChangesetExporter other_exporter(other_staging);

    const auto imported = other_exporter.import_from_file(file);
    EXPECT_NE(imported.id(), id);
    EXPECT_EQ(imported.name(), "c1");
    EXPECT_EQ(imported.description(), "pricing");
    EXPECT_EQ(imported.status(), ChangesetStatus::Staged);
    EXPECT_EQ(imported.stats(), staging->load(id).stats());
    EXPECT_TRUE(other_staging.storage().load_snapshot_detail(imported.id()).has_value());

    const auto report = other_exporter.check_compatibility(imported);
    EXPECT_TRUE(report.compatible);
    EXPECT_TRUE(report.base_snapshot_match);
    EXPECT_TRUE(report.warnings.empty());

    other_staging.commit(imported.id());
    EXPECT_TRUE(other->graph().has_node("business.service.pricing"));
    EXPECT_FALSE(other->graph().has_node("business.service.payments"));
}

TEST_F(ExporterTest, ImportIntoDivergedModelReportsDrift) {
    const auto doc = exporter->export_changeset(id);

    TempDir other_dir;
    auto other = clone_model(other_dir);
    other->graph().remove_node("business.service.payments");
    other->save_all();

    StagingAreaManager other_staging(*other);
    ChangesetExporter other_exporter(other_staging);
    const auto imported = other_exporter.import_changeset(doc);

    const auto report = other_exporter.check_compatibility(imported);
    EXPECT_FALSE(report.compatible);
    EXPECT_FALSE(report.base_snapshot_match);
    EXPECT_EQ(report.missing_elements, (std::vector<std::string>{"business.service.payments"}));
    EXPECT_EQ(report.affected_layers, (std::vector<std::string>{"business"}));
    EXPECT_FALSE(report.warnings.empty());

    const auto j = arch_staging::compatibility_report_to_json(report);
    EXPECT_FALSE(j["compatible"].get<bool>());
    EXPECT_EQ(j["missing_elements"].size(), 1u);

    EXPECT_THROW(other_staging.commit(imported.id()), arch_staging::DriftError);
}

TEST_F(ExporterTest, RejectsForeignDocuments) {
    EXPECT_THROW(exporter->import_changeset(nlohmann::json::object()), std::invalid_argument);
    EXPECT_THROW(exporter->import_changeset({{"format", "something-else"}}), std::invalid_argument);

    auto doc = exporter->export_changeset(id);
    doc["version"] = arch_staging::exchange_version + 1;
    EXPECT_THROW(exporter->import_changeset(doc), std::invalid_argument);
}
