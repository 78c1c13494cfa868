#include "test_support.hpp"
#include <arch_staging/change_apply.hpp>
#include <arch_staging/virtual_projection.hpp>

using namespace archstage_test;
using arch_staging::Changeset;
using arch_staging::VirtualProjectionEngine;

class ProjectionTest : public ModelTest {
protected:
    Changeset changeset{"changeset-1", "work", "", "sha256:base"};
};

TEST_F(ProjectionTest, OverlayLeavesBaseUntouched) {
    const auto nodes = model->graph().all_nodes();
    const auto edges = model->graph().all_edges();
    const auto version = model->graph().version();

    auto web = make_element("application", "component", "web");
    web.relationships.push_back({"uses", "application.component.api", nlohmann::json::object()});
    changeset.append(add_record(web));
    changeset.append(update_record("business.service.billing", "business", {{"properties", {{"tier", 3}}}}));
    changeset.append(delete_record("business.service.payments", "business"));

    VirtualProjectionEngine engine(model->graph());
    const auto projected = engine.project_changes(changeset);

    EXPECT_TRUE(projected.has_node("application.component.web"));
    EXPECT_FALSE(projected.has_node("business.service.payments"));
    EXPECT_EQ(projected.find_node("business.service.billing")->properties["tier"], 3);
    EXPECT_TRUE(projected.edges_from("business.service.billing").empty());
    ASSERT_EQ(projected.edges_from("application.component.web").size(), 1u);

    EXPECT_EQ(model->graph().all_nodes(), nodes);
    EXPECT_EQ(model->graph().all_edges(), edges);
    EXPECT_EQ(model->graph().version(), version);
}

TEST_F(ProjectionTest, ProjectionMatchesDirectApplication) {
    auto web = make_element("application", "component", "web");
    web.relationships.push_back({"uses", "application.component.api", nlohmann::json::object()});
    changeset.append(add_record(web));
    changeset.append(update_record("business.service.billing", "business",
        {{"name", "billing-v2"}, {"properties", {{"owner", nullptr}}}}));
    changeset.append(delete_record("business.service.payments", "business"));
    changeset.append(update_record("application.component.web", "application", {{"description", "front end"}}));

    VirtualProjectionEngine engine(model->graph());
    const auto projected = engine.project_changes(changeset);

    arch_model::GraphModel direct = model->graph();
    arch_staging::apply_changes(direct, changeset.changes());

    EXPECT_EQ(projected.all_nodes(), direct.all_nodes());
    EXPECT_EQ(projected.all_edges(), direct.all_edges());
    EXPECT_EQ(projected.layer_names(), direct.layer_names());

    const auto billing = direct.find_node("business.service.billing");
    ASSERT_NE(billing, nullptr);
    EXPECT_EQ(billing->name, "billing-v2");
    EXPECT_FALSE(billing->properties.contains("owner"));
    EXPECT_EQ(billing->properties["tier"], 1);
}

TEST_F(ProjectionTest, UpdateAfterDeleteInReplayConflicts) {
    const std::vector<arch_staging::ChangeRecord> records{
        delete_record("business.service.payments", "business"),
        update_record("business.service.payments", "business", {{"name", "again"}}),
    };
    VirtualProjectionEngine engine(model->graph());
    EXPECT_THROW(engine.project_changes(records), arch_model::ConflictError);
}

TEST_F(ProjectionTest, MissingElementIsNotFound) {
    VirtualProjectionEngine engine(model->graph());
    EXPECT_THROW(engine.project_changes({delete_record("business.service.ghost", "business")}),
        arch_model::NotFoundError);
    EXPECT_THROW(engine.project_changes({update_record("business.service.ghost", "business", {{"name", "x"}})}),
        arch_model::NotFoundError);
}

TEST_F(ProjectionTest, AddOfExistingElementConflicts) {
    VirtualProjectionEngine engine(model->graph());
    EXPECT_THROW(engine.project_changes({add_record(make_element("business", "service", "billing"))}),
        arch_model::ConflictError);
}

TEST_F(ProjectionTest, ReAddAfterDelete) {
    changeset.append(delete_record("business.service.payments", "business"));
    auto again = make_element("business", "service", "payments");
    again.description = "rebuilt";
    changeset.append(add_record(again));

    VirtualProjectionEngine engine(model->graph());
    const auto element = engine.project_element(changeset, "business.service.payments");
    ASSERT_TRUE(element.has_value());
    EXPECT_EQ(element->description, std::optional<std::string>("rebuilt"));
}

TEST_F(ProjectionTest, ProjectLayer) {
    changeset.append(add_record(make_element("business", "service", "audit")));
    changeset.append(delete_record("business.service.billing", "business"));

    VirtualProjectionEngine engine(model->graph());
    const auto elements = engine.project_layer(changeset, "business");
    ASSERT_EQ(elements.size(), 2u);
    EXPECT_EQ(elements[0].id, "business.service.audit");
    EXPECT_EQ(elements[1].id, "business.service.payments");
}

TEST_F(ProjectionTest, DiffCoversTouchedAndAffectedElements) {
    changeset.append(add_record(make_element("business", "service", "audit")));
    changeset.append(update_record("application.component.api", "application", {{"description", "public"}}));
    changeset.append(delete_record("business.service.payments", "business"));

    VirtualProjectionEngine engine(model->graph());
    const auto diff = engine.compute_diff(changeset);

    ASSERT_EQ(diff.additions.size(), 1u);
    EXPECT_EQ(diff.additions[0].id, "business.service.audit");
    EXPECT_TRUE(diff.additions[0].before.is_null());

    ASSERT_EQ(diff.deletions.size(), 1u);
    EXPECT_EQ(diff.deletions[0].id, "business.service.payments");
    EXPECT_TRUE(diff.deletions[0].after.is_null());

    // api was updated; billing lost its edge to payments.
    ASSERT_EQ(diff.modifications.size(), 2u);
    EXPECT_EQ(diff.modifications[0].id, "application.component.api");
    EXPECT_EQ(diff.modifications[1].id, "business.service.billing");
    EXPECT_EQ(diff.modifications[1].before["relationships"].size(), 1u);
    EXPECT_TRUE(diff.modifications[1].after["relationships"].empty());

    const auto j = arch_staging::model_diff_to_json(diff);
    EXPECT_EQ(j["additions"].size(), 1u);
    EXPECT_EQ(j["modifications"].size(), 2u);
    EXPECT_EQ(j["deletions"].size(), 1u);
}

TEST_F(ProjectionTest, NoOpUpdateIsNotAModification) {
    changeset.append(update_record("business.service.billing", "business", {{"name", "billing"}}));
    VirtualProjectionEngine engine(model->graph());
    EXPECT_TRUE(engine.compute_diff(changeset).empty());
}

TEST_F(ProjectionTest, TombstonesTrackBaseRemovals) {
    VirtualProjectionEngine engine(model->graph());
    const auto projected = engine.project_changes({delete_record("business.service.payments", "business")});
    EXPECT_EQ(projected.overlay_node_count(), 0u);
    // The node and its incoming edge.
    EXPECT_EQ(projected.tombstone_count(), 2u);
}
