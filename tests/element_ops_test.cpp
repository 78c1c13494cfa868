#include "test_support.hpp"
#include <arch_model/element_id.hpp>
#include <arch_model/element_ops.hpp>
#include <arch_model/graph_model.hpp>

using namespace archstage_test;
using arch_model::GraphModel;

TEST(ElementIdTest, KebabCaseAndParsing) {
    EXPECT_EQ(arch_model::to_kebab_case("Order Service"), "order-service");
    EXPECT_EQ(arch_model::to_kebab_case("  API  Gateway v2 "), "api-gateway-v2");
    EXPECT_EQ(arch_model::make_element_id("business", "service", "Order Service"), "business.service.order-service");

    const auto parts = arch_model::parse_element_id("application.component.api.v2");
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->layer, "application");
    EXPECT_EQ(parts->type, "component");
    EXPECT_EQ(parts->name, "api.v2");

    EXPECT_FALSE(arch_model::parse_element_id("business.service").has_value());
    EXPECT_FALSE(arch_model::parse_element_id(".service.x").has_value());
    EXPECT_TRUE(arch_model::element_id_in_layer("business.service.x", "business"));
    EXPECT_FALSE(arch_model::element_id_in_layer("business.service.x", "application"));
}

TEST(ElementOpsTest, InsertRejectsDuplicateRelationships) {
    GraphModel g;
    arch_model::insert_element(g, make_element("business", "service", "b"));
    auto a = make_element("business", "service", "a");
    a.relationships.push_back({"serves", "business.service.b", nlohmann::json::object()});
    a.relationships.push_back({"serves", "business.service.b", nlohmann::json::object()});

    EXPECT_THROW(arch_model::insert_element(g, a), std::invalid_argument);
    EXPECT_FALSE(g.has_node("business.service.a"));
}

TEST(ElementOpsTest, SelfRelationshipIsAllowed) {
    GraphModel g;
    auto a = make_element("business", "process", "retry");
    a.relationships.push_back({"triggers", "business.process.retry", nlohmann::json::object()});
    arch_model::insert_element(g, a);

    const auto back = arch_model::read_element(g, "business.process.retry");
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, a);
}

TEST(ElementOpsTest, MergeWithoutRelationshipsKeepsEdges) {
    GraphModel g;
    arch_model::insert_element(g, make_element("business", "service", "b"));
    auto a = make_element("business", "service", "a");
    a.relationships.push_back({"serves", "business.service.b", nlohmann::json::object()});
    arch_model::insert_element(g, a);

    arch_model::ElementPatch patch;
    patch.properties = {{"k", "v"}};
    arch_model::merge_element(g, "business.service.a", patch);

    EXPECT_EQ(g.edges_from("business.service.a").size(), 1u);
    EXPECT_EQ(g.find_node("business.service.a")->properties["k"], "v");
    EXPECT_THROW(arch_model::merge_element(g, "business.service.nope", patch), arch_model::NotFoundError);
}

TEST(ElementOpsTest, MergeRelationshipsKeepsSurvivingEdges) {
    GraphModel g;
    arch_model::insert_element(g, make_element("business", "service", "b"));
    arch_model::insert_element(g, make_element("business", "service", "c"));
    arch_model::insert_element(g, make_element("business", "service", "a"));
    arch_model::Edge kept;
    kept.id = "rel-1";
    kept.source = "business.service.a";
    kept.destination = "business.service.b";
    kept.predicate = "serves";
    kept.category = arch_model::EdgeCategory::Structural;
    g.add_edge(kept);
    arch_model::Edge dropped = kept;
    dropped.id = "rel-2";
    dropped.destination = "business.service.c";
    g.add_edge(dropped);

    arch_model::ElementPatch patch;
    patch.relationships = std::vector<arch_model::Relationship>{
        {"serves", "business.service.b", {{"weight", 1}}},
        {"uses", "business.service.c", nlohmann::json::object()},
    };
    arch_model::merge_element(g, "business.service.a", patch);

    ASSERT_EQ(g.edges_from("business.service.a").size(), 2u);
    const auto* e = g.find_edge("rel-1");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->category, arch_model::EdgeCategory::Structural);
    EXPECT_EQ(e->properties["weight"], 1);
    EXPECT_EQ(g.find_edge("rel-2"), nullptr);
    EXPECT_NE(g.find_edge("business.service.a--uses->business.service.c"), nullptr);
    EXPECT_TRUE(g.check_indices().empty());
}

TEST(ElementOpsTest, NullDescriptionClears) {
    GraphModel g;
    auto a = make_element("business", "service", "a");
    a.description = "old";
    arch_model::insert_element(g, a);

    arch_model::merge_element(g, "business.service.a", arch_model::patch_from_json({{"name", "A"}}));
    EXPECT_EQ(g.find_node("business.service.a")->description, std::optional<std::string>("old"));

    const auto patch = arch_model::patch_from_json({{"description", nullptr}});
    EXPECT_TRUE(patch.clear_description);
    arch_model::merge_element(g, "business.service.a", patch);
    EXPECT_FALSE(g.find_node("business.service.a")->description.has_value());
}

TEST(ElementJsonTest, ElementDocumentRoundTrip) {
    auto e = make_element("business", "service", "billing");
    e.description = "Bills";
    e.properties = {{"tier", 1}, {"tags", {"a", "b"}}};
    e.references.push_back({"application.component.api", "realized-by", "main API"});
    e.relationships.push_back({"serves", "business.service.payments", {{"weight", 3}}});

    const auto back = arch_model::element_from_json(arch_model::element_to_json(e));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, e);
}

TEST(ElementJsonTest, MissingRequiredFieldsGiveNullopt) {
    EXPECT_FALSE(arch_model::node_from_json({{"layer", "business"}, {"type", "service"}}).has_value());
    EXPECT_FALSE(arch_model::node_from_json({{"id", "business.service.x"}, {"type", "service"}}).has_value());
    EXPECT_FALSE(arch_model::edge_from_json({{"source", "a"}, {"predicate", "p"}}).has_value());
    EXPECT_FALSE(arch_model::node_from_json(nlohmann::json::array()).has_value());
}

TEST(ElementJsonTest, PatchLeavesAbsentFieldsUnset) {
    const auto patch = arch_model::patch_from_json({{"name", "New"}, {"properties", {{"x", nullptr}}}});
    ASSERT_TRUE(patch.name.has_value());
    EXPECT_FALSE(patch.type.has_value());
    EXPECT_FALSE(patch.references.has_value());
    EXPECT_FALSE(patch.relationships.has_value());
    EXPECT_TRUE(patch.properties.is_object());
}
