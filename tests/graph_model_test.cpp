#include "test_support.hpp"
#include <arch_model/graph_model.hpp>

using namespace archstage_test;
using arch_model::AddMode;
using arch_model::Edge;
using arch_model::GraphModel;

namespace {

Edge edge(const std::string& src, const std::string& dst, const std::string& predicate) {
    Edge e;
    e.source = src;
    e.destination = dst;
    e.predicate = predicate;
    return e;
}

} // namespace

TEST(GraphModelTest, AddNodeRejectsDuplicateWithoutReplace) {
    GraphModel g;
    g.add_node(make_node("business", "service", "orders"));
    EXPECT_THROW(g.add_node(make_node("business", "service", "orders")), arch_model::DuplicateError);
    EXPECT_EQ(g.node_count(), 1u);
}

TEST(GraphModelTest, ReplaceMovesIndexEntries) {
    GraphModel g;
    g.add_node(make_node("business", "service", "orders"));

    auto moved = make_node("business", "service", "orders");
    moved.type = "process";
    moved.layer = "application";
    g.add_node(moved, AddMode::Replace);

    EXPECT_TRUE(g.nodes_by_layer("business").empty());
    EXPECT_TRUE(g.nodes_by_type("service").empty());
    ASSERT_EQ(g.nodes_by_layer("application").size(), 1u);
    EXPECT_EQ(g.nodes_by_type("process").front().id, "business.service.orders");
    EXPECT_TRUE(g.check_indices().empty());
}

TEST(GraphModelTest, AddEdgeNamesMissingEndpoint) {
    GraphModel g;
    g.add_node(make_node("business", "service", "orders"));
    try {
        g.add_edge(edge("business.service.orders", "business.service.ghost", "serves"));
        FAIL() << "expected ReferenceError";
    } catch (const arch_model::ReferenceError& e) {
        EXPECT_EQ(e.missing_id(), "business.service.ghost");
    }
    EXPECT_EQ(g.edge_count(), 0u);
}

TEST(GraphModelTest, EdgeIdIsDerivedAndUnique) {
    GraphModel g;
    g.add_node(make_node("business", "service", "a"));
    g.add_node(make_node("business", "service", "b"));
    g.add_edge(edge("business.service.a", "business.service.b", "serves"));

    const auto id = arch_model::make_edge_id("business.service.a", "serves", "business.service.b");
    ASSERT_NE(g.find_edge(id), nullptr);
    EXPECT_THROW(g.add_edge(edge("business.service.a", "business.service.b", "serves")), arch_model::DuplicateError);
}

TEST(GraphModelTest, RemoveNodeCascadesIncidentEdges) {
    GraphModel g;
    for (const char* n : {"a", "b", "c"}) g.add_node(make_node("business", "service", n));
    g.add_edge(edge("business.service.a", "business.service.b", "serves"));
    g.add_edge(edge("business.service.c", "business.service.b", "uses"));
    g.add_edge(edge("business.service.a", "business.service.c", "flows"));

    EXPECT_TRUE(g.remove_node("business.service.b"));
    EXPECT_EQ(g.edge_count(), 1u);
    EXPECT_TRUE(g.edges_to("business.service.b").empty());
    EXPECT_EQ(g.edges_from("business.service.a").size(), 1u);
    EXPECT_FALSE(g.remove_node("business.service.b"));
    EXPECT_TRUE(g.check_indices().empty());
}

TEST(GraphModelTest, IndicesStayConsistentAcrossReplaceDeleteSequences) {
    GraphModel g;
    for (int i = 0; i < 20; ++i) g.add_node(make_node("business", "service", "s" + std::to_string(i)));
    for (int i = 0; i + 1 < 20; ++i)
        g.add_edge(edge("business.service.s" + std::to_string(i), "business.service.s" + std::to_string(i + 1), "next"));

    for (int i = 0; i < 20; i += 3) {
        auto n = make_node("business", "service", "s" + std::to_string(i));
        n.type = i % 2 ? "process" : "function";
        g.add_node(n, AddMode::Replace);
    }
    for (int i = 1; i < 20; i += 4) g.remove_node("business.service.s" + std::to_string(i));
    g.update_node("business.service.s0", arch_model::ElementPatch{std::nullopt, std::string("actor")});

    EXPECT_TRUE(g.check_indices().empty());
    for (const auto& e : g.all_edges()) {
        EXPECT_TRUE(g.has_node(e.source));
        EXPECT_TRUE(g.has_node(e.destination));
    }
    EXPECT_EQ(g.nodes_by_type("actor").size(), 1u);
}

TEST(GraphModelTest, VersionAdvancesOnEveryMutation) {
    GraphModel g;
    auto v = g.version();
    g.add_node(make_node("business", "service", "a"));
    EXPECT_GT(g.version(), v);
    v = g.version();
    g.update_node("business.service.a", arch_model::ElementPatch{std::string("A")});
    EXPECT_GT(g.version(), v);
    v = g.version();
    g.remove_node("business.service.a");
    EXPECT_GT(g.version(), v);
    v = g.version();
    EXPECT_FALSE(g.remove_node("business.service.a"));
    EXPECT_EQ(g.version(), v);
}

TEST(GraphModelTest, RestoreKeepsVersionMovingForward) {
    GraphModel g;
    g.add_node(make_node("business", "service", "a"));
    const GraphModel saved = g;
    g.add_node(make_node("business", "service", "b"));
    const auto before = g.version();

    g.restore(saved);
    EXPECT_EQ(g.node_count(), 1u);
    EXPECT_GT(g.version(), before);
}

TEST(GraphModelTest, QueriesOnUnknownKeysAreEmpty) {
    GraphModel g;
    EXPECT_TRUE(g.nodes_by_layer("nope").empty());
    EXPECT_TRUE(g.nodes_by_type("nope").empty());
    EXPECT_TRUE(g.edges_from("nope").empty());
    EXPECT_TRUE(g.edges_to("nope").empty());
    EXPECT_EQ(g.find_node("nope"), nullptr);
    EXPECT_THROW(g.update_node("nope", {}), arch_model::NotFoundError);
}

TEST(GraphModelTest, EdgeQueriesFilterByPredicate) {
    GraphModel g;
    for (const char* n : {"a", "b", "c"}) g.add_node(make_node("business", "service", n));
    g.add_edge(edge("business.service.a", "business.service.b", "serves"));
    g.add_edge(edge("business.service.a", "business.service.b", "uses"));
    g.add_edge(edge("business.service.a", "business.service.c", "serves"));

    EXPECT_EQ(g.edges_from("business.service.a", "serves").size(), 2u);
    EXPECT_EQ(g.edges_between("business.service.a", "business.service.b").size(), 2u);
    EXPECT_EQ(g.edges_between("business.service.a", "business.service.b", "uses").size(), 1u);

    const auto from = g.edges_from("business.service.a");
    ASSERT_EQ(from.size(), 3u);
    EXPECT_EQ(from[0].destination, "business.service.b");
    EXPECT_EQ(from[0].predicate, "serves");
    EXPECT_EQ(from[2].destination, "business.service.c");
}

TEST(GraphModelTest, UpdateEdgeChangesPredicateAndProperties) {
    GraphModel g;
    g.add_node(make_node("business", "service", "a"));
    g.add_node(make_node("business", "service", "b"));
    g.add_edge(edge("business.service.a", "business.service.b", "serves"));
    const auto id = g.all_edges().front().id;

    g.update_edge(id, "uses", {{"weight", 2}});
    EXPECT_EQ(g.find_edge(id)->predicate, "uses");
    EXPECT_EQ(g.find_edge(id)->properties["weight"], 2);
    EXPECT_TRUE(g.edges_from("business.service.a", "serves").empty());
    EXPECT_TRUE(g.check_indices().empty());
}

TEST(GraphModelTest, TraverseIsBreadthFirstAndBounded) {
    GraphModel g;
    for (const char* n : {"a", "b", "c", "d"}) g.add_node(make_node("business", "service", n));
    g.add_edge(edge("business.service.a", "business.service.b", "next"));
    g.add_edge(edge("business.service.a", "business.service.c", "next"));
    g.add_edge(edge("business.service.b", "business.service.d", "next"));
    g.add_edge(edge("business.service.d", "business.service.a", "next"));

    const auto all = g.traverse("business.service.a");
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all[0].id, "business.service.a");
    EXPECT_EQ(all[3].id, "business.service.d");

    EXPECT_EQ(g.traverse("business.service.a", {}, 1).size(), 3u);
}
