#include <gtest/gtest.h>
#include <graph/graph_data.hpp>
#include <graph/type_styles.hpp>
#include "test_helpers.hpp"
#include <cmath>
#include <stdexcept>

using namespace kgviz;
using namespace kgviz::test;

TEST(GraphDataTest, AddNodesAndEdges) {
    GraphData graph = paper_graph();

    EXPECT_EQ(graph.node_count(), 5u);
    EXPECT_EQ(graph.edge_count(), 5u);
    EXPECT_TRUE(graph.has_node("m1"));
    EXPECT_FALSE(graph.has_node("zz"));
    EXPECT_EQ(graph.node("d1").type, "dataset");
}

TEST(GraphDataTest, DuplicateNodeIsDropped) {
    GraphData graph;
    EXPECT_TRUE(graph.add_node(make_node("a", "method")));
    GraphNode duplicate = make_node("a", "dataset");
    duplicate.label = "second";
    EXPECT_FALSE(graph.add_node(duplicate));

    EXPECT_EQ(graph.node_count(), 1u);
    EXPECT_EQ(graph.node("a").type, "method");
    EXPECT_EQ(graph.dropped_node_count(), 1u);
}

TEST(GraphDataTest, DanglingEdgeIsDropped) {
    GraphData graph;
    graph.add_node(make_node("a", "method"));
    EXPECT_FALSE(graph.add_edge(make_edge("a", "missing")));
    EXPECT_FALSE(graph.add_edge(make_edge("missing", "a")));

    EXPECT_EQ(graph.edge_count(), 0u);
    EXPECT_EQ(graph.dropped_edge_count(), 2u);
}

TEST(GraphDataTest, TypesInFirstSeenOrder) {
    GraphData graph = paper_graph();
    std::vector<std::string> expected{"research_problem", "method", "dataset", "metric"};
    EXPECT_EQ(graph.types(), expected);
}

TEST(GraphDataTest, NegativeSizeAndWeightClampToZero) {
    GraphData graph;
    graph.add_node(make_node("a", "method", -3.0f));
    graph.add_node(make_node("b", "method", std::nanf("")));
    graph.add_edge(make_edge("a", "b", "uses", -1.0f));

    EXPECT_FLOAT_EQ(graph.node("a").size, 0.0f);
    EXPECT_FLOAT_EQ(graph.node("b").size, 0.0f);
    EXPECT_FLOAT_EQ(graph.edges()[0].weight, 0.0f);
}

TEST(GraphDataTest, UnknownNodeThrows) {
    GraphData graph = paper_graph();
    EXPECT_THROW(graph.node("nope"), std::out_of_range);
}

TEST(GraphDataTest, Confidence) {
    GraphNode node = make_node("a", "method");
    EXPECT_FALSE(node.confidence().has_value());

    node.metadata["confidence"] = 0.87;
    ASSERT_TRUE(node.confidence().has_value());
    EXPECT_DOUBLE_EQ(*node.confidence(), 0.87);

    node.metadata["confidence"] = std::string("high");
    EXPECT_FALSE(node.confidence().has_value());
}

TEST(GraphDataTest, EdgeDisplayText) {
    GraphEdge edge = make_edge("a", "b", "evaluates_on");
    EXPECT_EQ(edge.display_text(), "evaluates_on");

    edge.label = "evaluates on";
    EXPECT_EQ(edge.display_text(), "evaluates on");

    edge.label = "";
    EXPECT_EQ(edge.display_text(), "evaluates_on");
}

TEST(TypeStylesTest, DefaultTable) {
    TypeStyles styles = TypeStyles::defaults();

    EXPECT_EQ(styles.color("research_problem"), "#ef4444");
    EXPECT_EQ(styles.color("method"), "#3b82f6");
    EXPECT_EQ(styles.color("tool"), "#06b6d4");
    EXPECT_EQ(styles.display_label("research_problem"), "Research Problem");
    EXPECT_FLOAT_EQ(styles.style("dataset").default_size, 2.0f);
    EXPECT_FLOAT_EQ(styles.style("theory").default_size, 2.0f);
    EXPECT_EQ(styles.entries().size(), 8u);
}

TEST(TypeStylesTest, UnknownTypeFallsBack) {
    TypeStyles styles = TypeStyles::defaults();

    EXPECT_FALSE(styles.has("hypothesis"));
    EXPECT_EQ(styles.color("hypothesis"), "#6b7280");
    EXPECT_EQ(styles.display_label("hypothesis"), "hypothesis");
    EXPECT_FLOAT_EQ(styles.style("hypothesis").default_size, 1.0f);
}

TEST(TypeStylesTest, InjectedStyle) {
    TypeStyles styles = TypeStyles::defaults();
    styles.set("hypothesis", {"#123456", "Hypothesis", 1.8f});

    EXPECT_EQ(styles.color("hypothesis"), "#123456");
    EXPECT_EQ(styles.display_label("hypothesis"), "Hypothesis");
}
