#include <gtest/gtest.h>
#include <layout/type_anchors.hpp>
#include "test_helpers.hpp"
#include <cmath>

using namespace kgviz;
using namespace kgviz::test;

TEST(TypeAnchorsTest, CanvasGeometry) {
    CanvasSize canvas;
    EXPECT_FLOAT_EQ(canvas.width, 900.0f);
    EXPECT_FLOAT_EQ(canvas.height, 600.0f);
    EXPECT_EQ(canvas.center(), Vec2(450.0f, 300.0f));
    EXPECT_NEAR(canvas.diagonal(), std::sqrt(900.0f * 900.0f + 600.0f * 600.0f), 1e-3f);
}

TEST(TypeAnchorsTest, AnchorsOnCircle) {
    CanvasSize canvas;
    std::vector<std::string> types{"method", "dataset", "metric", "tool"};
    TypeAnchors anchors = compute_type_anchors(types, canvas);

    ASSERT_EQ(anchors.size(), 4u);
    const float radius = canvas.diagonal() / 5.0f;
    for (const auto& type : types) {
        EXPECT_NEAR(anchors[type].distance_to(canvas.center()), radius, 1e-3f);
    }

    // First type at angle 0, second at pi/2
    EXPECT_NEAR(anchors["method"].x, canvas.center().x + radius, 1e-3f);
    EXPECT_NEAR(anchors["method"].y, canvas.center().y, 1e-3f);
    EXPECT_NEAR(anchors["dataset"].x, canvas.center().x, 1e-3f);
    EXPECT_NEAR(anchors["dataset"].y, canvas.center().y + radius, 1e-3f);
}

TEST(TypeAnchorsTest, OrderFollowsFirstAppearance) {
    std::vector<GraphNode> nodes{
        make_node("a", "metric"),
        make_node("b", "method"),
        make_node("c", "metric"),
        make_node("d", "tool"),
    };
    std::vector<std::string> expected{"metric", "method", "tool"};
    EXPECT_EQ(ordered_types(nodes), expected);
}

TEST(TypeAnchorsTest, PureFunction) {
    GraphData graph = paper_graph();
    CanvasSize canvas{1200.0f, 800.0f};
    TypeAnchors first = compute_type_anchors(graph.nodes(), canvas);
    TypeAnchors second = compute_type_anchors(graph.nodes(), canvas);
    EXPECT_EQ(first, second);
}

TEST(TypeAnchorsTest, EmptyInput) {
    EXPECT_TRUE(compute_type_anchors(std::vector<std::string>{}, CanvasSize{}).empty());
}
