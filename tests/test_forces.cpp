#include <gtest/gtest.h>
#include <simulation/forces.hpp>
#include "test_helpers.hpp"
#include <cmath>

using namespace kgviz;
using namespace kgviz::test;

class ForcesTest : public ::testing::Test {
protected:
    std::vector<SimulationNode> nodes;
    Jiggle jiggle{42};

    void add(const Vec2& position, float radius = 6.0f, const std::string& type = "method") {
        SimulationNode node = sim_node("n" + std::to_string(nodes.size()), position, radius, type);
        node.index = static_cast<NodeIndex>(nodes.size());
        nodes.push_back(node);
    }
};

TEST_F(ForcesTest, LinkPullsStretchedPairTogether) {
    add(Vec2(0.0f, 0.0f));
    add(Vec2(200.0f, 0.0f));

    SimulationLink link;
    link.source = 0;
    link.target = 1;
    link.distance = 120.0f;
    link.strength = 1.0f;
    link.bias = 0.5f;

    apply_link_force(nodes, {link}, 1.0f, 1, 1.0f, jiggle);

    // (200 - 120) / 200 * 200 = 80, split evenly
    EXPECT_FLOAT_EQ(nodes[0].velocity.x, 40.0f);
    EXPECT_FLOAT_EQ(nodes[1].velocity.x, -40.0f);
    EXPECT_FLOAT_EQ(nodes[0].velocity.y, 0.0f);
}

TEST_F(ForcesTest, LinkPushesCompressedPairApart) {
    add(Vec2(0.0f, 0.0f));
    add(Vec2(60.0f, 0.0f));

    SimulationLink link;
    link.source = 0;
    link.target = 1;
    link.distance = 120.0f;

    apply_link_force(nodes, {link}, 1.0f, 1, 1.0f, jiggle);

    EXPECT_LT(nodes[0].velocity.x, 0.0f);
    EXPECT_GT(nodes[1].velocity.x, 0.0f);
}

TEST_F(ForcesTest, LinkScalesWithAlpha) {
    add(Vec2(0.0f, 0.0f));
    add(Vec2(200.0f, 0.0f));

    SimulationLink link;
    link.source = 0;
    link.target = 1;
    link.bias = 0.5f;

    apply_link_force(nodes, {link}, 0.5f, 1, 1.0f, jiggle);
    EXPECT_FLOAT_EQ(nodes[0].velocity.x, 20.0f);
}

TEST_F(ForcesTest, ManyBodyRepelsSymmetrically) {
    add(Vec2(0.0f, 0.0f));
    add(Vec2(10.0f, 0.0f));

    apply_many_body_force(nodes, -300.0f, 0.0f, 1.0f, 1.0f, jiggle);

    // delta * s * alpha / d^2 = 10 * -300 / 100
    EXPECT_FLOAT_EQ(nodes[0].velocity.x, -30.0f);
    EXPECT_FLOAT_EQ(nodes[1].velocity.x, 30.0f);
}

TEST_F(ForcesTest, ManyBodyDistanceFloor) {
    add(Vec2(0.0f, 0.0f));
    add(Vec2(0.5f, 0.0f));

    apply_many_body_force(nodes, -1.0f, 0.0f, 1.0f, 1.0f, jiggle);

    // d^2 = 0.25 is floored to 1
    EXPECT_FLOAT_EQ(nodes[0].velocity.x, -0.5f);
}

TEST_F(ForcesTest, BarnesHutApproximatesExact) {
    for (int i = 0; i < 40; ++i) {
        float angle = static_cast<float>(i) * 2.4f;
        float radius = 15.0f * std::sqrt(static_cast<float>(i) + 1.0f);
        add(Vec2(radius * std::cos(angle), radius * std::sin(angle)));
    }
    std::vector<SimulationNode> exact = nodes;

    apply_many_body_force(exact, -300.0f, 0.0f, 1.0f, 1.0f, jiggle);
    apply_many_body_force(nodes, -300.0f, 0.5f, 1.0f, 1.0f, jiggle);

    float error = 0.0f;
    float magnitude = 0.0f;
    for (size_t i = 0; i < nodes.size(); ++i) {
        error += (nodes[i].velocity - exact[i].velocity).length();
        magnitude += exact[i].velocity.length();
    }
    EXPECT_LT(error / magnitude, 0.05f);
}

TEST_F(ForcesTest, CoincidentNodesAreSeparated) {
    add(Vec2(5.0f, 5.0f));
    add(Vec2(5.0f, 5.0f));

    apply_many_body_force(nodes, -300.0f, 0.0f, 1.0f, 1.0f, jiggle);

    EXPECT_TRUE(nodes[0].velocity.is_finite());
    EXPECT_TRUE(nodes[1].velocity.is_finite());
    EXPECT_GT(nodes[0].velocity.length(), 0.0f);
}

TEST_F(ForcesTest, CenterMovesCentroidToCenter) {
    add(Vec2(0.0f, 0.0f));
    add(Vec2(10.0f, 20.0f));

    apply_center_force(nodes, Vec2(450.0f, 300.0f), 1.0f);

    EXPECT_FLOAT_EQ(nodes[0].position.x, 445.0f);
    EXPECT_FLOAT_EQ(nodes[0].position.y, 290.0f);
    EXPECT_FLOAT_EQ(nodes[1].position.x, 455.0f);
    EXPECT_FLOAT_EQ(nodes[1].position.y, 310.0f);
}

TEST_F(ForcesTest, CollisionResolvesOverlap) {
    add(Vec2(0.0f, 0.0f), 6.0f);
    add(Vec2(6.0f, 0.0f), 6.0f);

    apply_collision_force(nodes, 0.0f, 1.0f, 1, 1.0f, jiggle);

    EXPECT_FLOAT_EQ(nodes[0].velocity.x, -3.0f);
    EXPECT_FLOAT_EQ(nodes[1].velocity.x, 3.0f);

    // Predicted positions just touch
    Vec2 a = nodes[0].position + nodes[0].velocity;
    Vec2 b = nodes[1].position + nodes[1].velocity;
    EXPECT_FLOAT_EQ(a.distance_to(b), 12.0f);
}

TEST_F(ForcesTest, CollisionIncludesPadding) {
    add(Vec2(0.0f, 0.0f), 6.0f);
    add(Vec2(20.0f, 0.0f), 6.0f);

    apply_collision_force(nodes, 0.0f, 1.0f, 1, 1.0f, jiggle);
    EXPECT_FLOAT_EQ(nodes[0].velocity.x, 0.0f);

    apply_collision_force(nodes, 10.0f, 1.0f, 1, 1.0f, jiggle);
    EXPECT_LT(nodes[0].velocity.x, 0.0f);
}

TEST_F(ForcesTest, CollisionMovesSmallerNodeMore) {
    add(Vec2(0.0f, 0.0f), 20.0f);
    add(Vec2(10.0f, 0.0f), 6.0f);

    apply_collision_force(nodes, 0.0f, 1.0f, 1, 1.0f, jiggle);

    EXPECT_LT(std::abs(nodes[0].velocity.x), std::abs(nodes[1].velocity.x));
}

TEST_F(ForcesTest, ClusterPullsTowardAnchor) {
    add(Vec2(0.0f, 0.0f), 6.0f, "method");
    add(Vec2(0.0f, 0.0f), 6.0f, "unknown");

    TypeAnchors anchors{{"method", Vec2(100.0f, 50.0f)}};
    apply_cluster_force(nodes, anchors, Vec2(-10.0f, 0.0f), 0.1f, 1.0f);

    EXPECT_FLOAT_EQ(nodes[0].velocity.x, 10.0f);
    EXPECT_FLOAT_EQ(nodes[0].velocity.y, 5.0f);
    EXPECT_FLOAT_EQ(nodes[1].velocity.x, -1.0f);
}

TEST(JiggleTest, SameSeedSameSequence) {
    Jiggle a(7);
    Jiggle b(7);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(a.direction(), b.direction());
    }
}

TEST(JiggleTest, NondegenerateKeepsNonZero) {
    Jiggle jiggle(1);
    EXPECT_EQ(nondegenerate(Vec2(1.0f, 2.0f), 1.0f, jiggle), Vec2(1.0f, 2.0f));

    Vec2 fixed = nondegenerate(Vec2::zero(), 0.5f, jiggle);
    EXPECT_NEAR(fixed.length(), 0.5f, 1e-5f);
}
