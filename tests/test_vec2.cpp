#include <gtest/gtest.h>
#include <math/vec2.hpp>
#include <cmath>
#include <limits>

using namespace kgviz;

TEST(Vec2Test, DefaultConstruction) {
    Vec2 v;
    EXPECT_FLOAT_EQ(v.x, 0.0f);
    EXPECT_FLOAT_EQ(v.y, 0.0f);
}

TEST(Vec2Test, Arithmetic) {
    Vec2 a(1.0f, 2.0f);
    Vec2 b(4.0f, 6.0f);
    Vec2 c = a + b;
    EXPECT_FLOAT_EQ(c.x, 5.0f);
    EXPECT_FLOAT_EQ(c.y, 8.0f);

    Vec2 d = b - a;
    EXPECT_FLOAT_EQ(d.x, 3.0f);
    EXPECT_FLOAT_EQ(d.y, 4.0f);

    Vec2 e = 2.0f * a;
    EXPECT_EQ(e, Vec2(2.0f, 4.0f));
}

TEST(Vec2Test, LengthAndDistance) {
    Vec2 v(3.0f, 4.0f);
    EXPECT_FLOAT_EQ(v.length(), 5.0f);
    EXPECT_FLOAT_EQ(v.length_squared(), 25.0f);
    EXPECT_FLOAT_EQ(Vec2::zero().distance_to(v), 5.0f);
}

TEST(Vec2Test, Normalized) {
    Vec2 n = Vec2(3.0f, 4.0f).normalized();
    EXPECT_FLOAT_EQ(n.length(), 1.0f);
    EXPECT_FLOAT_EQ(n.x, 0.6f);
    EXPECT_FLOAT_EQ(n.y, 0.8f);
}

TEST(Vec2Test, NormalizedZeroStaysZero) {
    EXPECT_EQ(Vec2::zero().normalized(), Vec2::zero());
}

TEST(Vec2Test, Finite) {
    EXPECT_TRUE(Vec2(1.0f, -1.0f).is_finite());
    EXPECT_FALSE(Vec2(std::numeric_limits<float>::quiet_NaN(), 0.0f).is_finite());
    EXPECT_FALSE(Vec2(0.0f, std::numeric_limits<float>::infinity()).is_finite());
}

TEST(Vec2Test, Lerp) {
    Vec2 mid = lerp(Vec2(0.0f, 0.0f), Vec2(10.0f, -4.0f), 0.5f);
    EXPECT_FLOAT_EQ(mid.x, 5.0f);
    EXPECT_FLOAT_EQ(mid.y, -2.0f);
}
