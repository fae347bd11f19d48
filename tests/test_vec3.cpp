#include <gtest/gtest.h>
#include <math/vec3.hpp>

using namespace traitgalaxy;

TEST(Vec3Test, DefaultConstructionIsOrigin) {
    Vec3 v;
    EXPECT_TRUE(v.is_zero());
    EXPECT_EQ(v, Vec3::zero());
}

TEST(Vec3Test, ArithmeticIsComponentWise) {
    Vec3 a(1.0f, 2.0f, 3.0f);
    Vec3 b(4.0f, 5.0f, 6.0f);

    Vec3 sum = a + b;
    EXPECT_FLOAT_EQ(sum.x, 5.0f);
    EXPECT_FLOAT_EQ(sum.y, 7.0f);
    EXPECT_FLOAT_EQ(sum.z, 9.0f);

    Vec3 scaled = 2.0f * a - b;
    EXPECT_FLOAT_EQ(scaled.x, -2.0f);
    EXPECT_FLOAT_EQ(scaled.y, -1.0f);
    EXPECT_FLOAT_EQ(scaled.z, 0.0f);

    EXPECT_FLOAT_EQ(a.dot(b), 32.0f);
}

TEST(Vec3Test, LengthAndDistance) {
    Vec3 v(3.0f, 4.0f, 0.0f);
    EXPECT_FLOAT_EQ(v.length(), 5.0f);
    EXPECT_FLOAT_EQ(v.length_squared(), 25.0f);
    EXPECT_FLOAT_EQ(Vec3(1.0f, 1.0f, 1.0f).distance_to(Vec3(1.0f, 4.0f, 5.0f)), 5.0f);
}

TEST(Vec3Test, NormalizedZeroStaysZero) {
    EXPECT_EQ(Vec3::zero().normalized(), Vec3::zero());

    Vec3 n = Vec3(3.0f, 4.0f, 0.0f).normalized();
    EXPECT_FLOAT_EQ(n.length(), 1.0f);
    EXPECT_FLOAT_EQ(n.x, 0.6f);
    EXPECT_FLOAT_EQ(n.y, 0.8f);
}

TEST(Vec3Test, WithLengthKeepsDirection) {
    Vec3 v = Vec3(0.0f, 0.0f, 2.0f).with_length(7.0f);
    EXPECT_FLOAT_EQ(v.x, 0.0f);
    EXPECT_FLOAT_EQ(v.z, 7.0f);
}
