#include <gtest/gtest.h>
#include "geometry.hpp"
#include <cmath>
#include <numbers>

using namespace sectionpath;

TEST(Vec2Test, DefaultConstruction) {
    Vec2 v;
    EXPECT_DOUBLE_EQ(v.x, 0.0);
    EXPECT_DOUBLE_EQ(v.y, 0.0);
}

TEST(Vec2Test, Arithmetic) {
    Vec2 a(1.0, 2.0);
    Vec2 b(4.0, -5.0);
    Vec2 c = a + b;
    EXPECT_DOUBLE_EQ(c.x, 5.0);
    EXPECT_DOUBLE_EQ(c.y, -3.0);

    Vec2 d = (b - a) * 2.0;
    EXPECT_DOUBLE_EQ(d.x, 6.0);
    EXPECT_DOUBLE_EQ(d.y, -14.0);

    Vec2 e = 0.5 * d;
    EXPECT_DOUBLE_EQ(e.x, 3.0);
    EXPECT_DOUBLE_EQ(e.y, -7.0);
}

TEST(Vec2Test, DotAndCross) {
    Vec2 x(1.0, 0.0);
    Vec2 y(0.0, 1.0);
    EXPECT_DOUBLE_EQ(x.dot(y), 0.0);
    EXPECT_DOUBLE_EQ(x.cross(y), 1.0);
    EXPECT_DOUBLE_EQ(y.cross(x), -1.0);
}

TEST(Vec2Test, Length) {
    Vec2 v(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v.length(), 5.0);
    EXPECT_DOUBLE_EQ(Vec2(1.0, 1.0).distance_to(Vec2(4.0, 5.0)), 5.0);
}

TEST(Vec2Test, RotationIsCounterClockwise) {
    Vec2 r = Vec2(1.0, 0.0).rotated(90.0);
    EXPECT_NEAR(r.x, 0.0, 1e-12);
    EXPECT_NEAR(r.y, 1.0, 1e-12);

    Vec2 about = Vec2(2.0, 1.0).rotated_about({1.0, 1.0}, 180.0);
    EXPECT_NEAR(about.x, 0.0, 1e-12);
    EXPECT_NEAR(about.y, 1.0, 1e-12);
}

TEST(Vec2Test, Direction) {
    Vec2 d = direction(135.0);
    EXPECT_NEAR(d.x, -std::sqrt(0.5), 1e-12);
    EXPECT_NEAR(d.y, std::sqrt(0.5), 1e-12);
    EXPECT_NEAR(d.length(), 1.0, 1e-12);
}

TEST(AnglesTest, Conversions) {
    EXPECT_NEAR(deg_to_rad(180.0), std::numbers::pi, 1e-15);
    EXPECT_NEAR(rad_to_deg(std::numbers::pi / 2.0), 90.0, 1e-12);
    EXPECT_NEAR(slope_to_angle(100.0), 45.0, 1e-12);
    EXPECT_DOUBLE_EQ(slope_to_angle(0.0), 0.0);
}
