#include <gtest/gtest.h>
#include <common/errors.hpp>
#include <geometry/steering.hpp>
#include <presentation/rounding.hpp>
#include <cmath>
#include <numbers>

using namespace bikecalc;

TEST(Trail, RoadBike) {
    Trail result = rounded(trail(73.0, 64.0, 700.0), 1);

    EXPECT_DOUBLE_EQ(result.trail, 40.1);
    EXPECT_DOUBLE_EQ(result.mechanical_trail, 38.3);
    EXPECT_DOUBLE_EQ(result.wheel_flop, 11.2);
}

TEST(Trail, DerivedQuantitiesFollowTrail) {
    Trail result = trail(71.5, 45.0, 686.0);
    double a = 71.5 * std::numbers::pi / 180.0;

    EXPECT_NEAR(result.mechanical_trail, result.trail * std::sin(a), 1e-12);
    EXPECT_NEAR(result.wheel_flop, result.trail * std::sin(a) * std::cos(a), 1e-12);
}

TEST(Trail, MoreRakeLessTrail) {
    EXPECT_GT(trail(73.0, 40.0, 700.0).trail, trail(73.0, 55.0, 700.0).trail);
}

TEST(Trail, NegativeRake) {
    Trail result = trail(73.0, -10.0, 700.0);
    EXPECT_GT(result.trail, trail(73.0, 0.0, 700.0).trail);
}

TEST(Trail, VerticalHeadTube) {
    // cos(90) vanishes, so trail is just minus the rake
    Trail result = trail(90.0, 30.0, 700.0);
    EXPECT_NEAR(result.trail, -30.0, 1e-9);
    EXPECT_NEAR(result.wheel_flop, 0.0, 1e-9);
}

TEST(Trail, HorizontalSteeringAxis) {
    EXPECT_THROW(trail(180.0, 64.0, 700.0), DomainError);
    EXPECT_THROW(trail(0.0, 64.0, 700.0), DomainError);
    EXPECT_THROW(trail(360.0, 64.0, 700.0), DomainError);
    EXPECT_THROW(trail(-180.0, 64.0, 700.0), DomainError);
}

TEST(Trail, NonFiniteAngle) {
    EXPECT_THROW(trail(std::nan(""), 64.0, 700.0), DomainError);
}

TEST(Trail, NonFiniteRakeOrDiameter) {
    EXPECT_THROW(trail(73.0, std::nan(""), 700.0), DomainError);
    EXPECT_THROW(trail(73.0, 64.0, std::nan("")), DomainError);
    EXPECT_THROW(trail(73.0, 64.0, HUGE_VAL), DomainError);
}

TEST(Trail, WheelWithoutDiameter) {
    EXPECT_THROW(trail(73.0, 64.0, 0.0), DomainError);
    EXPECT_THROW(trail(73.0, 64.0, -700.0), DomainError);
}
