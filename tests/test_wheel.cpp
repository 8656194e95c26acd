#include <gtest/gtest.h>
#include <bicycle/wheel.hpp>
#include <common/errors.hpp>
#include <wheel/diameter.hpp>
#include <cmath>

using namespace bikecalc;

TEST(ApproxWheelDiameter, BeadSeatPlusTwoTires) {
    EXPECT_DOUBLE_EQ(approx_wheel_diameter(584.0, 42.0), 668.0);
    EXPECT_DOUBLE_EQ(approx_wheel_diameter(622.0, 25.0), 672.0);
}

TEST(ApproxWheelDiameter, NonFinite) {
    EXPECT_THROW(approx_wheel_diameter(std::nan(""), 42.0), DomainError);
}

TEST(ApproxWheelDiameter, NonPositiveMeasurements) {
    EXPECT_THROW(approx_wheel_diameter(0.0, 42.0), DomainError);
    EXPECT_THROW(approx_wheel_diameter(584.0, -42.0), DomainError);
}

TEST(Wheel, Defaults) {
    Wheel wheel;
    EXPECT_FALSE(wheel.diameter.has_value());
    EXPECT_FALSE(wheel.bsd.has_value());
    EXPECT_FALSE(wheel.center_to_flange.left.has_value());
    EXPECT_FALSE(wheel.center_to_flange.right.has_value());
    EXPECT_FALSE(wheel.num_spokes.has_value());
    EXPECT_DOUBLE_EQ(wheel.spoke_hole_diameter, 2.6);
    EXPECT_EQ(wheel.num_crosses, 3u);
    EXPECT_DOUBLE_EQ(wheel.offset, 0.0);
}

TEST(Wheel, DefaultsAreNotShared) {
    Wheel first;
    Wheel second;
    first.center_to_flange.left = 35.0;
    EXPECT_FALSE(second.center_to_flange.left.has_value());
}

TEST(Wheel, FromTireFillsDiameter) {
    Wheel wheel = Wheel::from_tire(584.0, 42.0);
    ASSERT_TRUE(wheel.diameter.has_value());
    EXPECT_DOUBLE_EQ(*wheel.diameter, 668.0);
    EXPECT_DOUBLE_EQ(*wheel.bsd, 584.0);
    EXPECT_DOUBLE_EQ(*wheel.tire_width, 42.0);
}

TEST(Wheel, Presets) {
    auto road = Wheel::road_700c();
    auto gravel = Wheel::gravel_650b();
    auto mtb = Wheel::mtb_29er();

    EXPECT_DOUBLE_EQ(*road.diameter, 672.0);
    EXPECT_LT(*road.tire_width, *gravel.tire_width);
    EXPECT_LT(*gravel.tire_width, *mtb.tire_width);
    EXPECT_EQ(*road.bsd, *mtb.bsd);
}

TEST(PerSide, AccessBySide) {
    PerSide<double> sides{1.0, 2.0};
    EXPECT_DOUBLE_EQ(sides.at(Side::Left), 1.0);
    EXPECT_DOUBLE_EQ(sides.at(Side::Right), 2.0);

    sides.at(Side::Right) = 5.0;
    EXPECT_DOUBLE_EQ(sides.right, 5.0);
    EXPECT_STREQ(side_name(Side::Left), "left");
    EXPECT_STREQ(side_name(Side::Right), "right");
}
