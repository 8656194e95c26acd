#include <gtest/gtest.h>
#include <calculator/bicycle_calculator.hpp>
#include <common/errors.hpp>
#include <presentation/rounding.hpp>
#include "test_helpers.hpp"

using namespace bikecalc;
using namespace bikecalc::test;

class BicycleCalculatorTest : public ::testing::Test {
protected:
    Bicycle bicycle;

    void SetUp() override {
        bicycle = simple_bicycle();
    }
};

TEST_F(BicycleCalculatorTest, DerailerCapacity) {
    bicycle.front_cogs = {26, 36};
    bicycle.rear_cogs = {12, 18, 32};
    EXPECT_EQ(derailer_capacity(bicycle), 30u);
}

TEST_F(BicycleCalculatorTest, GearRatios) {
    auto ratios = gear_ratios(bicycle);
    EXPECT_DOUBLE_EQ(ratios.at(CogPair{40, 20}), 2.0);
    EXPECT_DOUBLE_EQ(ratios.at(CogPair{40, 30}), 40.0 / 30.0);
}

TEST_F(BicycleCalculatorTest, GainRatiosUseRearWheel) {
    auto ratios = gain_ratios(bicycle);
    // Rear wheel is 600 mm; the 700 mm front wheel must not be used
    EXPECT_DOUBLE_EQ(ratios.at(CogPair{40, 30}), 4.0);
    EXPECT_DOUBLE_EQ(ratios.at(CogPair{40, 20}), 6.0);
}

TEST_F(BicycleCalculatorTest, SpeedsAndCadences) {
    auto speeds = rounded(cadence_to_speeds(bicycle, 2.0), 1);
    EXPECT_DOUBLE_EQ(speeds.at(CogPair{40, 30}), 18.1);
    EXPECT_DOUBLE_EQ(speeds.at(CogPair{40, 20}), 27.1);

    auto cadences = rounded(speed_to_cadences(bicycle, 18.1), 1);
    EXPECT_DOUBLE_EQ(cadences.at(CogPair{40, 30}), 2.0);
    EXPECT_DOUBLE_EQ(cadences.at(CogPair{40, 20}), 1.3);
}

TEST_F(BicycleCalculatorTest, SkidPatches) {
    bicycle.front_cogs = {50};
    bicycle.rear_cogs = {25, 30};

    auto single = num_skid_patches(bicycle);
    EXPECT_EQ(single.at(CogPair{50, 25}), 1u);
    EXPECT_EQ(single.at(CogPair{50, 30}), 3u);

    auto both = num_skid_patches(bicycle, true);
    EXPECT_EQ(both.at(CogPair{50, 30}), 6u);
}

TEST_F(BicycleCalculatorTest, TrailUsesFrontWheel) {
    Trail result = rounded(trail(bicycle), 1);
    EXPECT_DOUBLE_EQ(result.trail, 40.1);
    EXPECT_DOUBLE_EQ(result.mechanical_trail, 38.3);
    EXPECT_DOUBLE_EQ(result.wheel_flop, 11.2);
}

TEST_F(BicycleCalculatorTest, MissingMeasurementsRaiseInvalidInput) {
    bicycle.crank_length.reset();
    EXPECT_THROW(gain_ratios(bicycle), InvalidInput);
    EXPECT_THROW(cadence_to_speeds(bicycle, 1.0), InvalidInput);
    EXPECT_THROW(speed_to_cadences(bicycle, 20.0), InvalidInput);

    // Gear ratios do not need the crank
    EXPECT_NO_THROW(gear_ratios(bicycle));

    bicycle.fork_rake.reset();
    EXPECT_THROW(trail(bicycle), InvalidInput);

    bicycle.rear_cogs.clear();
    EXPECT_THROW(derailer_capacity(bicycle), InvalidInput);
    EXPECT_THROW(num_skid_patches(bicycle), InvalidInput);
}

TEST_F(BicycleCalculatorTest, HorizontalHeadTubeIsDomainError) {
    bicycle.head_tube_angle = 180.0;
    EXPECT_THROW(trail(bicycle), DomainError);
}

TEST_F(BicycleCalculatorTest, ZeroCrankLengthIsDomainError) {
    bicycle.crank_length = 0.0;
    EXPECT_THROW(gain_ratios(bicycle), DomainError);
    EXPECT_THROW(cadence_to_speeds(bicycle, 1.0), DomainError);
    EXPECT_THROW(speed_to_cadences(bicycle, 20.0), DomainError);
}

TEST_F(BicycleCalculatorTest, ToothlessCogIsDomainError) {
    bicycle.rear_cogs = {0, 20};
    EXPECT_THROW(gear_ratios(bicycle), DomainError);
    EXPECT_THROW(num_skid_patches(bicycle), DomainError);
}

TEST_F(BicycleCalculatorTest, RecordUnchanged) {
    Bicycle before = bicycle;
    gain_ratios(bicycle);
    trail(bicycle);
    EXPECT_EQ(bicycle.front_cogs, before.front_cogs);
    EXPECT_EQ(bicycle.rear_cogs, before.rear_cogs);
    EXPECT_EQ(bicycle.crank_length, before.crank_length);
    EXPECT_EQ(bicycle.rear_wheel.diameter, before.rear_wheel.diameter);
}

TEST(WheelCalculator, SpokeLengths) {
    PerSide<double> lengths = rounded(spoke_lengths(laced_rear_wheel()), 1);
    EXPECT_DOUBLE_EQ(lengths.left, 270.3);
    EXPECT_DOUBLE_EQ(lengths.right, 269.2);
}

TEST(WheelCalculator, SpokeGeometryCopiesMeasurements) {
    SpokeGeometry geometry = spoke_geometry(laced_rear_wheel());
    EXPECT_DOUBLE_EQ(geometry.center_to_flange.left, 37.1);
    EXPECT_DOUBLE_EQ(geometry.center_to_flange.right, 20.9);
    EXPECT_DOUBLE_EQ(geometry.erd, 560.0);
    EXPECT_EQ(geometry.num_spokes, 36u);
    EXPECT_EQ(geometry.num_crosses, 3u);
    EXPECT_DOUBLE_EQ(geometry.offset, 3.0);
}

TEST(WheelCalculator, SpokeLengthsNeedHubMeasurements) {
    Wheel wheel = laced_rear_wheel();
    wheel.flange_diameter.right.reset();
    EXPECT_THROW(spoke_lengths(wheel), InvalidInput);
}

TEST(WheelCalculator, OddSpokeCountIsDomainError) {
    Wheel wheel = laced_rear_wheel();
    wheel.num_spokes = 33;
    EXPECT_THROW(spoke_lengths(wheel), DomainError);
}

TEST(WheelCalculator, ApproxDiameter) {
    Wheel wheel;
    wheel.bsd = 584.0;
    wheel.tire_width = 42.0;
    EXPECT_DOUBLE_EQ(approx_diameter(wheel), 668.0);

    // A measured diameter is left alone
    wheel.diameter = 660.0;
    EXPECT_DOUBLE_EQ(approx_diameter(wheel), 668.0);
    EXPECT_DOUBLE_EQ(*wheel.diameter, 660.0);
}

TEST(WheelCalculator, ApproxDiameterNeedsTire) {
    EXPECT_THROW(approx_diameter(Wheel{}), InvalidInput);
}
