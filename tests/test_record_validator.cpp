#include <gtest/gtest.h>
#include <common/errors.hpp>
#include <validation/record_validator.hpp>
#include "test_helpers.hpp"
#include <algorithm>

using namespace bikecalc;
using namespace bikecalc::test;

namespace {

bool mentions(const ValidationResult& result, const std::string& text) {
    return std::any_of(result.errors().begin(), result.errors().end(),
                       [&](const std::string& error) {
                           return error.find(text) != std::string::npos;
                       });
}

}  // namespace

TEST(RecordValidator, CompleteBicyclePasses) {
    Bicycle bicycle = simple_bicycle();
    EXPECT_TRUE(check_cogs(bicycle).ok());
    EXPECT_TRUE(check_gain(bicycle).ok());
    EXPECT_TRUE(check_steering(bicycle).ok());
}

TEST(RecordValidator, EmptyBicycleReportsEverything) {
    Bicycle bicycle;
    ValidationResult result = check_gain(bicycle);

    EXPECT_TRUE(result.has_errors());
    EXPECT_EQ(result.errors().size(), 4u);
    EXPECT_TRUE(mentions(result, "front_cogs"));
    EXPECT_TRUE(mentions(result, "rear_cogs"));
    EXPECT_TRUE(mentions(result, "crank_length"));
    EXPECT_TRUE(mentions(result, "rear_wheel.diameter"));
}

TEST(RecordValidator, ValuesAreNotRangeChecked) {
    // Impossible values are the calculation's to reject
    Bicycle bicycle = simple_bicycle();
    bicycle.rear_cogs = {0, 20};
    bicycle.crank_length = 0.0;
    bicycle.head_tube_angle = 180.0;
    EXPECT_TRUE(check_cogs(bicycle).ok());
    EXPECT_TRUE(check_gain(bicycle).ok());
    EXPECT_TRUE(check_steering(bicycle).ok());

    Wheel wheel = laced_rear_wheel();
    wheel.num_spokes = 33;
    wheel.erd = -1.0;
    EXPECT_TRUE(check_spokes(wheel).ok());
}

TEST(RecordValidator, GainUsesRearWheel) {
    Bicycle bicycle = simple_bicycle();
    bicycle.rear_wheel.diameter.reset();
    EXPECT_TRUE(mentions(check_gain(bicycle), "rear_wheel.diameter"));

    // The front wheel does not stand in for the rear one
    EXPECT_TRUE(bicycle.front_wheel.diameter.has_value());
    EXPECT_FALSE(check_gain(bicycle).ok());
}

TEST(RecordValidator, SteeringUsesFrontWheel) {
    Bicycle bicycle = simple_bicycle();
    bicycle.front_wheel.diameter.reset();
    ValidationResult result = check_steering(bicycle);
    EXPECT_EQ(result.errors().size(), 1u);
    EXPECT_TRUE(mentions(result, "front_wheel.diameter"));
}

TEST(RecordValidator, HeadTubeAngleMissing) {
    Bicycle bicycle = simple_bicycle();
    bicycle.head_tube_angle.reset();
    EXPECT_TRUE(mentions(check_steering(bicycle), "head_tube_angle is not set"));
}

TEST(RecordValidator, NegativeRakeAllowed) {
    Bicycle bicycle = simple_bicycle();
    bicycle.fork_rake = -5.0;
    EXPECT_TRUE(check_steering(bicycle).ok());
}

TEST(RecordValidator, SpokesNeedBothSides) {
    Wheel wheel = laced_rear_wheel();
    EXPECT_TRUE(check_spokes(wheel).ok());

    wheel.center_to_flange.right.reset();
    wheel.flange_diameter.left.reset();
    ValidationResult result = check_spokes(wheel);
    EXPECT_EQ(result.errors().size(), 2u);
    EXPECT_TRUE(mentions(result, "center_to_flange.right"));
    EXPECT_TRUE(mentions(result, "flange_diameter.left"));
}

TEST(RecordValidator, SpokeCountMissing) {
    Wheel wheel = laced_rear_wheel();
    wheel.num_spokes.reset();
    EXPECT_TRUE(mentions(check_spokes(wheel), "num_spokes is not set"));
}

TEST(RecordValidator, TireNeedsBsdAndWidth) {
    Wheel wheel;
    wheel.bsd = 584.0;
    ValidationResult result = check_tire(wheel);
    EXPECT_EQ(result.errors().size(), 1u);
    EXPECT_TRUE(mentions(result, "tire_width"));
}

TEST(RecordValidator, RequireValidThrowsWithContext) {
    Bicycle bicycle;
    bicycle.name = "Fixie";
    try {
        require_valid(check_cogs(bicycle), record_label(bicycle));
        FAIL() << "expected InvalidInput";
    } catch (const InvalidInput& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("Bicycle 'Fixie'"), std::string::npos);
        EXPECT_NE(message.find("front_cogs must not be empty"), std::string::npos);
        EXPECT_NE(message.find("rear_cogs must not be empty"), std::string::npos);
    }
}

TEST(RecordValidator, RequireValidPassesCleanResult) {
    EXPECT_NO_THROW(require_valid(ValidationResult{}, "anything"));
}

TEST(RecordValidator, Labels) {
    EXPECT_EQ(record_label(Bicycle{}), "Nameless bicycle");
    EXPECT_EQ(record_label(Wheel{}), "Nameless wheel");
    EXPECT_EQ(record_label(laced_rear_wheel()), "Wheel 'Rear 36h'");
}
