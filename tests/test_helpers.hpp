#ifndef BIKECALC_TEST_HELPERS_HPP
#define BIKECALC_TEST_HELPERS_HPP

#include <bicycle/bicycle.hpp>
#include <bicycle/wheel.hpp>
#include <string>

namespace bikecalc {
namespace test {

// Wheel with only a measured diameter
inline Wheel wheel_with_diameter(double diameter) {
    Wheel wheel;
    wheel.diameter = diameter;
    return wheel;
}

// Rear wheel from the spoke length worked example:
// 36 spokes, 3 cross, 560 ERD, rim offset 3 mm toward the drive side
inline Wheel laced_rear_wheel() {
    Wheel wheel;
    wheel.name = "Rear 36h";
    wheel.erd = 560.0;
    wheel.center_to_flange = {37.1, 20.9};
    wheel.flange_diameter = {45.0, 45.0};
    wheel.spoke_hole_diameter = 2.6;
    wheel.num_spokes = 36;
    wheel.num_crosses = 3;
    wheel.offset = 3.0;
    return wheel;
}

// Single chainring, two sprockets, 100 mm cranks on a 600 mm wheel.
// Gain ratios come out at whole numbers (4 and 6).
inline Bicycle simple_bicycle() {
    Bicycle bicycle;
    bicycle.name = "Test bike";
    bicycle.front_cogs = {40};
    bicycle.rear_cogs = {20, 30};
    bicycle.crank_length = 100.0;
    bicycle.head_tube_angle = 73.0;
    bicycle.fork_rake = 64.0;
    bicycle.front_wheel = wheel_with_diameter(700.0);
    bicycle.rear_wheel = wheel_with_diameter(600.0);
    return bicycle;
}

}  // namespace test
}  // namespace bikecalc

#endif // BIKECALC_TEST_HELPERS_HPP
