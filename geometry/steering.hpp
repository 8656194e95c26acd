#ifndef BIKECALC_GEOMETRY_STEERING_HPP
#define BIKECALC_GEOMETRY_STEERING_HPP

namespace bikecalc {

// Steering geometry of the front end (mm)
struct Trail {
    double trail = 0.0;             // Ground distance from contact patch to steering axis
    double mechanical_trail = 0.0;  // Trail measured perpendicular to the steering axis
    double wheel_flop = 0.0;        // Drop of the head tube when the bars are turned 90 degrees

    bool operator==(const Trail&) const = default;
};

// head_tube_angle in degrees, fork_rake and wheel_diameter in mm.
// wheel_diameter is the front wheel.
// Throws DomainError when the head tube angle is a multiple of 180 degrees,
// the rake is not finite or the wheel diameter is not positive.
Trail trail(double head_tube_angle, double fork_rake, double wheel_diameter);

}  // namespace bikecalc

#endif // BIKECALC_GEOMETRY_STEERING_HPP
