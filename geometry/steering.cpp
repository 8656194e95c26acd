#include "steering.hpp"
#include <common/errors.hpp>
#include <cmath>
#include <numbers>
#include <sstream>

namespace bikecalc {

namespace {

double radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

}  // namespace

Trail trail(double head_tube_angle, double fork_rake, double wheel_diameter) {
    // sin(pi) is not exactly zero in floating point, so test the angle itself
    if (!std::isfinite(head_tube_angle) || std::fmod(head_tube_angle, 180.0) == 0.0) {
        std::ostringstream ss;
        ss << "trail undefined for head_tube_angle=" << head_tube_angle
           << ": steering axis is horizontal";
        throw DomainError(ss.str());
    }
    if (!std::isfinite(fork_rake)) {
        std::ostringstream ss;
        ss << "trail undefined for fork_rake=" << fork_rake;
        throw DomainError(ss.str());
    }
    if (!std::isfinite(wheel_diameter) || !(wheel_diameter > 0.0)) {
        std::ostringstream ss;
        ss << "trail undefined for wheel_diameter=" << wheel_diameter;
        throw DomainError(ss.str());
    }

    double a = radians(head_tube_angle);
    double wheel_radius = wheel_diameter / 2.0;

    Trail result;
    result.trail = (wheel_radius * std::cos(a) - fork_rake) / std::sin(a);
    result.mechanical_trail = result.trail * std::sin(a);
    result.wheel_flop = result.trail * std::sin(a) * std::cos(a);
    return result;
}

}  // namespace bikecalc
