#ifndef BIKECALC_BICYCLE_WHEEL_HPP
#define BIKECALC_BICYCLE_WHEEL_HPP

#include "per_side.hpp"
#include <wheel/diameter.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace bikecalc {

// Measurements of a bicycle wheel (mm). Anything that may be unknown is
// an explicit optional; the calculator reports what is missing instead
// of guessing.
struct Wheel {
    std::optional<std::string> name;

    // Rim and tire
    std::optional<double> bsd;          // Bead seat diameter, e.g. 584 for a 650b rim
    std::optional<double> erd;          // Effective rim diameter (at the nipple seats)
    std::optional<double> tire_width;
    std::optional<double> diameter;     // Inflated rolling diameter

    // Hub
    PerSide<std::optional<double>> center_to_flange;   // e.g. {37.1, 20.9}
    PerSide<std::optional<double>> flange_diameter;    // e.g. {45, 45}

    // Lacing
    double spoke_hole_diameter = 2.6;
    std::optional<uint32_t> num_spokes;
    uint32_t num_crosses = 3;
    double offset = 0.0;                // Off-center (asymmetric) rims

    // Wheel with its diameter estimated from rim and tire
    static Wheel from_tire(double bsd, double tire_width) {
        Wheel wheel;
        wheel.bsd = bsd;
        wheel.tire_width = tire_width;
        wheel.diameter = approx_wheel_diameter(bsd, tire_width);
        return wheel;
    }

    // Factory methods for common wheel sizes
    static Wheel road_700c() {
        Wheel wheel = from_tire(622.0, 25.0);
        wheel.name = "700x25c";
        wheel.erd = 602.0;
        wheel.num_spokes = 32;
        return wheel;
    }

    static Wheel gravel_650b() {
        Wheel wheel = from_tire(584.0, 47.0);
        wheel.name = "650bx47";
        wheel.erd = 564.0;
        wheel.num_spokes = 32;
        return wheel;
    }

    static Wheel mtb_29er() {
        Wheel wheel = from_tire(622.0, 56.0);
        wheel.name = "29x2.2";
        wheel.erd = 604.0;
        wheel.num_spokes = 32;
        return wheel;
    }
};

}  // namespace bikecalc

#endif // BIKECALC_BICYCLE_WHEEL_HPP
