#include "bicycle_calculator.hpp"
#include <common/logging.hpp>
#include <gearing/cadence.hpp>
#include <gearing/derailer.hpp>
#include <gearing/ratios.hpp>
#include <gearing/skid_patches.hpp>
#include <validation/record_validator.hpp>
#include <wheel/diameter.hpp>

namespace bikecalc {

uint32_t derailer_capacity(const Bicycle& bicycle) {
    require_valid(check_cogs(bicycle), record_label(bicycle));
    return derailer_capacity(bicycle.front_cogs, bicycle.rear_cogs);
}

CogPairMap<double> gear_ratios(const Bicycle& bicycle) {
    require_valid(check_cogs(bicycle), record_label(bicycle));
    return gear_ratios(bicycle.front_cogs, bicycle.rear_cogs);
}

CogPairMap<double> gain_ratios(const Bicycle& bicycle) {
    require_valid(check_gain(bicycle), record_label(bicycle));
    logging::get_logger()->debug("Gain ratios for {}: crank {} mm, rear wheel {} mm",
                                 record_label(bicycle), *bicycle.crank_length,
                                 *bicycle.rear_wheel.diameter);
    return gain_ratios(bicycle.front_cogs, bicycle.rear_cogs,
                       *bicycle.crank_length, *bicycle.rear_wheel.diameter);
}

CogPairMap<double> cadence_to_speeds(const Bicycle& bicycle, double cadence) {
    require_valid(check_gain(bicycle), record_label(bicycle));
    logging::get_logger()->debug("Speeds for {} at {} Hz", record_label(bicycle), cadence);
    return cadence_to_speeds(cadence, bicycle.front_cogs, bicycle.rear_cogs,
                             *bicycle.crank_length, *bicycle.rear_wheel.diameter);
}

CogPairMap<double> speed_to_cadences(const Bicycle& bicycle, double speed) {
    require_valid(check_gain(bicycle), record_label(bicycle));
    logging::get_logger()->debug("Cadences for {} at {} km/h", record_label(bicycle), speed);
    return speed_to_cadences(speed, bicycle.front_cogs, bicycle.rear_cogs,
                             *bicycle.crank_length, *bicycle.rear_wheel.diameter);
}

CogPairMap<uint32_t> num_skid_patches(const Bicycle& bicycle, bool ambidextrous) {
    require_valid(check_cogs(bicycle), record_label(bicycle));
    return num_skid_patches(bicycle.front_cogs, bicycle.rear_cogs, ambidextrous);
}

Trail trail(const Bicycle& bicycle) {
    require_valid(check_steering(bicycle), record_label(bicycle));
    logging::get_logger()->debug("Trail for {}: head tube {} deg, rake {} mm, front wheel {} mm",
                                 record_label(bicycle), *bicycle.head_tube_angle,
                                 *bicycle.fork_rake, *bicycle.front_wheel.diameter);
    return trail(*bicycle.head_tube_angle, *bicycle.fork_rake, *bicycle.front_wheel.diameter);
}

SpokeGeometry spoke_geometry(const Wheel& wheel) {
    require_valid(check_spokes(wheel), record_label(wheel));

    SpokeGeometry geometry;
    for (Side side : kSides) {
        geometry.center_to_flange.at(side) = *wheel.center_to_flange.at(side);
        geometry.flange_diameter.at(side) = *wheel.flange_diameter.at(side);
    }
    geometry.spoke_hole_diameter = wheel.spoke_hole_diameter;
    geometry.erd = *wheel.erd;
    geometry.offset = wheel.offset;
    geometry.num_spokes = *wheel.num_spokes;
    geometry.num_crosses = wheel.num_crosses;
    return geometry;
}

PerSide<double> spoke_lengths(const Wheel& wheel) {
    SpokeGeometry geometry = spoke_geometry(wheel);
    logging::get_logger()->debug("Spoke lengths for {}: {} spokes, {} cross, erd {} mm",
                                 record_label(wheel), geometry.num_spokes,
                                 geometry.num_crosses, geometry.erd);
    return spoke_lengths(geometry);
}

double approx_diameter(const Wheel& wheel) {
    require_valid(check_tire(wheel), record_label(wheel));
    return approx_wheel_diameter(*wheel.bsd, *wheel.tire_width);
}

}  // namespace bikecalc
