#ifndef BIKECALC_CALCULATOR_BICYCLE_CALCULATOR_HPP
#define BIKECALC_CALCULATOR_BICYCLE_CALCULATOR_HPP

// Calculations on whole bicycle and wheel records.
//
// Each function checks that the record carries the measurements it needs
// (throwing InvalidInput naming every missing one) and then runs the
// matching formula. Results are never rounded here; see
// presentation/rounding.hpp.
//
// Usage:
//   Bicycle bike{.front_cogs = {34, 50}, .rear_cogs = {11, 13, 15, 17},
//                .crank_length = 172.5, .rear_wheel = Wheel::road_700c()};
//   CogPairMap<double> speeds = cadence_to_speeds(bike, 1.5);

#include <bicycle/bicycle.hpp>
#include <bicycle/wheel.hpp>
#include <gearing/cog_pairs.hpp>
#include <geometry/steering.hpp>
#include <wheel/spoke_length.hpp>

namespace bikecalc {

uint32_t derailer_capacity(const Bicycle& bicycle);

CogPairMap<double> gear_ratios(const Bicycle& bicycle);

// Uses the rear wheel
CogPairMap<double> gain_ratios(const Bicycle& bicycle);

// cadence in Hz, speeds in km/h; uses the rear wheel
CogPairMap<double> cadence_to_speeds(const Bicycle& bicycle, double cadence);
CogPairMap<double> speed_to_cadences(const Bicycle& bicycle, double speed);

CogPairMap<uint32_t> num_skid_patches(const Bicycle& bicycle, bool ambidextrous = false);

// Uses the front wheel
Trail trail(const Bicycle& bicycle);

SpokeGeometry spoke_geometry(const Wheel& wheel);
PerSide<double> spoke_lengths(const Wheel& wheel);

// Estimated from bsd and tire width, independent of wheel.diameter
double approx_diameter(const Wheel& wheel);

}  // namespace bikecalc

#endif // BIKECALC_CALCULATOR_BICYCLE_CALCULATOR_HPP
