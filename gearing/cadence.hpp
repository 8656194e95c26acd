#ifndef BIKECALC_GEARING_CADENCE_HPP
#define BIKECALC_GEARING_CADENCE_HPP

#include "cog_pairs.hpp"

namespace bikecalc {

// Cadence is in revolutions per second (Hz), speed in km/h.
// Both directions recompute the gain ratios from the raw measurements so
// that speed_to_cadences(cadence_to_speeds(c)) gives back c.

// mm/s to km/h
inline constexpr double kMillimetersPerSecondToKph = 3600.0 / 1e6;

// Speed reached in each gear at the given cadence
CogPairMap<double> cadence_to_speeds(double cadence,
                                     const CogList& front_cogs, const CogList& rear_cogs,
                                     double crank_length, double wheel_diameter);

// Cadence needed in each gear to hold the given speed
CogPairMap<double> speed_to_cadences(double speed,
                                     const CogList& front_cogs, const CogList& rear_cogs,
                                     double crank_length, double wheel_diameter);

}  // namespace bikecalc

#endif // BIKECALC_GEARING_CADENCE_HPP
