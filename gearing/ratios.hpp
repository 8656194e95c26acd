#ifndef BIKECALC_GEARING_RATIOS_HPP
#define BIKECALC_GEARING_RATIOS_HPP

#include "cog_pairs.hpp"

namespace bikecalc {

// Tooth ratio front / rear (dimensionless)
double gear_ratio(const CogPair& pair);

// Distance travelled by the bicycle per unit distance travelled by the
// pedal, (wheel_diameter / 2 / crank_length) * (front / rear).
// wheel_diameter is the driven (rear) wheel. Throws DomainError unless
// crank_length and wheel_diameter are positive.
double gain_ratio(const CogPair& pair, double crank_length, double wheel_diameter);

// Ratios for every cog pair, unrounded
CogPairMap<double> gear_ratios(const CogList& front_cogs, const CogList& rear_cogs);

CogPairMap<double> gain_ratios(const CogList& front_cogs, const CogList& rear_cogs,
                               double crank_length, double wheel_diameter);

}  // namespace bikecalc

#endif // BIKECALC_GEARING_RATIOS_HPP
