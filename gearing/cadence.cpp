#include "cadence.hpp"
#include "ratios.hpp"
#include <common/errors.hpp>
#include <numbers>

namespace bikecalc {

namespace {

// km/h produced by one pedal revolution per second in the given gear:
// the pedal circle times the gain ratio
double speed_per_hertz(double crank_length, double gain) {
    return 2.0 * std::numbers::pi * crank_length * gain * kMillimetersPerSecondToKph;
}

}  // namespace

CogPairMap<double> cadence_to_speeds(double cadence,
                                     const CogList& front_cogs, const CogList& rear_cogs,
                                     double crank_length, double wheel_diameter) {
    CogPairMap<double> result;
    for (const auto& [pair, gain] :
         gain_ratios(front_cogs, rear_cogs, crank_length, wheel_diameter)) {
        result[pair] = speed_per_hertz(crank_length, gain) * cadence;
    }
    return result;
}

CogPairMap<double> speed_to_cadences(double speed,
                                     const CogList& front_cogs, const CogList& rear_cogs,
                                     double crank_length, double wheel_diameter) {
    CogPairMap<double> result;
    for (const auto& [pair, gain] :
         gain_ratios(front_cogs, rear_cogs, crank_length, wheel_diameter)) {
        // A zero wheel diameter leaves every gear without forward travel
        double per_hertz = speed_per_hertz(crank_length, gain);
        if (per_hertz == 0.0) {
            throw DomainError("cadence undefined for cog pair " + to_string(pair) +
                              ": gear produces no forward travel");
        }
        result[pair] = speed / per_hertz;
    }
    return result;
}

}  // namespace bikecalc
