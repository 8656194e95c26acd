#include "ratios.hpp"
#include <common/errors.hpp>
#include <cmath>
#include <sstream>

namespace bikecalc {

namespace {

void require_rear_teeth(const CogPair& pair) {
    if (pair.rear == 0) {
        throw DomainError("ratio undefined for cog pair " + to_string(pair) +
                          ": rear cog has no teeth");
    }
}

// Wheel radius per crank length; the gain ratio of a 1:1 gear
double wheel_to_crank(double crank_length, double wheel_diameter) {
    if (!std::isfinite(crank_length) || !(crank_length > 0.0)) {
        std::ostringstream ss;
        ss << "gain ratio undefined for crank_length=" << crank_length;
        throw DomainError(ss.str());
    }
    if (!std::isfinite(wheel_diameter) || !(wheel_diameter > 0.0)) {
        std::ostringstream ss;
        ss << "gain ratio undefined for wheel_diameter=" << wheel_diameter;
        throw DomainError(ss.str());
    }
    return wheel_diameter / 2.0 / crank_length;
}

}  // namespace

double gear_ratio(const CogPair& pair) {
    require_rear_teeth(pair);
    return static_cast<double>(pair.front) / static_cast<double>(pair.rear);
}

double gain_ratio(const CogPair& pair, double crank_length, double wheel_diameter) {
    require_rear_teeth(pair);
    double w = wheel_to_crank(crank_length, wheel_diameter);
    return w * static_cast<double>(pair.front) / static_cast<double>(pair.rear);
}

CogPairMap<double> gear_ratios(const CogList& front_cogs, const CogList& rear_cogs) {
    return map_cog_pairs(front_cogs, rear_cogs,
                         [](const CogPair& pair) { return gear_ratio(pair); });
}

CogPairMap<double> gain_ratios(const CogList& front_cogs, const CogList& rear_cogs,
                               double crank_length, double wheel_diameter) {
    return map_cog_pairs(front_cogs, rear_cogs, [&](const CogPair& pair) {
        return gain_ratio(pair, crank_length, wheel_diameter);
    });
}

}  // namespace bikecalc
