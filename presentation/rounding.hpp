#ifndef BIKECALC_PRESENTATION_ROUNDING_HPP
#define BIKECALC_PRESENTATION_ROUNDING_HPP

// Output rounding. Applied once, to final results only; calculations
// always work on unrounded values.

#include <bicycle/per_side.hpp>
#include <gearing/cog_pairs.hpp>
#include <geometry/steering.hpp>
#include <cmath>
#include <limits>

namespace bikecalc {

// Round to the given number of decimal digits, halves away from zero.
// Negative digits round to tens, hundreds and so on.
inline double round_to(double value, int digits) {
    double scale = std::pow(10.0, digits);
    if (scale == 0.0) {
        return 0.0;
    }
    double scaled = value * scale;
    // Already finer than a double can hold at this magnitude
    if (!std::isfinite(scaled) || std::abs(scaled) >= 1.0 / std::numeric_limits<double>::epsilon()) {
        return value;
    }
    return std::round(scaled) / scale;
}

inline CogPairMap<double> rounded(const CogPairMap<double>& values, int digits) {
    CogPairMap<double> result;
    for (const auto& [pair, value] : values) {
        result.emplace(pair, round_to(value, digits));
    }
    return result;
}

inline PerSide<double> rounded(const PerSide<double>& values, int digits) {
    return PerSide<double>{round_to(values.left, digits), round_to(values.right, digits)};
}

inline Trail rounded(const Trail& values, int digits) {
    return Trail{round_to(values.trail, digits),
                 round_to(values.mechanical_trail, digits),
                 round_to(values.wheel_flop, digits)};
}

}  // namespace bikecalc

#endif // BIKECALC_PRESENTATION_ROUNDING_HPP
