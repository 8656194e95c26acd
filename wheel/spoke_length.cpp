#include "spoke_length.hpp"
#include <common/errors.hpp>
#include <cmath>
#include <numbers>
#include <sstream>

namespace bikecalc {

double spoke_angle(uint32_t num_spokes, uint32_t num_crosses) {
    if (num_spokes == 0 || num_spokes % 2 != 0) {
        throw DomainError("spoke length undefined for num_spokes=" +
                          std::to_string(num_spokes) + ": needs an even, positive count");
    }
    double spokes_per_side = static_cast<double>(num_spokes) / 2.0;
    return 2.0 * std::numbers::pi * static_cast<double>(num_crosses) / spokes_per_side;
}

PerSide<double> spoke_lengths(const SpokeGeometry& geometry) {
    if (!(geometry.erd > 0.0)) {
        std::ostringstream ss;
        ss << "spoke length undefined for erd=" << geometry.erd << ": must be positive";
        throw DomainError(ss.str());
    }
    if (!(geometry.spoke_hole_diameter >= 0.0)) {
        std::ostringstream ss;
        ss << "spoke length undefined for spoke_hole_diameter="
           << geometry.spoke_hole_diameter << ": must not be negative";
        throw DomainError(ss.str());
    }

    double angle = spoke_angle(geometry.num_spokes, geometry.num_crosses);
    double r2 = geometry.erd / 2.0;
    double r3 = geometry.spoke_hole_diameter / 2.0;

    PerSide<double> result;
    for (Side side : kSides) {
        double offset = side == Side::Right ? geometry.offset : -geometry.offset;
        double d = geometry.center_to_flange.at(side) + offset;
        double r1 = geometry.flange_diameter.at(side) / 2.0;

        double radicand = d * d + r1 * r1 + r2 * r2 - 2.0 * r1 * r2 * std::cos(angle);
        if (!(radicand >= 0.0) || !std::isfinite(radicand)) {
            std::ostringstream ss;
            ss << side_name(side) << " spoke length undefined: hub to rim distance squared is "
               << radicand;
            throw DomainError(ss.str());
        }

        double length = std::sqrt(radicand) - r3;
        if (!(length > 0.0)) {
            std::ostringstream ss;
            ss << side_name(side) << " spoke length is " << length
               << ": spoke_hole_diameter " << geometry.spoke_hole_diameter
               << " exceeds the hub to rim distance";
            throw DomainError(ss.str());
        }
        result.at(side) = length;
    }
    return result;
}

}  // namespace bikecalc
