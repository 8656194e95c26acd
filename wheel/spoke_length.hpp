#ifndef BIKECALC_WHEEL_SPOKE_LENGTH_HPP
#define BIKECALC_WHEEL_SPOKE_LENGTH_HPP

#include <bicycle/per_side.hpp>
#include <cstdint>

namespace bikecalc {

// Hub, rim and lacing measurements for one wheel build (mm)
struct SpokeGeometry {
    PerSide<double> center_to_flange;
    PerSide<double> flange_diameter;
    double spoke_hole_diameter = 2.6;
    double erd = 0.0;
    double offset = 0.0;        // Positive moves the rim toward the right flange
    uint32_t num_spokes = 0;    // Total, half per side
    uint32_t num_crosses = 0;
};

// Angle (radians) around the hub between a spoke's flange hole and the
// rim hole it reaches, for one side carrying num_spokes / 2 spokes
double spoke_angle(uint32_t num_spokes, uint32_t num_crosses);

// Left (non-drive) and right (drive) spoke lengths.
//
// Each spoke is the third side of the triangle formed by the flange hole
// circle (radius r1) and the rim hole circle (radius r2) separated by the
// angle above, lifted axially by the flange distance d:
//
//   length = sqrt(d^2 + r1^2 + r2^2 - 2 r1 r2 cos(angle)) - r3
//
// where r3 is half the spoke hole diameter.
// Throws DomainError for an odd or zero spoke count, a non-positive erd,
// a negative spoke hole diameter, or measurements for which no spoke fits.
// A length that would come out zero or negative once r3 is subtracted is
// also rejected, although the triangle itself is still defined there.
PerSide<double> spoke_lengths(const SpokeGeometry& geometry);

}  // namespace bikecalc

#endif // BIKECALC_WHEEL_SPOKE_LENGTH_HPP
