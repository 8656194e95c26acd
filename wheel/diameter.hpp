#ifndef BIKECALC_WHEEL_DIAMETER_HPP
#define BIKECALC_WHEEL_DIAMETER_HPP

namespace bikecalc {

// Approximate inflated wheel diameter from the rim's bead seat diameter
// and the tire width: bsd + 2 * tire_width.
// Linear estimate that ignores casing compression; prefer a measured
// diameter when one is available.
// Throws DomainError unless both measurements are positive.
double approx_wheel_diameter(double bsd, double tire_width);

}  // namespace bikecalc

#endif // BIKECALC_WHEEL_DIAMETER_HPP
