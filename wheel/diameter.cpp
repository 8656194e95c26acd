#include "diameter.hpp"
#include <common/errors.hpp>
#include <cmath>
#include <sstream>

namespace bikecalc {

double approx_wheel_diameter(double bsd, double tire_width) {
    if (!std::isfinite(bsd) || !std::isfinite(tire_width) ||
        !(bsd > 0.0) || !(tire_width > 0.0)) {
        std::ostringstream ss;
        ss << "wheel diameter undefined for bsd=" << bsd
           << ", tire_width=" << tire_width;
        throw DomainError(ss.str());
    }
    return bsd + 2.0 * tire_width;
}

}  // namespace bikecalc
