#ifndef BIKECALC_BICYCLE_BICYCLE_HPP
#define BIKECALC_BICYCLE_BICYCLE_HPP

#include "wheel.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bikecalc {

// Tooth counts of the cogs on one side of the drivetrain, e.g. {28, 42}
using CogList = std::vector<uint32_t>;

// Frame, drivetrain and wheel measurements of a bicycle.
// The front wheel drives the steering geometry and the rear wheel the
// gearing; they are kept apart even when identical.
struct Bicycle {
    std::optional<std::string> name;

    CogList front_cogs;
    CogList rear_cogs;
    std::optional<double> crank_length;

    std::optional<double> head_tube_angle;   // Degrees
    std::optional<double> fork_rake;         // May be negative

    Wheel front_wheel;
    Wheel rear_wheel;

    // Copy with both cog lists in ascending order
    Bicycle sorted_cogs() const;
};

}  // namespace bikecalc

#endif // BIKECALC_BICYCLE_BICYCLE_HPP
