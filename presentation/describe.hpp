#ifndef BIKECALC_PRESENTATION_DESCRIBE_HPP
#define BIKECALC_PRESENTATION_DESCRIBE_HPP

#include <bicycle/bicycle.hpp>
#include <bicycle/wheel.hpp>
#include <gearing/cog_pairs.hpp>
#include <optional>
#include <string>

namespace bikecalc {

// Titled attribute listing of a record, unset values shown as "None":
//
//   Touring
//   =======
//   front_cogs = [26, 36, 48]
//   ...
std::string describe(const Bicycle& bicycle);
std::string describe(const Wheel& wheel);

// A result as printed: rounded and shown with exactly digits decimals
// when digits is set, otherwise the shortest text that reads back as
// the same double
std::string format_number(double value, std::optional<int> digits = std::nullopt);

// One line per gear, "front x rear : value", rounded when digits is set
std::string format_cog_table(const CogPairMap<double>& values,
                             std::optional<int> digits = std::nullopt);
std::string format_cog_table(const CogPairMap<uint32_t>& values);

}  // namespace bikecalc

#endif // BIKECALC_PRESENTATION_DESCRIBE_HPP
