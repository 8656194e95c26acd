#include "describe.hpp"
#include "rounding.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <sstream>

namespace bikecalc {

namespace {

std::string format_value(const std::optional<double>& value) {
    if (!value) {
        return "None";
    }
    return format_number(*value);
}

std::string format_value(const std::optional<uint32_t>& value) {
    return value ? std::to_string(*value) : "None";
}

std::string format_value(const CogList& cogs) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < cogs.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << cogs[i];
    }
    ss << "]";
    return ss.str();
}

std::string format_value(const PerSide<std::optional<double>>& values) {
    return "{'left': " + format_value(values.left) +
           ", 'right': " + format_value(values.right) + "}";
}

void write_title(std::ostringstream& ss, const std::string& title, char underline) {
    ss << title << "\n" << std::string(title.size(), underline) << "\n";
}

}  // namespace

std::string describe(const Wheel& wheel) {
    std::ostringstream ss;
    write_title(ss, wheel.name.value_or("Nameless wheel"), '-');
    ss << "bsd = " << format_value(wheel.bsd) << "\n";
    ss << "center_to_flange = " << format_value(wheel.center_to_flange) << "\n";
    ss << "diameter = " << format_value(wheel.diameter) << "\n";
    ss << "erd = " << format_value(wheel.erd) << "\n";
    ss << "flange_diameter = " << format_value(wheel.flange_diameter) << "\n";
    ss << "num_crosses = " << wheel.num_crosses << "\n";
    ss << "num_spokes = " << format_value(wheel.num_spokes) << "\n";
    ss << "offset = " << format_number(wheel.offset) << "\n";
    ss << "spoke_hole_diameter = " << format_number(wheel.spoke_hole_diameter) << "\n";
    ss << "tire_width = " << format_value(wheel.tire_width);
    return ss.str();
}

std::string describe(const Bicycle& bicycle) {
    std::ostringstream ss;
    write_title(ss, bicycle.name.value_or("Nameless bicycle"), '=');
    ss << "front_cogs = " << format_value(bicycle.front_cogs) << "\n";
    ss << "rear_cogs = " << format_value(bicycle.rear_cogs) << "\n";
    ss << "crank_length = " << format_value(bicycle.crank_length) << "\n";
    ss << "head_tube_angle = " << format_value(bicycle.head_tube_angle) << "\n";
    ss << "fork_rake = " << format_value(bicycle.fork_rake) << "\n";
    ss << "\nfront_wheel = " << describe(bicycle.front_wheel) << "\n";
    ss << "\nrear_wheel = " << describe(bicycle.rear_wheel);
    return ss.str();
}

std::string format_number(double value, std::optional<int> digits) {
    if (!digits) {
        return fmt::format("{}", value);
    }
    return fmt::format("{:.{}f}", round_to(value, *digits), std::max(*digits, 0));
}

std::string format_cog_table(const CogPairMap<double>& values, std::optional<int> digits) {
    std::ostringstream ss;
    for (const auto& [pair, value] : values) {
        ss << pair.front << " x " << pair.rear << " : " << format_number(value, digits) << "\n";
    }
    return ss.str();
}

std::string format_cog_table(const CogPairMap<uint32_t>& values) {
    std::ostringstream ss;
    for (const auto& [pair, value] : values) {
        ss << pair.front << " x " << pair.rear << " : " << value << "\n";
    }
    return ss.str();
}

}  // namespace bikecalc
