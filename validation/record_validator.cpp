#include "record_validator.hpp"
#include <common/errors.hpp>
#include <sstream>

namespace bikecalc {

namespace {

void check_cog_list(ValidationResult& result, const CogList& cogs, const std::string& attr) {
    if (cogs.empty()) {
        result.error(attr + " must not be empty");
    }
}

template<typename T>
void check_present(ValidationResult& result, const std::optional<T>& value,
                   const std::string& attr) {
    if (!value.has_value()) {
        result.error(attr + " is not set");
    }
}

void check_both_sides(ValidationResult& result, const PerSide<std::optional<double>>& values,
                      const std::string& attr) {
    for (Side side : kSides) {
        check_present(result, values.at(side), attr + "." + side_name(side));
    }
}

}  // namespace

void require_valid(const ValidationResult& result, const std::string& context) {
    if (result.ok()) {
        return;
    }
    std::ostringstream ss;
    ss << context << ":";
    for (const auto& error : result.errors()) {
        ss << " " << error << ";";
    }
    std::string message = ss.str();
    message.pop_back();
    throw InvalidInput(message);
}

std::string record_label(const Bicycle& bicycle) {
    return bicycle.name ? "Bicycle '" + *bicycle.name + "'" : "Nameless bicycle";
}

std::string record_label(const Wheel& wheel) {
    return wheel.name ? "Wheel '" + *wheel.name + "'" : "Nameless wheel";
}

ValidationResult check_cogs(const Bicycle& bicycle) {
    ValidationResult result;
    check_cog_list(result, bicycle.front_cogs, "front_cogs");
    check_cog_list(result, bicycle.rear_cogs, "rear_cogs");
    return result;
}

ValidationResult check_gain(const Bicycle& bicycle) {
    ValidationResult result = check_cogs(bicycle);
    check_present(result, bicycle.crank_length, "crank_length");
    check_present(result, bicycle.rear_wheel.diameter, "rear_wheel.diameter");
    return result;
}

ValidationResult check_steering(const Bicycle& bicycle) {
    ValidationResult result;
    check_present(result, bicycle.head_tube_angle, "head_tube_angle");
    check_present(result, bicycle.fork_rake, "fork_rake");
    check_present(result, bicycle.front_wheel.diameter, "front_wheel.diameter");
    return result;
}

ValidationResult check_spokes(const Wheel& wheel) {
    ValidationResult result;
    check_both_sides(result, wheel.center_to_flange, "center_to_flange");
    check_both_sides(result, wheel.flange_diameter, "flange_diameter");
    check_present(result, wheel.erd, "erd");
    check_present(result, wheel.num_spokes, "num_spokes");
    return result;
}

ValidationResult check_tire(const Wheel& wheel) {
    ValidationResult result;
    check_present(result, wheel.bsd, "bsd");
    check_present(result, wheel.tire_width, "tire_width");
    return result;
}

}  // namespace bikecalc
