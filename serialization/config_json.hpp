#ifndef BIKECALC_SERIALIZATION_CONFIG_JSON_HPP
#define BIKECALC_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <bicycle/bicycle.hpp>
#include <bicycle/per_side.hpp>
#include <bicycle/wheel.hpp>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace bikecalc {

namespace detail {

// Absent and null keys both read as "not measured"
template <typename T>
std::optional<T> optional_value(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<T>();
}

// Tooth and spoke counts. Negative or fractional numbers are rejected
// rather than wrapped into huge unsigned values.
inline uint32_t count_value(const nlohmann::json& value, const std::string& what) {
    constexpr auto max_count = std::numeric_limits<uint32_t>::max();
    if (value.is_number_unsigned() && value.get<uint64_t>() <= max_count) {
        return static_cast<uint32_t>(value.get<uint64_t>());
    }
    if (value.is_number_integer() && value.get<int64_t>() >= 0 &&
        value.get<int64_t>() <= static_cast<int64_t>(max_count)) {
        return static_cast<uint32_t>(value.get<int64_t>());
    }
    throw std::runtime_error(what + " must be a whole number from 0 to " +
                             std::to_string(max_count) + ", got " + value.dump());
}

inline std::optional<uint32_t> optional_count(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return count_value(j[key], key);
}

inline CogList cog_list(const nlohmann::json& j, const char* key) {
    CogList cogs;
    if (!j.contains(key) || j[key].is_null()) {
        return cogs;
    }
    const auto& values = j[key];
    if (!values.is_array()) {
        throw std::runtime_error(std::string(key) + " must be a list of tooth counts, got " +
                                 values.dump());
    }
    for (const auto& value : values) {
        cogs.push_back(count_value(value, key));
    }
    return cogs;
}

template <typename T>
nlohmann::json optional_json(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace detail

// PerSide serialization: {"left": ..., "right": ...}
inline void to_json(nlohmann::json& j, const PerSide<std::optional<double>>& sides) {
    j = {
        {"left", detail::optional_json(sides.left)},
        {"right", detail::optional_json(sides.right)}
    };
}

inline void from_json(const nlohmann::json& j, PerSide<std::optional<double>>& sides) {
    for (const auto& [key, value] : j.items()) {
        if (key != "left" && key != "right") {
            throw std::runtime_error("Unknown hub side '" + key +
                                     "', expected 'left' or 'right'");
        }
    }
    sides.left = detail::optional_value<double>(j, "left");
    sides.right = detail::optional_value<double>(j, "right");
}

inline void to_json(nlohmann::json& j, const PerSide<double>& sides) {
    j = {
        {"left", sides.left},
        {"right", sides.right}
    };
}

// Wheel preset by name
inline Wheel wheel_preset(const std::string& name) {
    if (name == "road_700c") return Wheel::road_700c();
    if (name == "gravel_650b") return Wheel::gravel_650b();
    if (name == "mtb_29er") return Wheel::mtb_29er();
    throw std::runtime_error("Unknown wheel preset: " + name);
}

// Wheel serialization
inline void to_json(nlohmann::json& j, const Wheel& wheel) {
    j = {
        {"name", detail::optional_json(wheel.name)},
        {"bsd", detail::optional_json(wheel.bsd)},
        {"erd", detail::optional_json(wheel.erd)},
        {"tire_width", detail::optional_json(wheel.tire_width)},
        {"diameter", detail::optional_json(wheel.diameter)},
        {"center_to_flange", wheel.center_to_flange},
        {"flange_diameter", wheel.flange_diameter},
        {"spoke_hole_diameter", wheel.spoke_hole_diameter},
        {"num_spokes", detail::optional_json(wheel.num_spokes)},
        {"num_crosses", wheel.num_crosses},
        {"offset", wheel.offset}
    };
}

// A wheel is either a preset name or an object of measurements
inline void from_json(const nlohmann::json& j, Wheel& wheel) {
    if (j.is_string()) {
        wheel = wheel_preset(j.get<std::string>());
        return;
    }
    wheel = Wheel{};
    wheel.name = detail::optional_value<std::string>(j, "name");
    wheel.bsd = detail::optional_value<double>(j, "bsd");
    wheel.erd = detail::optional_value<double>(j, "erd");
    wheel.tire_width = detail::optional_value<double>(j, "tire_width");
    wheel.diameter = detail::optional_value<double>(j, "diameter");
    if (j.contains("center_to_flange")) {
        wheel.center_to_flange = j["center_to_flange"].get<PerSide<std::optional<double>>>();
    }
    if (j.contains("flange_diameter")) {
        wheel.flange_diameter = j["flange_diameter"].get<PerSide<std::optional<double>>>();
    }
    wheel.spoke_hole_diameter = j.value("spoke_hole_diameter", 2.6);
    wheel.num_spokes = detail::optional_count(j, "num_spokes");
    if (auto crosses = detail::optional_count(j, "num_crosses")) {
        wheel.num_crosses = *crosses;
    }
    wheel.offset = j.value("offset", 0.0);
}

// Bicycle serialization
inline void to_json(nlohmann::json& j, const Bicycle& bicycle) {
    j = {
        {"name", detail::optional_json(bicycle.name)},
        {"front_cogs", bicycle.front_cogs},
        {"rear_cogs", bicycle.rear_cogs},
        {"crank_length", detail::optional_json(bicycle.crank_length)},
        {"head_tube_angle", detail::optional_json(bicycle.head_tube_angle)},
        {"fork_rake", detail::optional_json(bicycle.fork_rake)},
        {"front_wheel", bicycle.front_wheel},
        {"rear_wheel", bicycle.rear_wheel}
    };
}

// Cog lists come back sorted ascending
inline void from_json(const nlohmann::json& j, Bicycle& bicycle) {
    Bicycle loaded;
    loaded.name = detail::optional_value<std::string>(j, "name");
    loaded.front_cogs = detail::cog_list(j, "front_cogs");
    loaded.rear_cogs = detail::cog_list(j, "rear_cogs");
    loaded.crank_length = detail::optional_value<double>(j, "crank_length");
    loaded.head_tube_angle = detail::optional_value<double>(j, "head_tube_angle");
    loaded.fork_rake = detail::optional_value<double>(j, "fork_rake");
    if (j.contains("front_wheel")) {
        loaded.front_wheel = j["front_wheel"].get<Wheel>();
    }
    if (j.contains("rear_wheel")) {
        loaded.rear_wheel = j["rear_wheel"].get<Wheel>();
    }
    bicycle = loaded.sorted_cogs();
}

}  // namespace bikecalc

#endif // BIKECALC_SERIALIZATION_CONFIG_JSON_HPP
