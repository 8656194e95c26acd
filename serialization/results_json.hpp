#ifndef BIKECALC_SERIALIZATION_RESULTS_JSON_HPP
#define BIKECALC_SERIALIZATION_RESULTS_JSON_HPP

#include <nlohmann/json.hpp>
#include <gearing/cog_pairs.hpp>
#include <geometry/steering.hpp>

namespace bikecalc {

// Per-gear results as [{"front": 40, "rear": 20, "value": 2.0}, ...]
template <typename T>
nlohmann::json cog_pair_map_to_json(const CogPairMap<T>& values) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& [pair, value] : values) {
        j.push_back({
            {"front", pair.front},
            {"rear", pair.rear},
            {"value", value}
        });
    }
    return j;
}

// Trail serialization
inline void to_json(nlohmann::json& j, const Trail& trail) {
    j = {
        {"trail", trail.trail},
        {"mechanical_trail", trail.mechanical_trail},
        {"wheel_flop", trail.wheel_flop}
    };
}

}  // namespace bikecalc

#endif // BIKECALC_SERIALIZATION_RESULTS_JSON_HPP
