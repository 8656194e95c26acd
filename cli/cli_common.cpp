#include "cli_common.hpp"
#include <common/logging.hpp>
#include <serialization/config_json.hpp>

namespace bikecalc::cli {

void apply_verbosity(const CommandContext& ctx) {
    if (ctx.verbose) {
        logging::get_logger()->set_level(spdlog::level::debug);
    }
}

bool is_bicycle_record(const nlohmann::json& j) {
    return j.is_object() &&
           (j.contains("front_wheel") || j.contains("rear_wheel") ||
            j.contains("front_cogs") || j.contains("rear_cogs"));
}

Bicycle load_bicycle(const std::string& path) {
    nlohmann::json j = json::read_json_file(path);
    Bicycle bicycle = j.get<Bicycle>();
    logging::get_logger()->debug("Loaded bicycle from {}: {} front, {} rear cogs",
                                 path, bicycle.front_cogs.size(), bicycle.rear_cogs.size());
    return bicycle;
}

Wheel load_wheel(const std::string& path, const std::string& which) {
    nlohmann::json j = json::read_json_file(path);

    if (!is_bicycle_record(j)) {
        logging::get_logger()->debug("Loaded wheel from {}", path);
        return j.get<Wheel>();
    }

    Bicycle bicycle = j.get<Bicycle>();
    logging::get_logger()->debug("Using the {} wheel of bicycle {}", which, path);
    return which == "front" ? bicycle.front_wheel : bicycle.rear_wheel;
}

void write_result(const CommandContext& ctx, const std::string& step,
                  const nlohmann::json& config, const nlohmann::json& data,
                  const nlohmann::json& stats) {
    if (ctx.output_path.empty()) {
        return;
    }

    json::ResultEnvelope result;
    result.step = step;
    result.timestamp = json::get_timestamp();
    result.source_file = ctx.input_path;
    result.config = config;
    result.stats = stats;
    result.data = data;
    result.digits = ctx.digits;
    json::write_json_file(ctx.output_path, result);

    logging::get_logger()->info("Wrote {} to {}", step, ctx.output_path);
}

}  // namespace bikecalc::cli
