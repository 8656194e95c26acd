#include "cli_common.hpp"
#include <calculator/bicycle_calculator.hpp>
#include <common/logging.hpp>
#include <presentation/describe.hpp>
#include <presentation/rounding.hpp>
#include <serialization/config_json.hpp>
#include <serialization/results_json.hpp>
#include <validation/record_validator.hpp>

namespace bikecalc::cli {

int command_capacity(int argc, char** argv) {
    auto log = bikecalc::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);
        apply_verbosity(ctx);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: bikecalc capacity <bicycle.json> [-o <capacity.json>]\n";
            return ctx.help ? 0 : 1;
        }

        Bicycle bicycle = load_bicycle(ctx.input_path);
        uint32_t capacity = derailer_capacity(bicycle);

        std::cout << "derailer capacity : " << capacity << "\n";
        write_result(ctx, "derailer_capacity", bicycle, capacity);
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int command_ratios(int argc, char** argv) {
    auto log = bikecalc::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);
        apply_verbosity(ctx);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: bikecalc ratios <bicycle.json> [-d <digits>] [-o <ratios.json>]\n";
            std::cerr << "Prints gear ratios, and gain ratios when crank length and\n";
            std::cerr << "rear wheel diameter are known.\n";
            return ctx.help ? 0 : 1;
        }

        Bicycle bicycle = load_bicycle(ctx.input_path);
        CogPairMap<double> gear = gear_ratios(bicycle);

        std::cout << "Gear ratios\n" << format_cog_table(gear, ctx.digits);

        nlohmann::json data;
        data["gear_ratios"] = cog_pair_map_to_json(ctx.digits ? rounded(gear, *ctx.digits) : gear);
        data["gain_ratios"] = nullptr;

        // Gain ratios need more measurements than gear ratios
        ValidationResult gain_check = check_gain(bicycle);
        if (gain_check.ok()) {
            CogPairMap<double> gain = gain_ratios(bicycle);
            std::cout << "\nGain ratios\n" << format_cog_table(gain, ctx.digits);
            data["gain_ratios"] =
                cog_pair_map_to_json(ctx.digits ? rounded(gain, *ctx.digits) : gain);
        } else {
            log->warn("Skipping gain ratios: {}", gain_check.errors().front());
        }

        write_result(ctx, "ratios", bicycle, data, {{"gear_count", gear.size()}});
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int command_skid(int argc, char** argv) {
    auto log = bikecalc::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);
        apply_verbosity(ctx);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: bikecalc skid <bicycle.json> [--ambidextrous] [-o <skid.json>]\n";
            std::cerr << "Counts fixed-gear skid patches for every gear.\n";
            return ctx.help ? 0 : 1;
        }

        Bicycle bicycle = load_bicycle(ctx.input_path);
        CogPairMap<uint32_t> patches = num_skid_patches(bicycle, ctx.ambidextrous);

        std::cout << "Skid patches" << (ctx.ambidextrous ? " (ambidextrous)" : "") << "\n"
                  << format_cog_table(patches);

        write_result(ctx, "skid_patches", bicycle, cog_pair_map_to_json(patches),
                     {{"ambidextrous", ctx.ambidextrous}});
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace bikecalc::cli
