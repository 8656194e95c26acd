#include "cli_common.hpp"
#include <calculator/bicycle_calculator.hpp>
#include <common/logging.hpp>
#include <presentation/describe.hpp>
#include <presentation/rounding.hpp>
#include <serialization/config_json.hpp>
#include <serialization/results_json.hpp>

namespace bikecalc::cli {

int command_speeds(int argc, char** argv) {
    auto log = bikecalc::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);
        apply_verbosity(ctx);

        if (ctx.help || ctx.input_path.empty() || !ctx.cadence) {
            std::cerr << "Usage: bikecalc speeds <bicycle.json> --cadence <hz> [-d <digits>] [-o <speeds.json>]\n";
            std::cerr << "Speed in km/h for every gear at a cadence in revolutions per second.\n";
            return ctx.help ? 0 : 1;
        }

        Bicycle bicycle = load_bicycle(ctx.input_path);
        CogPairMap<double> speeds = cadence_to_speeds(bicycle, *ctx.cadence);

        std::cout << "Speeds (km/h) at " << format_number(*ctx.cadence) << " Hz\n"
                  << format_cog_table(speeds, ctx.digits);

        write_result(ctx, "speeds", bicycle,
                     cog_pair_map_to_json(ctx.digits ? rounded(speeds, *ctx.digits) : speeds),
                     {{"cadence_hz", *ctx.cadence}});
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int command_cadences(int argc, char** argv) {
    auto log = bikecalc::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);
        apply_verbosity(ctx);

        if (ctx.help || ctx.input_path.empty() || !ctx.speed) {
            std::cerr << "Usage: bikecalc cadences <bicycle.json> --speed <kph> [-d <digits>] [-o <cadences.json>]\n";
            std::cerr << "Cadence in revolutions per second for every gear at a speed in km/h.\n";
            return ctx.help ? 0 : 1;
        }

        Bicycle bicycle = load_bicycle(ctx.input_path);
        CogPairMap<double> cadences = speed_to_cadences(bicycle, *ctx.speed);

        std::cout << "Cadences (Hz) at " << format_number(*ctx.speed) << " km/h\n"
                  << format_cog_table(cadences, ctx.digits);

        write_result(ctx, "cadences", bicycle,
                     cog_pair_map_to_json(ctx.digits ? rounded(cadences, *ctx.digits) : cadences),
                     {{"speed_kph", *ctx.speed}});
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace bikecalc::cli
