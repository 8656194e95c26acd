#include "cli_common.hpp"
#include <calculator/bicycle_calculator.hpp>
#include <common/logging.hpp>
#include <presentation/describe.hpp>
#include <presentation/rounding.hpp>
#include <serialization/config_json.hpp>
#include <serialization/results_json.hpp>

namespace bikecalc::cli {

int command_trail(int argc, char** argv) {
    auto log = bikecalc::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);
        apply_verbosity(ctx);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: bikecalc trail <bicycle.json> [-d <digits>] [-o <trail.json>]\n";
            std::cerr << "Trail, mechanical trail and wheel flop from head tube angle,\n";
            std::cerr << "fork rake and front wheel diameter.\n";
            return ctx.help ? 0 : 1;
        }

        Bicycle bicycle = load_bicycle(ctx.input_path);
        Trail result = trail(bicycle);
        if (ctx.digits) {
            result = rounded(result, *ctx.digits);
        }

        std::cout << "trail            : " << format_number(result.trail, ctx.digits) << "\n";
        std::cout << "mechanical trail : " << format_number(result.mechanical_trail, ctx.digits) << "\n";
        std::cout << "wheel flop       : " << format_number(result.wheel_flop, ctx.digits) << "\n";

        write_result(ctx, "trail", bicycle, result);
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace bikecalc::cli
