#include "cli_common.hpp"
#include <calculator/bicycle_calculator.hpp>
#include <common/logging.hpp>
#include <presentation/describe.hpp>
#include <presentation/rounding.hpp>
#include <serialization/config_json.hpp>

namespace bikecalc::cli {

int command_spokes(int argc, char** argv) {
    auto log = bikecalc::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);
        apply_verbosity(ctx);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: bikecalc spokes <wheel.json|bicycle.json> [--wheel front|rear] [-d <digits>] [-o <spokes.json>]\n";
            std::cerr << "Left (non-drive) and right (drive) spoke lengths.\n";
            return ctx.help ? 0 : 1;
        }

        Wheel wheel = load_wheel(ctx.input_path, ctx.wheel.value_or("rear"));
        PerSide<double> lengths = spoke_lengths(wheel);
        if (ctx.digits) {
            lengths = rounded(lengths, *ctx.digits);
        }

        std::cout << "left  : " << format_number(lengths.left, ctx.digits) << "\n";
        std::cout << "right : " << format_number(lengths.right, ctx.digits) << "\n";

        write_result(ctx, "spoke_lengths", wheel, lengths,
                     {{"num_spokes", *wheel.num_spokes}, {"num_crosses", wheel.num_crosses}});
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int command_diameter(int argc, char** argv) {
    auto log = bikecalc::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);
        apply_verbosity(ctx);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: bikecalc diameter <wheel.json|bicycle.json> [--wheel front|rear] [-d <digits>]\n";
            std::cerr << "Approximate wheel diameter from bead seat diameter and tire width.\n";
            return ctx.help ? 0 : 1;
        }

        Wheel wheel = load_wheel(ctx.input_path, ctx.wheel.value_or("rear"));
        double diameter = approx_diameter(wheel);
        if (ctx.digits) {
            diameter = round_to(diameter, *ctx.digits);
        }

        std::cout << "approximate diameter : " << format_number(diameter, ctx.digits) << "\n";
        if (wheel.diameter) {
            std::cout << "measured diameter    : " << format_number(*wheel.diameter) << "\n";
        }

        write_result(ctx, "approx_diameter", wheel, diameter);
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace bikecalc::cli
