#include "cli_common.hpp"
#include <common/logging.hpp>
#include <presentation/describe.hpp>
#include <serialization/config_json.hpp>

namespace bikecalc::cli {

int command_describe(int argc, char** argv) {
    auto log = bikecalc::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);
        apply_verbosity(ctx);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: bikecalc describe <record.json> [--wheel front|rear]\n";
            std::cerr << "Lists the attributes of a bicycle record, or of a single wheel\n";
            std::cerr << "when the file holds a wheel or --wheel is given.\n";
            return ctx.help ? 0 : 1;
        }

        nlohmann::json record = json::read_json_file(ctx.input_path);
        if (!is_bicycle_record(record) || ctx.wheel) {
            std::cout << describe(load_wheel(ctx.input_path, ctx.wheel.value_or("rear"))) << "\n";
        } else {
            std::cout << describe(load_bicycle(ctx.input_path)) << "\n";
        }
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace bikecalc::cli
