#include <iostream>
#include <string>

#include <cli/cli_common.hpp>
#include <common/logging.hpp>

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> <record.json> [options]\n";
    std::cerr << "\n";
    std::cerr << "Bicycle drivetrain, steering and wheel calculations.\n";
    std::cerr << "All lengths in millimeters, angles in degrees.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  describe    List the attributes of a bicycle or wheel record\n";
    std::cerr << "  capacity    Derailer capacity for the cog set\n";
    std::cerr << "  ratios      Gear and gain ratios for every gear\n";
    std::cerr << "  speeds      Speed (km/h) per gear at --cadence <hz>\n";
    std::cerr << "  cadences    Cadence (Hz) per gear at --speed <kph>\n";
    std::cerr << "  skid        Fixed-gear skid patches per gear [--ambidextrous]\n";
    std::cerr << "  trail       Trail, mechanical trail and wheel flop\n";
    std::cerr << "  spokes      Spoke lengths [--wheel front|rear]\n";
    std::cerr << "  diameter    Approximate wheel diameter [--wheel front|rear]\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -d, --digits <n>   Round printed and written results to n decimals\n";
    std::cerr << "  -o, --output <f>   Also write results as JSON\n";
    std::cerr << "  -v, --verbose      Debug logging\n";
    std::cerr << "  -h, --help         Show help for a command\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  BIKECALC_LOG_LEVEL - Set log level (trace, debug, info, warn, error)\n";
}

int main(int argc, char* argv[]) {
    namespace cli = bikecalc::cli;

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    bikecalc::logging::get_logger()->debug("Running command: {}", command);

    if (command == "describe") return cli::command_describe(argc, argv);
    if (command == "capacity") return cli::command_capacity(argc, argv);
    if (command == "ratios") return cli::command_ratios(argc, argv);
    if (command == "speeds") return cli::command_speeds(argc, argv);
    if (command == "cadences") return cli::command_cadences(argc, argv);
    if (command == "skid") return cli::command_skid(argc, argv);
    if (command == "trail") return cli::command_trail(argc, argv);
    if (command == "spokes") return cli::command_spokes(argc, argv);
    if (command == "diameter") return cli::command_diameter(argc, argv);

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
