#ifndef BIKECALC_CLI_COMMON_HPP
#define BIKECALC_CLI_COMMON_HPP

#include <bicycle/bicycle.hpp>
#include <bicycle/wheel.hpp>
#include <serialization/json_serialization.hpp>
#include <cmath>
#include <string>
#include <optional>
#include <iostream>
#include <fstream>
#include <sstream>

namespace bikecalc::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<int> digits;
    std::optional<double> cadence;     // Hz
    std::optional<double> speed;       // km/h
    bool ambidextrous = false;
    std::optional<std::string> wheel;  // Which wheel of a bicycle record
    bool verbose = false;
    bool help = false;
};

// Parse a numeric option value, naming the option on failure
inline double parse_number(const std::string& option, const std::string& text) {
    try {
        size_t used = 0;
        double value = std::stod(text, &used);
        if (used != text.size() || !std::isfinite(value)) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::runtime_error(option + " expects a number, got '" + text + "'");
    }
}

// Most decimals a double can carry meaningfully
constexpr int kMaxDigits = 15;

// Parse the -d/--digits value: a whole number from 0 to kMaxDigits
inline int parse_digits(const std::string& option, const std::string& text) {
    int value = 0;
    try {
        size_t used = 0;
        value = std::stoi(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument(text);
        }
    } catch (const std::logic_error&) {
        throw std::runtime_error(option + " expects a whole number, got '" + text + "'");
    }
    if (value < 0 || value > kMaxDigits) {
        throw std::runtime_error(option + " must be between 0 and " +
                                 std::to_string(kMaxDigits) + ", got " + text);
    }
    return value;
}

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    auto next_value = [&](const std::string& option) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(option + " requires an argument");
        }
        i += 2;
        return argv[i - 1];
    };

    // Parse flags and positional arguments
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = next_value("-o/--output");
        } else if (arg == "-d" || arg == "--digits") {
            ctx.digits = parse_digits("-d/--digits", next_value("-d/--digits"));
        } else if (arg == "--cadence") {
            ctx.cadence = parse_number("--cadence", next_value("--cadence"));
        } else if (arg == "--speed") {
            ctx.speed = parse_number("--speed", next_value("--speed"));
        } else if (arg == "--wheel") {
            ctx.wheel = next_value("--wheel");
            if (*ctx.wheel != "front" && *ctx.wheel != "rear") {
                throw std::runtime_error("--wheel must be 'front' or 'rear', got '" +
                                         *ctx.wheel + "'");
            }
        } else if (arg == "--ambidextrous") {
            ctx.ambidextrous = true;
            ++i;
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            ++i;
        } else if (arg[0] != '-') {
            // Positional argument (input file)
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
                ++i;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    return {ctx, i};
}

// Raise the log level to debug for -v
void apply_verbosity(const CommandContext& ctx);

// A bicycle record has cogs or wheels; anything else is read as a wheel
bool is_bicycle_record(const nlohmann::json& j);

// Load a bicycle record (cog lists sorted)
Bicycle load_bicycle(const std::string& path);

// Load a wheel record, either a wheel file or the chosen wheel of a
// bicycle file
Wheel load_wheel(const std::string& path, const std::string& which);

// Write the envelope when -o was given
void write_result(const CommandContext& ctx, const std::string& step,
                  const nlohmann::json& config, const nlohmann::json& data,
                  const nlohmann::json& stats = nullptr);

// Command function declarations
int command_describe(int argc, char** argv);
int command_capacity(int argc, char** argv);
int command_ratios(int argc, char** argv);
int command_speeds(int argc, char** argv);
int command_cadences(int argc, char** argv);
int command_skid(int argc, char** argv);
int command_trail(int argc, char** argv);
int command_spokes(int argc, char** argv);
int command_diameter(int argc, char** argv);

}  // namespace bikecalc::cli

#endif // BIKECALC_CLI_COMMON_HPP
