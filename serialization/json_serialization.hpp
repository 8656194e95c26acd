#ifndef BIKECALC_SERIALIZATION_JSON_SERIALIZATION_HPP
#define BIKECALC_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace bikecalc::json {

// Bumped when the result file layout changes
constexpr const char* RESULT_FORMAT_VERSION = "1.0";

// One calculation written by the command line tool: the record it ran on,
// the results, and how they were produced.
struct ResultEnvelope {
    std::string step;                  // Command that produced the results
    std::string timestamp;
    std::string source_file;           // Record file the command read
    nlohmann::json config;             // The record as the calculation saw it
    nlohmann::json stats;              // Inputs and counts for the run
    nlohmann::json data;               // Per-gear, per-side or scalar results
    std::optional<int> digits;         // Decimal digits data was rounded to
};

inline void to_json(nlohmann::json& j, const ResultEnvelope& envelope) {
    j = {
        {"version", RESULT_FORMAT_VERSION},
        {"step", envelope.step}
    };
    if (!envelope.timestamp.empty()) j["timestamp"] = envelope.timestamp;
    if (!envelope.source_file.empty()) j["source_file"] = envelope.source_file;
    if (!envelope.config.is_null()) j["config"] = envelope.config;
    if (!envelope.stats.is_null()) j["stats"] = envelope.stats;
    j["rounded_to"] = envelope.digits ? nlohmann::json(*envelope.digits) : nlohmann::json(nullptr);
    j["data"] = envelope.data;
}

// UTC, ISO 8601
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2) << "\n";
}

// Parse errors are reported with the file they came from
inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Cannot parse " + path + ": " + e.what());
    }
}

}  // namespace bikecalc::json

#endif // BIKECALC_SERIALIZATION_JSON_SERIALIZATION_HPP
