#ifndef ENVELOPEKIT_SERIALIZATION_JSON_SERIALIZATION_HPP
#define ENVELOPEKIT_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <common/errors.hpp>
#include <chrono>
#include <ctime>
#include <exception>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>

namespace envelopekit::json {

// Version of the report format
constexpr const char* SERIALIZATION_VERSION = "0.1.0";

// Report envelope written by every generator command
struct SerializedData {
    std::string version = SERIALIZATION_VERSION;
    std::string step;                 // panelize, fenestrate or tower
    std::string timestamp;
    std::string source_file;          // configuration the run was read from
    nlohmann::json config;            // effective configuration after defaults
    nlohmann::json stats;
    nlohmann::json data;

    nlohmann::json to_json() const {
        nlohmann::json j = {{"version", version}, {"step", step}};
        if (!timestamp.empty()) j["timestamp"] = timestamp;
        if (!source_file.empty()) j["source_file"] = source_file;
        if (!config.is_null()) j["config"] = config;
        if (!stats.is_null()) j["stats"] = stats;
        j["data"] = data;
        return j;
    }
};

// UTC, ISO 8601
inline std::string get_timestamp() {
    auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&time, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Reads a configuration object. A missing file, malformed JSON or a
// non-object document is an InputValidationError; parser details are
// kept as the nested cause.
inline nlohmann::json read_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw InputValidationError("Cannot open configuration file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error&) {
        std::throw_with_nested(InputValidationError("Malformed configuration file: " + path));
    }

    if (!j.is_object()) {
        throw InputValidationError("Configuration must be a JSON object: " + path);
    }
    return j;
}

// Pretty printed, two-space indent, trailing newline
inline void write_report(std::ostream& out, const SerializedData& report) {
    out << report.to_json().dump(2) << "\n";
}

}  // namespace envelopekit::json

#endif // ENVELOPEKIT_SERIALIZATION_JSON_SERIALIZATION_HPP
