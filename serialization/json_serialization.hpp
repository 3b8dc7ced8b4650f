#ifndef FUNNEL_SERIALIZATION_JSON_SERIALIZATION_HPP
#define FUNNEL_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace funnel::json {

// Version of the summary document layout
constexpr const char* SUMMARY_VERSION = "1.0.0";

// Envelope of every JSON document funnel writes
struct SerializedData {
    std::string version = SUMMARY_VERSION;
    std::string kind;                 // What `data` holds, e.g. "comparison"
    std::string timestamp;
    std::string reference_file;
    std::string test_file;
    nlohmann::json config;            // Settings the run used
    nlohmann::json stats;             // Counters for quick inspection
    nlohmann::json data;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["version"] = version;
        j["kind"] = kind;
        if (!timestamp.empty()) j["timestamp"] = timestamp;
        if (!reference_file.empty() || !test_file.empty()) {
            j["sources"] = {
                {"reference", reference_file},
                {"test", test_file}
            };
        }
        if (!config.is_null()) j["config"] = config;
        if (!stats.is_null()) j["stats"] = stats;
        j["data"] = data;
        return j;
    }

    static SerializedData from_json(const nlohmann::json& j) {
        SerializedData result;
        result.version = j.value("version", "unknown");
        result.kind = j.value("kind", "unknown");
        result.timestamp = j.value("timestamp", "");
        if (j.contains("sources")) {
            result.reference_file = j["sources"].value("reference", "");
            result.test_file = j["sources"].value("test", "");
        }
        if (j.contains("config")) result.config = j["config"];
        if (j.contains("stats")) result.stats = j["stats"];
        if (j.contains("data")) result.data = j["data"];
        return result;
    }
};

// Current UTC time in ISO 8601 format
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

// Parse errors are reported with the offending path
inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
}

inline SerializedData read_serialized(const std::string& path) {
    return SerializedData::from_json(read_json_file(path));
}

}  // namespace funnel::json

#endif // FUNNEL_SERIALIZATION_JSON_SERIALIZATION_HPP
