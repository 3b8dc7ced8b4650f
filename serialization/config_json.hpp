#ifndef FUNNEL_SERIALIZATION_CONFIG_JSON_HPP
#define FUNNEL_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <common/errors.hpp>
#include <compare/run_config.hpp>
#include <io/csv_reader.hpp>
#include <math/point2.hpp>
#include <serialization/json_serialization.hpp>
#include <tube/tolerances.hpp>
#include <tube/tube_size.hpp>
#include <string>

namespace funnel {

namespace io {

// CsvOptions serialization
inline void to_json(nlohmann::json& j, const CsvOptions& options) {
    j = {
        {"skip_lines", options.skip_lines}
    };
}

inline void from_json(const nlohmann::json& j, CsvOptions& options) {
    options.skip_lines = j.value("skip_lines", size_t{1});
}

}  // namespace io

// Point2 serialization
inline void to_json(nlohmann::json& j, const Point2& p) {
    j = nlohmann::json::array({p.x, p.y});
}

inline void from_json(const nlohmann::json& j, Point2& p) {
    p.x = j[0].get<double>();
    p.y = j[1].get<double>();
}

// Tolerances serialization
inline void to_json(nlohmann::json& j, const Tolerances& tol) {
    j = {
        {"atolx", tol.atolx},
        {"atoly", tol.atoly},
        {"rtolx", tol.rtolx},
        {"rtoly", tol.rtoly}
    };
}

inline void from_json(const nlohmann::json& j, Tolerances& tol) {
    tol.atolx = j.value("atolx", 0.0);
    tol.atoly = j.value("atoly", 0.0);
    tol.rtolx = j.value("rtolx", 0.0);
    tol.rtoly = j.value("rtoly", 0.0);
}

// TubeSize serialization
inline void to_json(nlohmann::json& j, const TubeSize& tube) {
    j = {
        {"half_width", tube.half_width},
        {"half_height", tube.half_height},
        {"range_x", tube.range_x},
        {"range_y", tube.range_y}
    };
}

inline void from_json(const nlohmann::json& j, TubeSize& tube) {
    tube.half_width = j.value("half_width", 0.0);
    tube.half_height = j.value("half_height", 0.0);
    tube.range_x = j.value("range_x", 0.0);
    tube.range_y = j.value("range_y", 0.0);
}

// RunConfig serialization
inline void to_json(nlohmann::json& j, const RunConfig& config) {
    j = {
        {"tolerances", config.tolerances},
        {"csv", config.csv}
    };
}

inline void from_json(const nlohmann::json& j, RunConfig& config) {
    if (j.contains("tolerances")) {
        config.tolerances = j["tolerances"].get<Tolerances>();
    }
    if (j.contains("csv")) {
        config.csv = j["csv"].get<io::CsvOptions>();
    }
}

// Load a run configuration file.
// Throws ConfigurationError when the content has the wrong shape.
inline RunConfig load_run_config(const std::string& path) {
    nlohmann::json j = json::read_json_file(path);
    if (!j.is_object()) {
        throw ConfigurationError("Configuration " + path + " must be a JSON object");
    }
    try {
        return j.get<RunConfig>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Invalid configuration " + path + ": " + e.what());
    }
}

}  // namespace funnel

#endif // FUNNEL_SERIALIZATION_CONFIG_JSON_HPP
