#ifndef FUNNEL_SERIALIZATION_COMPARISON_JSON_HPP
#define FUNNEL_SERIALIZATION_COMPARISON_JSON_HPP

#include <nlohmann/json.hpp>
#include <compare/report_sink.hpp>
#include <compare/run_config.hpp>
#include <serialization/config_json.hpp>
#include <serialization/json_serialization.hpp>
#include <string>

namespace funnel {

constexpr const char* SUMMARY_FILE = "summary.json";

// Verdict and worst violation of a comparison
inline nlohmann::json comparison_to_json(const ComparisonResult& result) {
    nlohmann::json j = {
        {"passed", result.passed()},
        {"tube", result.tube},
        {"outliers", result.errors.outliers.points()}
    };
    auto worst = result.errors.max_deviation();
    if (worst.has_value()) {
        j["max_deviation"] = {
            {"x", worst->x},
            {"distance", worst->y}
        };
    } else {
        j["max_deviation"] = nullptr;
    }
    return j;
}

// Summary document written next to the CSV report
inline json::SerializedData make_summary(const ComparisonResult& result,
                                         const RunConfig& config) {
    json::SerializedData summary;
    summary.kind = "comparison";
    summary.timestamp = json::get_timestamp();
    summary.config = config;
    summary.stats = {
        {"reference_samples", result.reference.size()},
        {"test_samples", result.test.size()},
        {"compared_samples", result.errors.diff.size()},
        {"lower_bound_points", result.lower.size()},
        {"upper_bound_points", result.upper.size()},
        {"outlier_count", result.errors.outliers.size()}
    };
    summary.data = comparison_to_json(result);
    return summary;
}

}  // namespace funnel

#endif // FUNNEL_SERIALIZATION_COMPARISON_JSON_HPP
