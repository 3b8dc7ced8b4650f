#ifndef FUNNEL_COMPARE_COMPARISON_HPP
#define FUNNEL_COMPARE_COMPARISON_HPP

#include "report_sink.hpp"
#include <curve/data_set.hpp>
#include <tube/tolerances.hpp>
#include <span>
#include <string>

namespace funnel {

// Run the whole pipeline: tube size, raw bounds, loop removal, resampling
// onto the test grid and classification.
//
// Throws ConfigurationError, InputError or GeometryError. Holds no state, so
// independent comparisons may run concurrently.
ComparisonResult compare_curves(const DataSet& reference,
                                const DataSet& test,
                                const Tolerances& tol);

// In-process entry point on raw coordinate arrays
ComparisonResult compare_points(std::span<const double> x_reference,
                                std::span<const double> y_reference,
                                std::span<const double> x_test,
                                std::span<const double> y_test,
                                const Tolerances& tol);

// Compare and hand the result to `sink`. Nothing reaches the sink when the
// comparison throws. Returns true when the test curve stays inside the tube.
bool compare_and_report(const DataSet& reference,
                        const DataSet& test,
                        const Tolerances& tol,
                        ReportSink& sink);

// Compare raw arrays and write the CSV report files into `output_directory`
bool compare_and_report(std::span<const double> x_reference,
                        std::span<const double> y_reference,
                        std::span<const double> x_test,
                        std::span<const double> y_test,
                        const Tolerances& tol,
                        const std::string& output_directory);

}  // namespace funnel

#endif // FUNNEL_COMPARE_COMPARISON_HPP
