#include "comparison.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <io/csv_report_writer.hpp>
#include <tube/bound_curve_builder.hpp>
#include <tube/comparator.hpp>
#include <tube/interpolator.hpp>
#include <tube/loop_resolver.hpp>
#include <tube/tube_size.hpp>
#include <vector>

namespace funnel {

ComparisonResult compare_curves(const DataSet& reference,
                                const DataSet& test,
                                const Tolerances& tol) {
    auto log = funnel::logging::get_logger();

    // Stage 1: Validate configuration and inputs
    validate_tolerances(tol);
    reference.validate_series("reference");
    test.validate_series("test");
    log->debug("Comparing {} test samples against {} reference samples",
               test.size(), reference.size());

    // Stage 2: Tube size
    TubeSize tube = TubeSize::from_reference(reference, tol);

    // Stage 3: Raw envelopes
    BoundCurveBuilder builder(reference, tube);
    DataSet lower_raw = builder.build_lower();
    DataSet upper_raw = builder.build_upper();

    // Stage 4: Remove loops
    LoopResolution lower = LoopResolver::resolve(lower_raw, BoundSide::Lower);
    LoopResolution upper = LoopResolver::resolve(upper_raw, BoundSide::Upper);

    if (lower.curve.empty() || upper.curve.empty()) {
        throw GeometryError("lower or upper curve has 0 elements");
    }

    // Stage 5: Resample bounds on the test grid
    std::vector<double> test_x = test.xs();
    std::vector<double> lower_y = interpolate(lower.curve, test_x);
    std::vector<double> upper_y = interpolate(upper.curve, test_x);

    // Stage 6: Classify
    ErrorReport errors = compare_to_bounds(lower_y, upper_y, test);

    log->debug("Comparison done: {} outliers in {} compared samples",
               errors.outliers.size(), errors.diff.size());

    ComparisonResult result;
    result.reference = reference;
    result.lower = std::move(lower.curve);
    result.upper = std::move(upper.curve);
    result.test = test;
    result.tube = tube;
    result.errors = std::move(errors);
    return result;
}

ComparisonResult compare_points(std::span<const double> x_reference,
                                std::span<const double> y_reference,
                                std::span<const double> x_test,
                                std::span<const double> y_test,
                                const Tolerances& tol) {
    return compare_curves(DataSet::from_arrays(x_reference, y_reference),
                          DataSet::from_arrays(x_test, y_test),
                          tol);
}

bool compare_and_report(const DataSet& reference,
                        const DataSet& test,
                        const Tolerances& tol,
                        ReportSink& sink) {
    ComparisonResult result = compare_curves(reference, test, tol);
    sink.write(result);
    return result.passed();
}

bool compare_and_report(std::span<const double> x_reference,
                        std::span<const double> y_reference,
                        std::span<const double> x_test,
                        std::span<const double> y_test,
                        const Tolerances& tol,
                        const std::string& output_directory) {
    io::CsvReportWriter writer(output_directory);
    return compare_and_report(DataSet::from_arrays(x_reference, y_reference),
                              DataSet::from_arrays(x_test, y_test),
                              tol, writer);
}

}  // namespace funnel
