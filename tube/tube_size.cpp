#include "tube_size.hpp"
#include <common/errors.hpp>
#include <common/float_compare.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <initializer_list>

namespace funnel {

namespace {

// Half extent along one axis.
// A flat reference on that axis falls back to a small floor scaled by the
// magnitude of its values.
double half_extent(double range, double max_value, double atol, double rtol) {
    if (approx_equal(range, 0.0)) {
        return std::max(TubeSize::MIN_HALF_SIZE,
                        TubeSize::MIN_HALF_SIZE * std::fabs(max_value));
    }
    return std::max(atol, rtol * range);
}

}  // namespace

void validate_tolerances(const Tolerances& tol) {
    for (double value : {tol.atolx, tol.atoly, tol.rtolx, tol.rtoly}) {
        if (!std::isfinite(value)) {
            throw ConfigurationError("Tolerances must be finite numbers.");
        }
    }
    if (tol.atolx < 0.0 || tol.atoly < 0.0 || tol.rtolx < 0.0 || tol.rtoly < 0.0) {
        throw ConfigurationError("Tolerances must not be negative.");
    }
    if ((approx_equal(tol.atolx, 0.0) && approx_equal(tol.rtolx, 0.0)) ||
        (approx_equal(tol.atoly, 0.0) && approx_equal(tol.rtoly, 0.0))) {
        throw ConfigurationError(
            "At least one tolerance has to be set for both, x and y.");
    }
}

TubeSize TubeSize::from_reference(const DataSet& reference, const Tolerances& tol) {
    auto log = funnel::logging::get_logger();

    validate_tolerances(tol);
    if (reference.empty()) {
        throw InputError("reference curve has no samples");
    }

    Bounds b = reference.bounds();

    TubeSize tube;
    tube.range_x = b.range_x();
    tube.range_y = b.range_y();
    tube.half_width = half_extent(tube.range_x, b.max_x, tol.atolx, tol.rtolx);
    tube.half_height = half_extent(tube.range_y, b.max_y, tol.atoly, tol.rtoly);

    log->debug("TubeSize: half_width={} half_height={} (range_x={}, range_y={})",
               tube.half_width, tube.half_height, tube.range_x, tube.range_y);
    return tube;
}

}  // namespace funnel
