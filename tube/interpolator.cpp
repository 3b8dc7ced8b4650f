#include "interpolator.hpp"
#include <common/float_compare.hpp>
#include <common/logging.hpp>

namespace funnel {

std::vector<double> interpolate(const DataSet& source, std::span<const double> target_x) {
    auto log = funnel::logging::get_logger();
    std::vector<double> target_y;

    if (source.empty()) {
        return target_y;
    }

    const size_t n = source.size();
    const double last_x = source.back().x;
    target_y.reserve(target_x.size());

    // A single point only covers targets at or before its x
    size_t j = n > 1 ? 1 : 0;

    for (double x : target_x) {
        if (x > last_x) {
            log->debug("Interpolator: truncated at x={} ({} of {} targets)",
                       x, target_y.size(), target_x.size());
            break;
        }

        // Step the source to the current target
        while (source[j].x < x && j + 1 < n) {
            ++j;
        }

        const Point2& p1 = source[j];
        const Point2& p0 = j > 0 ? source[j - 1] : p1;

        // Degenerate bracket: no slope to follow
        if (approx_equal(p1.x, p0.x)) {
            target_y.push_back(p0.y);
        } else {
            target_y.push_back(p0.y + ((p1.y - p0.y) / (p1.x - p0.x)) * (x - p0.x));
        }
    }

    return target_y;
}

}  // namespace funnel
