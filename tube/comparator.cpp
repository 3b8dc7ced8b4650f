#include "comparator.hpp"
#include <common/float_compare.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <vector>

namespace funnel {

std::optional<Point2> ErrorReport::max_deviation() const {
    if (diff.empty()) {
        return std::nullopt;
    }
    const auto& points = diff.points();
    auto it = std::max_element(points.begin(), points.end(),
        [](const Point2& a, const Point2& b) { return a.y < b.y; });
    return *it;
}

ErrorReport compare_to_bounds(std::span<const double> lower,
                              std::span<const double> upper,
                              const DataSet& test) {
    auto log = funnel::logging::get_logger();

    const size_t n = std::min({lower.size(), upper.size(), test.size()});
    if (n < test.size()) {
        log->debug("Comparator: comparing {} of {} test samples (bounds end earlier)",
                   n, test.size());
    }

    std::vector<Point2> outliers;
    std::vector<Point2> diff;
    diff.reserve(n);

    for (size_t i = 0; i < n; ++i) {
        const Point2& sample = test[i];
        double distance = 0.0;

        if (sample.y < lower[i] && !approx_equal(sample.y, lower[i])) {
            distance = lower[i] - sample.y;
        } else if (sample.y > upper[i] && !approx_equal(sample.y, upper[i])) {
            distance = sample.y - upper[i];
        }

        if (distance > 0.0) {
            outliers.emplace_back(sample.x, distance);
        }
        diff.emplace_back(sample.x, distance);
    }

    log->debug("Comparator: {} outliers in {} samples", outliers.size(), n);

    ErrorReport report;
    report.outliers = DataSet(std::move(outliers));
    report.diff = DataSet(std::move(diff));
    return report;
}

}  // namespace funnel
