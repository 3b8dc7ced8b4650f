#ifndef FUNNEL_TUBE_COMPARATOR_HPP
#define FUNNEL_TUBE_COMPARATOR_HPP

#include <curve/data_set.hpp>
#include <math/point2.hpp>
#include <optional>
#include <span>

namespace funnel {

// Per-sample result of checking a test curve against the tube
struct ErrorReport {
    // (x, distance outside the tube) for every violating sample
    DataSet outliers;
    // (x, distance or 0) for every compared sample, aligned with the test curve
    DataSet diff;

    bool passed() const { return outliers.empty(); }

    // First diff sample with the largest distance; empty when nothing was compared
    std::optional<Point2> max_deviation() const;
};

// Classify the test samples against the resampled bounds.
// Only the first min(lower, upper, test) samples are compared. A sample on a
// bound (within the equality tolerance) is inside the tube.
ErrorReport compare_to_bounds(std::span<const double> lower,
                              std::span<const double> upper,
                              const DataSet& test);

}  // namespace funnel

#endif // FUNNEL_TUBE_COMPARATOR_HPP
