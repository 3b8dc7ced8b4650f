#ifndef FUNNEL_CURVE_DATA_SET_HPP
#define FUNNEL_CURVE_DATA_SET_HPP

#include <math/point2.hpp>
#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace funnel {

// Axis-aligned extent of a curve
struct Bounds {
    double min_x = 0.0;
    double max_x = 0.0;
    double min_y = 0.0;
    double max_y = 0.0;

    double range_x() const { return max_x - min_x; }
    double range_y() const { return max_y - min_y; }
};

// Ordered sequence of (x, y) samples.
// Used for the reference and test series and for every derived curve.
class DataSet {
public:
    DataSet() = default;
    explicit DataSet(std::vector<Point2> points);

    // Build from parallel coordinate arrays; throws InputError on length mismatch
    static DataSet from_arrays(std::span<const double> x, std::span<const double> y);

    size_t size() const { return points_.size(); }
    bool empty() const { return points_.empty(); }

    const Point2& operator[](size_t i) const { return points_[i]; }
    const Point2& front() const { return points_.front(); }
    const Point2& back() const { return points_.back(); }

    const std::vector<Point2>& points() const { return points_; }

    std::vector<double> xs() const;

    // Extent of the samples; requires a non-empty set
    Bounds bounds() const;

    // True when x never decreases between neighbouring samples
    bool is_x_ascending() const;

    // Throws InputError unless the set is non-empty, every coordinate is
    // finite and x is non-decreasing. `name` identifies the curve in the message.
    void validate_series(const std::string& name) const;

private:
    std::vector<Point2> points_;
};

}  // namespace funnel

#endif // FUNNEL_CURVE_DATA_SET_HPP
