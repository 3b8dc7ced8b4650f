#include "data_set.hpp"
#include <common/errors.hpp>
#include <algorithm>
#include <cmath>

namespace funnel {

DataSet::DataSet(std::vector<Point2> points)
    : points_(std::move(points)) {}

DataSet DataSet::from_arrays(std::span<const double> x, std::span<const double> y) {
    if (x.size() != y.size()) {
        throw InputError("x and y must have the same length (got " +
                         std::to_string(x.size()) + " and " +
                         std::to_string(y.size()) + ")");
    }

    std::vector<Point2> points;
    points.reserve(x.size());
    for (size_t i = 0; i < x.size(); ++i) {
        points.emplace_back(x[i], y[i]);
    }
    return DataSet(std::move(points));
}

std::vector<double> DataSet::xs() const {
    std::vector<double> result;
    result.reserve(points_.size());
    for (const auto& p : points_) {
        result.push_back(p.x);
    }
    return result;
}

Bounds DataSet::bounds() const {
    Bounds b;
    b.min_x = b.max_x = points_.front().x;
    b.min_y = b.max_y = points_.front().y;

    for (const auto& p : points_) {
        b.min_x = std::min(b.min_x, p.x);
        b.max_x = std::max(b.max_x, p.x);
        b.min_y = std::min(b.min_y, p.y);
        b.max_y = std::max(b.max_y, p.y);
    }
    return b;
}

bool DataSet::is_x_ascending() const {
    for (size_t i = 1; i < points_.size(); ++i) {
        if (points_[i].x < points_[i - 1].x) {
            return false;
        }
    }
    return true;
}

void DataSet::validate_series(const std::string& name) const {
    if (points_.empty()) {
        throw InputError(name + " curve has no samples");
    }
    for (size_t i = 0; i < points_.size(); ++i) {
        if (!std::isfinite(points_[i].x) || !std::isfinite(points_[i].y)) {
            throw InputError(name + " curve has a non-finite value at sample " +
                             std::to_string(i));
        }
    }
    if (!is_x_ascending()) {
        throw InputError(name + " curve x values must be ascending");
    }
}

}  // namespace funnel
