#include "loop_resolver.hpp"
#include <common/float_compare.hpp>
#include <common/logging.hpp>
#include <cmath>

namespace funnel {

LoopResolution LoopResolver::resolve(const DataSet& raw, BoundSide side) {
    auto log = funnel::logging::get_logger();

    LoopResolver resolver(raw, side);
    resolver.run();

    log->debug("LoopResolver: {} bound {} -> {} points, {} loops removed",
               to_string(side), raw.size(), resolver.points_.size(),
               resolver.loops_removed_);

    LoopResolution result;
    result.curve = DataSet(std::move(resolver.points_));
    result.loops_removed = resolver.loops_removed_;
    return result;
}

LoopResolver::LoopResolver(const DataSet& raw, BoundSide side)
    : points_(raw.points())
    , side_(side) {}

void LoopResolver::run() {
    size_t j = 1;
    while (j + 2 < points_.size()) {
        // Backward segment (j, j+1)
        if (points_[j + 1].x < points_[j].x) {
            ++loops_removed_;
            j = remove_loop(j);
        }
        ++j;
    }
}

size_t LoopResolver::remove_loop(size_t j) {
    auto& p = points_;
    const size_t last = p.size() - 1;

    // ===== 1. Find i, k with i <= j < j+1 <= k-1 such that segment (i-1, i)
    //          crosses segment (k-1, k) =====
    size_t i = j;
    size_t i_previous = i;

    // Initial i such that X[i-1] <= X[j+1] < X[i]
    while (i > 1 && p[j + 1].x < p[i - 1].x) {
        --i;
    }

    // k stays within (j+1, k_max]
    size_t k_max = j + 1;
    while (p[k_max].x < p[j].x && k_max < last) {
        ++k_max;
    }

    size_t k = j + 1;
    double y = p[i - 1].y;

    // Advance k while the outgoing branch is still past the returning one
    while (beyond(y, p[k].y) && k < k_max) {
        i_previous = i;
        ++k;
        while ((p[i].x < p[k].x || tie_before(i, k)) && i < j) {
            ++i;
        }
        // Now X[i-1] < X[k] <= X[i]: level of the outgoing branch at X[k]
        if (!approx_equal(p[i].x, p[i - 1].x)) {
            y = y_on_segment(i, p[k].x);
        } else {
            y = p[i].y;
        }
    }

    // k located: the crossing is on segment (k-1, k).
    // i approximately located: the crossing is on the polyline (i_previous-1, i).
    if (i_previous > 1) {
        i = i_previous - 1;
    } else {
        i = i_previous;
    }

    const bool k_vertical = approx_equal(p[k].x, p[k - 1].x);
    if (!k_vertical) {
        y = y_on_segment(k, p[i].x);
    }
    while ((!k_vertical && beyond(p[i].y, y)) ||
           (k_vertical && p[i].x < p[k].x)) {
        ++i;
        if (!k_vertical) {
            y = y_on_segment(k, p[i].x);
        }
    }

    // ===== 2. Crossing of segments (i-1, i) and (k-1, k) =====
    std::optional<Point2> cross = crossing(i, k);

    // ===== 3. Delete points i until (including) k-1 =====
    p.erase(p.begin() + static_cast<std::ptrdiff_t>(i),
            p.begin() + static_cast<std::ptrdiff_t>(k));

    // ===== 4. Add the crossing unless it is already there =====
    if (cross && (!approx_equal(p[i].x, cross->x) || !approx_equal(p[i].y, cross->y))) {
        p.insert(p.begin() + static_cast<std::ptrdiff_t>(i), *cross);
    }

    // ===== 5. Continue from the splice point =====
    size_t next = i;

    // ===== 6. Delete a doubled point =====
    if (approx_equal(p[i - 1].x, p[i].x) && approx_equal(p[i - 1].y, p[i].y)) {
        p.erase(p.begin() + static_cast<std::ptrdiff_t>(i));
        next = i - 1;
    }

    return next;
}

bool LoopResolver::beyond(double a, double b) const {
    return side_ == BoundSide::Lower ? a < b : a > b;
}

bool LoopResolver::tie_before(size_t i, size_t k) const {
    const auto& p = points_;
    if (!approx_equal(p[i].x, p[k].x) || !beyond(p[i].y, p[k].y)) {
        return false;
    }
    bool k_steps_out = k + 1 < p.size() &&
                       approx_equal(p[k].x, p[k + 1].x) &&
                       beyond(p[k + 1].y, p[k].y);
    return !k_steps_out;
}

double LoopResolver::y_on_segment(size_t end, double x) const {
    const Point2& a = points_[end - 1];
    const Point2& b = points_[end];
    return (b.y - a.y) / (b.x - a.x) * (x - a.x) + a.y;
}

std::optional<Point2> LoopResolver::crossing(size_t i, size_t k) const {
    const auto& p = points_;
    const bool i_vertical = approx_equal(p[i].x, p[i - 1].x);
    const bool k_vertical = approx_equal(p[k].x, p[k - 1].x);

    // Both branches vertical: no single crossing
    if (i_vertical && k_vertical) {
        return std::nullopt;
    }

    if (i_vertical) {
        double x = p[i].x;
        return Point2(x, p[k - 1].y + ((x - p[k - 1].x) * (p[k].y - p[k - 1].y)) /
                                          (p[k].x - p[k - 1].x));
    }

    if (k_vertical) {
        double x = p[k].x;
        return Point2(x, p[i - 1].y + ((x - p[i - 1].x) * (p[i].y - p[i - 1].y)) /
                                          (p[i].x - p[i - 1].x));
    }

    double a1 = (p[i].y - p[i - 1].y) / (p[i].x - p[i - 1].x);
    double a2 = (p[k].y - p[k - 1].y) / (p[k].x - p[k - 1].x);

    // Parallel branches do not cross
    if (approx_equal(a1, a2)) {
        return std::nullopt;
    }

    double x = (a1 * p[i - 1].x - a2 * p[k - 1].x - p[i - 1].y + p[k - 1].y) / (a1 - a2);
    // Evaluate on the flatter segment
    double y_cross;
    if (std::fabs(a1) > std::fabs(a2)) {
        y_cross = a2 * (x - p[k - 1].x) + p[k - 1].y;
    } else {
        y_cross = a1 * (x - p[i - 1].x) + p[i - 1].y;
    }
    return Point2(x, y_cross);
}

}  // namespace funnel
