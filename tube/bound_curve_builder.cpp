#include "bound_curve_builder.hpp"
#include <common/errors.hpp>
#include <common/float_compare.hpp>
#include <common/logging.hpp>

namespace funnel {

namespace {

// Stand-in slope for vertical reference segments
constexpr double VERTICAL_SLOPE = 1e15;

double segment_slope(const Point2& a, const Point2& b, int slope_sign) {
    if (!approx_equal(b.x, a.x)) {
        return (b.y - a.y) / (b.x - a.x);
    }
    return slope_sign > 0 ? VERTICAL_SLOPE : -VERTICAL_SLOPE;
}

bool same_point(const Point2& a, const Point2& b) {
    return approx_equal(a.x, b.x) && approx_equal(a.y, b.y);
}

}  // namespace

BoundCurveBuilder::BoundCurveBuilder(const DataSet& reference, const TubeSize& tube)
    : reference_(reference)
    , tube_(tube) {}

DataSet BoundCurveBuilder::build(BoundSide side) const {
    auto log = funnel::logging::get_logger();

    if (reference_.empty()) {
        throw InputError("cannot build a tube around an empty reference curve");
    }

    const auto& ref = reference_.points();
    const size_t n = ref.size();
    const int dir = direction(side);
    const double dx = tube_.half_width;
    const double dy = dir * tube_.half_height;

    std::vector<Point2> curve;
    curve.reserve(2 * n);

    auto add_left = [&](const Point2& c) { curve.emplace_back(c.x - dx, c.y + dy); };
    auto add_right = [&](const Point2& c) { curve.emplace_back(c.x + dx, c.y + dy); };

    // Slope signs seen from the bound: +1 means the reference moves away
    // from this side of the tube (rising for the lower bound).
    auto outward = [dir](int slope_sign) { return -dir * slope_sign; };

    // Start: skip leading duplicates
    size_t b = 0;
    while (b + 1 < n && same_point(ref[b], ref[b + 1])) {
        ++b;
    }

    if (b + 1 == n) {
        // Every sample is the same point: a single rectangle
        add_left(ref[b]);
        add_right(ref[b]);
        log->debug("BoundCurveBuilder: {} bound of a single-point reference", to_string(side));
        return DataSet(std::move(curve));
    }

    int s0 = sign(ref[b + 1].y - ref[b].y);
    double m0 = segment_slope(ref[b], ref[b + 1], s0);

    add_left(ref[b]);
    if (outward(s0) == 1) {
        add_right(ref[b]);
    }

    // Interior: rectangle corners at each change of slope
    for (size_t i = b + 1; i + 1 < n; ++i) {
        if (same_point(ref[i], ref[i + 1])) {
            continue;
        }

        int s1 = sign(ref[i + 1].y - ref[i].y);
        double m1 = segment_slope(ref[i], ref[i + 1], s1);

        // Collinear segments add no corner
        if (!approx_equal(m0, m1)) {
            int r0 = outward(s0);
            int r1 = outward(s1);

            if (r0 != -1 && r1 != -1) {
                add_right(ref[i]);
            } else if (r0 != 1 && r1 != 1) {
                add_left(ref[i]);
            } else if (r0 == -1 && r1 == 1) {
                add_left(ref[i]);
                add_right(ref[i]);
            } else if (r0 == 1 && r1 == -1) {
                add_right(ref[i]);
                add_left(ref[i]);
            }

            retract_plateau(curve, ref[i + 1].y + dy, s0 * s1 == -1);
        }

        s0 = s1;
        m0 = m1;
    }

    // End
    if (outward(s0) == -1) {
        add_left(ref[n - 1]);
    }
    add_right(ref[n - 1]);

    log->debug("BoundCurveBuilder: raw {} bound has {} points ({} reference samples)",
               to_string(side), curve.size(), n);
    return DataSet(std::move(curve));
}

void BoundCurveBuilder::retract_plateau(std::vector<Point2>& curve, double next_level,
                                        bool turned) {
    const size_t len = curve.size();
    const double last_y = curve.back().y;

    if (!approx_equal(next_level, last_y)) {
        return;
    }

    // A turn emitted two corners (len >= 3: start corner plus both),
    // otherwise one corner was emitted (len >= 2).
    if (turned && approx_equal(curve[len - 3].y, last_y)) {
        curve.pop_back();
        curve.pop_back();
    } else if (!turned && approx_equal(curve[len - 2].y, last_y)) {
        curve.pop_back();
    }
}

}  // namespace funnel
