#ifndef FUNNEL_TUBE_LOOP_RESOLVER_HPP
#define FUNNEL_TUBE_LOOP_RESOLVER_HPP

#include "bound_side.hpp"
#include <curve/data_set.hpp>
#include <math/point2.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace funnel {

// Outcome of resolving a raw envelope
struct LoopResolution {
    DataSet curve;              // Simple curve, x non-decreasing
    size_t loops_removed = 0;   // Backward segments that were cut out
};

// Removes the loops a raw envelope forms where neighbouring rectangles
// overlap, replacing each one by the crossing point of the two branches.
//
// For every backward segment (j, j+1) the resolver walks two cursors: i along
// the outgoing branch (before j) and k along the returning branch (after
// j+1), until it finds segments (i-1, i) and (k-1, k) that cross. Points
// i..k-1 are spliced out and the crossing is inserted in their place.
class LoopResolver {
public:
    static LoopResolution resolve(const DataSet& raw, BoundSide side);

private:
    LoopResolver(const DataSet& raw, BoundSide side);

    void run();

    // Cut the loop that starts with backward segment (j, j+1).
    // Returns the index scanning resumes from.
    size_t remove_loop(size_t j);

    // True when `a` lies strictly past `b` on this bound's own side
    // (below for the lower bound, above for the upper one)
    bool beyond(double a, double b) const;

    // Equal-x tie between the branches that still counts as "before k".
    // Not taken when k is followed by another point at the same x that
    // moves further out, since that one is resolved first.
    bool tie_before(size_t i, size_t k) const;

    // y on segment (end - 1, end) at x
    double y_on_segment(size_t end, double x) const;

    // Crossing of segments (i - 1, i) and (k - 1, k); empty when both are
    // vertical or they are parallel
    std::optional<Point2> crossing(size_t i, size_t k) const;

    std::vector<Point2> points_;
    BoundSide side_;
    size_t loops_removed_ = 0;
};

}  // namespace funnel

#endif // FUNNEL_TUBE_LOOP_RESOLVER_HPP
