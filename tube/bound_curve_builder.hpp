#ifndef FUNNEL_TUBE_BOUND_CURVE_BUILDER_HPP
#define FUNNEL_TUBE_BOUND_CURVE_BUILDER_HPP

#include "bound_side.hpp"
#include "tube_size.hpp"
#include <curve/data_set.hpp>
#include <math/point2.hpp>
#include <vector>

namespace funnel {

// Sweeps the tube rectangle along the reference curve and collects the
// corners that form the lower or upper envelope.
//
// The result is the raw envelope: at sharp turns of the reference the
// rectangles overlap and the curve runs backward in x. LoopResolver turns it
// into a simple curve.
class BoundCurveBuilder {
public:
    BoundCurveBuilder(const DataSet& reference, const TubeSize& tube);

    // Raw envelope for one side of the tube
    DataSet build(BoundSide side) const;

    DataSet build_lower() const { return build(BoundSide::Lower); }
    DataSet build_upper() const { return build(BoundSide::Upper); }

private:
    // Drop corners that only repeat the level of the flat stretch that follows
    static void retract_plateau(std::vector<Point2>& curve, double next_level,
                                bool turned);

    const DataSet& reference_;
    TubeSize tube_;
};

}  // namespace funnel

#endif // FUNNEL_TUBE_BOUND_CURVE_BUILDER_HPP
