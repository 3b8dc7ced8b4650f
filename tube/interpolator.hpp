#ifndef FUNNEL_TUBE_INTERPOLATOR_HPP
#define FUNNEL_TUBE_INTERPOLATOR_HPP

#include <curve/data_set.hpp>
#include <span>
#include <vector>

namespace funnel {

// Resample a simple curve onto an ascending x grid by piecewise-linear
// interpolation.
//
// The cursor into `source` only moves forward. The output stops at the first
// target x beyond the last source x, so it may be shorter than `target_x`;
// values are never extrapolated past the end of the source.
std::vector<double> interpolate(const DataSet& source, std::span<const double> target_x);

}  // namespace funnel

#endif // FUNNEL_TUBE_INTERPOLATOR_HPP
