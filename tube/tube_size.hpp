#ifndef FUNNEL_TUBE_TUBE_SIZE_HPP
#define FUNNEL_TUBE_TUBE_SIZE_HPP

#include "tolerances.hpp"
#include <curve/data_set.hpp>

namespace funnel {

// Half extents of the rectangle swept along the reference curve
struct TubeSize {
    double half_width = 0.0;    // x (time) half extent
    double half_height = 0.0;   // y (value) half extent
    double range_x = 0.0;       // max - min of reference x
    double range_y = 0.0;       // max - min of reference y

    // Lower bound for either half extent when the reference has no range
    static constexpr double MIN_HALF_SIZE = 1e-5;

    // Derive the tube from the reference curve.
    // Throws ConfigurationError when an axis has neither an absolute nor a
    // relative tolerance, or when a tolerance is negative.
    static TubeSize from_reference(const DataSet& reference, const Tolerances& tol);
};

// Throws ConfigurationError unless both axes carry a tolerance policy
void validate_tolerances(const Tolerances& tol);

}  // namespace funnel

#endif // FUNNEL_TUBE_TUBE_SIZE_HPP
