#ifndef FUNNEL_COMMON_FLOAT_COMPARE_HPP
#define FUNNEL_COMMON_FLOAT_COMPARE_HPP

#include <cmath>

namespace funnel {

// Absolute tolerance below which two values are treated as equal.
// Shared by every stage of the comparison pipeline.
constexpr double EQUALITY_TOLERANCE = 1e-10;

inline bool approx_equal(double a, double b) {
    return std::fabs(a - b) < EQUALITY_TOLERANCE;
}

// -1, 0 or +1 (exact comparison against zero)
constexpr int sign(double value) {
    return value > 0.0 ? 1 : (value < 0.0 ? -1 : 0);
}

}  // namespace funnel

#endif // FUNNEL_COMMON_FLOAT_COMPARE_HPP
