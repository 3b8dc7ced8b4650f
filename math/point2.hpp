#ifndef FUNNEL_MATH_POINT2_HPP
#define FUNNEL_MATH_POINT2_HPP

namespace funnel {

// A sample of a time series: x is time, y is value
struct Point2 {
    double x = 0.0;
    double y = 0.0;

    constexpr Point2() = default;
    constexpr Point2(double x_, double y_) : x(x_), y(y_) {}

    // Comparison (exact)
    constexpr bool operator==(const Point2& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Point2& other) const {
        return !(*this == other);
    }
};

}  // namespace funnel

#endif // FUNNEL_MATH_POINT2_HPP
