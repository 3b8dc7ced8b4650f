#ifndef FUNNEL_TUBE_TOLERANCES_HPP
#define FUNNEL_TUBE_TOLERANCES_HPP

namespace funnel {

// Comparison tolerances on both axes.
// The relative values scale with the reference curve's range on that axis.
struct Tolerances {
    double atolx = 0.0;   // Absolute tolerance in x (time)
    double atoly = 0.0;   // Absolute tolerance in y (value)
    double rtolx = 0.0;   // Relative tolerance in x
    double rtoly = 0.0;   // Relative tolerance in y

    // Factory methods for the common single-policy cases
    static Tolerances absolute(double x, double y) {
        return Tolerances{
            .atolx = x,
            .atoly = y
        };
    }

    static Tolerances relative(double x, double y) {
        return Tolerances{
            .rtolx = x,
            .rtoly = y
        };
    }
};

}  // namespace funnel

#endif // FUNNEL_TUBE_TOLERANCES_HPP
