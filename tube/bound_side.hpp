#ifndef FUNNEL_TUBE_BOUND_SIDE_HPP
#define FUNNEL_TUBE_BOUND_SIDE_HPP

namespace funnel {

// Which envelope of the tube is being built.
// The underlying value is the direction of the offset in y.
enum class BoundSide : int {
    Lower = -1,
    Upper = 1
};

constexpr int direction(BoundSide side) {
    return static_cast<int>(side);
}

constexpr const char* to_string(BoundSide side) {
    return side == BoundSide::Lower ? "lower" : "upper";
}

}  // namespace funnel

#endif // FUNNEL_TUBE_BOUND_SIDE_HPP
