#ifndef BIKECALC_BICYCLE_PER_SIDE_HPP
#define BIKECALC_BICYCLE_PER_SIDE_HPP

#include <array>
#include <string>

namespace bikecalc {

// Hub side. Left is the non-drive side, right is the drive side.
enum class Side { Left, Right };

inline constexpr std::array<Side, 2> kSides = {Side::Left, Side::Right};

inline const char* side_name(Side side) {
    return side == Side::Left ? "left" : "right";
}

// A value carried once for each hub side
template <typename T>
struct PerSide {
    T left{};
    T right{};

    const T& at(Side side) const { return side == Side::Left ? left : right; }
    T& at(Side side) { return side == Side::Left ? left : right; }

    bool operator==(const PerSide&) const = default;
};

}  // namespace bikecalc

#endif // BIKECALC_BICYCLE_PER_SIDE_HPP
