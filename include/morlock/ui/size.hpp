// include/morlock/ui/size.hpp
// @brief Size requirements and extents used during layout.
// @invariant Requirement sums saturate at kUnbounded instead of overflowing.
// @ownership Plain value types.
#pragma once

#include <limits>

namespace morlock::ui
{

/// @brief Maximum meaning "as much as offered".
inline constexpr int kUnbounded = std::numeric_limits<int>::max();

/// @brief Minimum and maximum extent along one axis; min <= max is assumed.
struct SizeReq
{
    int min{0};
    int max{0};

    bool operator==(const SizeReq &other) const = default;
};

/// @brief Width and height of a grid, in cells.
struct Size
{
    int width{0};
    int height{0};

    bool operator==(const Size &other) const = default;
};

/// @brief a + b clamped to [0, kUnbounded].
constexpr int saturatingAdd(int a, int b)
{
    if (a < 0)
        a = 0;
    if (b < 0)
        b = 0;
    return a > kUnbounded - b ? kUnbounded : a + b;
}

/// @brief Sum requirements componentwise (stacking along the axis).
constexpr SizeReq stack(SizeReq a, SizeReq b)
{
    return SizeReq{saturatingAdd(a.min, b.min), saturatingAdd(a.max, b.max)};
}

/// @brief Componentwise maximum (sharing the cross axis).
constexpr SizeReq widest(SizeReq a, SizeReq b)
{
    return SizeReq{a.min > b.min ? a.min : b.min, a.max > b.max ? a.max : b.max};
}

} // namespace morlock::ui
