/**
 * @file Square.inl
 * @brief Inline implementation of SquareCoord.
 * @see   Square.hpp
 */

#ifndef TES_COORD_SQUARE_INL
    #define TES_COORD_SQUARE_INL

#include <cmath>
#include <cstdlib>

namespace tes::coord {

template <Connectivity N>
constexpr SquareCoord<N>::SquareCoord(core::i32 x_, core::i32 y_) : x(x_), y(y_) {}

template <Connectivity N>
constexpr SquareCoord<N> SquareCoord<N>::operator+(SquareCoord rhs) const { return {x + rhs.x, y + rhs.y}; }

template <Connectivity N>
constexpr SquareCoord<N> SquareCoord<N>::operator-(SquareCoord rhs) const { return {x - rhs.x, y - rhs.y}; }

template <Connectivity N>
constexpr SquareCoord<N> SquareCoord<N>::operator*(core::i32 k) const { return {x * k, y * k}; }

template <Connectivity N>
constexpr core::u32 SquareCoord<N>::distance(SquareCoord other) const
{
    const auto dx = static_cast<core::u32>(std::abs(x - other.x));
    const auto dy = static_cast<core::u32>(std::abs(y - other.y));
    if constexpr (N == Connectivity::kFour)
        return dx + dy;
    else
        return dx > dy ? dx : dy;
}

template <Connectivity N>
constexpr auto SquareCoord<N>::neighbors() const -> std::array<SquareCoord, kNeighborCount>
{
    if constexpr (N == Connectivity::kFour)
    {
        return {{
            {x + 1, y}, {x - 1, y}, {x, y + 1}, {x, y - 1},
        }};
    }
    else
    {
        return {{
            {x + 1, y},     {x - 1, y},     {x, y + 1},     {x, y - 1},
            {x + 1, y + 1}, {x - 1, y + 1}, {x + 1, y - 1}, {x - 1, y - 1},
        }};
    }
}

template <Connectivity N>
math::Vec2f SquareCoord<N>::toPixel(core::f32 tileSize) const
{
    return {static_cast<core::f32>(x) * tileSize, static_cast<core::f32>(y) * tileSize};
}

template <Connectivity N>
SquareCoord<N> SquareCoord<N>::fromPixel(math::Vec2f pixel, core::f32 tileSize)
{
    return {static_cast<core::i32>(std::lround(pixel.x / tileSize)),
            static_cast<core::i32>(std::lround(pixel.y / tileSize))};
}

} // namespace tes::coord

#endif // TES_COORD_SQUARE_INL
