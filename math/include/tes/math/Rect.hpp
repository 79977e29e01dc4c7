/**
 * @file Rect.hpp
 * @brief Axis-aligned rectangle for spatial-index bounds and queries.
 *
 * Bounds are closed on both ends: a point lying on @c max is contained.
 *
 * @tparam T Scalar type satisfying tes::core::Arithmetic.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_MATH_RECT_HPP
    #define TES_MATH_RECT_HPP

    #include "Vec2.hpp"

    #include <array>

namespace tes::math {

template <core::Arithmetic T>
struct Rect final {
    Vec2<T> min{};
    Vec2<T> max{};

    constexpr Rect() = default;
    constexpr Rect(Vec2<T> min, Vec2<T> max);

    /// @brief Build from left/top/right/bottom edges.
    static constexpr Rect fromEdges(T left, T top, T right, T bottom);
    static constexpr Rect fromCenter(Vec2<T> center, Vec2<T> halfExtents);

    [[nodiscard]] constexpr bool    contains(Vec2<T> point)       const;
    [[nodiscard]] constexpr bool    contains(const Rect &other)   const;
    [[nodiscard]] constexpr bool    intersects(const Rect &other) const;
    /// @brief True if the closed disc touches this rectangle.
    [[nodiscard]] constexpr bool    intersectsCircle(Vec2<T> center, T radius) const;
    [[nodiscard]] constexpr bool    isValid()                     const;
    [[nodiscard]] constexpr Vec2<T> center()                      const;
    [[nodiscard]] constexpr Vec2<T> size()                        const;
    [[nodiscard]] constexpr T       area()                        const;
    [[nodiscard]] constexpr Vec2<T> clamp(Vec2<T> point)          const;

    /**
     * @brief Split into four quadrants around the centre.
     *
     * Order: NE, NW, SE, SW where "north" is the low-y half and "east" the
     * high-x half. The quadrants share their inner edges, so together they
     * cover the parent exactly.
     */
    [[nodiscard]] constexpr std::array<Rect, 4> quadrants() const;

    [[nodiscard]] constexpr bool operator==(const Rect &) const = default;
};

using Rectf = Rect<float>;
using Recti = Rect<core::i32>;

} // namespace tes::math

    #include "Rect.inl"

#endif // TES_MATH_RECT_HPP
