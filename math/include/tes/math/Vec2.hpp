/**
 * @file Vec2.hpp
 * @brief 2-component vector template for pixel and world-space math.
 *
 * Used for coordinate-to-pixel handoff, spatial-index positions and the
 * geometric parts of line tracing.
 *
 * @tparam T Scalar type satisfying tes::core::Arithmetic.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_MATH_VEC2_HPP
    #define TES_MATH_VEC2_HPP

    #include <tes/core/Concepts.hpp>

namespace tes::math {

template <core::Arithmetic T>
struct Vec2 final {
    T x{};
    T y{};

    constexpr Vec2() = default;
    constexpr Vec2(T x, T y);

    [[nodiscard]] constexpr Vec2 operator+(Vec2 rhs) const;
    [[nodiscard]] constexpr Vec2 operator-(Vec2 rhs) const;
    [[nodiscard]] constexpr Vec2 operator*(T scalar)  const;
    [[nodiscard]] constexpr Vec2 operator/(T scalar)  const;
    [[nodiscard]] constexpr Vec2 operator-()          const;

    constexpr Vec2 &operator+=(Vec2 rhs);
    constexpr Vec2 &operator-=(Vec2 rhs);
    constexpr Vec2 &operator*=(T scalar);

    [[nodiscard]] constexpr bool operator==(const Vec2 &) const = default;

    [[nodiscard]] constexpr T    dot(Vec2 rhs)        const;
    /// @brief z component of the 3D cross product (signed parallelogram area).
    [[nodiscard]] constexpr T    cross(Vec2 rhs)      const;
    [[nodiscard]] constexpr T    lengthSquared()      const;
    [[nodiscard]] T              length()             const;
    [[nodiscard]] T              distance(Vec2 rhs)   const;
    [[nodiscard]] constexpr Vec2 lerp(Vec2 rhs, T t)  const;

    static constexpr Vec2 zero();
};

using Vec2f = Vec2<float>;
using Vec2d = Vec2<double>;
using Vec2i = Vec2<core::i32>;

} // namespace tes::math

    #include "Vec2.inl"

#endif // TES_MATH_VEC2_HPP
