/**
 * @file Vec2.inl
 * @brief Inline implementation of Vec2 operations.
 * @see   Vec2.hpp
 */

#ifndef TES_MATH_VEC2_INL
    #define TES_MATH_VEC2_INL

#include <cmath>

namespace tes::math {

template <core::Arithmetic T>
constexpr Vec2<T>::Vec2(T x_, T y_) : x(x_), y(y_) {}

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::operator+(Vec2 rhs) const { return {x + rhs.x, y + rhs.y}; }

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::operator-(Vec2 rhs) const { return {x - rhs.x, y - rhs.y}; }

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::operator*(T s) const { return {x * s, y * s}; }

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::operator/(T s) const { return {x / s, y / s}; }

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::operator-() const { return {-x, -y}; }

template <core::Arithmetic T>
constexpr Vec2<T> &Vec2<T>::operator+=(Vec2 rhs) { x += rhs.x; y += rhs.y; return *this; }

template <core::Arithmetic T>
constexpr Vec2<T> &Vec2<T>::operator-=(Vec2 rhs) { x -= rhs.x; y -= rhs.y; return *this; }

template <core::Arithmetic T>
constexpr Vec2<T> &Vec2<T>::operator*=(T s) { x *= s; y *= s; return *this; }

template <core::Arithmetic T>
constexpr T Vec2<T>::dot(Vec2 rhs) const { return x * rhs.x + y * rhs.y; }

template <core::Arithmetic T>
constexpr T Vec2<T>::cross(Vec2 rhs) const { return x * rhs.y - y * rhs.x; }

template <core::Arithmetic T>
constexpr T Vec2<T>::lengthSquared() const { return dot(*this); }

template <core::Arithmetic T>
T Vec2<T>::length() const
{
    return static_cast<T>(std::sqrt(lengthSquared()));
}

template <core::Arithmetic T>
T Vec2<T>::distance(Vec2 rhs) const { return (rhs - *this).length(); }

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::lerp(Vec2 rhs, T t) const
{
    return {x + (rhs.x - x) * t, y + (rhs.y - y) * t};
}

template <core::Arithmetic T>
constexpr Vec2<T> Vec2<T>::zero() { return {T{}, T{}}; }

} // namespace tes::math

#endif // TES_MATH_VEC2_INL
