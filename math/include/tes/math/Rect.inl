/**
 * @file Rect.inl
 * @brief Inline implementations of Rect template methods.
 *
 * @note This file is automatically included at the end of Rect.hpp.
 *       Do not include it directly.
 */

namespace tes::math {

template <core::Arithmetic T>
constexpr Rect<T>::Rect(Vec2<T> mn, Vec2<T> mx) : min(mn), max(mx) {}

template <core::Arithmetic T>
constexpr Rect<T> Rect<T>::fromEdges(T left, T top, T right, T bottom)
{
    return Rect{Vec2<T>{left, top}, Vec2<T>{right, bottom}};
}

template <core::Arithmetic T>
constexpr Rect<T> Rect<T>::fromCenter(Vec2<T> c, Vec2<T> half)
{
    return Rect{c - half, c + half};
}

template <core::Arithmetic T>
constexpr bool Rect<T>::contains(Vec2<T> p) const
{
    return p.x >= min.x && p.x <= max.x
        && p.y >= min.y && p.y <= max.y;
}

template <core::Arithmetic T>
constexpr bool Rect<T>::contains(const Rect &o) const
{
    return o.min.x >= min.x && o.max.x <= max.x
        && o.min.y >= min.y && o.max.y <= max.y;
}

template <core::Arithmetic T>
constexpr bool Rect<T>::intersects(const Rect &o) const
{
    return min.x <= o.max.x && max.x >= o.min.x
        && min.y <= o.max.y && max.y >= o.min.y;
}

template <core::Arithmetic T>
constexpr bool Rect<T>::intersectsCircle(Vec2<T> c, T radius) const
{
    const Vec2<T> nearest = clamp(c);
    return (c - nearest).lengthSquared() <= radius * radius;
}

template <core::Arithmetic T>
constexpr bool Rect<T>::isValid() const
{
    return min.x <= max.x && min.y <= max.y;
}

template <core::Arithmetic T>
constexpr Vec2<T> Rect<T>::center() const
{
    return Vec2<T>{(min.x + max.x) / T(2), (min.y + max.y) / T(2)};
}

template <core::Arithmetic T>
constexpr Vec2<T> Rect<T>::size() const { return max - min; }

template <core::Arithmetic T>
constexpr T Rect<T>::area() const
{
    const auto ext = size();
    return ext.x * ext.y;
}

template <core::Arithmetic T>
constexpr Vec2<T> Rect<T>::clamp(Vec2<T> p) const
{
    auto cl = [](T v, T lo, T hi) { return v < lo ? lo : (v > hi ? hi : v); };
    return Vec2<T>{cl(p.x, min.x, max.x), cl(p.y, min.y, max.y)};
}

template <core::Arithmetic T>
constexpr std::array<Rect<T>, 4> Rect<T>::quadrants() const
{
    const Vec2<T> c = center();
    return {
        Rect{Vec2<T>{c.x, min.y},   Vec2<T>{max.x, c.y}},   // NE
        Rect{min,                   c},                     // NW
        Rect{c,                     max},                   // SE
        Rect{Vec2<T>{min.x, c.y},   Vec2<T>{c.x, max.y}},   // SW
    };
}

} // namespace tes::math
