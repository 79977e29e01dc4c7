/**
 * @file Hex.inl
 * @brief Inline implementation of HexAxial.
 * @see   Hex.hpp
 */

#ifndef TES_COORD_HEX_INL
    #define TES_COORD_HEX_INL

#include <cmath>
#include <cstdlib>

namespace tes::coord {

template <Orientation O>
constexpr HexAxial<O>::HexAxial(core::i32 q_, core::i32 r_) : q(q_), r(r_) {}

template <Orientation O>
constexpr HexAxial<O> HexAxial<O>::operator+(HexAxial rhs) const { return {q + rhs.q, r + rhs.r}; }

template <Orientation O>
constexpr HexAxial<O> HexAxial<O>::operator-(HexAxial rhs) const { return {q - rhs.q, r - rhs.r}; }

template <Orientation O>
constexpr HexAxial<O> HexAxial<O>::operator*(core::i32 k) const { return {q * k, r * k}; }

template <Orientation O>
constexpr core::u32 HexAxial<O>::distance(HexAxial other) const
{
    const HexAxial d = *this - other;
    return static_cast<core::u32>((std::abs(d.q) + std::abs(d.r) + std::abs(d.s())) / 2);
}

template <Orientation O>
constexpr HexAxial<O> HexAxial<O>::direction(core::u32 index)
{
    constexpr std::array<HexAxial, 6> kDirections{{
        {1, 0}, {1, -1}, {0, -1}, {-1, 0}, {-1, 1}, {0, 1},
    }};
    return kDirections[index % 6];
}

template <Orientation O>
constexpr auto HexAxial<O>::neighbors() const -> std::array<HexAxial, kNeighborCount>
{
    std::array<HexAxial, kNeighborCount> out{};
    for (core::u32 i = 0; i < kNeighborCount; ++i)
        out[i] = *this + direction(i);
    return out;
}

template <Orientation O>
std::vector<HexAxial<O>> HexAxial<O>::ring(core::u32 radius) const
{
    if (radius == 0)
        return {*this};

    std::vector<HexAxial> out;
    out.reserve(6u * radius);

    HexAxial cursor = *this + direction(4) * static_cast<core::i32>(radius);
    for (core::u32 side = 0; side < 6; ++side)
    {
        for (core::u32 step = 0; step < radius; ++step)
        {
            out.push_back(cursor);
            cursor = cursor + direction(side);
        }
    }
    return out;
}

template <Orientation O>
std::vector<HexAxial<O>> HexAxial<O>::spiral(core::u32 radius) const
{
    std::vector<HexAxial> out;
    out.reserve(1u + 3u * radius * (radius + 1u));
    out.push_back(*this);
    for (core::u32 k = 1; k <= radius; ++k)
    {
        const auto band = ring(k);
        out.insert(out.end(), band.begin(), band.end());
    }
    return out;
}

template <Orientation O>
math::Vec2f HexAxial<O>::toPixel(core::f32 size) const
{
    const auto fq = static_cast<core::f32>(q);
    const auto fr = static_cast<core::f32>(r);
    if constexpr (O == Orientation::kPointy)
        return {size * (core::kSqrt3 * fq + core::kSqrt3 * 0.5f * fr), size * (1.5f * fr)};
    else
        return {size * (1.5f * fq), size * (core::kSqrt3 * 0.5f * fq + core::kSqrt3 * fr)};
}

template <Orientation O>
HexAxial<O> HexAxial<O>::fromPixel(math::Vec2f pixel, core::f32 size)
{
    const math::Vec2f p = pixel / size;
    if constexpr (O == Orientation::kPointy)
        return round(core::kSqrt3 / 3.0f * p.x - p.y / 3.0f, 2.0f / 3.0f * p.y);
    else
        return round(2.0f / 3.0f * p.x, -p.x / 3.0f + core::kSqrt3 / 3.0f * p.y);
}

template <Orientation O>
HexAxial<O> HexAxial<O>::round(core::f32 fq, core::f32 fr)
{
    const core::f32 fs = -fq - fr;

    auto rq = std::round(fq);
    auto rr = std::round(fr);
    const auto rs = std::round(fs);

    const core::f32 dq = std::abs(rq - fq);
    const core::f32 dr = std::abs(rr - fr);
    const core::f32 ds = std::abs(rs - fs);

    if (dq > dr && dq > ds)
        rq = -rr - rs;
    else if (dr > ds)
        rr = -rq - rs;

    return {static_cast<core::i32>(rq), static_cast<core::i32>(rr)};
}

template <Orientation O>
template <OffsetParity P>
constexpr OffsetCoord HexAxial<O>::toOffset() const
{
    if constexpr (O == Orientation::kPointy)
    {
        const core::i32 shove = (P == OffsetParity::kOdd) ? (r - (r & 1)) : (r + (r & 1));
        return {q + shove / 2, r};
    }
    else
    {
        const core::i32 shove = (P == OffsetParity::kOdd) ? (q - (q & 1)) : (q + (q & 1));
        return {q, r + shove / 2};
    }
}

template <Orientation O>
template <OffsetParity P>
constexpr HexAxial<O> HexAxial<O>::fromOffset(OffsetCoord o)
{
    if constexpr (O == Orientation::kPointy)
    {
        const core::i32 shove = (P == OffsetParity::kOdd) ? (o.row - (o.row & 1)) : (o.row + (o.row & 1));
        return {o.col - shove / 2, o.row};
    }
    else
    {
        const core::i32 shove = (P == OffsetParity::kOdd) ? (o.col - (o.col & 1)) : (o.col + (o.col & 1));
        return {o.col, o.row - shove / 2};
    }
}

} // namespace tes::coord

#endif // TES_COORD_HEX_INL
