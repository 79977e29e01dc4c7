/**
 * @file Triangular.cpp
 * @brief Triangle-lattice distance, adjacency and pixel geometry.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tes/coord/Triangular.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace tes::coord {

namespace {

[[nodiscard]] core::f32 rowHeight(core::f32 side) { return side * core::kSqrt3 * 0.5f; }

/// Is the pixel (u in half-sides, fy in row fraction) inside cell column k?
[[nodiscard]] bool insideCell(core::i32 k, core::i32 row, core::f32 u, core::f32 fy)
{
    const core::f32 offset = std::abs(u - static_cast<core::f32>(k + 1));
    const bool upward = ((k + row) & 1) == 0;
    return upward ? offset <= 1.0f - fy : offset <= fy;
}

} // namespace

core::u32 Triangular::distance(Triangular other) const
{
    const auto dx = static_cast<core::u32>(std::abs(x - other.x));
    const auto dy = static_cast<core::u32>(std::abs(y - other.y));
    return std::max((dx + 1u) / 2u, dy);
}

std::array<Triangular, Triangular::kNeighborCount> Triangular::neighbors() const
{
    // Upward cells have their base on the y - 1 side.
    const core::i32 base = isUpward() ? -1 : 1;
    const core::i32 apex = -base;

    return {{
        {x - 1, y}, {x + 1, y}, {x, y + base},
        {x - 2, y}, {x + 2, y},
        {x - 2, y + base}, {x + 2, y + base}, {x - 1, y + base}, {x + 1, y + base},
        {x - 1, y + apex}, {x, y + apex}, {x + 1, y + apex},
    }};
}

math::Vec2f Triangular::toPixel(core::f32 side) const
{
    const core::f32 h = rowHeight(side);
    const core::f32 cx = static_cast<core::f32>(x + 1) * side * 0.5f;
    const core::f32 cy = static_cast<core::f32>(y) * h + (isUpward() ? h / 3.0f : 2.0f * h / 3.0f);
    return {cx, cy};
}

Triangular Triangular::fromPixel(math::Vec2f pixel, core::f32 side)
{
    const core::f32 h = rowHeight(side);
    const core::f32 rowF = pixel.y / h;
    const auto row = static_cast<core::i32>(std::floor(rowF));
    const core::f32 fy = rowF - static_cast<core::f32>(row);
    const core::f32 u = pixel.x / (side * 0.5f);
    const auto c = static_cast<core::i32>(std::floor(u));

    for (core::i32 k : {c - 1, c})
    {
        if (insideCell(k, row, u, fy))
            return {k, row};
    }

    // Numerical edge case on a shared edge: pick the nearest centroid.
    const Triangular a{c - 1, row};
    const Triangular b{c, row};
    return (a.toPixel(side) - pixel).lengthSquared() <= (b.toPixel(side) - pixel).lengthSquared() ? a : b;
}

} // namespace tes::coord
