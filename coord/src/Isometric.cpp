/**
 * @file Isometric.cpp
 * @brief Isometric diamond projection.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tes/coord/Isometric.hpp>

#include <cmath>
#include <cstdlib>

namespace tes::coord {

core::u32 Isometric::distance(Isometric other) const
{
    return static_cast<core::u32>(std::abs(x - other.x) + std::abs(y - other.y));
}

std::array<Isometric, Isometric::kNeighborCount> Isometric::neighbors() const
{
    return {{{x + 1, y}, {x - 1, y}, {x, y + 1}, {x, y - 1}}};
}

math::Vec2f Isometric::toPixel(core::f32 tileSize) const
{
    return {static_cast<core::f32>(x - y) * tileSize * 0.5f,
            static_cast<core::f32>(x + y) * tileSize * 0.25f};
}

Isometric Isometric::fromPixel(math::Vec2f pixel, core::f32 tileSize)
{
    const core::f32 xn = pixel.x / (tileSize * 0.5f);
    const core::f32 yn = pixel.y / (tileSize * 0.25f);
    return {static_cast<core::i32>(std::lround((xn + yn) * 0.5f)),
            static_cast<core::i32>(std::lround((yn - xn) * 0.5f))};
}

std::array<math::Vec2f, 4> Isometric::tileCorners(core::f32 tileSize) const
{
    const math::Vec2f c = toPixel(tileSize);
    const core::f32 hw = tileSize * 0.5f;
    const core::f32 hh = tileSize * 0.25f;
    return {{
        {c.x, c.y - hh},
        {c.x + hw, c.y},
        {c.x, c.y + hh},
        {c.x - hw, c.y},
    }};
}

} // namespace tes::coord
