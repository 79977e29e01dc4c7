/**
 * @file LineOfSight.inl
 * @brief Inline implementation of line tracing.
 * @see   LineOfSight.hpp
 */

#ifndef TES_VISION_LINE_OF_SIGHT_INL
    #define TES_VISION_LINE_OF_SIGHT_INL

#include <tes/core/Constants.hpp>

#include <cmath>
#include <optional>

namespace tes::vision {

namespace detail {

/// Neighbour of @p current closest (in pixel space) to @p target.
template <coord::GridCoordinate C>
C closestNeighbor(const C &current, math::Vec2f target)
{
    const auto around = current.neighbors();
    C best = around.front();
    core::f32 bestDist = (best.toPixel(1.0f) - target).lengthSquared();
    for (const C &n : around)
    {
        const core::f32 d = (n.toPixel(1.0f) - target).lengthSquared();
        if (d < bestDist)
        {
            best = n;
            bestDist = d;
        }
    }
    return best;
}

} // namespace detail

template <coord::GridCoordinate C>
std::vector<C> traceLine(const C &from, const C &to)
{
    std::vector<C> line{from};
    if (from == to)
        return line;

    const math::Vec2f a = from.toPixel(1.0f);
    const math::Vec2f b = to.toPixel(1.0f);
    const math::Vec2f seg = b - a;
    const core::f32 len2 = seg.lengthSquared();
    const core::f32 len  = std::sqrt(len2);

    // The walk advances strictly along the segment, so it cannot take more
    // steps than there are cells it can touch; past that, fall back to a
    // greedy walk that only ever gets closer to the target.
    const core::u32 budget = (from.distance(to) + 2) * static_cast<core::u32>(C::kNeighborCount);

    C current = from;
    core::f32 progress = 0.0f;
    core::u32 steps = 0;
    while (current != to)
    {
        std::optional<C> next;
        core::f32 nextT = 0.0f;
        core::f32 nextPerp = 0.0f;

        if (steps++ < budget)
        {
            for (const C &n : current.neighbors())
            {
                if (n == to)
                {
                    next = n;
                    nextT = 1.0f;
                    break;
                }

                const math::Vec2f v = n.toPixel(1.0f) - a;
                const core::f32 t = v.dot(seg) / len2;
                if (t <= progress + core::kPixelEpsilon || t > 1.0f + core::kPixelEpsilon)
                    continue;

                const core::f32 perp = std::abs(v.cross(seg)) / len;
                const bool better = !next
                    || perp < nextPerp - core::kPixelEpsilon
                    || (perp <= nextPerp + core::kPixelEpsilon && t < nextT);
                if (better)
                {
                    next = n;
                    nextT = t;
                    nextPerp = perp;
                }
            }
        }

        if (!next)
        {
            next = detail::closestNeighbor(current, b);
            nextT = (next->toPixel(1.0f) - a).dot(seg) / len2;
        }

        current = *next;
        progress = nextT;
        line.push_back(current);
    }
    return line;
}

template <coord::GridCoordinate C>
bool lineOfSight(const C &from, const C &to, const BlockFn<C> &blocks)
{
    const std::vector<C> line = traceLine(from, to);
    for (core::usize i = 1; i + 1 < line.size(); ++i)
    {
        if (blocks(line[i]))
            return false;
    }
    return true;
}

} // namespace tes::vision

#endif // TES_VISION_LINE_OF_SIGHT_INL
