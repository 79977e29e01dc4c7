/**
 * @file Fov.inl
 * @brief Inline implementation of the FOV strategies.
 * @see   Fov.hpp
 */

#ifndef TES_VISION_FOV_INL
    #define TES_VISION_FOV_INL

#include <tes/core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <deque>
#include <format>
#include <numbers>
#include <unordered_set>
#include <utility>
#include <vector>

namespace tes::vision {

namespace detail {

template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

// --- Octant shadowcasting ------------------------------------------------- //

template <coord::GridCoordinate C>
class OctantCaster {
public:
    OctantCaster(const C &origin, core::u32 radius, const BlockFn<C> &blocks, VisibilityMap<C> &out)
        : _origin{origin}, _radius{static_cast<core::i32>(radius)}, _blocks{blocks}, _out{out}
    {}

    void run()
    {
        // Row/column multipliers mapping octant-local (dx, dy) to grid offsets.
        static constexpr core::i32 kMult[4][8] = {
            {1, 0, 0, -1, -1, 0, 0, 1},
            {0, 1, -1, 0, 0, -1, 1, 0},
            {0, 1, 1, 0, 0, -1, -1, 0},
            {1, 0, 0, 1, -1, 0, 0, -1},
        };
        for (core::usize oct = 0; oct < 8; ++oct)
            cast(1, 1.0f, 0.0f, kMult[0][oct], kMult[1][oct], kMult[2][oct], kMult[3][oct]);
    }

private:
    void cast(core::i32 row, core::f32 start, core::f32 end,
              core::i32 xx, core::i32 xy, core::i32 yx, core::i32 yy)
    {
        if (start < end)
            return;

        const auto [ox, oy] = _origin.components();
        core::f32 newStart = 0.0f;
        for (core::i32 j = row; j <= _radius; ++j)
        {
            bool blocked = false;
            const core::i32 dy = -j;
            for (core::i32 dx = -j; dx <= 0; ++dx)
            {
                const core::f32 leftSlope  = (static_cast<core::f32>(dx) - 0.5f) / (static_cast<core::f32>(dy) + 0.5f);
                const core::f32 rightSlope = (static_cast<core::f32>(dx) + 0.5f) / (static_cast<core::f32>(dy) - 0.5f);
                if (start < rightSlope)
                    continue;
                if (end > leftSlope)
                    break;

                const C cell = C::fromComponents(ox + dx * xx + dy * xy, oy + dx * yx + dy * yy);
                const bool opaque = _blocks(cell);
                if (cell.distance(_origin) <= static_cast<core::u32>(_radius))
                    _out.mark(cell, opaque);

                if (blocked)
                {
                    if (opaque)
                    {
                        newStart = rightSlope;
                        continue;
                    }
                    blocked = false;
                    start = newStart;
                }
                else if (opaque && j < _radius)
                {
                    blocked = true;
                    cast(j + 1, start, leftSlope, xx, xy, yx, yy);
                    newStart = rightSlope;
                }
            }
            if (blocked)
                break;
        }
    }

    C                  _origin;
    core::i32          _radius;
    const BlockFn<C>  &_blocks;
    VisibilityMap<C>  &_out;
};

// --- Angular sweep -------------------------------------------------------- //

struct ShadowInterval {
    core::f32 lo;
    core::f32 hi;
};

class ShadowSet {
public:
    [[nodiscard]] bool covers(core::f32 angle) const
    {
        for (const ShadowInterval &s : _intervals)
        {
            if (angle > s.lo && angle < s.hi)
                return true;
        }
        return false;
    }

    /// Adds [lo, hi], splitting it where it wraps past +-pi. The split
    /// pieces run past the atan2 range so that +-pi itself stays covered.
    void add(core::f32 lo, core::f32 hi)
    {
        constexpr core::f32 kPi  = std::numbers::pi_v<core::f32>;
        constexpr core::f32 kOut = kPi + 1.0f;
        if (lo < -kPi)
        {
            insert({lo + 2.0f * kPi, kOut});
            insert({-kOut, hi});
        }
        else if (hi > kPi)
        {
            insert({lo, kOut});
            insert({-kOut, hi - 2.0f * kPi});
        }
        else
        {
            insert({lo, hi});
        }
    }

private:
    /// Keeps the intervals disjoint; touching intervals are fused.
    void insert(ShadowInterval s)
    {
        std::vector<ShadowInterval> kept;
        kept.reserve(_intervals.size() + 1);
        for (const ShadowInterval &o : _intervals)
        {
            if (o.hi + core::kPixelEpsilon < s.lo || s.hi + core::kPixelEpsilon < o.lo)
            {
                kept.push_back(o);
                continue;
            }
            s.lo = std::min(s.lo, o.lo);
            s.hi = std::max(s.hi, o.hi);
        }
        kept.push_back(s);
        _intervals = std::move(kept);
    }

    std::vector<ShadowInterval> _intervals;
};

template <coord::GridCoordinate C>
void sweepShadows(const C &origin, core::u32 radius, const BlockFn<C> &blocks, VisibilityMap<C> &out)
{
    struct Candidate {
        C         cell;
        core::f32 range;
        core::f32 angle;
    };

    const math::Vec2f centre = origin.toPixel(1.0f);
    std::vector<Candidate> candidates;
    for (const C &c : coord::cellsWithin(origin, radius))
    {
        if (c == origin)
            continue;
        const math::Vec2f p = c.toPixel(1.0f) - centre;
        candidates.push_back({c, p.length(), std::atan2(p.y, p.x)});
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate &l, const Candidate &r) { return l.range < r.range; });

    ShadowSet shadows;
    std::vector<const Candidate *> ring;
    for (core::usize i = 0; i < candidates.size();)
    {
        // Cells at the same range cannot hide each other: test the whole
        // ring before any of its blockers cast a shadow.
        ring.clear();
        const core::f32 range = candidates[i].range;
        for (; i < candidates.size() && candidates[i].range <= range + core::kPixelEpsilon; ++i)
        {
            if (!shadows.covers(candidates[i].angle))
                ring.push_back(&candidates[i]);
        }

        for (const Candidate *c : ring)
        {
            const bool opaque = blocks(c->cell);
            out.mark(c->cell, opaque);
            if (opaque)
            {
                const core::f32 half = std::asin(std::min(1.0f, C::kCellRadius / c->range));
                shadows.add(c->angle - half, c->angle + half);
            }
        }
    }
}

// --- Ray marching and flood fill ------------------------------------------ //

template <coord::GridCoordinate C>
void marchRays(const C &origin, core::u32 radius, const BlockFn<C> &blocks, VisibilityMap<C> &out)
{
    for (const C &c : coord::cellsWithin(origin, radius))
    {
        if (c != origin && lineOfSight(origin, c, blocks))
            out.mark(c, blocks(c));
    }
}

template <coord::GridCoordinate C>
void floodFill(const C &origin, core::u32 radius, const BlockFn<C> &blocks, VisibilityMap<C> &out)
{
    std::unordered_set<C> seen{origin};
    std::deque<C> frontier{origin};
    while (!frontier.empty())
    {
        const C current = frontier.front();
        frontier.pop_front();

        for (const C &n : current.neighbors())
        {
            if (n.distance(origin) > radius || !seen.insert(n).second)
                continue;

            const bool opaque = blocks(n);
            out.mark(n, opaque);
            if (!opaque)
                frontier.push_back(n);
        }
    }
}

} // namespace detail

template <coord::GridCoordinate C>
VisibilityMap<C> computeFov(const C &origin, core::u32 radius, const BlockFn<C> &blocks,
                            const FovAlgorithm &algorithm)
{
    VisibilityMap<C> out{origin, radius};
    out.mark(origin, blocks(origin));

    std::visit(detail::Overloaded{
        [&](const Shadowcasting &) {
            if constexpr (C::kCartesian)
                detail::OctantCaster<C>{origin, radius, blocks, out}.run();
            else
                detail::sweepShadows(origin, radius, blocks, out);
        },
        [&](const RayMarching &) { detail::marchRays(origin, radius, blocks, out); },
        [&](const FloodFill &) { detail::floodFill(origin, radius, blocks, out); },
    }, algorithm);

    if (core::Log::enabled(core::LogLevel::kDebug))
        core::Log::debug("vision", std::format("{} from {} radius {}: {} cells visible",
                                               algorithmName(algorithm), coord::describe(origin),
                                               radius, out.size()));
    return out;
}

} // namespace tes::vision

#endif // TES_VISION_FOV_INL
