/**
 * @file SpatialHashGrid.cpp
 * @brief Uniform spatial hash grid implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tes/spatial/SpatialHashGrid.hpp>
#include <tes/core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <unordered_map>
#include <vector>

namespace tes::spatial {

struct SpatialHashGrid::Impl
{
    core::f32                                                        cellSize;
    std::unordered_map<core::u64, std::vector<core::EntityId>>       cells;
    std::unordered_map<core::EntityId, math::Vec2f>                  positions;

    explicit Impl(core::f32 cs) : cellSize{cs} {}

    static constexpr core::f64 kMinCell = std::numeric_limits<core::i32>::min();
    static constexpr core::f64 kMaxCell = std::numeric_limits<core::i32>::max();

    [[nodiscard]] core::f64 cellCoord(core::f32 v) const
    {
        return std::floor(static_cast<core::f64>(v) / cellSize);
    }

    /// @brief Finite and inside the 32-bit cell range; false for NaN.
    [[nodiscard]] bool isIndexable(math::Vec2f p) const
    {
        const core::f64 cx = cellCoord(p.x);
        const core::f64 cy = cellCoord(p.y);
        return std::isfinite(p.x) && std::isfinite(p.y)
            && cx >= kMinCell && cx <= kMaxCell && cy >= kMinCell && cy <= kMaxCell;
    }

    /// @brief Only called on positions that passed isIndexable().
    [[nodiscard]] core::i32 toCell(core::f32 v) const
    {
        return static_cast<core::i32>(cellCoord(v));
    }

    [[nodiscard]] core::i64 clampedCell(core::f32 v) const
    {
        return static_cast<core::i64>(std::clamp(cellCoord(v), kMinCell, kMaxCell));
    }

    [[nodiscard]] static core::u64 hashCell(core::i32 cx, core::i32 cy) noexcept
    {
        return (static_cast<core::u64>(static_cast<core::u32>(cx)) << 32)
             | static_cast<core::u64>(static_cast<core::u32>(cy));
    }

    [[nodiscard]] core::u64 keyOf(math::Vec2f p) const
    {
        return hashCell(toCell(p.x), toCell(p.y));
    }

    void link(core::EntityId id, math::Vec2f p)
    {
        cells[keyOf(p)].push_back(id);
    }

    void unlink(core::EntityId id, math::Vec2f p)
    {
        auto it = cells.find(keyOf(p));
        if (it == cells.end())
            return;

        auto &list = it->second;
        for (auto &slot : list)
        {
            if (slot == id)
            {
                slot = list.back();
                list.pop_back();
                break;
            }
        }
        if (list.empty())
            cells.erase(it);
    }

    template <typename Accept>
    void scan(const math::Rectf &region, Accept &&accept, const EntityCallback &callback) const
    {
        if (!region.isValid() || cells.empty())
            return;

        const core::i64 minCx = clampedCell(region.min.x);
        const core::i64 minCy = clampedCell(region.min.y);
        const core::i64 maxCx = clampedCell(region.max.x);
        const core::i64 maxCy = clampedCell(region.max.y);

        const auto visit = [&](const std::vector<core::EntityId> &list) {
            for (core::EntityId id : list)
            {
                if (accept(positions.at(id)))
                    callback(id);
            }
        };

        // A region wider than the population walks the occupied cells instead.
        const core::f64 span = static_cast<core::f64>(maxCx - minCx + 1) * static_cast<core::f64>(maxCy - minCy + 1);
        if (span > static_cast<core::f64>(cells.size()))
        {
            for (const auto &[key, list] : cells)
            {
                const auto cx = static_cast<core::i32>(static_cast<core::u32>(key >> 32));
                const auto cy = static_cast<core::i32>(static_cast<core::u32>(key));
                if (cx >= minCx && cx <= maxCx && cy >= minCy && cy <= maxCy)
                    visit(list);
            }
            return;
        }

        for (core::i64 cy = minCy; cy <= maxCy; ++cy)
        {
            for (core::i64 cx = minCx; cx <= maxCx; ++cx)
            {
                auto it = cells.find(hashCell(static_cast<core::i32>(cx), static_cast<core::i32>(cy)));
                if (it != cells.end())
                    visit(it->second);
            }
        }
    }

    [[nodiscard]] core::Error unindexable(core::EntityId id, math::Vec2f p) const
    {
        core::Error err{core::ErrorCode::kCoordinateOutOfBounds,
                        std::format("entity {} at ({}, {}) cannot be hashed with cell size {}",
                                    id, p.x, p.y, cellSize)};
        core::Log::reject("spatial", err);
        return err;
    }
};

core::Expected<SpatialHashGrid> SpatialHashGrid::create(core::f32 cellSize)
{
    if (!(cellSize > 0.0f) || !std::isfinite(cellSize))
    {
        core::Error err{core::ErrorCode::kInvalidConfiguration,
                        std::format("hash grid cell size {} must be positive", cellSize)};
        core::Log::reject("spatial", err);
        return std::unexpected(std::move(err));
    }
    return SpatialHashGrid{std::make_unique<Impl>(cellSize)};
}

SpatialHashGrid::SpatialHashGrid(std::unique_ptr<Impl> impl) : _impl{std::move(impl)} {}

SpatialHashGrid::SpatialHashGrid(SpatialHashGrid &&) noexcept            = default;
SpatialHashGrid &SpatialHashGrid::operator=(SpatialHashGrid &&) noexcept = default;
SpatialHashGrid::~SpatialHashGrid()                                      = default;

core::ExpectedVoid SpatialHashGrid::insert(core::EntityId id, math::Vec2f position)
{
    if (!_impl->isIndexable(position))
        return std::unexpected(_impl->unindexable(id, position));
    if (!_impl->positions.emplace(id, position).second)
        return core::makeError(core::ErrorCode::kAlreadyExists,
                               std::format("entity {} is already indexed", id));
    _impl->link(id, position);
    return {};
}

core::ExpectedVoid SpatialHashGrid::update(core::EntityId id, math::Vec2f position)
{
    auto it = _impl->positions.find(id);
    if (it == _impl->positions.end())
        return core::makeError(core::ErrorCode::kNotFound, std::format("entity {} is not indexed", id));
    if (!_impl->isIndexable(position))
        return std::unexpected(_impl->unindexable(id, position));

    if (_impl->keyOf(it->second) != _impl->keyOf(position))
    {
        _impl->unlink(id, it->second);
        _impl->link(id, position);
    }
    it->second = position;
    return {};
}

core::ExpectedVoid SpatialHashGrid::remove(core::EntityId id)
{
    auto it = _impl->positions.find(id);
    if (it == _impl->positions.end())
        return core::makeError(core::ErrorCode::kNotFound, std::format("entity {} is not indexed", id));

    _impl->unlink(id, it->second);
    _impl->positions.erase(it);
    return {};
}

void SpatialHashGrid::query(const math::Rectf &region, const EntityCallback &callback) const
{
    if (!region.isValid())
        return;
    _impl->scan(region, [&region](math::Vec2f p) { return region.contains(p); }, callback);
}

void SpatialHashGrid::queryRadius(math::Vec2f center, core::f32 radius, const EntityCallback &callback) const
{
    if (radius < 0.0f)
        return;
    const core::f32 r2 = radius * radius;
    _impl->scan(math::Rectf::fromCenter(center, {radius, radius}),
                [center, r2](math::Vec2f p) { return (p - center).lengthSquared() <= r2; },
                callback);
}

void SpatialHashGrid::clear()
{
    _impl->cells.clear();
    _impl->positions.clear();
}

core::u32 SpatialHashGrid::count() const noexcept
{
    return static_cast<core::u32>(_impl->positions.size());
}

core::f32 SpatialHashGrid::cellSize() const noexcept
{
    return _impl->cellSize;
}

core::usize SpatialHashGrid::occupiedCells() const noexcept
{
    return _impl->cells.size();
}

} // namespace tes::spatial
