/**
 * @file SpatialHashGrid.hpp
 * @brief Uniform spatial hash grid over an unbounded plane.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_SPATIAL_SPATIAL_HASH_GRID_HPP
    #define TES_SPATIAL_SPATIAL_HASH_GRID_HPP

    #include <tes/spatial/ISpatialIndex.hpp>
    #include <tes/core/NonCopyable.hpp>

    #include <memory>

namespace tes::spatial {

/**
 * @class SpatialHashGrid
 * @brief Fixed-cell-size hash grid. Best for uniformly distributed
 *        entities. O(1) insert / remove, O(k) query.
 */
class SpatialHashGrid final : public ISpatialIndex,
                              public core::NonCopyable<SpatialHashGrid>
{
public:
    /** @return kInvalidConfiguration for a non-positive cell size. */
    [[nodiscard]] static core::Expected<SpatialHashGrid> create(core::f32 cellSize);

    SpatialHashGrid(SpatialHashGrid &&) noexcept;
    SpatialHashGrid &operator=(SpatialHashGrid &&) noexcept;
    ~SpatialHashGrid() override;

    [[nodiscard]] core::ExpectedVoid insert(core::EntityId id, math::Vec2f position) override;
    [[nodiscard]] core::ExpectedVoid update(core::EntityId id, math::Vec2f position) override;
    [[nodiscard]] core::ExpectedVoid remove(core::EntityId id) override;

    void query(const math::Rectf &region, const EntityCallback &callback) const override;
    void queryRadius(math::Vec2f center, core::f32 radius, const EntityCallback &callback) const override;

    void clear() override;

    [[nodiscard]] core::u32 count() const noexcept override;

    [[nodiscard]] core::f32 cellSize() const noexcept;
    /// Number of non-empty cells.
    [[nodiscard]] core::usize occupiedCells() const noexcept;

private:
    struct Impl;

    explicit SpatialHashGrid(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> _impl;
};

} // namespace tes::spatial

#endif // TES_SPATIAL_SPATIAL_HASH_GRID_HPP
