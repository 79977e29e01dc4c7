/**
 * @file ISpatialIndex.hpp
 * @brief Abstract spatial index interface for broad-phase point queries.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_SPATIAL_ISPATIAL_INDEX_HPP
    #define TES_SPATIAL_ISPATIAL_INDEX_HPP

    #include <tes/core/Expected.hpp>
    #include <tes/core/Types.hpp>
    #include <tes/math/Rect.hpp>

    #include <functional>
    #include <vector>

namespace tes::spatial {

using EntityCallback = std::function<void(core::EntityId)>;

/**
 * @class ISpatialIndex
 * @brief Strategy interface for spatial acceleration structures.
 *
 * Implementations track only an id and a world-space position per entity.
 * Concrete implementations: @c Quadtree, @c SpatialHashGrid.
 */
class ISpatialIndex {
public:
    virtual ~ISpatialIndex() = default;

    /**
     * @brief Start tracking @p id at @p position.
     * @return kAlreadyExists for a tracked id.
     */
    [[nodiscard]] virtual core::ExpectedVoid insert(core::EntityId id, math::Vec2f position) = 0;

    /**
     * @brief Move a tracked entity.
     * @return kNotFound for an unknown id.
     */
    [[nodiscard]] virtual core::ExpectedVoid update(core::EntityId id, math::Vec2f position) = 0;

    /** @return kNotFound for an unknown id. */
    [[nodiscard]] virtual core::ExpectedVoid remove(core::EntityId id) = 0;

    /**
     * @brief Calls @p callback for every entity inside @p region (edges
     *        included). Each entity is reported once.
     */
    virtual void query(const math::Rectf &region, const EntityCallback &callback) const = 0;

    /** @brief Calls @p callback for every entity within @p radius of @p center. */
    virtual void queryRadius(math::Vec2f center, core::f32 radius, const EntityCallback &callback) const = 0;

    virtual void clear() = 0;

    [[nodiscard]] virtual core::u32 count() const noexcept = 0;

    [[nodiscard]] std::vector<core::EntityId> queryRect(const math::Rectf &region) const
    {
        std::vector<core::EntityId> out;
        query(region, [&out](core::EntityId id) { out.push_back(id); });
        return out;
    }

    [[nodiscard]] std::vector<core::EntityId> queryCircle(math::Vec2f center, core::f32 radius) const
    {
        std::vector<core::EntityId> out;
        queryRadius(center, radius, [&out](core::EntityId id) { out.push_back(id); });
        return out;
    }
};

} // namespace tes::spatial

#endif // TES_SPATIAL_ISPATIAL_INDEX_HPP
