/**
 * @file VisibilityMap.hpp
 * @brief Set of cells visible from one origin, with distance and light level.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_VISION_VISIBILITY_MAP_HPP
    #define TES_VISION_VISIBILITY_MAP_HPP

    #include <tes/coord/Coordinate.hpp>

    #include <algorithm>
    #include <functional>
    #include <optional>
    #include <unordered_map>
    #include <vector>

namespace tes::vision {

/// @brief Does this cell stop sight? Blocking cells are still seen themselves.
template <coord::GridCoordinate C>
using BlockFn = std::function<bool(const C &)>;

struct Visibility {
    core::u32 distance{0};
    /// max(0, 1 - distance / radius); 1 at the origin.
    core::f32 light{1.0f};
    bool      blocking{false};
};

template <coord::GridCoordinate C>
class VisibilityMap final {
public:
    VisibilityMap(C origin, core::u32 radius) : _origin{origin}, _radius{radius} {}

    [[nodiscard]] const C  &origin() const noexcept { return _origin; }
    [[nodiscard]] core::u32 radius() const noexcept { return _radius; }
    [[nodiscard]] core::usize size() const noexcept { return _cells.size(); }

    [[nodiscard]] bool isVisible(const C &c) const { return _cells.contains(c); }

    [[nodiscard]] const Visibility *find(const C &c) const
    {
        auto it = _cells.find(c);
        return it == _cells.end() ? nullptr : &it->second;
    }

    [[nodiscard]] std::optional<core::u32> distanceTo(const C &c) const
    {
        const Visibility *v = find(c);
        return v ? std::optional<core::u32>{v->distance} : std::nullopt;
    }

    /// @brief 0 for cells that are not visible.
    [[nodiscard]] core::f32 lightAt(const C &c) const
    {
        const Visibility *v = find(c);
        return v ? v->light : 0.0f;
    }

    /// @brief Visible cells whose distance lies in [minDistance, maxDistance].
    [[nodiscard]] std::vector<C> inRange(core::u32 minDistance, core::u32 maxDistance) const
    {
        std::vector<C> out;
        for (const auto &[c, v] : _cells)
        {
            if (v.distance >= minDistance && v.distance <= maxDistance)
                out.push_back(c);
        }
        return out;
    }

    [[nodiscard]] std::vector<C> visible() const { return inRange(0, _radius); }

    /// @brief Marks @p c visible; keeps the first record for a cell.
    void mark(const C &c, bool blocking)
    {
        const core::u32 d = c.distance(_origin);
        const core::f32 light = _radius == 0
            ? 1.0f
            : std::max(0.0f, 1.0f - static_cast<core::f32>(d) / static_cast<core::f32>(_radius));
        _cells.try_emplace(c, Visibility{d, light, blocking});
    }

    [[nodiscard]] auto begin() const { return _cells.begin(); }
    [[nodiscard]] auto end() const { return _cells.end(); }

private:
    C _origin;
    core::u32 _radius;
    std::unordered_map<C, Visibility> _cells;
};

} // namespace tes::vision

#endif // TES_VISION_VISIBILITY_MAP_HPP
