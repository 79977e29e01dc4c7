/**
 * @file Fov.hpp
 * @brief Field-of-view computation with interchangeable strategies.
 *
 * The strategy is a value of the closed FovAlgorithm variant, so callers
 * switch algorithms without changing the call site.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_VISION_FOV_HPP
    #define TES_VISION_FOV_HPP

    #include <tes/vision/LineOfSight.hpp>
    #include <tes/vision/VisibilityMap.hpp>

    #include <string_view>
    #include <variant>

namespace tes::vision {

/**
 * @brief Recursive shadowcasting.
 *
 * Square and isometric grids use the eight-octant slope scan. Hexagonal
 * and triangular grids sweep outwards in pixel distance order and keep a
 * set of angular shadow intervals cast by the blockers seen so far.
 */
struct Shadowcasting {};

/// @brief One traced line per cell in range; the reference strategy.
struct RayMarching {};

/// @brief Breadth-first spread stopped by blockers. Cheap, ignores occlusion
///        by anything but walls of connected blockers.
struct FloodFill {};

using FovAlgorithm = std::variant<Shadowcasting, RayMarching, FloodFill>;

[[nodiscard]] constexpr std::string_view algorithmName(const FovAlgorithm &algo) noexcept
{
    constexpr std::string_view kNames[] = {"shadowcasting", "ray-marching", "flood-fill"};
    return kNames[algo.index()];
}

/**
 * @brief Cells visible from @p origin within @p radius (topology distance).
 *
 * The origin is always visible and never blocks its own sight.
 */
template <coord::GridCoordinate C>
[[nodiscard]] VisibilityMap<C> computeFov(const C &origin, core::u32 radius, const BlockFn<C> &blocks,
                                          const FovAlgorithm &algorithm = Shadowcasting{});

} // namespace tes::vision

    #include "Fov.inl"

#endif // TES_VISION_FOV_HPP
