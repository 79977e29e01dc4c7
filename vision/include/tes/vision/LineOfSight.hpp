/**
 * @file LineOfSight.hpp
 * @brief Topology-generic line tracing and line-of-sight tests.
 *
 * A line is a walk over the neighbour relation: from the current cell it
 * steps to the neighbour that advances along the segment and stays closest
 * to it. On square grids this reproduces a Bresenham-style staircase; on
 * hexagons and triangles it follows the same rule without special cases.
 *
 * Sight is not guaranteed to be symmetric: the walk from a to b may differ
 * from the walk from b to a where two neighbours tie.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_VISION_LINE_OF_SIGHT_HPP
    #define TES_VISION_LINE_OF_SIGHT_HPP

    #include <tes/vision/VisibilityMap.hpp>

    #include <vector>

namespace tes::vision {

/// @brief Cells from @p from to @p to, both inclusive; consecutive cells are neighbours.
template <coord::GridCoordinate C>
[[nodiscard]] std::vector<C> traceLine(const C &from, const C &to);

/// @brief True when no cell strictly between @p from and @p to blocks.
template <coord::GridCoordinate C>
[[nodiscard]] bool lineOfSight(const C &from, const C &to, const BlockFn<C> &blocks);

} // namespace tes::vision

    #include "LineOfSight.inl"

#endif // TES_VISION_LINE_OF_SIGHT_HPP
