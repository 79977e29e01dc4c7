/**
 * @file Pathfinder.hpp
 * @brief A* shortest-path search over any coordinate topology.
 *
 * Accessibility and per-edge cost come with every query, so one grid can
 * serve several movement rules (walking, flying, swimming). The heuristic
 * is the topology distance times the query's minimum step cost, which
 * keeps it admissible as long as no edge costs less than that bound.
 *
 * Failing to find a path is an expected outcome: it is reported as
 * kNoPathExists (frontier exhausted) or kSearchLimitExceeded (ceiling or
 * expansion budget reached), never as an exception.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_NAV_PATHFINDER_HPP
    #define TES_NAV_PATHFINDER_HPP

    #include <tes/nav/CostPropagation.hpp>
    #include <tes/grid/Grid.hpp>
    #include <tes/core/Expected.hpp>

    #include <optional>
    #include <vector>

namespace tes::nav {

template <coord::GridCoordinate C>
struct PathQuery {
    C              start{};
    /// Search ends at whichever of these is reached first.
    std::vector<C> goals;
    /// Empty means every cell is accessible.
    AccessFn<C>    accessible;
    /// Empty means every step costs 1.
    CostFn<C>      cost;
    /// Give up once the cheapest possible path would cost more than this.
    std::optional<Cost> maxCost;
    /// Give up after this many expansions; 0 means unbounded.
    core::u64      maxExpanded{0};
    /// Lower bound of any edge cost, scales the heuristic.
    Cost           minStepCost{1};
};

template <coord::GridCoordinate C>
struct PathResult {
    /// Start to goal, inclusive. Consecutive entries are neighbours.
    std::vector<C>    path;
    /// Cost accumulated on arrival at each entry of @c path (0 at start).
    std::vector<Cost> stepCosts;
    Cost              totalCost{0};
    C                 goal{};
    core::u64         expanded{0};

    [[nodiscard]] core::usize length() const noexcept { return path.size(); }
};

/**
 * @brief Search over the unbounded lattice.
 *
 * The accessibility predicate, the ceiling or the expansion budget must
 * bound the search space, otherwise an unreachable goal keeps it running.
 *
 * @return kInvalidConfiguration for an empty goal set.
 */
template <coord::GridCoordinate C>
[[nodiscard]] core::Expected<PathResult<C>> findPath(const PathQuery<C> &query);

/**
 * @brief Search restricted to the cells of @p grid.
 *
 * @return kCoordinateOutOfBounds (from the grid) when the start or a goal
 *         lies outside it, in addition to the unbounded variant's errors.
 */
template <coord::GridCoordinate C, typename T>
[[nodiscard]] core::Expected<PathResult<C>> findPath(const grid::Grid<C, T> &grid, const PathQuery<C> &query);

/**
 * @brief Accessibility read from grid contents: @p pred(value) for cells
 *        inside @p grid, false outside. The grid must outlive the result.
 */
template <coord::GridCoordinate C, typename T, typename F>
    requires std::predicate<const F &, const T &>
[[nodiscard]] AccessFn<C> accessibleWhere(const grid::Grid<C, T> &grid, F pred);

/**
 * @brief Terrain cost read from grid contents: entering @c to costs
 *        @p costOf(value at to). The grid must outlive the result.
 */
template <coord::GridCoordinate C, typename T, typename F>
    requires std::invocable<const F &, const T &>
[[nodiscard]] CostFn<C> enteringCost(const grid::Grid<C, T> &grid, F costOf);

/// @brief True if consecutive cells of @p path are neighbours.
template <coord::GridCoordinate C>
[[nodiscard]] bool isContiguous(const std::vector<C> &path);

} // namespace tes::nav

    #include "Pathfinder.inl"

#endif // TES_NAV_PATHFINDER_HPP
