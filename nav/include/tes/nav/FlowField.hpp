/**
 * @file FlowField.hpp
 * @brief Whole-grid integration field toward one or more goals.
 *
 * Built once per goal configuration with a multi-source Dijkstra from the
 * goals, then queried in O(1) per agent. Every reachable cell points at
 * its neighbour with the strictly lowest integration cost, so following
 * the directions always ends on a goal.
 *
 * Edge costs below 1 are raised to 1 while integrating: a zero-cost edge
 * would let two neighbours share a cost and break the strict descent.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_NAV_FLOW_FIELD_HPP
    #define TES_NAV_FLOW_FIELD_HPP

    #include <tes/nav/CostPropagation.hpp>
    #include <tes/grid/Grid.hpp>
    #include <tes/core/Expected.hpp>

    #include <optional>
    #include <span>
    #include <vector>

namespace tes::nav {

/// @brief Per-cell content of a flow field.
struct FlowCell {
    static constexpr core::u8 kNoDirection = 0xFF;

    /// Integration cost to the nearest goal; kUnreachableCost if none.
    Cost     cost{core::kUnreachableCost};
    /// Index into the cell's neighbour order; kNoDirection on goals and
    /// unreachable cells.
    core::u8 direction{kNoDirection};

    [[nodiscard]] bool isReachable() const noexcept { return cost != core::kUnreachableCost; }
};

struct FlowFieldStats {
    core::usize reachable{0};
    core::usize unreachable{0};
    core::usize goals{0};
    Cost        maxCost{0};
    core::f64   averageCost{0.0};
};

template <coord::GridCoordinate C>
class FlowField final {
public:
    /**
     * @brief Integrate over the cells of @p grid toward @p goals.
     *
     * @param accessible Empty means every in-bounds cell is accessible.
     *                   Goals are sources whether or not they pass it.
     * @param cost       Cost of an agent moving from the first cell into the
     *                   second. Empty means 1.
     * @return kInvalidConfiguration for an empty goal set,
     *         kCoordinateOutOfBounds (from the grid) for a goal outside it.
     */
    template <typename T>
    [[nodiscard]] static core::Expected<FlowField> build(const grid::Grid<C, T> &grid,
                                                         std::span<const C> goals,
                                                         const AccessFn<C> &accessible = {},
                                                         const CostFn<C> &cost = {});

    /// @brief Neighbour offset to move along, nullopt on goals, unreachable
    ///        cells and coordinates outside the field.
    [[nodiscard]] std::optional<C> directionAt(const C &c) const;

    /// @brief The cell an agent at @p c should move into next.
    [[nodiscard]] std::optional<C> nextStep(const C &c) const;

    /// @return kCoordinateOutOfBounds outside the field.
    [[nodiscard]] core::Expected<Cost> costAt(const C &c) const;

    [[nodiscard]] bool isReachable(const C &c) const;
    [[nodiscard]] bool isGoal(const C &c) const;

    /// @brief directionAt for a batch of agents, in input order.
    [[nodiscard]] std::vector<std::optional<C>> directionsFor(std::span<const C> positions) const;

    /// @brief Follow the field from @p from until a goal; empty if unreachable.
    [[nodiscard]] std::vector<C> trace(const C &from) const;

    [[nodiscard]] FlowFieldStats stats() const;

    [[nodiscard]] const std::vector<C> &goals() const noexcept { return _goals; }
    [[nodiscard]] const grid::Grid<C, FlowCell> &cells() const noexcept { return _cells; }

private:
    FlowField(grid::Grid<C, FlowCell> cells, std::vector<C> goals)
        : _cells(std::move(cells)), _goals(std::move(goals)) {}

    grid::Grid<C, FlowCell> _cells;
    std::vector<C>          _goals;
};

} // namespace tes::nav

    #include "FlowField.inl"

#endif // TES_NAV_FLOW_FIELD_HPP
