/**
 * @file Engine.inl
 * @brief Inline implementation of the Engine batch operations.
 * @see   Engine.hpp
 */

#ifndef TES_ENGINE_ENGINE_INL
    #define TES_ENGINE_ENGINE_INL

#include <format>

namespace tes::engine {

template <coord::GridCoordinate C>
nav::PathQuery<C> Engine::withDefaults(nav::PathQuery<C> query) const
{
    if (!query.maxCost && config().searchCeiling() != core::kUnlimitedSearch)
        query.maxCost = config().searchCeiling();
    return query;
}

template <coord::GridCoordinate C, typename T>
std::vector<core::Expected<nav::PathResult<C>>>
Engine::findPaths(const grid::Grid<C, T> &grid, std::span<const nav::PathQuery<C>> queries)
{
    return pool().map(queries, [this, &grid](const nav::PathQuery<C> &query) {
        return nav::findPath(grid, withDefaults(query));
    });
}

template <coord::GridCoordinate C, typename T>
std::vector<core::Expected<nav::FlowField<C>>>
Engine::buildFlowFields(const grid::Grid<C, T> &grid, std::span<const std::vector<C>> goalGroups,
                        const nav::AccessFn<C> &accessible, const nav::CostFn<C> &cost)
{
    core::Log::debug("engine", std::format("building {} flow fields over {} cells",
                                           goalGroups.size(), grid.size()));
    return pool().map(goalGroups, [&](const std::vector<C> &goals) {
        return nav::FlowField<C>::build(grid, std::span<const C>{goals}, accessible, cost);
    });
}

template <coord::GridCoordinate C>
std::vector<bool> Engine::lineOfSightBatch(std::span<const std::pair<C, C>> pairs,
                                           const vision::BlockFn<C> &blocks)
{
    return pool().map(pairs, [&blocks](const std::pair<C, C> &p) {
        return vision::lineOfSight(p.first, p.second, blocks);
    });
}

} // namespace tes::engine

#endif // TES_ENGINE_ENGINE_INL
