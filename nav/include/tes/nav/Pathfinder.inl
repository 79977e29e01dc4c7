/**
 * @file Pathfinder.inl
 * @brief Inline implementation of the A* search.
 * @see   Pathfinder.hpp
 */

#ifndef TES_NAV_PATHFINDER_INL
    #define TES_NAV_PATHFINDER_INL

#include <tes/core/Log.hpp>

#include <algorithm>
#include <format>
#include <limits>

namespace tes::nav {

namespace detail {

template <coord::GridCoordinate C, typename Passable>
core::Expected<PathResult<C>> runAStar(const PathQuery<C> &query, Passable &&passable)
{
    if (query.goals.empty())
    {
        core::Error err{core::ErrorCode::kInvalidConfiguration,
                        std::format("path query from {} has no goal", coord::describe(query.start))};
        core::Log::reject("nav", err);
        return std::unexpected(std::move(err));
    }

    const auto costOf = [&query](const C &from, const C &to) -> Cost {
        return query.cost ? query.cost(from, to) : Cost{1};
    };

    const auto estimate = [&query](const C &c) -> Cost {
        Cost best = std::numeric_limits<Cost>::max();
        for (const C &g : query.goals)
            best = std::min(best, c.distance(g));
        return static_cast<Cost>(std::min<core::u64>(
            static_cast<core::u64>(best) * query.minStepCost, core::kUnreachableCost - 1));
    };

    const auto isGoal = [&query](const C &c) {
        return std::find(query.goals.begin(), query.goals.end(), c) != query.goals.end();
    };

    const C start[] = {query.start};
    Propagation<C> search = propagate<C>(std::span<const C>{start},
                                         passable, costOf, estimate, isGoal,
                                         Limits{query.maxCost, query.maxExpanded});

    if (!search.stoppedAt)
    {
        const core::ErrorCode code = search.limitHit ? core::ErrorCode::kSearchLimitExceeded
                                                     : core::ErrorCode::kNoPathExists;
        core::Log::debug("nav", std::format("A* from {} gave up after {} expansions ({})",
                                            coord::describe(query.start), search.expanded,
                                            core::errorCodeName(code)));
        return core::makeError(code, std::format("no path from {} after {} expansions",
                                                 coord::describe(query.start), search.expanded));
    }

    PathResult<C> result;
    result.goal     = *search.stoppedAt;
    result.expanded = search.expanded;

    std::optional<C> cursor = search.stoppedAt;
    while (cursor)
    {
        const NodeRecord<C> &rec = search.records.at(*cursor);
        result.path.push_back(*cursor);
        result.stepCosts.push_back(rec.cost);
        cursor = rec.parent;
    }
    std::reverse(result.path.begin(), result.path.end());
    std::reverse(result.stepCosts.begin(), result.stepCosts.end());
    result.totalCost = result.stepCosts.back();

    core::Log::debug("nav", std::format("A* {} -> {}: {} cells, cost {}, {} expansions",
                                        coord::describe(query.start), coord::describe(result.goal),
                                        result.path.size(), result.totalCost, result.expanded));
    return result;
}

} // namespace detail

template <coord::GridCoordinate C>
core::Expected<PathResult<C>> findPath(const PathQuery<C> &query)
{
    return detail::runAStar(query, [&query](const C &c) {
        return !query.accessible || query.accessible(c);
    });
}

template <coord::GridCoordinate C, typename T>
core::Expected<PathResult<C>> findPath(const grid::Grid<C, T> &grid, const PathQuery<C> &query)
{
    TES_TRY_VOID(grid.checkBounds(query.start));
    for (const C &goal : query.goals)
        TES_TRY_VOID(grid.checkBounds(goal));

    return detail::runAStar(query, [&grid, &query](const C &c) {
        return grid.contains(c) && (!query.accessible || query.accessible(c));
    });
}

template <coord::GridCoordinate C, typename T, typename F>
    requires std::predicate<const F &, const T &>
AccessFn<C> accessibleWhere(const grid::Grid<C, T> &grid, F pred)
{
    return [&grid, pred = std::move(pred)](const C &c) {
        const T *value = grid.find(c);
        return value != nullptr && pred(*value);
    };
}

template <coord::GridCoordinate C, typename T, typename F>
    requires std::invocable<const F &, const T &>
CostFn<C> enteringCost(const grid::Grid<C, T> &grid, F costOf)
{
    return [&grid, costOf = std::move(costOf)](const C &, const C &to) -> Cost {
        const T *value = grid.find(to);
        return value != nullptr ? static_cast<Cost>(costOf(*value)) : core::kUnreachableCost;
    };
}

template <coord::GridCoordinate C>
bool isContiguous(const std::vector<C> &path)
{
    for (core::usize i = 1; i < path.size(); ++i)
    {
        if (!coord::areNeighbors(path[i - 1], path[i]))
            return false;
    }
    return true;
}

} // namespace tes::nav

#endif // TES_NAV_PATHFINDER_INL
