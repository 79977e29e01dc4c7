/**
 * @file CostPropagation.hpp
 * @brief Best-first cost propagation shared by A* and flow fields.
 *
 * Both searches expand neighbours, relax their cost and record the
 * predecessor. They only differ in the frontier priority (cost + estimate
 * vs. cost alone), in the number of sources, and in when they stop. This
 * header holds that common loop; Pathfinder and FlowField plug in the
 * heuristic and the stop predicate.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_NAV_COST_PROPAGATION_HPP
    #define TES_NAV_COST_PROPAGATION_HPP

    #include <tes/coord/Coordinate.hpp>
    #include <tes/core/Constants.hpp>

    #include <functional>
    #include <optional>
    #include <queue>
    #include <span>
    #include <unordered_map>
    #include <vector>

namespace tes::nav {

using Cost = core::u32;

/// @brief Can an agent stand on this cell?
template <coord::GridCoordinate C>
using AccessFn = std::function<bool(const C &)>;

/// @brief Cost of moving from the first cell into the adjacent second one.
template <coord::GridCoordinate C>
using CostFn = std::function<Cost(const C &from, const C &to)>;

namespace detail {

template <coord::GridCoordinate C>
struct NodeRecord {
    Cost             cost{0};
    std::optional<C> parent;
};

template <coord::GridCoordinate C>
struct FrontierEntry {
    Cost      priority;
    Cost      cost;
    core::u64 sequence;
    C         coord;
};

/// Lowest priority first; among equal priorities the latest push wins.
struct FrontierOrder {
    template <typename E>
    bool operator()(const E &a, const E &b) const
    {
        if (a.priority != b.priority)
            return a.priority > b.priority;
        return a.sequence < b.sequence;
    }
};

template <coord::GridCoordinate C>
struct Propagation {
    std::unordered_map<C, NodeRecord<C>> records;
    std::optional<C> stoppedAt;
    core::u64        expanded{0};
    bool             limitHit{false};
};

struct Limits {
    /// Abort once the cheapest frontier priority exceeds this.
    std::optional<Cost> ceiling;
    /// Abort after this many expansions; 0 means unbounded.
    core::u64           maxExpanded{0};
};

[[nodiscard]] constexpr Cost saturatingAdd(Cost a, Cost b) noexcept
{
    return (b > core::kUnreachableCost - a) ? core::kUnreachableCost : a + b;
}

/**
 * @brief Expand from @p sources until @p stop accepts a popped cell, the
 *        frontier drains, or a limit is hit.
 *
 * @param passable  Cells that may be entered.
 * @param edgeCost  Cost of relaxing the edge (popped, neighbour).
 * @param heuristic Admissible estimate added to the priority (0 for Dijkstra).
 * @param stop      Called on every popped cell; true ends the search there.
 */
template <coord::GridCoordinate C, typename Passable, typename EdgeCost, typename Heuristic, typename Stop>
[[nodiscard]] Propagation<C> propagate(std::span<const C> sources,
                                       Passable &&passable,
                                       EdgeCost &&edgeCost,
                                       Heuristic &&heuristic,
                                       Stop &&stop,
                                       Limits limits = {})
{
    Propagation<C> out;
    std::priority_queue<FrontierEntry<C>, std::vector<FrontierEntry<C>>, FrontierOrder> frontier;
    core::u64 sequence = 0;

    for (const C &source : sources)
    {
        if (out.records.contains(source))
            continue;
        out.records.emplace(source, NodeRecord<C>{0, std::nullopt});
        frontier.push({static_cast<Cost>(heuristic(source)), 0, sequence++, source});
    }

    while (!frontier.empty())
    {
        const FrontierEntry<C> top = frontier.top();
        frontier.pop();

        if (top.cost > out.records.at(top.coord).cost)
            continue;

        if (limits.ceiling && top.priority > *limits.ceiling)
        {
            out.limitHit = true;
            break;
        }
        if (limits.maxExpanded != 0 && out.expanded >= limits.maxExpanded)
        {
            out.limitHit = true;
            break;
        }

        ++out.expanded;
        if (stop(top.coord))
        {
            out.stoppedAt = top.coord;
            break;
        }

        for (const C &next : top.coord.neighbors())
        {
            if (!passable(next))
                continue;

            const Cost candidate = saturatingAdd(top.cost, static_cast<Cost>(edgeCost(top.coord, next)));
            if (candidate == core::kUnreachableCost)
                continue;

            auto it = out.records.find(next);
            if (it != out.records.end() && it->second.cost <= candidate)
                continue;

            if (it == out.records.end())
                out.records.emplace(next, NodeRecord<C>{candidate, top.coord});
            else
                it->second = NodeRecord<C>{candidate, top.coord};

            frontier.push({saturatingAdd(candidate, static_cast<Cost>(heuristic(next))),
                           candidate, sequence++, next});
        }
    }
    return out;
}

} // namespace detail

} // namespace tes::nav

#endif // TES_NAV_COST_PROPAGATION_HPP
