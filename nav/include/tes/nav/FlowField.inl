/**
 * @file FlowField.inl
 * @brief Inline implementation of FlowField.
 * @see   FlowField.hpp
 */

#ifndef TES_NAV_FLOW_FIELD_INL
    #define TES_NAV_FLOW_FIELD_INL

#include <tes/core/Log.hpp>

#include <algorithm>
#include <format>

namespace tes::nav {

template <coord::GridCoordinate C>
template <typename T>
core::Expected<FlowField<C>> FlowField<C>::build(const grid::Grid<C, T> &grid,
                                                 std::span<const C> goals,
                                                 const AccessFn<C> &accessible,
                                                 const CostFn<C> &cost)
{
    if (goals.empty())
    {
        core::Error err{core::ErrorCode::kInvalidConfiguration, "flow field needs at least one goal"};
        core::Log::reject("nav", err);
        return std::unexpected(std::move(err));
    }
    for (const C &goal : goals)
        TES_TRY_VOID(grid.checkBounds(goal));

    auto cells = TES_TRY((grid::Grid<C, FlowCell>::create(grid.bounds(), FlowCell{})));

    const auto passable = [&grid, &accessible](const C &c) {
        return grid.contains(c) && (!accessible || accessible(c));
    };
    // Integration runs from the goals outward, so the agent moves from
    // `next` into `current`.
    const auto edgeCost = [&cost](const C &current, const C &next) -> Cost {
        const Cost step = cost ? cost(next, current) : Cost{1};
        return std::max<Cost>(step, 1);
    };
    const auto noEstimate = [](const C &) -> Cost { return 0; };
    const auto exhaustive = [](const C &) { return false; };

    const detail::Propagation<C> integration =
        detail::propagate<C>(goals, passable, edgeCost, noEstimate, exhaustive);

    for (const auto &[coord, record] : integration.records)
        cells[coord].cost = record.cost;

    for (auto cell : cells.cells())
    {
        if (!cell.value.isReachable() || cell.value.cost == 0)
            continue;

        const auto around = cell.coord.neighbors();
        Cost best = cell.value.cost;
        for (core::usize i = 0; i < around.size(); ++i)
        {
            const FlowCell *n = cells.find(around[i]);
            if (n != nullptr && n->cost < best)
            {
                best = n->cost;
                cell.value.direction = static_cast<core::u8>(i);
            }
        }
    }

    std::vector<C> goalList(goals.begin(), goals.end());
    core::Log::debug("nav", std::format("flow field over {} cells, {} goals, {} reached",
                                        cells.size(), goalList.size(), integration.records.size()));
    return FlowField{std::move(cells), std::move(goalList)};
}

template <coord::GridCoordinate C>
std::optional<C> FlowField<C>::directionAt(const C &c) const
{
    const FlowCell *cell = _cells.find(c);
    if (cell == nullptr || cell->direction == FlowCell::kNoDirection)
        return std::nullopt;
    return c.neighbors()[cell->direction] - c;
}

template <coord::GridCoordinate C>
std::optional<C> FlowField<C>::nextStep(const C &c) const
{
    const FlowCell *cell = _cells.find(c);
    if (cell == nullptr || cell->direction == FlowCell::kNoDirection)
        return std::nullopt;
    return c.neighbors()[cell->direction];
}

template <coord::GridCoordinate C>
core::Expected<Cost> FlowField<C>::costAt(const C &c) const
{
    return _cells.get(c).transform([](const FlowCell &cell) { return cell.cost; });
}

template <coord::GridCoordinate C>
bool FlowField<C>::isReachable(const C &c) const
{
    const FlowCell *cell = _cells.find(c);
    return cell != nullptr && cell->isReachable();
}

template <coord::GridCoordinate C>
bool FlowField<C>::isGoal(const C &c) const
{
    const FlowCell *cell = _cells.find(c);
    return cell != nullptr && cell->cost == 0;
}

template <coord::GridCoordinate C>
std::vector<std::optional<C>> FlowField<C>::directionsFor(std::span<const C> positions) const
{
    std::vector<std::optional<C>> out;
    out.reserve(positions.size());
    for (const C &p : positions)
        out.push_back(directionAt(p));
    return out;
}

template <coord::GridCoordinate C>
std::vector<C> FlowField<C>::trace(const C &from) const
{
    if (!isReachable(from))
        return {};

    std::vector<C> out{from};
    std::optional<C> next = nextStep(from);
    while (next)
    {
        out.push_back(*next);
        next = nextStep(*next);
    }
    return out;
}

template <coord::GridCoordinate C>
FlowFieldStats FlowField<C>::stats() const
{
    FlowFieldStats s;
    core::u64 total = 0;
    for (const auto cell : _cells.cells())
    {
        if (!cell.value.isReachable())
        {
            ++s.unreachable;
            continue;
        }
        ++s.reachable;
        if (cell.value.cost == 0)
            ++s.goals;
        total += cell.value.cost;
        s.maxCost = std::max(s.maxCost, cell.value.cost);
    }
    if (s.reachable > 0)
        s.averageCost = static_cast<core::f64>(total) / static_cast<core::f64>(s.reachable);
    return s;
}

} // namespace tes::nav

#endif // TES_NAV_FLOW_FIELD_INL
