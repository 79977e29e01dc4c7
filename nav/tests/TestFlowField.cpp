/**
 * @file TestFlowField.cpp
 * @brief Unit tests for flow field integration and queries.
 */

#include <catch2/catch_test_macros.hpp>

#include "tes/coord/Hex.hpp"
#include "tes/coord/Square.hpp"
#include "tes/nav/FlowField.hpp"
#include "tes/nav/Pathfinder.hpp"

#include <vector>

namespace tes::nav {

using coord::HexPointy;
using coord::Square4;
using coord::Square8;

TEST_CASE("FlowField on an open grid costs the topology distance", "[nav][flow]")
{
    auto g = grid::Grid<Square4, bool>::create(grid::Bounds<Square4>::fromSize(10, 10), true);
    REQUIRE(g.has_value());

    const std::vector<Square4> goals{{5, 5}};
    auto field = FlowField<Square4>::build(*g, goals);
    REQUIRE(field.has_value());

    for (const auto cell : g->cells())
    {
        const Cost expected = cell.coord.distance(goals.front());
        REQUIRE(*field->costAt(cell.coord) == expected);

        const auto route = field->trace(cell.coord);
        REQUIRE(route.size() == expected + 1);
        REQUIRE(route.back() == goals.front());
    }

    REQUIRE_FALSE(field->directionAt({5, 5}).has_value());
    REQUIRE(field->isGoal({5, 5}));
}

TEST_CASE("FlowField directions strictly descend", "[nav][flow]")
{
    auto g = grid::Grid<Square8, Cost>::createWith(grid::Bounds<Square8>::fromSize(12, 9),
        [](const Square8 &c) -> Cost { return 1 + static_cast<Cost>((c.x * 7 + c.y * 3) % 4); });
    REQUIRE(g.has_value());

    const std::vector<Square8> goals{{0, 0}, {11, 8}};
    auto field = FlowField<Square8>::build(*g, goals, {}, enteringCost(*g, [](Cost c) { return c; }));
    REQUIRE(field.has_value());

    for (const auto cell : field->cells().cells())
    {
        if (cell.value.cost == 0)
            continue;
        const auto next = field->nextStep(cell.coord);
        REQUIRE(next.has_value());
        REQUIRE(cell.coord.distance(*next) == 1);
        REQUIRE(*field->costAt(*next) < cell.value.cost);
        REQUIRE(*next - cell.coord == *field->directionAt(cell.coord));
    }
}

TEST_CASE("FlowField integration agrees with A*", "[nav][flow]")
{
    auto g = grid::Grid<HexPointy, Cost>::createWith({{-4, -4}, {4, 4}},
        [](const HexPointy &h) -> Cost { return (h.q == 1 && h.r > -3) ? 6 : 1; });
    REQUIRE(g.has_value());

    const auto cost = enteringCost(*g, [](Cost c) { return c; });
    const std::vector<HexPointy> goals{{4, -2}};
    auto field = FlowField<HexPointy>::build(*g, goals, {}, cost);
    REQUIRE(field.has_value());

    for (const auto cell : g->cells())
    {
        PathQuery<HexPointy> query;
        query.start = cell.coord;
        query.goals = goals;
        query.cost  = cost;

        auto path = findPath(*g, query);
        REQUIRE(path.has_value());
        REQUIRE(*field->costAt(cell.coord) == path->totalCost);
    }
}

TEST_CASE("FlowField marks sealed-off cells unreachable", "[nav][flow]")
{
    // Column x == 4 is a wall; the goal sits on its left.
    auto g = grid::Grid<Square4, bool>::createWith(grid::Bounds<Square4>::fromSize(8, 5),
        [](const Square4 &c) { return c.x != 4; });
    REQUIRE(g.has_value());

    const std::vector<Square4> goals{{1, 2}};
    auto field = FlowField<Square4>::build(*g, goals, accessibleWhere(*g, [](bool open) { return open; }));
    REQUIRE(field.has_value());

    REQUIRE(field->isReachable({0, 0}));
    REQUIRE_FALSE(field->isReachable({4, 2}));
    REQUIRE_FALSE(field->isReachable({6, 3}));
    REQUIRE(*field->costAt({6, 3}) == core::kUnreachableCost);
    REQUIRE_FALSE(field->nextStep({6, 3}).has_value());
    REQUIRE(field->trace({6, 3}).empty());

    const auto stats = field->stats();
    REQUIRE(stats.goals == 1);
    REQUIRE(stats.reachable == 4 * 5);
    REQUIRE(stats.unreachable == 4 * 5);
    REQUIRE(stats.maxCost == 4);
    REQUIRE(stats.averageCost > 0.0);
}

TEST_CASE("FlowField answers batch queries in order", "[nav][flow]")
{
    auto g = grid::Grid<Square4, bool>::create(grid::Bounds<Square4>::fromSize(5, 1), true);
    REQUIRE(g.has_value());

    const std::vector<Square4> goals{{2, 0}};
    auto field = FlowField<Square4>::build(*g, goals);
    REQUIRE(field.has_value());

    const std::vector<Square4> agents{{0, 0}, {4, 0}, {2, 0}, {9, 0}};
    const auto dirs = field->directionsFor(agents);
    REQUIRE(dirs.size() == 4);
    REQUIRE(dirs[0] == Square4{1, 0});
    REQUIRE(dirs[1] == Square4{-1, 0});
    REQUIRE_FALSE(dirs[2].has_value());
    REQUIRE_FALSE(dirs[3].has_value());
}

TEST_CASE("FlowField rejects bad goal sets", "[nav][flow]")
{
    auto g = grid::Grid<Square4, bool>::create(grid::Bounds<Square4>::fromSize(4, 4), true);
    REQUIRE(g.has_value());

    SECTION("empty")
    {
        auto field = FlowField<Square4>::build(*g, std::span<const Square4>{});
        REQUIRE_FALSE(field.has_value());
        REQUIRE(field.error().code() == core::ErrorCode::kInvalidConfiguration);
    }

    SECTION("outside the grid")
    {
        const std::vector<Square4> goals{{1, 1}, {4, 0}};
        auto field = FlowField<Square4>::build(*g, goals);
        REQUIRE_FALSE(field.has_value());
        REQUIRE(field.error().code() == core::ErrorCode::kCoordinateOutOfBounds);
    }

    SECTION("queries outside the field")
    {
        const std::vector<Square4> goals{{1, 1}};
        auto field = FlowField<Square4>::build(*g, goals);
        REQUIRE(field.has_value());
        auto cost = field->costAt({-1, 0});
        REQUIRE_FALSE(cost.has_value());
        REQUIRE(cost.error().code() == core::ErrorCode::kCoordinateOutOfBounds);
    }
}

TEST_CASE("FlowField treats zero-cost terrain as unit cost", "[nav][flow]")
{
    auto g = grid::Grid<Square4, Cost>::create(grid::Bounds<Square4>::fromSize(6, 1), 0);
    REQUIRE(g.has_value());

    const std::vector<Square4> goals{{0, 0}};
    auto field = FlowField<Square4>::build(*g, goals, {}, enteringCost(*g, [](Cost c) { return c; }));
    REQUIRE(field.has_value());
    REQUIRE(*field->costAt({5, 0}) == 5);
    REQUIRE(field->trace({5, 0}).size() == 6);
}

} // namespace tes::nav
