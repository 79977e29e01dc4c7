/**
 * @file TestGrid.cpp
 * @brief Unit tests for dense grid storage.
 */

#include <catch2/catch_test_macros.hpp>

#include "tes/coord/Hex.hpp"
#include "tes/coord/Square.hpp"
#include "tes/grid/Grid.hpp"

#include <limits>
#include <utility>
#include <vector>

namespace tes::grid {

using coord::HexPointy;
using coord::Square4;

TEST_CASE("Grid::create validates its bounds", "[grid]")
{
    SECTION("regular bounds")
    {
        auto g = Grid<Square4, int>::create(Bounds<Square4>::fromSize(4, 3), 7);
        REQUIRE(g.has_value());
        REQUIRE(g->width() == 4);
        REQUIRE(g->height() == 3);
        REQUIRE(g->size() == 12);
        REQUIRE(*g->get({3, 2}) == 7);
    }

    SECTION("inverted bounds are rejected")
    {
        auto g = Grid<Square4, int>::create({{2, 2}, {1, 5}}, 0);
        REQUIRE_FALSE(g.has_value());
        REQUIRE(g.error().code() == core::ErrorCode::kInvalidConfiguration);
    }

    SECTION("zero-size bounds are rejected")
    {
        auto g = Grid<Square4, int>::create(Bounds<Square4>::fromSize(0, 5), 0);
        REQUIRE_FALSE(g.has_value());
        REQUIRE(g.error().code() == core::ErrorCode::kInvalidConfiguration);
    }
}

TEST_CASE("Grid bounds at the 32-bit limits", "[grid]")
{
    constexpr core::i32 lo = std::numeric_limits<core::i32>::min();
    constexpr core::i32 hi = std::numeric_limits<core::i32>::max();

    SECTION("a full-range axis is rejected")
    {
        const Bounds<Square4> bounds{{lo, 0}, {hi, 0}};
        REQUIRE(bounds.extent(0) == (core::i64{1} << 32));
        REQUIRE_FALSE(bounds.isAddressable());

        auto g = Grid<Square4, int>::create(bounds, 0);
        REQUIRE_FALSE(g.has_value());
        REQUIRE(g.error().code() == core::ErrorCode::kInvalidConfiguration);
    }

    SECTION("small bounds touching both limits are usable")
    {
        auto g = Grid<Square4, int>::create({{hi - 1, lo}, {hi, lo + 2}}, 0);
        REQUIRE(g.has_value());
        REQUIRE(g->width() == 2);
        REQUIRE(g->height() == 3);
        REQUIRE(g->size() == 6);

        REQUIRE(g->set({hi, lo + 2}, 5).has_value());
        REQUIRE(*g->get({hi, lo + 2}) == 5);
        REQUIRE(*g->get({hi - 1, lo}) == 0);
        REQUIRE(g->get({hi, lo + 3}).error().code() == core::ErrorCode::kCoordinateOutOfBounds);

        std::vector<Square4> seen;
        for (const auto cell : g->cells())
            seen.push_back(cell.coord);
        REQUIRE(seen.front() == Square4{hi - 1, lo});
        REQUIRE(seen.back() == Square4{hi, lo + 2});
    }
}

TEST_CASE("Grid supports negative coordinates", "[grid]")
{
    auto g = Grid<Square4, int>::createWith({{-2, -2}, {2, 2}},
        [](const Square4 &c) { return c.x * 10 + c.y; });
    REQUIRE(g.has_value());

    REQUIRE(*g->get({-2, -2}) == -22);
    REQUIRE(*g->get({1, -1}) == 9);
    REQUIRE(g->contains({0, 0}));
    REQUIRE_FALSE(g->contains({3, 0}));
}

TEST_CASE("Grid access outside bounds is an error, never a wrap", "[grid]")
{
    auto g = Grid<Square4, int>::create(Bounds<Square4>::fromSize(5, 5), 0);
    REQUIRE(g.has_value());

    auto read = g->get({5, 0});
    REQUIRE_FALSE(read.has_value());
    REQUIRE(read.error().code() == core::ErrorCode::kCoordinateOutOfBounds);

    auto write = g->set({0, -1}, 3);
    REQUIRE_FALSE(write.has_value());
    REQUIRE(write.error().code() == core::ErrorCode::kCoordinateOutOfBounds);

    REQUIRE(g->find({-1, 0}) == nullptr);
    for (const auto cell : g->cells())
        REQUIRE(cell.value == 0);
}

TEST_CASE("Grid initializer runs once per coordinate in row-major order", "[grid]")
{
    std::vector<Square4> visited;
    auto g = Grid<Square4, int>::createWith(Bounds<Square4>::fromSize(3, 2),
        [&visited](const Square4 &c) { visited.push_back(c); return 1; });
    REQUIRE(g.has_value());

    const std::vector<Square4> expected{{0, 0}, {1, 0}, {2, 0}, {0, 1}, {1, 1}, {2, 1}};
    REQUIRE(visited == expected);
}

TEST_CASE("Grid iteration is lazy, ordered and restartable", "[grid]")
{
    auto g = Grid<Square4, int>::create(Bounds<Square4>::fromSize(3, 3), 0);
    REQUIRE(g.has_value());

    REQUIRE(g->set({1, 1}, 5).has_value());
    (*g)[{2, 0}] = 3;

    int total = 0;
    std::vector<Square4> order;
    for (const auto cell : std::as_const(*g).cells())
    {
        total += cell.value;
        order.push_back(cell.coord);
    }
    REQUIRE(total == 8);
    REQUIRE(order.size() == 9);
    REQUIRE(order.front() == Square4{0, 0});
    REQUIRE(order[1] == Square4{1, 0});
    REQUIRE(order.back() == Square4{2, 2});

    SECTION("mutable view writes through")
    {
        for (auto cell : g->cells())
            cell.value += 1;
        REQUIRE(*g->get({1, 1}) == 6);
        REQUIRE(*g->get({0, 2}) == 1);
    }

    SECTION("second pass sees the same cells")
    {
        core::usize count = 0;
        for ([[maybe_unused]] const auto cell : g->cells())
            ++count;
        REQUIRE(count == 9);
    }
}

TEST_CASE("Grid<bool> stores addressable flags", "[grid]")
{
    auto walls = Grid<Square4, bool>::create(Bounds<Square4>::fromSize(2, 2), false);
    REQUIRE(walls.has_value());

    bool *flag = walls->find({1, 0});
    REQUIRE(flag != nullptr);
    *flag = true;
    REQUIRE(*walls->get({1, 0}));
    walls->fill(true);
    REQUIRE(*walls->get({0, 1}));
}

TEST_CASE("Grid works for hexagonal coordinates", "[grid][hex]")
{
    auto g = Grid<HexPointy, int>::create({{-3, -3}, {3, 3}}, 0);
    REQUIRE(g.has_value());
    REQUIRE(g->size() == 49);
    REQUIRE(g->set({-3, 3}, 9).has_value());
    REQUIRE(*g->get({-3, 3}) == 9);
    REQUIRE_FALSE(g->get({4, 0}).has_value());
}

} // namespace tes::grid
