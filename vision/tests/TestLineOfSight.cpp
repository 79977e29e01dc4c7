/**
 * @file TestLineOfSight.cpp
 * @brief Unit tests for line tracing and line-of-sight queries.
 */

#include <catch2/catch_test_macros.hpp>

#include "tes/coord/Hex.hpp"
#include "tes/coord/Isometric.hpp"
#include "tes/coord/Square.hpp"
#include "tes/coord/Triangular.hpp"
#include "tes/vision/LineOfSight.hpp"

#include <random>
#include <vector>

namespace tes::vision {

using coord::HexPointy;
using coord::Isometric;
using coord::Square4;
using coord::Square8;
using coord::Triangular;

namespace {

template <coord::GridCoordinate C>
void requireWellFormed(const C &from, const C &to)
{
    const std::vector<C> line = traceLine(from, to);
    REQUIRE(line.front() == from);
    REQUIRE(line.back() == to);
    for (core::usize i = 1; i < line.size(); ++i)
        REQUIRE(coord::areNeighbors(line[i - 1], line[i]));
}

} // namespace

TEST_CASE("traceLine on a square grid", "[vision][los][square]")
{
    SECTION("straight")
    {
        const auto line = traceLine(Square4{0, 0}, Square4{4, 0});
        REQUIRE(line == std::vector<Square4>{{0, 0}, {1, 0}, {2, 0}, {3, 0}, {4, 0}});
    }

    SECTION("diagonal with 8-connectivity")
    {
        const auto line = traceLine(Square8{0, 0}, Square8{3, 3});
        REQUIRE(line == std::vector<Square8>{{0, 0}, {1, 1}, {2, 2}, {3, 3}});
    }

    SECTION("diagonal with 4-connectivity is a staircase")
    {
        const auto line = traceLine(Square4{0, 0}, Square4{3, 3});
        REQUIRE(line.size() == 7);
        requireWellFormed(Square4{0, 0}, Square4{3, 3});
    }

    SECTION("single cell")
    {
        REQUIRE(traceLine(Square8{2, 2}, Square8{2, 2}).size() == 1);
    }
}

TEST_CASE("traceLine is contiguous on every topology", "[vision][los]")
{
    std::mt19937 rng{99};
    std::uniform_int_distribution<core::i32> comp{-9, 9};
    for (int i = 0; i < 60; ++i)
    {
        const core::i32 a = comp(rng), b = comp(rng), c = comp(rng), d = comp(rng);
        requireWellFormed(Square4{a, b}, Square4{c, d});
        requireWellFormed(Square8{a, b}, Square8{c, d});
        requireWellFormed(HexPointy{a, b}, HexPointy{c, d});
        requireWellFormed(Triangular{a, b}, Triangular{c, d});
        requireWellFormed(Isometric{a, b}, Isometric{c, d});
    }
}

TEST_CASE("traceLine walks a hex line in distance steps", "[vision][los][hex]")
{
    const HexPointy from{0, 0};
    const HexPointy to{3, -1};
    REQUIRE(traceLine(from, to).size() == from.distance(to) + 1);
}

TEST_CASE("lineOfSight ignores the endpoints", "[vision][los]")
{
    const BlockFn<Square8> pillar = [](const Square8 &c) { return c == Square8{2, 0}; };

    REQUIRE_FALSE(lineOfSight(Square8{0, 0}, Square8{4, 0}, pillar));
    REQUIRE(lineOfSight(Square8{0, 0}, Square8{2, 0}, pillar));
    REQUIRE(lineOfSight(Square8{2, 0}, Square8{4, 0}, pillar));
    REQUIRE(lineOfSight(Square8{0, 0}, Square8{0, 4}, pillar));
}

TEST_CASE("lineOfSight over hexagons", "[vision][los][hex]")
{
    const BlockFn<HexPointy> blocks = [](const HexPointy &h) { return h == HexPointy{0, 2}; };
    REQUIRE_FALSE(lineOfSight(HexPointy{0, 0}, HexPointy{0, 4}, blocks));
    REQUIRE(lineOfSight(HexPointy{0, 0}, HexPointy{4, 0}, blocks));
}

} // namespace tes::vision
