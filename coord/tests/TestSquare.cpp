/**
 * @file TestSquare.cpp
 * @brief Unit tests for Square4 / Square8 coordinates.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "tes/coord/Coordinate.hpp"
#include "tes/coord/Square.hpp"

namespace tes::coord {

using Catch::Matchers::WithinAbs;

static_assert(GridCoordinate<Square4>);
static_assert(GridCoordinate<Square8>);

TEST_CASE("Square4 uses Manhattan distance, Square8 Chebyshev", "[coord][square]")
{
    STATIC_REQUIRE(Square4{0, 0}.distance(Square4{3, -4}) == 7);
    STATIC_REQUIRE(Square8{0, 0}.distance(Square8{3, -4}) == 4);
    STATIC_REQUIRE(Square8{2, 2}.distance(Square8{2, 2}) == 0);
}

TEST_CASE("Square distance is symmetric", "[coord][square]")
{
    for (core::i32 ax = -3; ax <= 3; ++ax)
        for (core::i32 ay = -3; ay <= 3; ++ay)
            for (core::i32 bx = -3; bx <= 3; ++bx)
                for (core::i32 by = -3; by <= 3; ++by)
                {
                    const Square4 a4{ax, ay}, b4{bx, by};
                    const Square8 a8{ax, ay}, b8{bx, by};
                    REQUIRE(a4.distance(b4) == b4.distance(a4));
                    REQUIRE(a8.distance(b8) == b8.distance(a8));
                }
}

TEST_CASE("Square neighbour order is stable", "[coord][square]")
{
    const auto n4 = Square4{5, 5}.neighbors();
    REQUIRE(n4[0] == Square4{6, 5});
    REQUIRE(n4[1] == Square4{4, 5});
    REQUIRE(n4[2] == Square4{5, 6});
    REQUIRE(n4[3] == Square4{5, 4});

    const auto n8 = Square8{0, 0}.neighbors();
    REQUIRE(n8.size() == 8);
    REQUIRE(n8[4] == Square8{1, 1});
    REQUIRE(n8[7] == Square8{-1, -1});
    for (const auto &n : n8)
        REQUIRE(n.distance(Square8{0, 0}) == 1);
}

TEST_CASE("Square arithmetic is closed", "[coord][square]")
{
    STATIC_REQUIRE(Square4{1, 2} + Square4{3, 4} == Square4{4, 6});
    STATIC_REQUIRE(Square4{1, 2} - Square4{3, 4} == Square4{-2, -2});
    STATIC_REQUIRE(Square8{1, -2} * 3 == Square8{3, -6});
}

TEST_CASE("Square pixel conversion round-trips on tile centres", "[coord][square][pixel]")
{
    constexpr core::f32 kTile = 32.0f;
    for (core::i32 x = -10; x <= 10; ++x)
        for (core::i32 y = -10; y <= 10; ++y)
        {
            const Square4 c{x, y};
            REQUIRE(Square4::fromPixel(c.toPixel(kTile), kTile) == c);
        }

    const math::Vec2f p = Square8{2, -1}.toPixel(kTile);
    REQUIRE_THAT(p.x, WithinAbs(64.0f, 1e-5f));
    REQUIRE_THAT(p.y, WithinAbs(-32.0f, 1e-5f));
    REQUIRE(Square8::fromPixel({70.0f, -20.0f}, kTile) == Square8{2, -1});
}

TEST_CASE("cellsWithin follows the topology metric", "[coord][square]")
{
    REQUIRE(cellsWithin(Square4{0, 0}, 2).size() == 13);
    REQUIRE(cellsWithin(Square8{0, 0}, 2).size() == 25);
    REQUIRE(cellsWithin(Square8{3, 3}, 0).size() == 1);
    REQUIRE(cellsWithin(Square4{0, 0}, 2).front() == Square4{0, 0});
}

TEST_CASE("TaggedCoord restores only into the same topology", "[coord][tagged]")
{
    const TaggedCoord t = tag(Square4{7, -3});
    REQUIRE(t.topology == Topology::kSquare4);

    auto same = restore<Square4>(t);
    REQUIRE(same.has_value());
    REQUIRE(*same == Square4{7, -3});

    auto other = restore<Square8>(t);
    REQUIRE_FALSE(other.has_value());
    REQUIRE(other.error().code() == core::ErrorCode::kTopologyMismatch);
}

TEST_CASE("describe prints raw components", "[coord]")
{
    REQUIRE(describe(Square4{3, -2}) == "(3, -2)");
}

} // namespace tes::coord
