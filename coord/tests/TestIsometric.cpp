/**
 * @file TestIsometric.cpp
 * @brief Unit tests for isometric coordinates and lattice conversions.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "tes/coord/Conversion.hpp"
#include "tes/coord/Coordinate.hpp"

namespace tes::coord {

using Catch::Matchers::WithinAbs;

static_assert(GridCoordinate<Isometric>);

TEST_CASE("Isometric projection", "[coord][isometric][pixel]")
{
    const math::Vec2f p = Isometric{1, 0}.toPixel(64.0f);
    REQUIRE_THAT(p.x, WithinAbs(32.0f, 1e-5f));
    REQUIRE_THAT(p.y, WithinAbs(16.0f, 1e-5f));

    for (core::i32 x = -10; x <= 10; ++x)
        for (core::i32 y = -10; y <= 10; ++y)
            REQUIRE(Isometric::fromPixel(Isometric{x, y}.toPixel(64.0f), 64.0f) == Isometric{x, y});
}

TEST_CASE("Isometric tile corners form a diamond", "[coord][isometric]")
{
    const auto corners = Isometric{0, 0}.tileCorners(64.0f);
    REQUIRE_THAT(corners[0].y, WithinAbs(-16.0f, 1e-5f));
    REQUIRE_THAT(corners[1].x, WithinAbs(32.0f, 1e-5f));
    REQUIRE_THAT(corners[2].y, WithinAbs(16.0f, 1e-5f));
    REQUIRE_THAT(corners[3].x, WithinAbs(-32.0f, 1e-5f));
}

TEST_CASE("Isometric adjacency matches Square4", "[coord][isometric]")
{
    REQUIRE(Isometric{0, 0}.distance(Isometric{2, -3}) == 5);
    const auto iso = Isometric{4, 4}.neighbors();
    const auto sq  = Square4{4, 4}.neighbors();
    for (core::usize i = 0; i < iso.size(); ++i)
        REQUIRE(toSquare(iso[i]) == sq[i]);
}

TEST_CASE("Lattice conversions", "[coord][conversion]")
{
    SECTION("square and isometric convert exactly")
    {
        STATIC_REQUIRE(toSquare(toIsometric(Square8{3, -7})) == Square4{3, -7});
    }

    SECTION("square -> hex -> square round-trips")
    {
        for (core::i32 x = -6; x <= 6; ++x)
            for (core::i32 y = -6; y <= 6; ++y)
            {
                const Square4 s{x, y};
                REQUIRE(toSquare(toHex<Orientation::kPointy>(s)) == s);
            }
    }

    SECTION("reorient mirrors pixel space")
    {
        const HexPointy p{2, -1};
        const HexFlat f = reorient<Orientation::kFlat>(p);
        const math::Vec2f pp = p.toPixel(1.0f);
        const math::Vec2f fp = f.toPixel(1.0f);
        REQUIRE_THAT(pp.x, WithinAbs(fp.y, 1e-5f));
        REQUIRE_THAT(pp.y, WithinAbs(fp.x, 1e-5f));
    }
}

} // namespace tes::coord
