/**
 * @file TestTriangular.cpp
 * @brief Unit tests for triangle-lattice coordinates.
 */

#include <catch2/catch_test_macros.hpp>

#include "tes/coord/Coordinate.hpp"
#include "tes/coord/Triangular.hpp"

#include <unordered_set>

namespace tes::coord {

static_assert(GridCoordinate<Triangular>);

TEST_CASE("Triangular orientation alternates", "[coord][triangular]")
{
    STATIC_REQUIRE(Triangular{0, 0}.isUpward());
    STATIC_REQUIRE_FALSE(Triangular{1, 0}.isUpward());
    STATIC_REQUIRE_FALSE(Triangular{0, -1}.isUpward());
    STATIC_REQUIRE(Triangular{-1, -1}.isUpward());
}

TEST_CASE("Triangular distance", "[coord][triangular]")
{
    REQUIRE(Triangular{0, 0}.distance(Triangular{0, 0}) == 0);
    REQUIRE(Triangular{0, 0}.distance(Triangular{2, 0}) == 1);
    REQUIRE(Triangular{0, 0}.distance(Triangular{3, 0}) == 2);
    REQUIRE(Triangular{0, 0}.distance(Triangular{1, 3}) == 3);

    for (core::i32 ax = -4; ax <= 4; ++ax)
        for (core::i32 ay = -4; ay <= 4; ++ay)
        {
            const Triangular a{ax, ay};
            const Triangular b{-ay, ax + 1};
            REQUIRE(a.distance(b) == b.distance(a));
        }
}

TEST_CASE("Triangular neighbourhood has twelve distinct cells", "[coord][triangular]")
{
    for (const Triangular cell : {Triangular{0, 0}, Triangular{1, 0}, Triangular{-3, 2}})
    {
        const auto around = cell.neighbors();
        const std::unordered_set<Triangular> unique(around.begin(), around.end());
        REQUIRE(unique.size() == 12);
        REQUIRE_FALSE(unique.contains(cell));

        for (const auto &n : around)
        {
            REQUIRE(n.distance(cell) == 1);
            REQUIRE(areNeighbors(n, cell));
        }
    }

    SECTION("edge neighbours come first")
    {
        const auto up = Triangular{0, 0}.neighbors();
        REQUIRE(up[0] == Triangular{-1, 0});
        REQUIRE(up[1] == Triangular{1, 0});
        REQUIRE(up[2] == Triangular{0, -1});

        const auto down = Triangular{1, 0}.neighbors();
        REQUIRE(down[2] == Triangular{1, 1});
    }
}

TEST_CASE("Triangular pixel conversion round-trips", "[coord][triangular][pixel]")
{
    for (core::f32 side : {1.0f, 16.0f})
        for (core::i32 x = -6; x <= 6; ++x)
            for (core::i32 y = -6; y <= 6; ++y)
            {
                const Triangular c{x, y};
                REQUIRE(Triangular::fromPixel(c.toPixel(side), side) == c);
            }
}

TEST_CASE("Triangular edge neighbours have adjacent centroids", "[coord][triangular][pixel]")
{
    const Triangular c{2, 3};
    const auto around = c.neighbors();
    const core::f32 inradius = Triangular::kCellRadius;
    for (int i = 0; i < 3; ++i)
    {
        const core::f32 d = c.toPixel(1.0f).distance(around[static_cast<core::usize>(i)].toPixel(1.0f));
        REQUIRE(d < 2.0f * inradius + 1e-4f);
    }
}

} // namespace tes::coord
