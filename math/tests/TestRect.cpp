/**
 * @file TestRect.cpp
 * @brief Unit tests for math::Vec2 and math::Rect.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "tes/math/Rect.hpp"

namespace tes::math {

using Catch::Matchers::WithinAbs;

TEST_CASE("Vec2 arithmetic and products", "[math][vec2]")
{
    constexpr Vec2f a{3.0f, 4.0f};
    constexpr Vec2f b{1.0f, -2.0f};

    STATIC_REQUIRE(a + b == Vec2f{4.0f, 2.0f});
    STATIC_REQUIRE(a - b == Vec2f{2.0f, 6.0f});
    STATIC_REQUIRE(a * 2.0f == Vec2f{6.0f, 8.0f});
    STATIC_REQUIRE(a.dot(b) == -5.0f);
    STATIC_REQUIRE(a.cross(b) == -10.0f);

    REQUIRE_THAT(a.length(), WithinAbs(5.0f, 1e-6f));
    REQUIRE_THAT(Vec2f::zero().distance(a), WithinAbs(5.0f, 1e-6f));

    const Vec2f mid = Vec2f::zero().lerp(a, 0.5f);
    REQUIRE_THAT(mid.x, WithinAbs(1.5f, 1e-6f));
    REQUIRE_THAT(mid.y, WithinAbs(2.0f, 1e-6f));
}

TEST_CASE("Rect containment is closed on both edges", "[math][rect]")
{
    const Rectf r = Rectf::fromEdges(0.0f, 0.0f, 10.0f, 10.0f);

    REQUIRE(r.contains(Vec2f{0.0f, 0.0f}));
    REQUIRE(r.contains(Vec2f{10.0f, 10.0f}));
    REQUIRE_FALSE(r.contains(Vec2f{10.01f, 5.0f}));
    REQUIRE(r.contains(Rectf::fromEdges(2.0f, 2.0f, 3.0f, 3.0f)));
    REQUIRE_FALSE(Rectf::fromEdges(5.0f, 5.0f, 1.0f, 1.0f).isValid());
}

TEST_CASE("Rect intersection tests", "[math][rect]")
{
    const Rectf r = Rectf::fromEdges(0.0f, 0.0f, 10.0f, 10.0f);

    SECTION("rectangles")
    {
        REQUIRE(r.intersects(Rectf::fromEdges(9.0f, 9.0f, 20.0f, 20.0f)));
        REQUIRE(r.intersects(Rectf::fromEdges(10.0f, 0.0f, 20.0f, 5.0f)));
        REQUIRE_FALSE(r.intersects(Rectf::fromEdges(11.0f, 0.0f, 20.0f, 5.0f)));
    }

    SECTION("circles")
    {
        REQUIRE(r.intersectsCircle(Vec2f{12.0f, 5.0f}, 2.0f));
        REQUIRE_FALSE(r.intersectsCircle(Vec2f{12.0f, 12.0f}, 2.0f));
        REQUIRE(r.intersectsCircle(Vec2f{5.0f, 5.0f}, 0.1f));
    }
}

TEST_CASE("Rect quadrants partition the parent", "[math][rect]")
{
    const Rectf r = Rectf::fromEdges(-8.0f, -4.0f, 8.0f, 4.0f);
    const auto q = r.quadrants();

    REQUIRE(q[0] == Rectf::fromEdges(0.0f, -4.0f, 8.0f, 0.0f));
    REQUIRE(q[1] == Rectf::fromEdges(-8.0f, -4.0f, 0.0f, 0.0f));
    REQUIRE(q[2] == Rectf::fromEdges(0.0f, 0.0f, 8.0f, 4.0f));
    REQUIRE(q[3] == Rectf::fromEdges(-8.0f, 0.0f, 0.0f, 4.0f));

    float total = 0.0f;
    for (const auto &quad : q)
    {
        REQUIRE(r.contains(quad));
        total += quad.area();
    }
    REQUIRE_THAT(total, WithinAbs(r.area(), 1e-4f));
}

} // namespace tes::math
