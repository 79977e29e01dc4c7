/**
 * @file Coordinate.hpp
 * @brief Capability set shared by every coordinate type, and helpers
 *        written once against it.
 *
 * Algorithms (storage, search, visibility, flow fields) are templates
 * constrained on GridCoordinate, so each topology gets its own
 * instantiation and no runtime tag is ever inspected.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_COORD_COORDINATE_HPP
    #define TES_COORD_COORDINATE_HPP

    #include <tes/coord/Topology.hpp>
    #include <tes/core/Concepts.hpp>
    #include <tes/core/Expected.hpp>
    #include <tes/math/Vec2.hpp>

    #include <algorithm>
    #include <array>
    #include <concepts>
    #include <deque>
    #include <format>
    #include <string>
    #include <unordered_set>
    #include <vector>

namespace tes::coord {

template <typename C>
concept GridCoordinate = std::regular<C> && core::StdHashable<C>
    && requires(const C &a, const C &b, core::i32 k, math::Vec2f p, core::f32 size) {
        { C::kTopology }      -> std::convertible_to<Topology>;
        { C::kOrientation }   -> std::convertible_to<Orientation>;
        { C::kNeighborCount } -> std::convertible_to<core::usize>;
        { C::kCartesian }     -> std::convertible_to<bool>;
        { C::kCellRadius }    -> std::convertible_to<core::f32>;
        { a.distance(b) }     -> std::same_as<core::u32>;
        { a.neighbors() }     -> std::same_as<std::array<C, C::kNeighborCount>>;
        { a.toPixel(size) }   -> std::same_as<math::Vec2f>;
        { C::fromPixel(p, size) } -> std::same_as<C>;
        { a + b }             -> std::same_as<C>;
        { a - b }             -> std::same_as<C>;
        { a * k }             -> std::same_as<C>;
        { a.components() }    -> std::same_as<std::array<core::i32, 2>>;
        { C::fromComponents(k, k) } -> std::same_as<C>;
    };

/// @brief "(a, b)" for log lines and error messages.
template <GridCoordinate C>
[[nodiscard]] std::string describe(const C &c)
{
    const auto [a, b] = c.components();
    return std::format("({}, {})", a, b);
}

/// @brief True if @p b is one of @p a's enumerated neighbours.
template <GridCoordinate C>
[[nodiscard]] bool areNeighbors(const C &a, const C &b)
{
    const auto around = a.neighbors();
    return std::find(around.begin(), around.end(), b) != around.end();
}

/// @brief Index of @p b in @p a's neighbour order, or kNeighborCount.
template <GridCoordinate C>
[[nodiscard]] core::usize neighborIndex(const C &a, const C &b)
{
    const auto around = a.neighbors();
    return static_cast<core::usize>(std::find(around.begin(), around.end(), b) - around.begin());
}

/**
 * @brief Every coordinate whose distance to @p origin is at most @p radius.
 *
 * Breadth-first over the neighbour relation restricted to the disc, so the
 * result is ordered by discovery (origin first, then outwards) and is the
 * same on every call.
 */
template <GridCoordinate C>
[[nodiscard]] std::vector<C> cellsWithin(const C &origin, core::u32 radius)
{
    std::vector<C> out;
    std::unordered_set<C> seen;
    std::deque<C> frontier;

    frontier.push_back(origin);
    seen.insert(origin);
    while (!frontier.empty())
    {
        const C current = frontier.front();
        frontier.pop_front();
        out.push_back(current);

        for (const C &n : current.neighbors())
        {
            if (n.distance(origin) <= radius && seen.insert(n).second)
                frontier.push_back(n);
        }
    }
    return out;
}

/// @brief Snapshot @p c with its topology and orientation tags.
template <GridCoordinate C>
[[nodiscard]] constexpr TaggedCoord tag(const C &c)
{
    const auto [a, b] = c.components();
    return TaggedCoord{C::kTopology, C::kOrientation, a, b};
}

/**
 * @brief Rebuild a concrete coordinate from a snapshot.
 * @return kTopologyMismatch when the snapshot was taken from another type.
 */
template <GridCoordinate C>
[[nodiscard]] core::Expected<C> restore(const TaggedCoord &tagged)
{
    if (tagged.topology != C::kTopology || tagged.orientation != C::kOrientation)
    {
        return core::makeError(core::ErrorCode::kTopologyMismatch,
            std::format("cannot restore a {}/{} coordinate as {}/{}",
                topologyName(tagged.topology), orientationName(tagged.orientation),
                topologyName(C::kTopology), orientationName(C::kOrientation)));
    }
    return C::fromComponents(tagged.a, tagged.b);
}

} // namespace tes::coord

#endif // TES_COORD_COORDINATE_HPP
