/**
 * @file Topology.hpp
 * @brief Topology and orientation tags shared by every coordinate type.
 *
 * Each coordinate type carries its tags as compile-time constants. The
 * runtime TaggedCoord snapshot exists only for handing coordinates to
 * code that does not know the concrete type (debug layers, save games).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_COORD_TOPOLOGY_HPP
    #define TES_COORD_TOPOLOGY_HPP

    #include <tes/core/Types.hpp>

    #include <functional>
    #include <string_view>

namespace tes::coord {

/// @brief Adjacency/geometry family of a grid.
enum class Topology : core::u8 {
    kSquare4 = 0,
    kSquare8,
    kHex,
    kTriangular,
    kIsometric,
};

/// @brief Hexagon orientation; kNone for topologies without one.
enum class Orientation : core::u8 {
    kNone = 0,
    kPointy,
    kFlat,
};

/// @brief Which rows (pointy) or columns (flat) are shoved in offset layouts.
enum class OffsetParity : core::u8 {
    kOdd = 0,
    kEven,
};

[[nodiscard]] constexpr std::string_view topologyName(Topology t) noexcept
{
    switch (t)
    {
        case Topology::kSquare4:    return "square4";
        case Topology::kSquare8:    return "square8";
        case Topology::kHex:        return "hex";
        case Topology::kTriangular: return "triangular";
        case Topology::kIsometric:  return "isometric";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view orientationName(Orientation o) noexcept
{
    switch (o)
    {
        case Orientation::kNone:   return "none";
        case Orientation::kPointy: return "pointy";
        case Orientation::kFlat:   return "flat";
    }
    return "unknown";
}

/**
 * @brief Type-erased coordinate snapshot.
 *
 * Holds the tags next to the two raw integer components so the value can
 * be restored only into a coordinate type with the same tags.
 */
struct TaggedCoord final {
    Topology    topology{Topology::kSquare4};
    Orientation orientation{Orientation::kNone};
    core::i32   a{0};
    core::i32   b{0};

    [[nodiscard]] constexpr bool operator==(const TaggedCoord &) const = default;
};

namespace detail {

/// @brief Mix two signed components into one hash value.
[[nodiscard]] inline core::usize hashComponents(core::i32 a, core::i32 b) noexcept
{
    const core::u64 packed = (static_cast<core::u64>(static_cast<core::u32>(a)) << 32)
                           | static_cast<core::u64>(static_cast<core::u32>(b));
    return std::hash<core::u64>{}(packed * 0x9E3779B97F4A7C15ULL);
}

} // namespace detail

} // namespace tes::coord

#endif // TES_COORD_TOPOLOGY_HPP
