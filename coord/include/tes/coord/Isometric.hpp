/**
 * @file Isometric.hpp
 * @brief Diamond-projected isometric tile coordinates.
 *
 * Logically a 4-connected square lattice; only the pixel projection
 * differs. A tile of size s is s wide and s / 2 high on screen.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_COORD_ISOMETRIC_HPP
    #define TES_COORD_ISOMETRIC_HPP

    #include <tes/coord/Topology.hpp>
    #include <tes/math/Vec2.hpp>

    #include <array>

namespace tes::coord {

struct Isometric final {
    static constexpr Topology    kTopology      = Topology::kIsometric;
    static constexpr Orientation kOrientation   = Orientation::kNone;
    static constexpr core::usize kNeighborCount = 4;
    static constexpr bool        kCartesian     = true;
    static constexpr core::f32   kCellRadius    = 0.5f;

    core::i32 x{0};
    core::i32 y{0};

    constexpr Isometric() = default;
    constexpr Isometric(core::i32 x_, core::i32 y_) : x(x_), y(y_) {}

    [[nodiscard]] constexpr Isometric operator+(Isometric rhs) const { return {x + rhs.x, y + rhs.y}; }
    [[nodiscard]] constexpr Isometric operator-(Isometric rhs) const { return {x - rhs.x, y - rhs.y}; }
    [[nodiscard]] constexpr Isometric operator*(core::i32 k)   const { return {x * k, y * k}; }
    [[nodiscard]] constexpr bool operator==(const Isometric &) const = default;

    /// @brief Manhattan distance in tile space.
    [[nodiscard]] core::u32 distance(Isometric other) const;

    /// @brief Order: (+1,0), (-1,0), (0,+1), (0,-1).
    [[nodiscard]] std::array<Isometric, kNeighborCount> neighbors() const;

    /// @brief ((x - y) * s / 2, (x + y) * s / 4).
    [[nodiscard]] math::Vec2f      toPixel(core::f32 tileSize) const;
    [[nodiscard]] static Isometric fromPixel(math::Vec2f pixel, core::f32 tileSize);

    /// @brief Diamond corners on screen: top, right, bottom, left.
    [[nodiscard]] std::array<math::Vec2f, 4> tileCorners(core::f32 tileSize) const;

    [[nodiscard]] constexpr std::array<core::i32, 2> components() const { return {x, y}; }
    [[nodiscard]] static constexpr Isometric fromComponents(core::i32 a, core::i32 b) { return {a, b}; }
};

} // namespace tes::coord

template <>
struct std::hash<tes::coord::Isometric> {
    std::size_t operator()(const tes::coord::Isometric &c) const noexcept
    {
        return tes::coord::detail::hashComponents(c.x, c.y);
    }
};

#endif // TES_COORD_ISOMETRIC_HPP
