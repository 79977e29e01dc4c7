/**
 * @file Square.hpp
 * @brief Square-lattice coordinates with 4- or 8-connectivity.
 *
 * Square4 measures Manhattan distance and enumerates the four orthogonal
 * neighbours; Square8 measures Chebyshev distance and adds the diagonals.
 * Tile centres sit at (x * size, y * size) in pixel space.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_COORD_SQUARE_HPP
    #define TES_COORD_SQUARE_HPP

    #include <tes/coord/Topology.hpp>
    #include <tes/math/Vec2.hpp>

    #include <array>

namespace tes::coord {

enum class Connectivity : core::u8 {
    kFour  = 4,
    kEight = 8,
};

template <Connectivity N>
struct SquareCoord final {
    static constexpr Topology    kTopology      = (N == Connectivity::kFour) ? Topology::kSquare4
                                                                           : Topology::kSquare8;
    static constexpr Orientation kOrientation   = Orientation::kNone;
    static constexpr core::usize kNeighborCount = static_cast<core::usize>(N);
    static constexpr bool        kCartesian     = true;
    /// Inradius of a unit tile, used for angular occlusion.
    static constexpr core::f32   kCellRadius    = 0.5f;

    core::i32 x{0};
    core::i32 y{0};

    constexpr SquareCoord() = default;
    constexpr SquareCoord(core::i32 x, core::i32 y);

    [[nodiscard]] constexpr SquareCoord operator+(SquareCoord rhs) const;
    [[nodiscard]] constexpr SquareCoord operator-(SquareCoord rhs) const;
    [[nodiscard]] constexpr SquareCoord operator*(core::i32 k)     const;
    [[nodiscard]] constexpr bool operator==(const SquareCoord &) const = default;

    /// @brief Manhattan (4) or Chebyshev (8) distance.
    [[nodiscard]] constexpr core::u32 distance(SquareCoord other) const;

    /**
     * @brief Adjacent coordinates.
     *
     * Order: (+1,0), (-1,0), (0,+1), (0,-1), then for 8-connectivity
     * (+1,+1), (-1,+1), (+1,-1), (-1,-1).
     */
    [[nodiscard]] constexpr std::array<SquareCoord, kNeighborCount> neighbors() const;

    [[nodiscard]] math::Vec2f        toPixel(core::f32 tileSize) const;
    [[nodiscard]] static SquareCoord fromPixel(math::Vec2f pixel, core::f32 tileSize);

    [[nodiscard]] constexpr std::array<core::i32, 2> components() const { return {x, y}; }
    [[nodiscard]] static constexpr SquareCoord fromComponents(core::i32 a, core::i32 b) { return {a, b}; }
};

using Square4 = SquareCoord<Connectivity::kFour>;
using Square8 = SquareCoord<Connectivity::kEight>;

} // namespace tes::coord

template <tes::coord::Connectivity N>
struct std::hash<tes::coord::SquareCoord<N>> {
    std::size_t operator()(const tes::coord::SquareCoord<N> &c) const noexcept
    {
        return tes::coord::detail::hashComponents(c.x, c.y);
    }
};

    #include "Square.inl"

#endif // TES_COORD_SQUARE_HPP
