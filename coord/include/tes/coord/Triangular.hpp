/**
 * @file Triangular.hpp
 * @brief Triangle-lattice coordinates.
 *
 * Cell (x, y) is "upward" when x + y is even: its base lies on the row's
 * lower edge (pixel y = row * h) and its apex on the upper edge. Cells of a
 * row overlap their neighbours by half a side, so column x spans
 * [x * s / 2, x * s / 2 + s] in pixel space.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_COORD_TRIANGULAR_HPP
    #define TES_COORD_TRIANGULAR_HPP

    #include <tes/coord/Topology.hpp>
    #include <tes/core/Constants.hpp>
    #include <tes/math/Vec2.hpp>

    #include <array>

namespace tes::coord {

struct Triangular final {
    static constexpr Topology    kTopology      = Topology::kTriangular;
    static constexpr Orientation kOrientation   = Orientation::kNone;
    static constexpr core::usize kNeighborCount = 12;
    static constexpr bool        kCartesian     = false;
    /// Inradius of a triangle of side 1.
    static constexpr core::f32   kCellRadius    = core::kSqrt3 / 6.0f;

    core::i32 x{0};
    core::i32 y{0};

    constexpr Triangular() = default;
    constexpr Triangular(core::i32 x_, core::i32 y_) : x(x_), y(y_) {}

    [[nodiscard]] constexpr bool isUpward() const { return ((x + y) & 1) == 0; }

    [[nodiscard]] constexpr Triangular operator+(Triangular rhs) const { return {x + rhs.x, y + rhs.y}; }
    [[nodiscard]] constexpr Triangular operator-(Triangular rhs) const { return {x - rhs.x, y - rhs.y}; }
    [[nodiscard]] constexpr Triangular operator*(core::i32 k)    const { return {x * k, y * k}; }
    [[nodiscard]] constexpr bool operator==(const Triangular &) const = default;

    /**
     * @brief max(ceil(|dx| / 2), |dy|).
     *
     * One move changes x by at most two and y by at most one, so this never
     * exceeds the number of moves between two cells.
     */
    [[nodiscard]] core::u32 distance(Triangular other) const;

    /**
     * @brief The twelve cells sharing an edge or a vertex.
     *
     * The three edge neighbours come first: left, right, then the cell
     * across the base. The vertex neighbours follow: the two remaining cells
     * of the same row (x-2, x+2), the two on the base side (x-2, x+2) with
     * the two between them (x-1, x+1), then the three on the apex side
     * (x-1, x, x+1).
     */
    [[nodiscard]] std::array<Triangular, kNeighborCount> neighbors() const;

    /// @brief Pixel position of the centroid for side length @p side.
    [[nodiscard]] math::Vec2f       toPixel(core::f32 side) const;
    [[nodiscard]] static Triangular fromPixel(math::Vec2f pixel, core::f32 side);

    [[nodiscard]] constexpr std::array<core::i32, 2> components() const { return {x, y}; }
    [[nodiscard]] static constexpr Triangular fromComponents(core::i32 a, core::i32 b) { return {a, b}; }
};

} // namespace tes::coord

template <>
struct std::hash<tes::coord::Triangular> {
    std::size_t operator()(const tes::coord::Triangular &c) const noexcept
    {
        return tes::coord::detail::hashComponents(c.x, c.y);
    }
};

#endif // TES_COORD_TRIANGULAR_HPP
