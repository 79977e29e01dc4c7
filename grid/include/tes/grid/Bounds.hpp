/**
 * @file Bounds.hpp
 * @brief Inclusive component rectangle delimiting a grid.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_GRID_BOUNDS_HPP
    #define TES_GRID_BOUNDS_HPP

    #include <tes/coord/Coordinate.hpp>

    #include <limits>

namespace tes::grid {

/**
 * @brief Every coordinate whose two components lie within [min, max].
 *
 * The rectangle is taken over raw components, so for hexagons it is a
 * rhombus in axial space.
 */
template <coord::GridCoordinate C>
struct Bounds final {
    static constexpr core::i64 kMaxExtent = std::numeric_limits<core::i32>::max();

    C min{};
    C max{};

    /// @brief Bounds covering [0, width) x [0, height).
    [[nodiscard]] static constexpr Bounds fromSize(core::u32 width, core::u32 height)
    {
        return {C::fromComponents(0, 0),
                C::fromComponents(static_cast<core::i32>(width) - 1,
                                  static_cast<core::i32>(height) - 1)};
    }

    [[nodiscard]] constexpr bool isValid() const
    {
        const auto lo = min.components();
        const auto hi = max.components();
        return lo[0] <= hi[0] && lo[1] <= hi[1];
    }

    /// @brief Cells along one axis, computed in 64 bits so limit-hugging bounds cannot overflow.
    [[nodiscard]] constexpr core::i64 extent(core::usize axis) const
    {
        return static_cast<core::i64>(max.components()[axis])
             - static_cast<core::i64>(min.components()[axis]) + 1;
    }

    /// @brief Both extents fit the 32-bit row/column arithmetic of indexOf().
    [[nodiscard]] constexpr bool isAddressable() const
    {
        return isValid() && extent(0) <= kMaxExtent && extent(1) <= kMaxExtent;
    }

    [[nodiscard]] constexpr core::u32 width() const
    {
        return static_cast<core::u32>(extent(0));
    }

    [[nodiscard]] constexpr core::u32 height() const
    {
        return static_cast<core::u32>(extent(1));
    }

    [[nodiscard]] constexpr core::usize area() const
    {
        return static_cast<core::usize>(width()) * height();
    }

    [[nodiscard]] constexpr bool contains(const C &c) const
    {
        const auto [a, b] = c.components();
        const auto lo = min.components();
        const auto hi = max.components();
        return a >= lo[0] && a <= hi[0] && b >= lo[1] && b <= hi[1];
    }

    /// @brief Row-major index; only meaningful when contains(c).
    [[nodiscard]] constexpr core::usize indexOf(const C &c) const
    {
        const auto [a, b] = c.components();
        const auto lo = min.components();
        const auto row = static_cast<core::usize>(static_cast<core::i64>(b) - lo[1]);
        const auto col = static_cast<core::usize>(static_cast<core::i64>(a) - lo[0]);
        return row * width() + col;
    }

    [[nodiscard]] constexpr C coordAt(core::usize index) const
    {
        const auto lo = min.components();
        const auto w = static_cast<core::usize>(width());
        return C::fromComponents(static_cast<core::i32>(lo[0] + static_cast<core::i64>(index % w)),
                                 static_cast<core::i32>(lo[1] + static_cast<core::i64>(index / w)));
    }

    [[nodiscard]] constexpr bool operator==(const Bounds &) const = default;
};

} // namespace tes::grid

#endif // TES_GRID_BOUNDS_HPP
