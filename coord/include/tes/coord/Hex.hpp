/**
 * @file Hex.hpp
 * @brief Axial hexagon coordinates and their offset-layout counterparts.
 *
 * Axial (q, r) with the implicit cube component s = -q - r. Pixel
 * conversion uses the centre-to-corner size and cube rounding, so every
 * point inside a hexagon maps back to that hexagon.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_COORD_HEX_HPP
    #define TES_COORD_HEX_HPP

    #include <tes/coord/Topology.hpp>
    #include <tes/core/Constants.hpp>
    #include <tes/math/Vec2.hpp>

    #include <array>
    #include <vector>

namespace tes::coord {

/**
 * @brief Column/row position of a hexagon in an offset (rectangular) layout.
 *
 * Only a storage/layout view: distances and neighbours are computed by
 * converting back to axial.
 */
struct OffsetCoord final {
    core::i32 col{0};
    core::i32 row{0};

    [[nodiscard]] constexpr bool operator==(const OffsetCoord &) const = default;
};

template <Orientation O>
struct HexAxial final {
    static_assert(O == Orientation::kPointy || O == Orientation::kFlat,
                  "hexagons are either pointy-top or flat-top");

    static constexpr Topology    kTopology      = Topology::kHex;
    static constexpr Orientation kOrientation   = O;
    static constexpr core::usize kNeighborCount = 6;
    static constexpr bool        kCartesian     = false;
    /// Inradius of a hexagon of size 1.
    static constexpr core::f32   kCellRadius    = core::kSqrt3 * 0.5f;

    core::i32 q{0};
    core::i32 r{0};

    constexpr HexAxial() = default;
    constexpr HexAxial(core::i32 q, core::i32 r);

    [[nodiscard]] constexpr core::i32 s() const { return -q - r; }

    [[nodiscard]] constexpr HexAxial operator+(HexAxial rhs) const;
    [[nodiscard]] constexpr HexAxial operator-(HexAxial rhs) const;
    [[nodiscard]] constexpr HexAxial operator*(core::i32 k)  const;
    [[nodiscard]] constexpr bool operator==(const HexAxial &) const = default;

    /// @brief (|dq| + |dr| + |ds|) / 2.
    [[nodiscard]] constexpr core::u32 distance(HexAxial other) const;

    /**
     * @brief Adjacent hexagons.
     *
     * Order: (1,0), (1,-1), (0,-1), (-1,0), (-1,1), (0,1), i.e. the same
     * order as direction(0..5).
     */
    [[nodiscard]] constexpr std::array<HexAxial, kNeighborCount> neighbors() const;

    /// @brief Unit offset for direction @p index (taken modulo 6).
    [[nodiscard]] static constexpr HexAxial direction(core::u32 index);

    /// @brief Hexagons at exactly @p radius, starting at direction 4 scaled.
    [[nodiscard]] std::vector<HexAxial> ring(core::u32 radius) const;

    /// @brief This hexagon followed by rings 1..radius.
    [[nodiscard]] std::vector<HexAxial> spiral(core::u32 radius) const;

    [[nodiscard]] math::Vec2f     toPixel(core::f32 size) const;
    [[nodiscard]] static HexAxial fromPixel(math::Vec2f pixel, core::f32 size);

    /// @brief Cube rounding of fractional axial coordinates.
    [[nodiscard]] static HexAxial round(core::f32 fq, core::f32 fr);

    template <OffsetParity P>
    [[nodiscard]] constexpr OffsetCoord toOffset() const;

    template <OffsetParity P>
    [[nodiscard]] static constexpr HexAxial fromOffset(OffsetCoord offset);

    [[nodiscard]] constexpr std::array<core::i32, 2> components() const { return {q, r}; }
    [[nodiscard]] static constexpr HexAxial fromComponents(core::i32 a, core::i32 b) { return {a, b}; }
};

using HexPointy = HexAxial<Orientation::kPointy>;
using HexFlat   = HexAxial<Orientation::kFlat>;

} // namespace tes::coord

template <tes::coord::Orientation O>
struct std::hash<tes::coord::HexAxial<O>> {
    std::size_t operator()(const tes::coord::HexAxial<O> &h) const noexcept
    {
        return tes::coord::detail::hashComponents(h.q, h.r);
    }
};

    #include "Hex.inl"

#endif // TES_COORD_HEX_HPP
