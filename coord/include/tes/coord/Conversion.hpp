/**
 * @file Conversion.hpp
 * @brief Conversions between coordinate families.
 *
 * Square and isometric share the same logical lattice, so that pair
 * converts exactly. Hex and square lattices do not line up; those
 * conversions are approximate but round-trip square -> hex -> square.
 * Each function is only declared for the pairs it makes sense for, so a
 * mismatched conversion does not compile.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_COORD_CONVERSION_HPP
    #define TES_COORD_CONVERSION_HPP

    #include <tes/coord/Hex.hpp>
    #include <tes/coord/Isometric.hpp>
    #include <tes/coord/Square.hpp>

namespace tes::coord {

template <Connectivity N>
[[nodiscard]] constexpr Isometric toIsometric(SquareCoord<N> c) { return {c.x, c.y}; }

template <Connectivity N = Connectivity::kFour>
[[nodiscard]] constexpr SquareCoord<N> toSquare(Isometric c) { return {c.x, c.y}; }

/// @brief Nearest-row square cell: x = q + r / 2 (truncating), y = r.
template <Connectivity N = Connectivity::kFour, Orientation O>
[[nodiscard]] constexpr SquareCoord<N> toSquare(HexAxial<O> h) { return {h.q + h.r / 2, h.r}; }

/// @brief Inverse of toSquare(HexAxial): q = x - y / 2, r = y.
template <Orientation O, Connectivity N>
[[nodiscard]] constexpr HexAxial<O> toHex(SquareCoord<N> c) { return {c.x - c.y / 2, c.y}; }

/// @brief Pointy <-> flat hexagon mirrored across the pixel-space x = y diagonal.
template <Orientation To, Orientation From>
[[nodiscard]] constexpr HexAxial<To> reorient(HexAxial<From> h) { return {h.r, h.q}; }

} // namespace tes::coord

#endif // TES_COORD_CONVERSION_HPP
