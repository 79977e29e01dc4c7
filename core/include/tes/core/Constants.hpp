/**
 * @file Constants.hpp
 * @brief Compile-time defaults for every tunable of the engine.
 *
 * engine::Config starts from these values; algorithms that run without a
 * Config fall back to them directly.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_CORE_CONSTANTS_HPP
    #define TES_CORE_CONSTANTS_HPP

    #include "Types.hpp"

    #include <limits>

namespace tes::core {

inline constexpr u32   kQuadtreeLeafCapacity    = 8;
inline constexpr u32   kQuadtreeMergeThreshold  = 4;
inline constexpr u32   kQuadtreeMaxDepth        = 16;
inline constexpr u32   kQuadtreeDepthLimit      = 24;

inline constexpr u32   kUnlimitedSearch         = 0;
inline constexpr u32   kUnreachableCost         = std::numeric_limits<u32>::max();

inline constexpr f32   kDefaultTileSize         = 1.0f;
inline constexpr f32   kPixelEpsilon            = 1e-4f;

inline constexpr f32   kSqrt3                   = 1.7320508075688772f;

} // namespace tes::core

#endif // TES_CORE_CONSTANTS_HPP
