/**
 * @file Types.hpp
 * @brief Primitive type aliases shared by every Tessera module.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_CORE_TYPES_HPP
    #define TES_CORE_TYPES_HPP

    #include <cstddef>
    #include <cstdint>

namespace tes::core {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;
using isize = std::ptrdiff_t;

/// @brief Opaque identifier of an entity tracked by a spatial index.
using EntityId = u32;

} // namespace tes::core

#endif // TES_CORE_TYPES_HPP
