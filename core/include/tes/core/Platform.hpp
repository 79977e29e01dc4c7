/**
 * @file Platform.hpp
 * @brief Compile-time compiler detection and portability macros.
 *
 * Provides branch-prediction hints and forced inlining used on the hot
 * loops of the search and visibility algorithms.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_CORE_PLATFORM_HPP
    #define TES_CORE_PLATFORM_HPP

// ---- Compiler ------------------------------------------------------------

    #if defined(__clang__)
        #define TES_COMPILER_CLANG 1
    #elif defined(__GNUC__)
        #define TES_COMPILER_GCC   1
    #elif defined(_MSC_VER)
        #define TES_COMPILER_MSVC  1
    #else
        #define TES_COMPILER_UNKNOWN 1
    #endif

// ---- Intrinsics ----------------------------------------------------------

    #if defined(TES_COMPILER_GCC) || defined(TES_COMPILER_CLANG)
        #define TES_LIKELY(x)       __builtin_expect(!!(x), 1)
        #define TES_UNLIKELY(x)     __builtin_expect(!!(x), 0)
        #define TES_FORCEINLINE     inline __attribute__((always_inline))
    #elif defined(TES_COMPILER_MSVC)
        #define TES_LIKELY(x)       (x)
        #define TES_UNLIKELY(x)     (x)
        #define TES_FORCEINLINE     __forceinline
    #else
        #define TES_LIKELY(x)       (x)
        #define TES_UNLIKELY(x)     (x)
        #define TES_FORCEINLINE     inline
    #endif

#endif // TES_CORE_PLATFORM_HPP
