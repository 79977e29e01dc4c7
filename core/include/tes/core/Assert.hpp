/**
 * @file Assert.hpp
 * @brief Internal invariant checks with source location.
 *
 * TES_ASSERT is compiled only when TES_DEBUG is defined, TES_VERIFY is
 * always evaluated and TES_UNREACHABLE marks dead code paths. None of them
 * replace the Error values returned for caller mistakes.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_CORE_ASSERT_HPP
    #define TES_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace tes::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[TES ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace tes::core::detail

    #ifdef TES_DEBUG
        #define TES_ASSERT(cond)                                          \
            do {                                                           \
                if (TES_UNLIKELY(!(cond)))                                 \
                    ::tes::core::detail::assertFail(#cond);                \
            } while (false)
    #else
        #define TES_ASSERT(cond) ((void)0)
    #endif

    #define TES_VERIFY(cond)                                              \
        do {                                                               \
            if (TES_UNLIKELY(!(cond)))                                     \
                ::tes::core::detail::assertFail(#cond);                    \
        } while (false)

    #define TES_UNREACHABLE()                                             \
        do {                                                               \
            ::tes::core::detail::assertFail("UNREACHABLE");                \
            __builtin_unreachable();                                       \
        } while (false)

#endif // TES_CORE_ASSERT_HPP
