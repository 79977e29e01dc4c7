/**
 * @file Expected.hpp
 * @brief Monadic error handling built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * TES_TRY macros used by higher-level components to surface lower-level
 * errors unchanged.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_CORE_EXPECTED_HPP
    #define TES_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace tes::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace tes::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once. On error the enclosing function returns that
 * same Error; otherwise the macro yields the contained value.
 *
 * @param expr An expression of type tes::core::Expected<U>.
 */
#define TES_TRY(expr)                                                     \
    ({                                                                     \
        auto &&_tes_result = (expr);                                       \
        if (!_tes_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_tes_result.error()));         \
        std::move(_tes_result.value());                                    \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type tes::core::ExpectedVoid.
 */
#define TES_TRY_VOID(expr)                                                \
    do {                                                                    \
        auto &&_tes_result = (expr);                                       \
        if (!_tes_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_tes_result.error()));         \
    } while (false)

#endif // TES_CORE_EXPECTED_HPP
