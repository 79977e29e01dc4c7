/**
 * @file Error.hpp
 * @brief Structured error type with source location tracking.
 *
 * Every failure the engine reports is an ordinary Error value: a code the
 * caller can branch on, a human-readable message and the location of the
 * call that detected the problem.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_CORE_ERROR_HPP
    #define TES_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <source_location>
    #include <string>
    #include <string_view>

namespace tes::core {

/**
 * @brief Engine-wide error code enumeration.
 *
 * kNoPathExists and kSearchLimitExceeded are expected gameplay outcomes.
 * kCoordinateOutOfBounds, kInvalidConfiguration and kTopologyMismatch point
 * at a programming mistake in the caller.
 */
enum class ErrorCode : u16 {
    kNone = 0,

    kCoordinateOutOfBounds,
    kInvalidConfiguration,
    kTopologyMismatch,

    kNoPathExists,
    kSearchLimitExceeded,

    kNotFound,
    kAlreadyExists,

    kInternalError,
};

/**
 * @brief Stable printable name of an error code (e.g. "NoPathExists").
 */
[[nodiscard]] std::string_view errorCodeName(ErrorCode code) noexcept;

/**
 * @brief Structured error value carrying a code, message, and origin.
 */
class Error final {
public:
    /**
     * @brief Construct an error from a code and message.
     * @param code    Enumerated error code.
     * @param message Human-readable description.
     * @param loc     Source location (auto-filled by the compiler).
     */
    explicit Error(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : _code(code), _message(std::move(message)), _location(loc) {}

    [[nodiscard]] ErrorCode           code()     const { return _code; }
    [[nodiscard]] const std::string & message()  const { return _message; }
    [[nodiscard]] std::source_location location() const { return _location; }

    /// @brief "<CodeName>: <message>", suitable for a log line.
    [[nodiscard]] std::string describe() const;

private:
    ErrorCode            _code;
    std::string          _message;
    std::source_location _location;
};

/// @brief Convenience alias for std::unexpected<Error>.
using Unexpected = std::unexpected<Error>;

/// @brief Factory function to create an unexpected error.
/// @param code Error code.
/// @param message Human-readable description.
/// @param loc Source location (auto-filled).
/// @return std::unexpected<Error>.
[[nodiscard]] inline auto makeError(
    ErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return std::unexpected<Error>(Error{code, std::move(message), loc});
}

} // namespace tes::core

#endif // TES_CORE_ERROR_HPP
