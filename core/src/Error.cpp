/**
 * @file Error.cpp
 * @brief Error code names and descriptions.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include "tes/core/Error.hpp"

namespace tes::core {

std::string_view errorCodeName(ErrorCode code) noexcept
{
    switch (code)
    {
        case ErrorCode::kNone:                  return "None";
        case ErrorCode::kCoordinateOutOfBounds: return "CoordinateOutOfBounds";
        case ErrorCode::kInvalidConfiguration:  return "InvalidConfiguration";
        case ErrorCode::kTopologyMismatch:      return "TopologyMismatch";
        case ErrorCode::kNoPathExists:          return "NoPathExists";
        case ErrorCode::kSearchLimitExceeded:   return "SearchLimitExceeded";
        case ErrorCode::kNotFound:              return "NotFound";
        case ErrorCode::kAlreadyExists:         return "AlreadyExists";
        case ErrorCode::kInternalError:         return "InternalError";
    }
    return "Unknown";
}

std::string Error::describe() const
{
    std::string out{errorCodeName(_code)};
    out += ": ";
    out += _message;
    return out;
}

} // namespace tes::core
