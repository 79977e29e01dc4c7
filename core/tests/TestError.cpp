/**
 * @file TestError.cpp
 * @brief Unit tests for core::Error, Expected and the TES_TRY macros.
 */

#include <catch2/catch_test_macros.hpp>

#include "tes/core/Expected.hpp"

#include <string>

namespace tes::core {

namespace {

Expected<int> parsePositive(int value)
{
    if (value <= 0)
        return makeError(ErrorCode::kInvalidConfiguration, "value must be positive");
    return value;
}

Expected<int> doubled(int value)
{
    const int v = TES_TRY(parsePositive(value));
    return v * 2;
}

ExpectedVoid checkBoth(int a, int b)
{
    TES_TRY_VOID(parsePositive(a).transform([](int) {}));
    TES_TRY_VOID(parsePositive(b).transform([](int) {}));
    return {};
}

} // namespace

TEST_CASE("Error carries code, message and origin", "[core][error]")
{
    const Error err{ErrorCode::kNoPathExists, "goal unreachable"};

    REQUIRE(err.code() == ErrorCode::kNoPathExists);
    REQUIRE(err.message() == "goal unreachable");
    REQUIRE(std::string{err.location().file_name()}.find("TestError.cpp") != std::string::npos);
    REQUIRE(err.describe() == "NoPathExists: goal unreachable");
}

TEST_CASE("errorCodeName is stable for every code", "[core][error]")
{
    REQUIRE(errorCodeName(ErrorCode::kCoordinateOutOfBounds) == "CoordinateOutOfBounds");
    REQUIRE(errorCodeName(ErrorCode::kSearchLimitExceeded) == "SearchLimitExceeded");
    REQUIRE(errorCodeName(ErrorCode::kTopologyMismatch) == "TopologyMismatch");
    REQUIRE(errorCodeName(ErrorCode::kInvalidConfiguration) == "InvalidConfiguration");
}

TEST_CASE("TES_TRY propagates the lower-level error unchanged", "[core][expected]")
{
    SECTION("success path yields the value")
    {
        auto r = doubled(21);
        REQUIRE(r.has_value());
        REQUIRE(*r == 42);
    }

    SECTION("failure path keeps the original code and message")
    {
        auto r = doubled(-1);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(r.error().code() == ErrorCode::kInvalidConfiguration);
        REQUIRE(r.error().message() == "value must be positive");
    }

    SECTION("void variant stops at the first failure")
    {
        REQUIRE(checkBoth(1, 2).has_value());
        REQUIRE_FALSE(checkBoth(1, 0).has_value());
    }
}

} // namespace tes::core
