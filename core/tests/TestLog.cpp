/**
 * @file TestLog.cpp
 * @brief Unit tests for the Log façade and its level filtering.
 */

#include <catch2/catch_test_macros.hpp>

#include "tes/core/Error.hpp"
#include "tes/core/Log.hpp"

#include <string>
#include <vector>

namespace tes::core {

namespace {

class CapturingLogger final : public ILogger {
public:
    struct Entry {
        LogLevel    level;
        std::string tag;
        std::string message;
    };

    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        entries.push_back({level, std::string{tag}, std::string{message}});
    }

    std::vector<Entry> entries;
};

} // namespace

TEST_CASE("Log routes messages above the minimum level to the sink", "[core][log]")
{
    CapturingLogger sink;
    Log::setLogger(&sink);
    Log::setMinLevel(LogLevel::kInfo);

    Log::debug("nav", "hidden");
    Log::info("nav", "visible");
    Log::error("spatial", "also visible");

    REQUIRE(sink.entries.size() == 2);
    REQUIRE(sink.entries[0].tag == "nav");
    REQUIRE(sink.entries[0].message == "visible");
    REQUIRE(sink.entries[1].level == LogLevel::kError);

    SECTION("lowering the level lets debug through")
    {
        Log::setMinLevel(LogLevel::kDebug);
        Log::debug("nav", "now shown");
        REQUIRE(sink.entries.back().message == "now shown");
    }

    Log::setMinLevel(LogLevel::kInfo);
    Log::setLogger(nullptr);
}

TEST_CASE("Log::reject formats the error description", "[core][log]")
{
    CapturingLogger sink;
    Log::setLogger(&sink);
    Log::setMinLevel(LogLevel::kDebug);

    Log::reject("grid", Error{ErrorCode::kCoordinateOutOfBounds, "(9, 9) outside [0..4]x[0..4]"});

    REQUIRE(sink.entries.size() == 1);
    REQUIRE(sink.entries[0].level == LogLevel::kWarn);
    REQUIRE(sink.entries[0].message == "CoordinateOutOfBounds: (9, 9) outside [0..4]x[0..4]");

    Log::setMinLevel(LogLevel::kInfo);
    Log::setLogger(nullptr);
}

} // namespace tes::core
