/**
 * @file TestConfig.cpp
 * @brief Unit tests for Config::Builder validation.
 */

#include <catch2/catch_test_macros.hpp>

#include "tes/engine/Config.hpp"

namespace tes::engine {

TEST_CASE("Config::Builder defaults are valid", "[engine][config]")
{
    auto cfg = Config::Builder{}.build();
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->quadtree().leafCapacity == core::kQuadtreeLeafCapacity);
    REQUIRE(cfg->quadtree().mergeThreshold == core::kQuadtreeMergeThreshold);
    REQUIRE(cfg->quadtree().maxDepth == core::kQuadtreeMaxDepth);
    REQUIRE(cfg->searchCeiling() == core::kUnlimitedSearch);
    REQUIRE(cfg->tileSize() == core::kDefaultTileSize);
    REQUIRE(cfg->threadCount() == 0);
}

TEST_CASE("Config::Builder carries every setting", "[engine][config]")
{
    auto cfg = Config::Builder{}
                   .quadtreeLeafCapacity(16)
                   .quadtreeMergeThreshold(6)
                   .quadtreeMaxDepth(10)
                   .searchCeiling(500)
                   .tileSize(32.0f)
                   .threadCount(3)
                   .logLevel(core::LogLevel::kWarn)
                   .build();
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->quadtree().leafCapacity == 16);
    REQUIRE(cfg->quadtree().mergeThreshold == 6);
    REQUIRE(cfg->quadtree().maxDepth == 10);
    REQUIRE(cfg->searchCeiling() == 500);
    REQUIRE(cfg->tileSize() == 32.0f);
    REQUIRE(cfg->threadCount() == 3);
    REQUIRE(cfg->logLevel() == core::LogLevel::kWarn);
}

TEST_CASE("Config::Builder rejects inconsistent settings", "[engine][config]")
{
    const auto rejected = [](const Config::Builder &b) {
        auto cfg = b.build();
        return !cfg.has_value() && cfg.error().code() == core::ErrorCode::kInvalidConfiguration;
    };

    REQUIRE(rejected(Config::Builder{}.quadtreeLeafCapacity(0)));
    REQUIRE(rejected(Config::Builder{}.quadtreeLeafCapacity(4).quadtreeMergeThreshold(5)));
    REQUIRE(rejected(Config::Builder{}.quadtreeMaxDepth(0)));
    REQUIRE(rejected(Config::Builder{}.quadtreeMaxDepth(core::kQuadtreeDepthLimit + 1)));
    REQUIRE(rejected(Config::Builder{}.tileSize(0.0f)));
    REQUIRE(rejected(Config::Builder{}.tileSize(-2.0f)));
    REQUIRE_FALSE(rejected(Config::Builder{}.quadtreeLeafCapacity(4).quadtreeMergeThreshold(4)));
}

} // namespace tes::engine
