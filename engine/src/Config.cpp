/**
 * @file Config.cpp
 * @brief Config::Builder implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tes/engine/Config.hpp>

#include <cmath>
#include <format>
#include <string>

namespace tes::engine {

Config::Builder &Config::Builder::quadtreeLeafCapacity(core::u32 n) noexcept
{
    _leafCapacity = n;
    return *this;
}

Config::Builder &Config::Builder::quadtreeMergeThreshold(core::u32 n) noexcept
{
    _mergeThreshold = n;
    return *this;
}

Config::Builder &Config::Builder::quadtreeMaxDepth(core::u32 depth) noexcept
{
    _maxDepth = depth;
    return *this;
}

Config::Builder &Config::Builder::searchCeiling(core::u32 cost) noexcept
{
    _searchCeiling = cost;
    return *this;
}

Config::Builder &Config::Builder::tileSize(core::f32 size) noexcept
{
    _tileSize = size;
    return *this;
}

Config::Builder &Config::Builder::threadCount(core::u32 n) noexcept
{
    _threadCount = n;
    return *this;
}

Config::Builder &Config::Builder::logLevel(core::LogLevel level) noexcept
{
    _logLevel = level;
    return *this;
}

core::Expected<Config> Config::Builder::build() const
{
    std::string problem;
    if (_leafCapacity == 0)
        problem = "quadtree leaf capacity must be positive";
    else if (_mergeThreshold > _leafCapacity)
        problem = std::format("quadtree merge threshold {} exceeds leaf capacity {}", _mergeThreshold, _leafCapacity);
    else if (_maxDepth == 0 || _maxDepth > core::kQuadtreeDepthLimit)
        problem = std::format("quadtree max depth {} outside [1, {}]", _maxDepth, core::kQuadtreeDepthLimit);
    else if (!(_tileSize > 0.0f) || !std::isfinite(_tileSize))
        problem = std::format("tile size {} must be positive", _tileSize);

    if (!problem.empty())
    {
        core::Error err{core::ErrorCode::kInvalidConfiguration, std::move(problem)};
        core::Log::reject("engine", err);
        return std::unexpected(std::move(err));
    }

    Config cfg;
    cfg._quadtree      = {_leafCapacity, _mergeThreshold, _maxDepth};
    cfg._searchCeiling = _searchCeiling;
    cfg._tileSize      = _tileSize;
    cfg._threadCount   = _threadCount;
    cfg._logLevel      = _logLevel;
    return cfg;
}

} // namespace tes::engine
