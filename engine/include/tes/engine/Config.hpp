/**
 * @file Config.hpp
 * @brief Engine configuration (Builder pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_ENGINE_CONFIG_HPP
    #define TES_ENGINE_CONFIG_HPP

    #include <tes/core/Constants.hpp>
    #include <tes/core/Expected.hpp>
    #include <tes/core/Log.hpp>
    #include <tes/core/Types.hpp>
    #include <tes/spatial/Quadtree.hpp>

namespace tes::engine {

/** @brief Immutable engine configuration. */
class Config
{
public:
    /** @brief Fluent builder for Config. */
    class Builder
    {
    public:
        Builder &quadtreeLeafCapacity(core::u32 n) noexcept;
        Builder &quadtreeMergeThreshold(core::u32 n) noexcept;
        Builder &quadtreeMaxDepth(core::u32 depth) noexcept;
        /// 0 means unlimited.
        Builder &searchCeiling(core::u32 cost) noexcept;
        Builder &tileSize(core::f32 size) noexcept;
        /// 0 means one worker per hardware thread.
        Builder &threadCount(core::u32 n) noexcept;
        Builder &logLevel(core::LogLevel level) noexcept;

        /**
         * @return kInvalidConfiguration for a zero leaf capacity, a merge
         *         threshold above it, a depth outside [1, kQuadtreeDepthLimit]
         *         or a non-positive tile size.
         */
        [[nodiscard]] core::Expected<Config> build() const;

    private:
        core::u32      _leafCapacity{core::kQuadtreeLeafCapacity};
        core::u32      _mergeThreshold{core::kQuadtreeMergeThreshold};
        core::u32      _maxDepth{core::kQuadtreeMaxDepth};
        core::u32      _searchCeiling{core::kUnlimitedSearch};
        core::f32      _tileSize{core::kDefaultTileSize};
        core::u32      _threadCount{0};
        core::LogLevel _logLevel{core::LogLevel::kInfo};
    };

    [[nodiscard]] const spatial::QuadtreeConfig &quadtree() const noexcept { return _quadtree; }
    [[nodiscard]] core::u32      searchCeiling() const noexcept { return _searchCeiling; }
    [[nodiscard]] core::f32      tileSize()      const noexcept { return _tileSize; }
    [[nodiscard]] core::u32      threadCount()   const noexcept { return _threadCount; }
    [[nodiscard]] core::LogLevel logLevel()      const noexcept { return _logLevel; }

private:
    friend class Builder;

    Config() = default;

    spatial::QuadtreeConfig _quadtree{};
    core::u32               _searchCeiling{core::kUnlimitedSearch};
    core::f32               _tileSize{core::kDefaultTileSize};
    core::u32               _threadCount{0};
    core::LogLevel          _logLevel{core::LogLevel::kInfo};
};

} // namespace tes::engine

#endif // TES_ENGINE_CONFIG_HPP
