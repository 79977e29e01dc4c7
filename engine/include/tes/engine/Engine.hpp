/**
 * @file Engine.hpp
 * @brief Top-level engine façade for batch work (Façade pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_ENGINE_ENGINE_HPP
    #define TES_ENGINE_ENGINE_HPP

    #include <tes/engine/Config.hpp>
    #include <tes/concurrency/ThreadPool.hpp>
    #include <tes/nav/FlowField.hpp>
    #include <tes/nav/Pathfinder.hpp>
    #include <tes/spatial/Quadtree.hpp>
    #include <tes/vision/LineOfSight.hpp>

    #include <memory>
    #include <span>
    #include <utility>
    #include <vector>

namespace tes::engine {

/**
 * @brief Owns the configuration and a worker pool and fans independent
 *        units of work out over it.
 *
 * Every batch reads the grid it is given and nothing else; callers must
 * not edit that grid until the batch returns.
 */
class Engine
{
public:
    /// @param config Immutable engine configuration; also sets the log level.
    explicit Engine(Config config);
    ~Engine();

    Engine(const Engine &)            = delete;
    Engine &operator=(const Engine &) = delete;

    [[nodiscard]] const Config &config() const noexcept;
    [[nodiscard]] concurrency::ThreadPool &pool() noexcept;

    /** @brief Quadtree over @p worldBounds with the configured tuning. */
    [[nodiscard]] core::Expected<spatial::Quadtree> makeQuadtree(const math::Rectf &worldBounds) const;

    /** @brief Applies the configured search ceiling when the query has none. */
    template <coord::GridCoordinate C>
    [[nodiscard]] nav::PathQuery<C> withDefaults(nav::PathQuery<C> query) const;

    /** @brief One A* search per query, results in query order. */
    template <coord::GridCoordinate C, typename T>
    [[nodiscard]] std::vector<core::Expected<nav::PathResult<C>>>
    findPaths(const grid::Grid<C, T> &grid, std::span<const nav::PathQuery<C>> queries);

    /** @brief One flow field per goal group, results in group order. */
    template <coord::GridCoordinate C, typename T>
    [[nodiscard]] std::vector<core::Expected<nav::FlowField<C>>>
    buildFlowFields(const grid::Grid<C, T> &grid, std::span<const std::vector<C>> goalGroups,
                    const nav::AccessFn<C> &accessible = {}, const nav::CostFn<C> &cost = {});

    /** @brief lineOfSight for every (from, to) pair. */
    template <coord::GridCoordinate C>
    [[nodiscard]] std::vector<bool> lineOfSightBatch(std::span<const std::pair<C, C>> pairs,
                                                     const vision::BlockFn<C> &blocks);

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace tes::engine

    #include "Engine.inl"

#endif // TES_ENGINE_ENGINE_HPP
