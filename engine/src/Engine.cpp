/**
 * @file Engine.cpp
 * @brief Engine façade implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tes/engine/Engine.hpp>
#include <tes/core/Log.hpp>

#include <format>

namespace tes::engine {

struct Engine::Impl
{
    Config                  config;
    concurrency::ThreadPool threadPool;

    explicit Impl(Config cfg)
        : config{std::move(cfg)}
        , threadPool{config.threadCount()}
    {
    }
};

Engine::Engine(Config config)
{
    core::Log::setMinLevel(config.logLevel());
    _impl = std::make_unique<Impl>(std::move(config));
    core::Log::info("engine", std::format("engine ready: {} workers, tile size {}, search ceiling {}",
                                          _impl->threadPool.threadCount(), _impl->config.tileSize(),
                                          _impl->config.searchCeiling()));
}

Engine::~Engine() = default;

const Config &Engine::config() const noexcept
{
    return _impl->config;
}

concurrency::ThreadPool &Engine::pool() noexcept
{
    return _impl->threadPool;
}

core::Expected<spatial::Quadtree> Engine::makeQuadtree(const math::Rectf &worldBounds) const
{
    return spatial::Quadtree::create(worldBounds, _impl->config.quadtree());
}

} // namespace tes::engine
