// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief Tessera benchmark entry-point.
///
/// Headless benchmark: times pathfinding, flow-field integration, every FOV
/// strategy and quadtree churn on generated maps.
// /////////////////////////////////////////////////////////////////////////////

#include <tes/core/Log.hpp>
#include <tes/core/Types.hpp>
#include <tes/coord/Hex.hpp>
#include <tes/coord/Square.hpp>
#include <tes/engine/Engine.hpp>
#include <tes/grid/Grid.hpp>
#include <tes/nav/FlowField.hpp>
#include <tes/nav/Pathfinder.hpp>
#include <tes/spatial/Quadtree.hpp>
#include <tes/vision/Fov.hpp>

#include <chrono>
#include <cstdio>
#include <format>
#include <random>
#include <vector>

using namespace tes;

namespace {

constexpr core::u32 kMapSide = 128;

template <typename Fn>
core::f64 benchmarkMs(const char *label, Fn &&fn)
{
    const auto start = std::chrono::steady_clock::now();
    fn();
    const auto end = std::chrono::steady_clock::now();
    const core::f64 ms = std::chrono::duration<core::f64, std::milli>(end - start).count();
    std::printf("  %-40s %10.3f ms\n", label, ms);
    return ms;
}

/// Open map with roughly one wall cell in eight; the corners stay open.
template <coord::GridCoordinate C>
core::Expected<grid::Grid<C, bool>> makeMap(core::u32 seed)
{
    std::mt19937 rng{seed};
    std::bernoulli_distribution wall{0.125};
    const auto bounds = grid::Bounds<C>::fromSize(kMapSide, kMapSide);
    return grid::Grid<C, bool>::createWith(bounds, [&](const C &c) {
        return c == bounds.min || c == bounds.max || !wall(rng);
    });
}

void benchmarkPathfinding(const grid::Grid<coord::Square8, bool> &map)
{
    nav::PathQuery<coord::Square8> query;
    query.start      = map.bounds().min;
    query.goals      = {map.bounds().max};
    query.accessible = nav::accessibleWhere(map, [](bool open) { return open; });

    benchmarkMs("A* corner to corner (Square8 128x128)", [&]() {
        auto result = nav::findPath(map, query);
        if (!result)
            core::Log::warn("bench", result.error().describe());
    });
}

void benchmarkFlowFields(engine::Engine &engine, const grid::Grid<coord::Square8, bool> &map)
{
    const auto accessible = nav::accessibleWhere(map, [](bool open) { return open; });
    const std::vector<coord::Square8> goals{map.bounds().max};

    benchmarkMs("Flow field, one goal", [&]() {
        auto field = nav::FlowField<coord::Square8>::build(map, std::span<const coord::Square8>{goals}, accessible);
        if (!field)
            core::Log::warn("bench", field.error().describe());
    });

    std::vector<std::vector<coord::Square8>> groups;
    for (core::i32 i = 0; i < 8; ++i)
        groups.push_back({coord::Square8{i * 16, 0}, coord::Square8{0, i * 16}});

    benchmarkMs("Flow fields, 8 groups on the pool", [&]() {
        const auto fields = engine.buildFlowFields(map, std::span<const std::vector<coord::Square8>>{groups}, accessible);
        for (const auto &field : fields)
        {
            if (!field)
                core::Log::warn("bench", field.error().describe());
        }
    });
}

template <coord::GridCoordinate C>
void benchmarkFov(const char *label, const grid::Grid<C, bool> &map, const vision::FovAlgorithm &algo)
{
    const C origin = C::fromComponents(kMapSide / 2, kMapSide / 2);
    const vision::BlockFn<C> blocks = [&map](const C &c) {
        const bool *open = map.find(c);
        return open == nullptr || !*open;
    };
    benchmarkMs(label, [&]() {
        [[maybe_unused]] const auto fov = vision::computeFov(origin, 24, blocks, algo);
    });
}

void benchmarkQuadtree(engine::Engine &engine)
{
    auto tree = engine.makeQuadtree(math::Rectf::fromEdges(0.0f, 0.0f, 1024.0f, 1024.0f));
    if (!tree)
    {
        core::Log::error("bench", tree.error().describe());
        return;
    }

    std::mt19937 rng{7};
    std::uniform_real_distribution<core::f32> coord{0.0f, 1024.0f};

    core::usize failures = 0;
    const auto check = [&failures](const core::ExpectedVoid &r) {
        if (!r)
            ++failures;
    };

    benchmarkMs("Quadtree insert 20k", [&]() {
        for (core::EntityId id = 0; id < 20000; ++id)
            check(tree->insert(id, {coord(rng), coord(rng)}));
    });
    benchmarkMs("Quadtree move 20k", [&]() {
        for (core::EntityId id = 0; id < 20000; ++id)
            check(tree->update(id, {coord(rng), coord(rng)}));
    });
    benchmarkMs("Quadtree circle query x1000", [&]() {
        core::usize hits = 0;
        for (int i = 0; i < 1000; ++i)
            hits += tree->queryCircle({coord(rng), coord(rng)}, 32.0f).size();
        core::Log::debug("bench", std::format("{} hits", hits));
    });
    benchmarkMs("Quadtree remove 20k", [&]() {
        for (core::EntityId id = 0; id < 20000; ++id)
            check(tree->remove(id));
    });

    if (failures > 0)
        core::Log::warn("bench", std::format("{} quadtree operations failed", failures));
}

} // anonymous namespace

int main(int /*argc*/, char * /*argv*/[])
{
    auto config = engine::Config::Builder{}.logLevel(core::LogLevel::kInfo).build();
    if (!config)
    {
        core::Log::fatal("bench", config.error().describe());
        return 1;
    }
    engine::Engine engine{std::move(*config)};

    core::Log::info("=== Tessera Benchmark ===");
    std::printf("\n");

    auto squares = makeMap<coord::Square8>(42);
    auto hexes = makeMap<coord::HexPointy>(43);
    if (!squares || !hexes)
    {
        core::Log::fatal("bench", "could not allocate the benchmark maps");
        return 1;
    }

    benchmarkPathfinding(*squares);
    benchmarkFlowFields(engine, *squares);
    benchmarkFov("FOV shadowcasting r24 (Square8)", *squares, vision::Shadowcasting{});
    benchmarkFov("FOV ray marching r24 (Square8)", *squares, vision::RayMarching{});
    benchmarkFov("FOV flood fill r24 (Square8)", *squares, vision::FloodFill{});
    benchmarkFov("FOV shadowcasting r24 (Hex)", *hexes, vision::Shadowcasting{});
    benchmarkQuadtree(engine);

    std::printf("\nDone.\n");
    return 0;
}
