/**
 * @file Quadtree.cpp
 * @brief Flat-arena quadtree with split-on-overflow and merge-on-removal.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tes/spatial/Quadtree.hpp>
#include <tes/core/Assert.hpp>
#include <tes/core/Log.hpp>

#include <algorithm>
#include <format>
#include <unordered_map>
#include <vector>

namespace tes::spatial {

// ========================================================================== //
//  Impl                                                                      //
// ========================================================================== //

struct Quadtree::Impl
{
    static constexpr core::i32 kNone = -1;

    struct Node
    {
        math::Rectf                 bounds;
        core::i32                   firstChild{kNone};
        core::i32                   parent{kNone};
        core::u32                   depth{0};
        std::vector<core::EntityId> entities;

        [[nodiscard]] bool isLeaf() const noexcept { return firstChild == kNone; }
    };

    struct Entry
    {
        math::Vec2f position;
        core::u32   leaf;
    };

    QuadtreeConfig                              config;
    std::vector<Node>                           nodes;
    std::vector<core::u32>                      freeBlocks;
    std::unordered_map<core::EntityId, Entry>   entries;

    Impl(const math::Rectf &worldBounds, QuadtreeConfig cfg) : config{cfg}
    {
        nodes.push_back(Node{worldBounds});
    }

    /// NE, NW, SE, SW, matching Rect::quadrants().
    [[nodiscard]] static core::u32 quadrantOf(const math::Rectf &bounds, math::Vec2f p) noexcept
    {
        const math::Vec2f c = bounds.center();
        const core::u32 west  = p.x < c.x ? 1u : 0u;
        const core::u32 south = p.y >= c.y ? 2u : 0u;
        return west + south;
    }

    [[nodiscard]] core::u32 leafFor(math::Vec2f p) const
    {
        core::u32 idx = 0;
        while (!nodes[idx].isLeaf())
            idx = static_cast<core::u32>(nodes[idx].firstChild) + quadrantOf(nodes[idx].bounds, p);
        return idx;
    }

    core::u32 allocateBlock()
    {
        if (!freeBlocks.empty())
        {
            const core::u32 block = freeBlocks.back();
            freeBlocks.pop_back();
            return block;
        }
        const auto block = static_cast<core::u32>(nodes.size());
        nodes.resize(nodes.size() + 4);
        return block;
    }

    void split(core::u32 nodeIdx)
    {
        const core::u32 block = allocateBlock();
        const auto quads = nodes[nodeIdx].bounds.quadrants();
        for (core::u32 i = 0; i < 4; ++i)
        {
            Node &child = nodes[block + i];
            child.bounds     = quads[i];
            child.firstChild = kNone;
            child.parent     = static_cast<core::i32>(nodeIdx);
            child.depth      = nodes[nodeIdx].depth + 1;
            child.entities.clear();
        }

        std::vector<core::EntityId> moving;
        moving.swap(nodes[nodeIdx].entities);
        nodes[nodeIdx].firstChild = static_cast<core::i32>(block);

        for (core::EntityId id : moving)
        {
            Entry &e = entries.at(id);
            e.leaf = block + quadrantOf(nodes[nodeIdx].bounds, e.position);
            nodes[e.leaf].entities.push_back(id);
        }

        if (core::Log::enabled(core::LogLevel::kDebug))
            core::Log::debug("spatial", std::format("split node {} at depth {} ({} entities)",
                                                    nodeIdx, nodes[nodeIdx].depth, moving.size()));

        // Every entity may have landed in the same quadrant.
        for (core::u32 i = 0; i < 4; ++i)
            splitIfOverflowing(block + i);
    }

    void splitIfOverflowing(core::u32 leafIdx)
    {
        const Node &leaf = nodes[leafIdx];
        if (leaf.entities.size() > config.leafCapacity && leaf.depth < config.maxDepth)
            split(leafIdx);
    }

    void place(core::EntityId id, math::Vec2f position)
    {
        const core::u32 leaf = leafFor(position);
        nodes[leaf].entities.push_back(id);
        entries[id] = Entry{position, leaf};
        splitIfOverflowing(leaf);
    }

    void detach(core::EntityId id, core::u32 leafIdx)
    {
        auto &list = nodes[leafIdx].entities;
        const auto it = std::find(list.begin(), list.end(), id);
        TES_ASSERT(it != list.end());
        *it = list.back();
        list.pop_back();
    }

    /// Collapses the children of @p nodeIdx and its ancestors while they are sparse.
    void mergeUpward(core::i32 nodeIdx)
    {
        while (nodeIdx != kNone)
        {
            Node &node = nodes[static_cast<core::u32>(nodeIdx)];
            const auto block = static_cast<core::u32>(node.firstChild);

            core::usize total = 0;
            for (core::u32 i = 0; i < 4; ++i)
            {
                if (!nodes[block + i].isLeaf())
                    return;
                total += nodes[block + i].entities.size();
            }
            if (total >= config.mergeThreshold)
                return;

            for (core::u32 i = 0; i < 4; ++i)
            {
                for (core::EntityId id : nodes[block + i].entities)
                {
                    node.entities.push_back(id);
                    entries.at(id).leaf = static_cast<core::u32>(nodeIdx);
                }
                nodes[block + i].entities.clear();
                nodes[block + i].parent = kNone;
            }
            node.firstChild = kNone;
            freeBlocks.push_back(block);

            if (core::Log::enabled(core::LogLevel::kDebug))
                core::Log::debug("spatial", std::format("merged children of node {} ({} entities)",
                                                        nodeIdx, total));
            nodeIdx = node.parent;
        }
    }

    template <typename Overlaps, typename Accept>
    void collect(core::u32 nodeIdx, Overlaps &&overlaps, Accept &&accept,
                 const EntityCallback &callback) const
    {
        const Node &node = nodes[nodeIdx];
        if (!overlaps(node.bounds))
            return;

        if (node.isLeaf())
        {
            for (core::EntityId id : node.entities)
            {
                if (accept(entries.at(id).position))
                    callback(id);
            }
            return;
        }

        const auto fc = static_cast<core::u32>(node.firstChild);
        for (core::u32 i = 0; i < 4; ++i)
            collect(fc + i, overlaps, accept, callback);
    }

    void visitLeaves(core::u32 nodeIdx, const LeafVisitor &visitor) const
    {
        const Node &node = nodes[nodeIdx];
        if (node.isLeaf())
        {
            visitor(node.bounds, node.depth, node.entities);
            return;
        }
        const auto fc = static_cast<core::u32>(node.firstChild);
        for (core::u32 i = 0; i < 4; ++i)
            visitLeaves(fc + i, visitor);
    }
};

// ========================================================================== //
//  Public API                                                                //
// ========================================================================== //

core::Expected<Quadtree> Quadtree::create(const math::Rectf &worldBounds, QuadtreeConfig config)
{
    std::string problem;
    if (!worldBounds.isValid() || worldBounds.area() <= 0.0f)
        problem = "world bounds must have a positive area";
    else if (config.leafCapacity == 0)
        problem = "leaf capacity must be positive";
    else if (config.mergeThreshold > config.leafCapacity)
        problem = std::format("merge threshold {} exceeds leaf capacity {}",
                              config.mergeThreshold, config.leafCapacity);
    else if (config.maxDepth == 0 || config.maxDepth > core::kQuadtreeDepthLimit)
        problem = std::format("max depth {} outside [1, {}]", config.maxDepth, core::kQuadtreeDepthLimit);

    if (!problem.empty())
    {
        core::Error err{core::ErrorCode::kInvalidConfiguration, std::move(problem)};
        core::Log::reject("spatial", err);
        return std::unexpected(std::move(err));
    }
    return Quadtree{std::make_unique<Impl>(worldBounds, config)};
}

Quadtree::Quadtree(std::unique_ptr<Impl> impl) : _impl{std::move(impl)} {}

Quadtree::Quadtree(Quadtree &&) noexcept            = default;
Quadtree &Quadtree::operator=(Quadtree &&) noexcept = default;
Quadtree::~Quadtree()                               = default;

core::ExpectedVoid Quadtree::insert(core::EntityId id, math::Vec2f position)
{
    if (!_impl->nodes[0].bounds.contains(position))
        return core::makeError(core::ErrorCode::kCoordinateOutOfBounds,
                               std::format("entity {} at ({}, {}) lies outside the quadtree",
                                           id, position.x, position.y));
    if (_impl->entries.contains(id))
        return core::makeError(core::ErrorCode::kAlreadyExists,
                               std::format("entity {} is already indexed", id));

    _impl->place(id, position);
    return {};
}

core::ExpectedVoid Quadtree::update(core::EntityId id, math::Vec2f position)
{
    auto it = _impl->entries.find(id);
    if (it == _impl->entries.end())
        return core::makeError(core::ErrorCode::kNotFound, std::format("entity {} is not indexed", id));
    if (!_impl->nodes[0].bounds.contains(position))
        return core::makeError(core::ErrorCode::kCoordinateOutOfBounds,
                               std::format("entity {} moved to ({}, {}) outside the quadtree",
                                           id, position.x, position.y));

    const core::u32 leaf = it->second.leaf;
    if (_impl->leafFor(position) == leaf)
    {
        it->second.position = position;
        return {};
    }

    _impl->detach(id, leaf);
    _impl->entries.erase(it);
    _impl->mergeUpward(_impl->nodes[leaf].parent);
    _impl->place(id, position);
    return {};
}

core::ExpectedVoid Quadtree::remove(core::EntityId id)
{
    auto it = _impl->entries.find(id);
    if (it == _impl->entries.end())
        return core::makeError(core::ErrorCode::kNotFound, std::format("entity {} is not indexed", id));

    const core::u32 leaf = it->second.leaf;
    _impl->detach(id, leaf);
    _impl->entries.erase(it);
    _impl->mergeUpward(_impl->nodes[leaf].parent);
    return {};
}

void Quadtree::query(const math::Rectf &region, const EntityCallback &callback) const
{
    _impl->collect(0,
        [&region](const math::Rectf &b) { return b.intersects(region); },
        [&region](math::Vec2f p) { return region.contains(p); },
        callback);
}

void Quadtree::queryRadius(math::Vec2f center, core::f32 radius, const EntityCallback &callback) const
{
    if (radius < 0.0f)
        return;

    const math::Rectf box = math::Rectf::fromCenter(center, {radius, radius});
    const core::f32 r2 = radius * radius;
    _impl->collect(0,
        [&box, center, radius](const math::Rectf &b) {
            return b.intersects(box) && b.intersectsCircle(center, radius);
        },
        [center, r2](math::Vec2f p) { return (p - center).lengthSquared() <= r2; },
        callback);
}

void Quadtree::clear()
{
    const math::Rectf worldBounds = _impl->nodes[0].bounds;
    _impl->nodes.clear();
    _impl->nodes.push_back(Impl::Node{worldBounds});
    _impl->freeBlocks.clear();
    _impl->entries.clear();
}

core::u32 Quadtree::count() const noexcept
{
    return static_cast<core::u32>(_impl->entries.size());
}

bool Quadtree::contains(core::EntityId id) const
{
    return _impl->entries.contains(id);
}

std::optional<math::Vec2f> Quadtree::positionOf(core::EntityId id) const
{
    auto it = _impl->entries.find(id);
    if (it == _impl->entries.end())
        return std::nullopt;
    return it->second.position;
}

std::vector<core::EntityId> Quadtree::entities() const
{
    std::vector<core::EntityId> out;
    out.reserve(_impl->entries.size());
    for (const auto &[id, entry] : _impl->entries)
        out.push_back(id);
    std::sort(out.begin(), out.end());
    return out;
}

void Quadtree::forEachLeaf(const LeafVisitor &visitor) const
{
    _impl->visitLeaves(0, visitor);
}

QuadtreeStats Quadtree::stats() const
{
    QuadtreeStats s;
    s.entities   = count();
    s.freeBlocks = static_cast<core::u32>(_impl->freeBlocks.size());

    core::u32 nonEmpty = 0;
    std::vector<core::u32> stack{0};
    while (!stack.empty())
    {
        const Impl::Node &node = _impl->nodes[stack.back()];
        stack.pop_back();

        ++s.totalNodes;
        s.maxDepth = std::max(s.maxDepth, node.depth);
        if (!node.isLeaf())
        {
            ++s.internalNodes;
            for (core::u32 i = 0; i < 4; ++i)
                stack.push_back(static_cast<core::u32>(node.firstChild) + i);
            continue;
        }

        ++s.leafNodes;
        const auto n = static_cast<core::u32>(node.entities.size());
        if (n == 0)
            ++s.emptyLeaves;
        else
            ++nonEmpty;
        s.maxPerLeaf = std::max(s.maxPerLeaf, n);
    }
    if (nonEmpty > 0)
        s.averagePerLeaf = static_cast<core::f32>(s.entities) / static_cast<core::f32>(nonEmpty);
    return s;
}

const math::Rectf &Quadtree::bounds() const noexcept
{
    return _impl->nodes[0].bounds;
}

const QuadtreeConfig &Quadtree::config() const noexcept
{
    return _impl->config;
}

} // namespace tes::spatial
