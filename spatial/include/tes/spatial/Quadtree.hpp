/**
 * @file Quadtree.hpp
 * @brief Dynamic point quadtree over a fixed world rectangle.
 *
 * Nodes live in a flat arena and refer to each other by index. The four
 * children of an internal node occupy four consecutive slots; blocks freed
 * by a merge go to a free-list and are reused by the next split.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_SPATIAL_QUADTREE_HPP
    #define TES_SPATIAL_QUADTREE_HPP

    #include <tes/spatial/ISpatialIndex.hpp>
    #include <tes/core/Constants.hpp>
    #include <tes/core/NonCopyable.hpp>

    #include <memory>
    #include <optional>
    #include <span>

namespace tes::spatial {

struct QuadtreeConfig {
    /// A leaf splits once it would hold more than this many entities.
    core::u32 leafCapacity{core::kQuadtreeLeafCapacity};
    /// Four sibling leaves holding fewer than this many entities collapse.
    core::u32 mergeThreshold{core::kQuadtreeMergeThreshold};
    /// Leaves at this depth never split (the root is depth 0).
    core::u32 maxDepth{core::kQuadtreeMaxDepth};
};

struct QuadtreeStats {
    core::u32 totalNodes{0};
    core::u32 leafNodes{0};
    core::u32 internalNodes{0};
    core::u32 emptyLeaves{0};
    core::u32 maxDepth{0};
    core::u32 entities{0};
    core::u32 maxPerLeaf{0};
    core::f32 averagePerLeaf{0.0f};
    core::u32 freeBlocks{0};
};

/**
 * @class Quadtree
 * @brief Splits a leaf into four quadrants when it overflows and merges
 *        sparse sibling leaves back on removal.
 *
 * A point on a split line belongs to the east and south (higher x, higher y)
 * side, so every position inside the bounds maps to exactly one leaf.
 */
class Quadtree final : public ISpatialIndex,
                       public core::NonCopyable<Quadtree>
{
public:
    using LeafVisitor = std::function<void(const math::Rectf &bounds, core::u32 depth,
                                           std::span<const core::EntityId> entities)>;

    /**
     * @brief Creates an empty tree covering @p worldBounds.
     * @return kInvalidConfiguration for degenerate bounds, zero capacity,
     *         a merge threshold above the capacity, or a depth outside
     *         [1, kQuadtreeDepthLimit].
     */
    [[nodiscard]] static core::Expected<Quadtree> create(const math::Rectf &worldBounds,
                                                         QuadtreeConfig config = {});

    Quadtree(Quadtree &&) noexcept;
    Quadtree &operator=(Quadtree &&) noexcept;
    ~Quadtree() override;

    /** @return kCoordinateOutOfBounds outside the world bounds, kAlreadyExists. */
    [[nodiscard]] core::ExpectedVoid insert(core::EntityId id, math::Vec2f position) override;

    /**
     * @brief Moves an entity, in place when it stays in its leaf.
     * @return kCoordinateOutOfBounds (the entity keeps its old position), kNotFound.
     */
    [[nodiscard]] core::ExpectedVoid update(core::EntityId id, math::Vec2f position) override;

    [[nodiscard]] core::ExpectedVoid remove(core::EntityId id) override;

    void query(const math::Rectf &region, const EntityCallback &callback) const override;
    void queryRadius(math::Vec2f center, core::f32 radius, const EntityCallback &callback) const override;

    void clear() override;

    [[nodiscard]] core::u32 count() const noexcept override;

    [[nodiscard]] bool contains(core::EntityId id) const;
    [[nodiscard]] std::optional<math::Vec2f> positionOf(core::EntityId id) const;
    [[nodiscard]] std::vector<core::EntityId> entities() const;

    /** @brief Visits every live leaf, depth-first in NE, NW, SE, SW order. */
    void forEachLeaf(const LeafVisitor &visitor) const;

    [[nodiscard]] QuadtreeStats stats() const;

    [[nodiscard]] const math::Rectf    &bounds() const noexcept;
    [[nodiscard]] const QuadtreeConfig &config() const noexcept;

private:
    struct Impl;

    explicit Quadtree(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> _impl;
};

} // namespace tes::spatial

#endif // TES_SPATIAL_QUADTREE_HPP
