/**
 * @file Lighting.hpp
 * @brief Multi-source light accumulation over a grid.
 *
 * Each source lights the cells it can see (or every cell in range when it
 * penetrates walls). Contributions are mixed additively and the sum is
 * clamped to 1 per cell, for the level and for each colour channel.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_VISION_LIGHTING_HPP
    #define TES_VISION_LIGHTING_HPP

    #include <tes/vision/Fov.hpp>

    #include <span>
    #include <unordered_map>

namespace tes::vision {

struct Color {
    core::f32 r{1.0f};
    core::f32 g{1.0f};
    core::f32 b{1.0f};

    [[nodiscard]] constexpr bool operator==(const Color &) const = default;
};

enum class Falloff : core::u8 {
    /// 1 - d / radius
    kLinear,
    /// (1 - d / radius)^2
    kQuadratic,
    /// Full intensity up to the radius.
    kConstant
};

template <coord::GridCoordinate C>
struct LightSource {
    C         position{};
    core::u32 radius{0};
    core::f32 intensity{1.0f};
    Color     color{};
    Falloff   falloff{Falloff::kLinear};
    bool      penetratesWalls{false};
};

struct LightSample {
    core::f32 level{0.0f};
    Color     color{0.0f, 0.0f, 0.0f};
};

/// @brief Attenuation in [0, 1] of a light at distance @p d.
[[nodiscard]] constexpr core::f32 attenuation(Falloff falloff, core::u32 d, core::u32 radius) noexcept
{
    if (d > radius)
        return 0.0f;
    if (falloff == Falloff::kConstant || radius == 0)
        return 1.0f;

    const core::f32 linear = 1.0f - static_cast<core::f32>(d) / static_cast<core::f32>(radius);
    return falloff == Falloff::kQuadratic ? linear * linear : linear;
}

template <coord::GridCoordinate C>
class LightMap final {
public:
    [[nodiscard]] core::usize size() const noexcept { return _samples.size(); }

    /// @brief 0 for unlit cells.
    [[nodiscard]] core::f32 levelAt(const C &c) const
    {
        auto it = _samples.find(c);
        return it == _samples.end() ? 0.0f : it->second.level;
    }

    /// @brief Black for unlit cells.
    [[nodiscard]] Color colorAt(const C &c) const
    {
        auto it = _samples.find(c);
        return it == _samples.end() ? Color{0.0f, 0.0f, 0.0f} : it->second.color;
    }

    [[nodiscard]] bool isLit(const C &c) const { return levelAt(c) > 0.0f; }

    /// @brief Adds one contribution and clamps every channel to 1.
    void accumulate(const C &c, core::f32 amount, const Color &tint);

    [[nodiscard]] auto begin() const { return _samples.begin(); }
    [[nodiscard]] auto end() const { return _samples.end(); }

private:
    std::unordered_map<C, LightSample> _samples;
};

/**
 * @brief Light levels produced by @p sources.
 * @param blocks    Opaque cells; ignored by sources that penetrate walls.
 * @param algorithm FOV strategy used for sources that do not.
 */
template <coord::GridCoordinate C>
[[nodiscard]] LightMap<C> computeLighting(std::span<const LightSource<C>> sources, const BlockFn<C> &blocks,
                                          const FovAlgorithm &algorithm = Shadowcasting{});

} // namespace tes::vision

    #include "Lighting.inl"

#endif // TES_VISION_LIGHTING_HPP
