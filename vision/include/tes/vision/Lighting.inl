/**
 * @file Lighting.inl
 * @brief Inline implementation of light accumulation.
 * @see   Lighting.hpp
 */

#ifndef TES_VISION_LIGHTING_INL
    #define TES_VISION_LIGHTING_INL

#include <algorithm>

namespace tes::vision {

template <coord::GridCoordinate C>
void LightMap<C>::accumulate(const C &c, core::f32 amount, const Color &tint)
{
    if (amount <= 0.0f)
        return;

    LightSample &s = _samples[c];
    s.level   = std::min(1.0f, s.level + amount);
    s.color.r = std::min(1.0f, s.color.r + tint.r * amount);
    s.color.g = std::min(1.0f, s.color.g + tint.g * amount);
    s.color.b = std::min(1.0f, s.color.b + tint.b * amount);
}

template <coord::GridCoordinate C>
LightMap<C> computeLighting(std::span<const LightSource<C>> sources, const BlockFn<C> &blocks,
                            const FovAlgorithm &algorithm)
{
    LightMap<C> out;
    for (const LightSource<C> &light : sources)
    {
        if (light.intensity <= 0.0f)
            continue;

        const auto contribute = [&](const C &c, core::u32 d) {
            out.accumulate(c, light.intensity * attenuation(light.falloff, d, light.radius), light.color);
        };

        if (light.penetratesWalls)
        {
            for (const C &c : coord::cellsWithin(light.position, light.radius))
                contribute(c, c.distance(light.position));
            continue;
        }

        for (const auto &[c, seen] : computeFov(light.position, light.radius, blocks, algorithm))
            contribute(c, seen.distance);
    }
    return out;
}

} // namespace tes::vision

#endif // TES_VISION_LIGHTING_INL
