/**
 * @file HexLayout.hpp
 * @brief Rectangular hexagon maps described in offset space.
 *
 * Game maps are usually authored as width x height offset grids; the
 * layout hands out the matching axial coordinates (which the algorithms
 * work in) and the axial bounding box to size storage with.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_GRID_HEX_LAYOUT_HPP
    #define TES_GRID_HEX_LAYOUT_HPP

    #include <tes/grid/Bounds.hpp>
    #include <tes/coord/Hex.hpp>
    #include <tes/core/Expected.hpp>
    #include <tes/math/Rect.hpp>

    #include <algorithm>
    #include <format>
    #include <vector>

namespace tes::grid {

template <coord::Orientation O, coord::OffsetParity P = coord::OffsetParity::kOdd>
class HexRectLayout final {
public:
    using Hex = coord::HexAxial<O>;

    /// @return kInvalidConfiguration when either dimension is zero.
    [[nodiscard]] static core::Expected<HexRectLayout> create(core::u32 columns, core::u32 rows)
    {
        if (columns == 0 || rows == 0)
        {
            return core::makeError(core::ErrorCode::kInvalidConfiguration,
                std::format("hex layout needs at least one cell, got {}x{}", columns, rows));
        }
        return HexRectLayout{columns, rows};
    }

    [[nodiscard]] core::u32 columns() const noexcept { return _columns; }
    [[nodiscard]] core::u32 rows()    const noexcept { return _rows; }
    [[nodiscard]] core::usize size()  const noexcept { return static_cast<core::usize>(_columns) * _rows; }

    [[nodiscard]] bool contains(const Hex &h) const
    {
        const coord::OffsetCoord o = h.template toOffset<P>();
        return o.col >= 0 && o.row >= 0
            && o.col < static_cast<core::i32>(_columns)
            && o.row < static_cast<core::i32>(_rows);
    }

    /// @brief Every hexagon of the map, row by row in offset space.
    [[nodiscard]] std::vector<Hex> cells() const
    {
        std::vector<Hex> out;
        out.reserve(size());
        for (core::i32 row = 0; row < static_cast<core::i32>(_rows); ++row)
            for (core::i32 col = 0; col < static_cast<core::i32>(_columns); ++col)
                out.push_back(Hex::template fromOffset<P>({col, row}));
        return out;
    }

    /// @brief Smallest axial rectangle holding every hexagon of the map.
    [[nodiscard]] Bounds<Hex> axialBounds() const
    {
        const auto all = cells();
        Bounds<Hex> b{all.front(), all.front()};
        for (const Hex &h : all)
        {
            b.min = Hex{std::min(b.min.q, h.q), std::min(b.min.r, h.r)};
            b.max = Hex{std::max(b.max.q, h.q), std::max(b.max.r, h.r)};
        }
        return b;
    }

    /// @brief Pixel rectangle spanned by the hexagon centres.
    [[nodiscard]] math::Rectf pixelExtent(core::f32 size) const
    {
        const auto all = cells();
        math::Rectf r{all.front().toPixel(size), all.front().toPixel(size)};
        for (const Hex &h : all)
        {
            const math::Vec2f p = h.toPixel(size);
            r.min = {std::min(r.min.x, p.x), std::min(r.min.y, p.y)};
            r.max = {std::max(r.max.x, p.x), std::max(r.max.y, p.y)};
        }
        return r;
    }

    /// @brief Pixel centre of the map.
    [[nodiscard]] math::Vec2f center(core::f32 size) const { return pixelExtent(size).center(); }

private:
    HexRectLayout(core::u32 columns, core::u32 rows) : _columns(columns), _rows(rows) {}

    core::u32 _columns;
    core::u32 _rows;
};

} // namespace tes::grid

#endif // TES_GRID_HEX_LAYOUT_HPP
