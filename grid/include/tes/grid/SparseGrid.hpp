/**
 * @file SparseGrid.hpp
 * @brief Optional-valued grid for partially populated maps.
 *
 * Bounds are still fixed and dense (O(1) access); a cell simply may hold
 * nothing. insert/remove hand back whatever the cell held before.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_GRID_SPARSE_GRID_HPP
    #define TES_GRID_SPARSE_GRID_HPP

    #include <tes/grid/Grid.hpp>

    #include <optional>
    #include <utility>

namespace tes::grid {

template <coord::GridCoordinate C, typename T>
class SparseGrid final {
public:
    using coord_type = C;
    using value_type = T;

    [[nodiscard]] static core::Expected<SparseGrid> create(Bounds<C> bounds)
    {
        auto storage = TES_TRY((Grid<C, std::optional<T>>::create(bounds, std::nullopt)));
        return SparseGrid{std::move(storage)};
    }

    [[nodiscard]] const Bounds<C> &bounds() const noexcept { return _cells.bounds(); }
    [[nodiscard]] bool inBounds(const C &c) const noexcept { return _cells.contains(c); }

    /// @brief Number of cells currently holding a value.
    [[nodiscard]] core::usize occupied() const noexcept { return _occupied; }

    /// @brief Store @p value at @p c; yields the value it replaced, if any.
    [[nodiscard]] core::Expected<std::optional<T>> insert(const C &c, T value)
    {
        std::optional<T> *slot = _cells.find(c);
        if (slot == nullptr)
            return std::unexpected(_cells.get(c).error());

        std::optional<T> previous = std::exchange(*slot, std::move(value));
        if (!previous)
            ++_occupied;
        return previous;
    }

    /// @brief Empty the cell at @p c; yields the value it held, if any.
    [[nodiscard]] core::Expected<std::optional<T>> remove(const C &c)
    {
        std::optional<T> *slot = _cells.find(c);
        if (slot == nullptr)
            return std::unexpected(_cells.get(c).error());

        std::optional<T> previous = std::exchange(*slot, std::nullopt);
        if (previous)
            --_occupied;
        return previous;
    }

    /// @brief The value at @p c (nullopt when empty), or kCoordinateOutOfBounds.
    [[nodiscard]] core::Expected<std::optional<T>> get(const C &c) const { return _cells.get(c); }

    [[nodiscard]] const T *find(const C &c) const noexcept
    {
        const std::optional<T> *slot = _cells.find(c);
        return (slot != nullptr && slot->has_value()) ? &**slot : nullptr;
    }

    [[nodiscard]] bool isOccupied(const C &c) const noexcept { return find(c) != nullptr; }

    /// @brief Visit occupied cells in row-major order.
    template <typename F>
        requires std::invocable<F &, const C &, const T &>
    void forEach(F &&fn) const
    {
        for (const auto cell : _cells.cells())
        {
            if (cell.value)
                fn(cell.coord, *cell.value);
        }
    }

    void clear()
    {
        _cells.fill(std::nullopt);
        _occupied = 0;
    }

private:
    explicit SparseGrid(Grid<C, std::optional<T>> cells) : _cells(std::move(cells)) {}

    Grid<C, std::optional<T>> _cells;
    core::usize               _occupied{0};
};

} // namespace tes::grid

#endif // TES_GRID_SPARSE_GRID_HPP
