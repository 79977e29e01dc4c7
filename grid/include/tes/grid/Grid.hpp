/**
 * @file Grid.hpp
 * @brief Dense 2D container keyed by a coordinate type.
 *
 * Values live in one contiguous row-major vector; every access is a
 * bounds check plus an offset computation. Out-of-bounds get/set return
 * kCoordinateOutOfBounds instead of clamping or wrapping.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_GRID_GRID_HPP
    #define TES_GRID_GRID_HPP

    #include <tes/grid/Bounds.hpp>
    #include <tes/core/Assert.hpp>
    #include <tes/core/Expected.hpp>

    #include <concepts>
    #include <iterator>
    #include <type_traits>
    #include <vector>

namespace tes::grid {

/**
 * @brief One (coordinate, value) pair yielded by Grid::cells().
 * @tparam V @c T or @c const T.
 */
template <coord::GridCoordinate C, typename V>
struct Cell final {
    C  coord;
    V &value;
};

template <coord::GridCoordinate C, typename T>
class Grid final {
public:
    using coord_type = C;
    using value_type = T;

    /**
     * @brief Lazy row-major view over a grid. Restartable: every begin()
     *        starts again at the first cell.
     */
    template <bool Const>
    class CellView final {
        using GridRef = std::conditional_t<Const, const Grid &, Grid &>;
        using Value   = std::conditional_t<Const, const T, T>;

    public:
        class Iterator final {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type        = Cell<C, Value>;
            using difference_type   = std::ptrdiff_t;
            using reference         = Cell<C, Value>;

            Iterator() = default;
            Iterator(std::conditional_t<Const, const Grid *, Grid *> grid, core::usize index)
                : _grid(grid), _index(index) {}

            [[nodiscard]] reference operator*() const
            {
                return {_grid->_bounds.coordAt(_index), _grid->_values[_index].value};
            }

            Iterator &operator++() { ++_index; return *this; }
            Iterator operator++(int) { Iterator tmp = *this; ++_index; return tmp; }

            [[nodiscard]] bool operator==(const Iterator &other) const { return _index == other._index; }

        private:
            std::conditional_t<Const, const Grid *, Grid *> _grid{nullptr};
            core::usize _index{0};
        };

        explicit CellView(GridRef grid) : _grid(&grid) {}

        [[nodiscard]] Iterator begin() const { return {_grid, 0}; }
        [[nodiscard]] Iterator end()   const { return {_grid, _grid->_values.size()}; }

    private:
        std::conditional_t<Const, const Grid *, Grid *> _grid;
    };

    /**
     * @brief Build a grid with every cell set to @p value.
     * @return kInvalidConfiguration for empty or inverted bounds.
     */
    [[nodiscard]] static core::Expected<Grid> create(Bounds<C> bounds, const T &value);

    /**
     * @brief Build a grid calling @p init exactly once per coordinate, in
     *        row-major order.
     */
    template <typename F>
        requires std::invocable<F &, const C &>
              && std::convertible_to<std::invoke_result_t<F &, const C &>, T>
    [[nodiscard]] static core::Expected<Grid> createWith(Bounds<C> bounds, F &&init);

    [[nodiscard]] const Bounds<C> &bounds() const noexcept { return _bounds; }
    [[nodiscard]] core::u32  width()  const noexcept { return _bounds.width(); }
    [[nodiscard]] core::u32  height() const noexcept { return _bounds.height(); }
    [[nodiscard]] core::usize size()  const noexcept { return _values.size(); }

    [[nodiscard]] bool contains(const C &c) const noexcept { return _bounds.contains(c); }

    /// @brief Success when @p c is inside, otherwise kCoordinateOutOfBounds.
    [[nodiscard]] core::ExpectedVoid checkBounds(const C &c) const;

    /// @brief Copy of the value at @p c, or kCoordinateOutOfBounds.
    [[nodiscard]] core::Expected<T> get(const C &c) const;

    /// @brief Overwrite the value at @p c, or kCoordinateOutOfBounds.
    [[nodiscard]] core::ExpectedVoid set(const C &c, T value);

    /// @brief Pointer to the value at @p c, nullptr when outside.
    [[nodiscard]] T       *find(const C &c) noexcept;
    [[nodiscard]] const T *find(const C &c) const noexcept;

    /// @brief Unchecked access; asserts in debug builds.
    [[nodiscard]] T       &operator[](const C &c);
    [[nodiscard]] const T &operator[](const C &c) const;

    void fill(const T &value);

    [[nodiscard]] CellView<false> cells()       { return CellView<false>{*this}; }
    [[nodiscard]] CellView<true>  cells() const { return CellView<true>{*this}; }

private:
    /// Wrapped so that Grid<C, bool> stores addressable values.
    struct Slot {
        T value;
    };

    Grid(Bounds<C> bounds, std::vector<Slot> values)
        : _bounds(bounds), _values(std::move(values)) {}

    [[nodiscard]] static core::ExpectedVoid validate(const Bounds<C> &bounds);
    [[nodiscard]] core::Error outOfBounds(const C &c) const;

    Bounds<C>         _bounds;
    std::vector<Slot> _values;
};

} // namespace tes::grid

    #include "Grid.inl"

#endif // TES_GRID_GRID_HPP
