/**
 * @file Grid.inl
 * @brief Inline implementation of Grid.
 * @see   Grid.hpp
 */

#ifndef TES_GRID_GRID_INL
    #define TES_GRID_GRID_INL

#include <tes/core/Log.hpp>
#include <tes/core/Platform.hpp>

#include <algorithm>
#include <format>

namespace tes::grid {

template <coord::GridCoordinate C, typename T>
core::ExpectedVoid Grid<C, T>::validate(const Bounds<C> &bounds)
{
    if (!bounds.isValid())
    {
        core::Error err{core::ErrorCode::kInvalidConfiguration,
            std::format("grid bounds {}..{} are empty or inverted",
                        coord::describe(bounds.min), coord::describe(bounds.max))};
        core::Log::reject("grid", err);
        return std::unexpected(std::move(err));
    }
    if (!bounds.isAddressable())
    {
        core::Error err{core::ErrorCode::kInvalidConfiguration,
            std::format("grid bounds {}..{} span {} x {} cells, more than {} per axis",
                        coord::describe(bounds.min), coord::describe(bounds.max),
                        bounds.extent(0), bounds.extent(1), Bounds<C>::kMaxExtent)};
        core::Log::reject("grid", err);
        return std::unexpected(std::move(err));
    }
    return {};
}

template <coord::GridCoordinate C, typename T>
core::Error Grid<C, T>::outOfBounds(const C &c) const
{
    core::Error err{core::ErrorCode::kCoordinateOutOfBounds,
        std::format("{} outside grid {}..{}", coord::describe(c),
                    coord::describe(_bounds.min), coord::describe(_bounds.max))};
    core::Log::reject("grid", err);
    return err;
}

template <coord::GridCoordinate C, typename T>
core::Expected<Grid<C, T>> Grid<C, T>::create(Bounds<C> bounds, const T &value)
{
    TES_TRY_VOID(validate(bounds));
    return Grid{bounds, std::vector<Slot>(bounds.area(), Slot{value})};
}

template <coord::GridCoordinate C, typename T>
template <typename F>
    requires std::invocable<F &, const C &>
          && std::convertible_to<std::invoke_result_t<F &, const C &>, T>
core::Expected<Grid<C, T>> Grid<C, T>::createWith(Bounds<C> bounds, F &&init)
{
    TES_TRY_VOID(validate(bounds));

    std::vector<Slot> values;
    values.reserve(bounds.area());
    for (core::usize i = 0; i < bounds.area(); ++i)
        values.push_back(Slot{static_cast<T>(init(bounds.coordAt(i)))});
    return Grid{bounds, std::move(values)};
}

template <coord::GridCoordinate C, typename T>
core::ExpectedVoid Grid<C, T>::checkBounds(const C &c) const
{
    if (!_bounds.contains(c)) [[unlikely]]
        return std::unexpected(outOfBounds(c));
    return {};
}

template <coord::GridCoordinate C, typename T>
core::Expected<T> Grid<C, T>::get(const C &c) const
{
    if (!_bounds.contains(c)) [[unlikely]]
        return std::unexpected(outOfBounds(c));
    return _values[_bounds.indexOf(c)].value;
}

template <coord::GridCoordinate C, typename T>
core::ExpectedVoid Grid<C, T>::set(const C &c, T value)
{
    if (!_bounds.contains(c)) [[unlikely]]
        return std::unexpected(outOfBounds(c));
    _values[_bounds.indexOf(c)].value = std::move(value);
    return {};
}

template <coord::GridCoordinate C, typename T>
T *Grid<C, T>::find(const C &c) noexcept
{
    return TES_LIKELY(_bounds.contains(c)) ? &_values[_bounds.indexOf(c)].value : nullptr;
}

template <coord::GridCoordinate C, typename T>
const T *Grid<C, T>::find(const C &c) const noexcept
{
    return TES_LIKELY(_bounds.contains(c)) ? &_values[_bounds.indexOf(c)].value : nullptr;
}

template <coord::GridCoordinate C, typename T>
T &Grid<C, T>::operator[](const C &c)
{
    TES_ASSERT(_bounds.contains(c));
    return _values[_bounds.indexOf(c)].value;
}

template <coord::GridCoordinate C, typename T>
const T &Grid<C, T>::operator[](const C &c) const
{
    TES_ASSERT(_bounds.contains(c));
    return _values[_bounds.indexOf(c)].value;
}

template <coord::GridCoordinate C, typename T>
void Grid<C, T>::fill(const T &value)
{
    std::fill(_values.begin(), _values.end(), Slot{value});
}

} // namespace tes::grid

#endif // TES_GRID_GRID_INL
