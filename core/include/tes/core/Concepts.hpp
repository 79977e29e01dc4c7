/**
 * @file Concepts.hpp
 * @brief Generic concepts shared across modules.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TES_CORE_CONCEPTS_HPP
    #define TES_CORE_CONCEPTS_HPP

    #include "Types.hpp"

    #include <concepts>
    #include <functional>
    #include <type_traits>

namespace tes::core {

/**
 * @brief A type that supports basic arithmetic operations.
 */
template <typename T>
concept Arithmetic = std::is_arithmetic_v<T> || requires(T a, T b) {
    { a + b } -> std::convertible_to<T>;
    { a - b } -> std::convertible_to<T>;
    { a * b } -> std::convertible_to<T>;
    { a / b } -> std::convertible_to<T>;
};

/**
 * @brief A type usable as an unordered container key through std::hash.
 */
template <typename T>
concept StdHashable = requires(const T &val) {
    { std::hash<T>{}(val) } -> std::convertible_to<usize>;
};

/**
 * @brief A callable answering a yes/no question about a value.
 */
template <typename F, typename T>
concept Predicate = std::predicate<const F &, const T &>;

} // namespace tes::core

#endif // TES_CORE_CONCEPTS_HPP
