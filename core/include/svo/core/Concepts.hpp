/**
 * @file Concepts.hpp
 * @brief C++20 concepts constraining the generic containers.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SVO_CORE_CONCEPTS_HPP
    #define SVO_CORE_CONCEPTS_HPP

    #include "Types.hpp"

    #include <concepts>
    #include <ostream>
    #include <type_traits>

namespace svo::core {

/**
 * @brief A type that can be written to a std::ostream with operator<<.
 */
template <typename T>
concept Streamable = requires(std::ostream &os, const T &val) {
    { os << val } -> std::convertible_to<std::ostream &>;
};

/**
 * @brief A type storable in an arena slot: movable out of a freed slot.
 */
template <typename T>
concept Slottable = std::is_nothrow_move_constructible_v<T> && std::is_destructible_v<T>;

/**
 * @brief A voxel payload: copied into leaves, compared to detect uniform
 *        regions, and printed by the tree dump.
 */
template <typename T>
concept VoxelValue = std::copyable<T> && std::equality_comparable<T> && Streamable<T> && Slottable<T>;

} // namespace svo::core

#endif // SVO_CORE_CONCEPTS_HPP
