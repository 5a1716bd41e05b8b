/**
 * @file Coord.hpp
 * @brief Unsigned 8-bit voxel coordinate.
 *
 * Plain three-axis position used to address voxels inside an octree.
 * Arithmetic wraps like the underlying u8; callers keep positions inside
 * the tree domain, which the octree validates on entry.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SVO_MATH_COORD_HPP
    #define SVO_MATH_COORD_HPP

    #include <svo/core/Types.hpp>

    #include <ostream>

namespace svo::math {

struct Coord final {
    core::u8 x{};
    core::u8 y{};
    core::u8 z{};

    constexpr Coord() = default;
    constexpr Coord(core::u8 x, core::u8 y, core::u8 z);

    [[nodiscard]] constexpr Coord operator+(Coord rhs) const;
    [[nodiscard]] constexpr Coord operator-(Coord rhs) const;

    constexpr Coord &operator+=(Coord rhs);
    constexpr Coord &operator-=(Coord rhs);

    [[nodiscard]] constexpr bool operator==(const Coord &) const = default;

    /// @brief Largest axis value, used for domain checks.
    [[nodiscard]] constexpr core::u8 maxAxis() const;

    static constexpr Coord zero();
    static constexpr Coord unitX();
    static constexpr Coord unitY();
    static constexpr Coord unitZ();
};

inline std::ostream &operator<<(std::ostream &os, Coord c);

} // namespace svo::math

    #include "Coord.inl"

#endif // SVO_MATH_COORD_HPP
