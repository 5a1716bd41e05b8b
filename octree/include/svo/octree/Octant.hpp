/**
 * @file Octant.hpp
 * @brief Octant addressing used on every level of an octree descent.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SVO_OCTREE_OCTANT_HPP
    #define SVO_OCTREE_OCTANT_HPP

    #include <svo/core/Platform.hpp>
    #include <svo/core/Types.hpp>
    #include <svo/math/Coord.hpp>

namespace svo::octree {

/**
 * @brief Select the octant of @p pos inside a node of half-width
 *        @p halfWidth and rebase @p pos into that octant's frame.
 *
 * Each axis at or above @p halfWidth sets one bit of the index (x = 4,
 * y = 2, z = 1) and has @p halfWidth subtracted from it.  Callers that
 * still need the unrebased position must copy it first.
 *
 * @return Octant index in [0, 8).
 */
[[nodiscard]] SVO_FORCEINLINE constexpr core::u8 octantIndex(math::Coord &pos, core::u8 halfWidth)
{
    core::u8 index = 0;
    if (pos.x >= halfWidth) {
        index |= 0b100;
        pos.x = static_cast<core::u8>(pos.x - halfWidth);
    }
    if (pos.y >= halfWidth) {
        index |= 0b010;
        pos.y = static_cast<core::u8>(pos.y - halfWidth);
    }
    if (pos.z >= halfWidth) {
        index |= 0b001;
        pos.z = static_cast<core::u8>(pos.z - halfWidth);
    }
    return index;
}

/**
 * @brief Whether every axis of @p pos lies in [0, width).
 */
[[nodiscard]] constexpr bool inDomain(math::Coord pos, core::u16 width)
{
    return static_cast<core::u16>(pos.maxAxis()) < width;
}

} // namespace svo::octree

#endif // SVO_OCTREE_OCTANT_HPP
