/**
 * @file Constants.hpp
 * @brief Library-wide compile-time constants.
 *
 * Default arena reservations, the dump layout, and the octree size limits
 * are centralised here.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SVO_CORE_CONSTANTS_HPP
    #define SVO_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace svo::core {

inline constexpr u8    kOctantCount          = 8;
inline constexpr u32   kMaxHalfWidth         = 128;
inline constexpr u32   kMaxDepth             = 8;

inline constexpr usize kDefaultNodeReserve   = 64;
inline constexpr usize kDefaultLeafReserve   = 64;

inline constexpr usize kDumpIndentWidth      = 3;

} // namespace svo::core

#endif // SVO_CORE_CONSTANTS_HPP
