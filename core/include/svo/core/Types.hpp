/**
 * @file Types.hpp
 * @brief Primitive type aliases shared by every svo module.
 *
 * Provides fixed-width integer aliases and the size aliases used for
 * arena handles, half-widths and octant indices.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SVO_CORE_TYPES_HPP
    #define SVO_CORE_TYPES_HPP

    #include <cstddef>
    #include <cstdint>

namespace svo::core {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using usize = std::size_t;
using isize = std::ptrdiff_t;

} // namespace svo::core

#endif // SVO_CORE_TYPES_HPP
