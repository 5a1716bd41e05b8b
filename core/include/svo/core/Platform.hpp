/**
 * @file Platform.hpp
 * @brief Compile-time compiler detection and portability macros.
 *
 * Detects the compiler at preprocessing time and provides branch-prediction
 * hints and forced inlining used on the octree descent paths.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SVO_CORE_PLATFORM_HPP
    #define SVO_CORE_PLATFORM_HPP

// ---- Compiler ------------------------------------------------------------

    #if defined(__clang__)
        #define SVO_COMPILER_CLANG 1
    #elif defined(__GNUC__)
        #define SVO_COMPILER_GCC   1
    #elif defined(_MSC_VER)
        #define SVO_COMPILER_MSVC  1
    #else
        #define SVO_COMPILER_UNKNOWN 1
    #endif

// ---- Intrinsics ----------------------------------------------------------

    #if defined(SVO_COMPILER_GCC) || defined(SVO_COMPILER_CLANG)
        #define SVO_LIKELY(x)       __builtin_expect(!!(x), 1)
        #define SVO_UNLIKELY(x)     __builtin_expect(!!(x), 0)
        #define SVO_FORCEINLINE     inline __attribute__((always_inline))
    #elif defined(SVO_COMPILER_MSVC)
        #define SVO_LIKELY(x)       (x)
        #define SVO_UNLIKELY(x)     (x)
        #define SVO_FORCEINLINE     __forceinline
    #else
        #define SVO_LIKELY(x)       (x)
        #define SVO_UNLIKELY(x)     (x)
        #define SVO_FORCEINLINE     inline
    #endif

#endif // SVO_CORE_PLATFORM_HPP
