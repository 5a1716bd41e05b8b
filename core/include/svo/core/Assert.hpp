/**
 * @file Assert.hpp
 * @brief Debug assertions and contract-checking macros with source location.
 *
 * Provides SVO_ASSERT (debug-only) and SVO_VERIFY (always evaluated).
 * Both print the failing expression with its file, line and function
 * before aborting.  In release builds SVO_ASSERT is a no-op.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SVO_CORE_ASSERT_HPP
    #define SVO_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace svo::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[SVO ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), static_cast<unsigned>(loc.line()), loc.function_name(), expr
    );
    std::abort();
}

} // namespace svo::core::detail

    #ifdef SVO_DEBUG
        #define SVO_ASSERT(cond)                                          \
            do {                                                           \
                if (SVO_UNLIKELY(!(cond)))                                 \
                    ::svo::core::detail::assertFail(#cond);                \
            } while (false)
    #else
        #define SVO_ASSERT(cond) ((void)0)
    #endif

    #define SVO_VERIFY(cond)                                              \
        do {                                                               \
            if (SVO_UNLIKELY(!(cond)))                                     \
                ::svo::core::detail::assertFail(#cond);                    \
        } while (false)

#endif // SVO_CORE_ASSERT_HPP
