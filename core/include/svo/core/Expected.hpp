/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * SVO_TRY_VOID macro for early-return propagation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SVO_CORE_EXPECTED_HPP
    #define SVO_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace svo::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace svo::core

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type svo::core::ExpectedVoid.
 */
#define SVO_TRY_VOID(expr)                                                \
    do {                                                                    \
        auto &&_svo_result = (expr);                                       \
        if (!_svo_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_svo_result.error()));         \
    } while (false)

#endif // SVO_CORE_EXPECTED_HPP
