/**
 * @file Format.hpp
 * @brief Stream-based message composition for logs and error messages.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SVO_CORE_FORMAT_HPP
    #define SVO_CORE_FORMAT_HPP

    #include <sstream>
    #include <string>

namespace svo::core {

/**
 * @brief Concatenate the operator<< renderings of @p args.
 *
 * Narrow integer types render as characters; widen them first.
 */
template <typename... Args>
[[nodiscard]] std::string concat(const Args &...args)
{
    std::ostringstream os;
    (os << ... << args);
    return os.str();
}

} // namespace svo::core

#endif // SVO_CORE_FORMAT_HPP
