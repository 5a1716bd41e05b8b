// /////////////////////////////////////////////////////////////////////////////
/// @file Config.hpp
/// @brief Octree configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder.
/// Centralises the per-instance tuning of an Octree.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <svo/core/Constants.hpp>
#include <svo/core/Types.hpp>

namespace svo::octree {

/// @brief Immutable octree configuration.
class Config
{
public:
    /// @brief Fluent builder for Config.
    class Builder
    {
    public:
        /// @brief Node-arena slots reserved at construction.
        Builder& reserveNodes(core::usize n) noexcept;
        /// @brief Leaf-arena slots reserved at construction.
        Builder& reserveLeaves(core::usize n) noexcept;
        /// @brief Log every split, collapse, path build, prune and edit at debug level.
        Builder& traceOperations(bool enabled) noexcept;

        [[nodiscard]] Config build() const noexcept;

    private:
        core::usize reserveNodes_{core::kDefaultNodeReserve};
        core::usize reserveLeaves_{core::kDefaultLeafReserve};
        bool traceOperations_{false};
    };

    [[nodiscard]] core::usize reserveNodes()    const noexcept { return reserveNodes_; }
    [[nodiscard]] core::usize reserveLeaves()   const noexcept { return reserveLeaves_; }
    [[nodiscard]] bool        traceOperations() const noexcept { return traceOperations_; }

private:
    friend class Builder;

    core::usize reserveNodes_{core::kDefaultNodeReserve};
    core::usize reserveLeaves_{core::kDefaultLeafReserve};
    bool traceOperations_{false};
};

} // namespace svo::octree
