/**
 * @file Octree.hpp
 * @brief Compact sparse voxel octree with uniform-region collapsing.
 *
 * Stores one value per unit voxel of a cube of side 2 * HalfWidth.  Any
 * subtree whose voxels all hold the same value is collapsed into a single
 * Full node backed by one leaf; writing a different value into a Full
 * node splits it again.  Nodes and leaf values live in two SlotArenas and
 * reference each other by handle; the root is always node handle 0.
 *
 * The tree is not synchronised: callers serialise all access.
 *
 * @tparam V         Voxel payload type.
 * @tparam HalfWidth Half the side of the cube, a power of two in [1, 128].
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SVO_OCTREE_OCTREE_HPP
    #define SVO_OCTREE_OCTREE_HPP

    #include "Config.hpp"
    #include "Node.hpp"

    #include <svo/core/Concepts.hpp>
    #include <svo/core/Constants.hpp>
    #include <svo/core/Expected.hpp>
    #include <svo/math/Coord.hpp>
    #include <svo/memory/SlotArena.hpp>

    #include <array>
    #include <iostream>
    #include <optional>
    #include <string>
    #include <string_view>

namespace svo::octree {

template <core::VoxelValue V, core::u8 HalfWidth>
class Octree final {
    static_assert(HalfWidth >= 1 && HalfWidth <= core::kMaxHalfWidth, "HalfWidth must lie in [1, 128]");
    static_assert((HalfWidth & (HalfWidth - 1)) == 0, "HalfWidth must be a power of two");

public:
    using value_type = V;

    /// @brief Side length of the cube; every axis must be below it.
    static constexpr core::u16 kWidth = static_cast<core::u16>(2 * HalfWidth);

    /// @brief The root is allocated first and never freed.
    static constexpr memory::Handle kRootHandle = 0;

    Octree();
    explicit Octree(const Config &config);

    /**
     * @brief Read one voxel.
     * @return The stored value, nullopt if the voxel was never set, or
     *         kInvalidPosition for an out-of-domain position.
     */
    [[nodiscard]] core::Expected<std::optional<V>> get(math::Coord pos) const;

    /**
     * @brief Set or overwrite one voxel.
     *
     * Re-inserting the stored value is a no-op.  May split a Full node
     * or collapse a Mixed node that becomes uniform.
     *
     * @return kInvalidPosition for an out-of-domain position.
     */
    core::ExpectedVoid insert(math::Coord pos, V value);

    /**
     * @brief Clear one voxel.
     *
     * A Full node containing @p pos is split around the hole; Mixed nodes
     * left without any child are freed up to (but excluding) the root.
     *
     * @return The removed value, nullopt if the voxel was unset, or
     *         kInvalidPosition for an out-of-domain position.
     */
    core::Expected<std::optional<V>> remove(math::Coord pos);

    /**
     * @brief In-place mutable access.  Not supported: a Full leaf is shared
     *        by its whole region and an in-place edit could leave a uniform
     *        Mixed node behind.
     * @return Always kNotSupported (kInvalidPosition if out of domain).
     */
    [[nodiscard]] core::Expected<V *> getMut(math::Coord pos);

    /// @brief Depth-first, index-ascending dump of the tree.
    [[nodiscard]] std::string toString() const;

    /// @brief Write toString() followed by a newline.
    void print(std::ostream &os = std::cout) const;

    [[nodiscard]] core::usize nodeCount() const { return _nodes.size(); }
    [[nodiscard]] core::usize leafCount() const { return _leaves.size(); }
    [[nodiscard]] const Config &config() const { return _config; }

private:
    struct PathStep {
        memory::Handle node   = memory::kNullHandle;
        core::u8       octant = 0;
    };

    using Path = std::array<PathStep, core::kMaxDepth>;

    [[nodiscard]] core::ExpectedVoid checkPosition(math::Coord pos, std::string_view operation) const;

    /// @brief Value of a Full node, nullptr for a Mixed node.
    [[nodiscard]] const V *uniformValue(memory::Handle node) const;

    [[nodiscard]] bool wouldBecomeFull(const ChildArray &children, core::u8 octant, const V &value,
                                       math::Coord pos, core::u8 halfWidth) const;

    void freeChildren(const ChildArray &children, core::u8 halfWidth);

    /// @brief Children replacing a Full node of value @p majority.  The
    ///        octant branch ends in @p divergent, or in a hole when null.
    [[nodiscard]] ChildArray buildSplit(const V &majority, core::u8 octant, const V *divergent,
                                        math::Coord pos, core::u8 halfWidth);

    /// @brief Handle to place in an unset slot of a node of half-width
    ///        @p halfWidth so that it leads to one leaf holding @p value.
    [[nodiscard]] memory::Handle buildPath(math::Coord pos, const V &value, core::u8 halfWidth);

    void pruneEmptyBranch(const Path &path, core::usize depth);

    void dumpNode(std::string &out, memory::Handle handle, core::u8 halfWidth, core::usize depth,
                  std::string_view prefix) const;

    template <typename... Args>
    void trace(const Args &...args) const;

    Config                   _config;
    memory::SlotArena<Node>  _nodes;
    memory::SlotArena<V>     _leaves;
};

} // namespace svo::octree

    #include "Octree.inl"

#endif // SVO_OCTREE_OCTREE_HPP
