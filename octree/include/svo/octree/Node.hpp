/**
 * @file Node.hpp
 * @brief Octree node representation: Full (uniform) or Mixed (8 octants).
 *
 * Nodes never own their children directly.  Every reference is a
 * memory::Handle into one of the two arenas held by the Octree:
 *   - FullNode::leaf indexes the leaf arena;
 *   - MixedNode::children index the node arena, except at half-width 1
 *     where they index the leaf arena.
 * A kNullHandle child marks an unset octant.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SVO_OCTREE_NODE_HPP
    #define SVO_OCTREE_NODE_HPP

    #include <svo/core/Constants.hpp>
    #include <svo/memory/SlotArena.hpp>

    #include <algorithm>
    #include <array>
    #include <variant>

namespace svo::octree {

/// @brief One handle per octant, ordered by (x, y, z) threshold bits.
using ChildArray = std::array<memory::Handle, core::kOctantCount>;

[[nodiscard]] constexpr ChildArray emptyChildren()
{
    ChildArray children{};
    children.fill(memory::kNullHandle);
    return children;
}

/**
 * @brief The whole volume of the node holds one value.
 */
struct FullNode final {
    memory::Handle leaf = memory::kNullHandle;
};

/**
 * @brief Eight independent octants, each unset, a node, or a leaf.
 */
struct MixedNode final {
    ChildArray children = emptyChildren();

    /// @brief Mixed node with a single populated octant.
    [[nodiscard]] static constexpr MixedNode single(core::u8 octant, memory::Handle child)
    {
        MixedNode node;
        node.children[octant] = child;
        return node;
    }

    [[nodiscard]] constexpr bool isEmpty() const
    {
        return std::ranges::all_of(children, [](memory::Handle h) { return h == memory::kNullHandle; });
    }
};

using Node = std::variant<FullNode, MixedNode>;

} // namespace svo::octree

#endif // SVO_OCTREE_NODE_HPP
