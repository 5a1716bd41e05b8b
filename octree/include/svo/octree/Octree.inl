/**
 * @file Octree.inl
 * @brief Template implementation of the sparse voxel octree.
 * @see   Octree.hpp
 */

#ifndef SVO_OCTREE_OCTREE_INL
    #define SVO_OCTREE_OCTREE_INL

    #include "Octant.hpp"

    #include <svo/core/Assert.hpp>
    #include <svo/core/Format.hpp>
    #include <svo/core/Log.hpp>

    #include <utility>

namespace svo::octree {

namespace detail {

inline void appendLine(std::string &out, core::usize depth, std::string_view line)
{
    if (!out.empty())
        out += '\n';
    out.append(depth * core::kDumpIndentWidth, ' ');
    out += line;
}

} // namespace detail

template <core::VoxelValue V, core::u8 HalfWidth>
Octree<V, HalfWidth>::Octree()
    : Octree(Config{})
{
}

template <core::VoxelValue V, core::u8 HalfWidth>
Octree<V, HalfWidth>::Octree(const Config &config)
    : _config(config)
    , _nodes(config.reserveNodes())
    , _leaves(config.reserveLeaves())
{
    const memory::Handle root = _nodes.insert(MixedNode{});
    SVO_VERIFY(root == kRootHandle);
}

// ========================================================================== //
//  Public operations                                                         //
// ========================================================================== //

template <core::VoxelValue V, core::u8 HalfWidth>
core::Expected<std::optional<V>> Octree<V, HalfWidth>::get(math::Coord pos) const
{
    SVO_TRY_VOID(checkPosition(pos, "get"));

    memory::Handle current = kRootHandle;
    core::u8 halfWidth = HalfWidth;
    for (;;) {
        const Node &node = _nodes[current];
        if (const auto *full = std::get_if<FullNode>(&node))
            return std::optional<V>{_leaves[full->leaf]};

        const core::u8 octant = octantIndex(pos, halfWidth);
        const memory::Handle child = std::get<MixedNode>(node).children[octant];
        if (child == memory::kNullHandle)
            return std::optional<V>{};
        if (halfWidth == 1)
            return std::optional<V>{_leaves[child]};

        halfWidth /= 2;
        current = child;
    }
}

template <core::VoxelValue V, core::u8 HalfWidth>
core::ExpectedVoid Octree<V, HalfWidth>::insert(math::Coord pos, V value)
{
    SVO_TRY_VOID(checkPosition(pos, "insert"));

    memory::Handle current = kRootHandle;
    core::u8 halfWidth = HalfWidth;
    for (;;) {
        // Copy: the arenas below may reallocate while this node is rewritten.
        const Node node = _nodes[current];

        if (const auto *full = std::get_if<FullNode>(&node)) {
            const V &majority = _leaves[full->leaf];
            if (majority == value)
                return {};

            const core::u8 octant = octantIndex(pos, halfWidth);
            const V previous = majority;
            const ChildArray children = buildSplit(previous, octant, &value, pos, halfWidth);
            _leaves.remove(full->leaf);
            _nodes[current] = MixedNode{children};
            trace("split full node ", current, " (half-width ", unsigned{halfWidth}, ") at octant ", unsigned{octant});
            return {};
        }

        const ChildArray &children = std::get<MixedNode>(node).children;
        const core::u8 octant = octantIndex(pos, halfWidth);

        if (wouldBecomeFull(children, octant, value, pos, halfWidth)) {
            freeChildren(children, halfWidth);
            _nodes[current] = FullNode{_leaves.insert(std::move(value))};
            trace("collapsed node ", current, " (half-width ", unsigned{halfWidth}, ") into a full node");
            return {};
        }

        const memory::Handle child = children[octant];
        if (child == memory::kNullHandle) {
            const memory::Handle branch = buildPath(pos, value, halfWidth);
            std::get<MixedNode>(_nodes[current]).children[octant] = branch;
            trace("attached new branch ", branch, " under node ", current, " at octant ", unsigned{octant});
            return {};
        }

        if (halfWidth == 1) {
            trace("edit leaf ", child, ": ", _leaves[child], " -> ", value);
            _leaves[child] = std::move(value);
            return {};
        }

        halfWidth /= 2;
        current = child;
    }
}

template <core::VoxelValue V, core::u8 HalfWidth>
core::Expected<std::optional<V>> Octree<V, HalfWidth>::remove(math::Coord pos)
{
    SVO_TRY_VOID(checkPosition(pos, "remove"));

    Path path{};
    core::usize depth = 0;
    memory::Handle current = kRootHandle;
    core::u8 halfWidth = HalfWidth;
    for (;;) {
        const Node node = _nodes[current];
        const core::u8 octant = octantIndex(pos, halfWidth);

        if (const auto *full = std::get_if<FullNode>(&node)) {
            V previous = _leaves[full->leaf];
            const ChildArray children = buildSplit(previous, octant, nullptr, pos, halfWidth);
            _leaves.remove(full->leaf);
            _nodes[current] = MixedNode{children};
            trace("split full node ", current, " (half-width ", unsigned{halfWidth}, ") around a hole at octant ",
                  unsigned{octant});
            return std::optional<V>{std::move(previous)};
        }

        const memory::Handle child = std::get<MixedNode>(node).children[octant];
        if (child == memory::kNullHandle)
            return std::optional<V>{};

        SVO_ASSERT(depth < path.size());
        path[depth++] = PathStep{current, octant};

        if (halfWidth == 1) {
            V previous = _leaves.remove(child);
            std::get<MixedNode>(_nodes[current]).children[octant] = memory::kNullHandle;
            pruneEmptyBranch(path, depth);
            return std::optional<V>{std::move(previous)};
        }

        halfWidth /= 2;
        current = child;
    }
}

template <core::VoxelValue V, core::u8 HalfWidth>
core::Expected<V *> Octree<V, HalfWidth>::getMut(math::Coord pos)
{
    SVO_TRY_VOID(checkPosition(pos, "getMut"));
    return core::makeError(core::ErrorCode::kNotSupported, "getMut is not supported, use insert()");
}

template <core::VoxelValue V, core::u8 HalfWidth>
std::string Octree<V, HalfWidth>::toString() const
{
    std::string out;
    dumpNode(out, kRootHandle, HalfWidth, 0, "");
    return out;
}

template <core::VoxelValue V, core::u8 HalfWidth>
void Octree<V, HalfWidth>::print(std::ostream &os) const
{
    os << toString() << '\n';
}

// ========================================================================== //
//  Internals                                                                 //
// ========================================================================== //

template <core::VoxelValue V, core::u8 HalfWidth>
core::ExpectedVoid Octree<V, HalfWidth>::checkPosition(math::Coord pos, std::string_view operation) const
{
    if (SVO_LIKELY(inDomain(pos, kWidth)))
        return {};

    std::string message = core::concat(operation, " rejected position ", pos, ": axes must lie in [0, ", kWidth, ")");
    core::Log::warn("OCTREE", message);
    return core::makeError(core::ErrorCode::kInvalidPosition, std::move(message));
}

template <core::VoxelValue V, core::u8 HalfWidth>
const V *Octree<V, HalfWidth>::uniformValue(memory::Handle node) const
{
    const auto *full = std::get_if<FullNode>(&_nodes[node]);
    return full ? &_leaves[full->leaf] : nullptr;
}

template <core::VoxelValue V, core::u8 HalfWidth>
bool Octree<V, HalfWidth>::wouldBecomeFull(const ChildArray &children, core::u8 octant, const V &value,
                                           math::Coord pos, core::u8 halfWidth) const
{
    if (halfWidth == 1) {
        // The target leaf is overwritten; every sibling must already hold value.
        for (core::u8 i = 0; i < core::kOctantCount; ++i) {
            if (i == octant)
                continue;
            if (children[i] == memory::kNullHandle || _leaves[children[i]] != value)
                return false;
        }
        return true;
    }

    for (core::u8 i = 0; i < core::kOctantCount; ++i) {
        if (i == octant)
            continue;
        if (children[i] == memory::kNullHandle)
            return false;
        const V *uniform = uniformValue(children[i]);
        if (!uniform || *uniform != value)
            return false;
    }

    const memory::Handle target = children[octant];
    if (target == memory::kNullHandle)
        return false;

    const Node &node = _nodes[target];
    if (const auto *full = std::get_if<FullNode>(&node))
        return _leaves[full->leaf] == value;

    const core::u8 childHalfWidth = halfWidth / 2;
    const core::u8 childOctant = octantIndex(pos, childHalfWidth);
    return wouldBecomeFull(std::get<MixedNode>(node).children, childOctant, value, pos, childHalfWidth);
}

template <core::VoxelValue V, core::u8 HalfWidth>
void Octree<V, HalfWidth>::freeChildren(const ChildArray &children, core::u8 halfWidth)
{
    for (const memory::Handle child : children) {
        if (child == memory::kNullHandle)
            continue;
        if (halfWidth == 1) {
            _leaves.remove(child);
            continue;
        }

        const Node node = _nodes.remove(child);
        if (const auto *full = std::get_if<FullNode>(&node))
            _leaves.remove(full->leaf);
        else
            freeChildren(std::get<MixedNode>(node).children, halfWidth / 2);
    }
}

template <core::VoxelValue V, core::u8 HalfWidth>
ChildArray Octree<V, HalfWidth>::buildSplit(const V &majority, core::u8 octant, const V *divergent,
                                            math::Coord pos, core::u8 halfWidth)
{
    ChildArray children = emptyChildren();

    if (halfWidth == 1) {
        for (core::u8 i = 0; i < core::kOctantCount; ++i) {
            if (i != octant)
                children[i] = _leaves.insert(majority);
            else if (divergent)
                children[i] = _leaves.insert(*divergent);
        }
        return children;
    }

    const core::u8 childHalfWidth = halfWidth / 2;
    for (core::u8 i = 0; i < core::kOctantCount; ++i) {
        if (i != octant) {
            children[i] = _nodes.insert(FullNode{_leaves.insert(majority)});
            continue;
        }
        const core::u8 childOctant = octantIndex(pos, childHalfWidth);
        const ChildArray grandChildren = buildSplit(majority, childOctant, divergent, pos, childHalfWidth);
        children[i] = _nodes.insert(MixedNode{grandChildren});
    }
    return children;
}

template <core::VoxelValue V, core::u8 HalfWidth>
memory::Handle Octree<V, HalfWidth>::buildPath(math::Coord pos, const V &value, core::u8 halfWidth)
{
    if (halfWidth == 1)
        return _leaves.insert(value);

    const core::u8 childHalfWidth = halfWidth / 2;
    const core::u8 octant = octantIndex(pos, childHalfWidth);
    const memory::Handle child = buildPath(pos, value, childHalfWidth);
    return _nodes.insert(MixedNode::single(octant, child));
}

template <core::VoxelValue V, core::u8 HalfWidth>
void Octree<V, HalfWidth>::pruneEmptyBranch(const Path &path, core::usize depth)
{
    // path[0] is the root, which stays even when empty.
    for (core::usize d = depth - 1; d > 0; --d) {
        const memory::Handle node = path[d].node;
        if (!std::get<MixedNode>(_nodes[node]).isEmpty())
            return;

        _nodes.remove(node);
        const PathStep &parent = path[d - 1];
        std::get<MixedNode>(_nodes[parent.node]).children[parent.octant] = memory::kNullHandle;
        trace("pruned empty node ", node, " from node ", parent.node, " at octant ", unsigned{parent.octant});
    }
}

template <core::VoxelValue V, core::u8 HalfWidth>
void Octree<V, HalfWidth>::dumpNode(std::string &out, memory::Handle handle, core::u8 halfWidth,
                                    core::usize depth, std::string_view prefix) const
{
    detail::appendLine(out, depth, core::concat(prefix, "Node ", handle, " (", unsigned{halfWidth}, "):"));

    const Node &node = _nodes[handle];
    if (const auto *full = std::get_if<FullNode>(&node)) {
        detail::appendLine(out, depth + 1, "All: " + core::concat(_leaves[full->leaf]));
        return;
    }

    std::string empties;
    const ChildArray &children = std::get<MixedNode>(node).children;
    for (core::u8 i = 0; i < core::kOctantCount; ++i) {
        const memory::Handle child = children[i];
        if (child == memory::kNullHandle) {
            empties += core::concat(empties.empty() ? "" : ", ", unsigned{i});
        } else if (halfWidth == 1) {
            detail::appendLine(out, depth + 1, core::concat(unsigned{i}, ": Leaf: ", _leaves[child]));
        } else {
            dumpNode(out, child, static_cast<core::u8>(halfWidth / 2), depth + 1, core::concat(unsigned{i}, ": "));
        }
    }
    if (!empties.empty())
        detail::appendLine(out, depth + 1, empties + ": Empty");
}

template <core::VoxelValue V, core::u8 HalfWidth>
template <typename... Args>
void Octree<V, HalfWidth>::trace(const Args &...args) const
{
    if (!_config.traceOperations() || !core::Log::enabled(core::LogLevel::kDebug))
        return;
    core::Log::debug("OCTREE", core::concat(args...));
}

} // namespace svo::octree

#endif // SVO_OCTREE_OCTREE_INL
