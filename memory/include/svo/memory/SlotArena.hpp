/**
 * @file SlotArena.hpp
 * @brief Index-addressed slot storage with free-list reuse.
 *
 * Values live in a growable vector of slots and are referred to by a
 * 32-bit handle that stays stable until the slot is freed.  Freed slots
 * are chained into a LIFO free-list and handed out again by the next
 * insert, so insert, remove and access are all O(1).
 *
 * Accessing or freeing a handle that was never issued, or that has already
 * been freed, is a programming error: the fault is logged under the
 * "ARENA" tag and the process aborts.  validate() and find() are the
 * non-fatal probes.
 *
 * @tparam T Stored value type.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SVO_MEMORY_SLOT_ARENA_HPP
    #define SVO_MEMORY_SLOT_ARENA_HPP

    #include <svo/core/Concepts.hpp>
    #include <svo/core/Expected.hpp>
    #include <svo/core/Types.hpp>

    #include <optional>
    #include <vector>

namespace svo::memory {

/// @brief Stable reference to an arena slot.
using Handle = core::u32;

/// @brief Sentinel meaning "no handle".
inline constexpr Handle kNullHandle = ~Handle{0};

/**
 * @brief Growable slot arena.
 * @tparam T Slot payload type.
 */
template <core::Slottable T>
class SlotArena final {
public:
    SlotArena() = default;

    /**
     * @brief Construct an arena with room for @p capacity slots.
     * @param capacity Slots reserved up front (no handle is issued).
     */
    explicit SlotArena(core::usize capacity);

    /**
     * @brief Store a value.
     * @param value Value to move into the slot.
     * @return Handle of the slot, valid until remove().
     */
    [[nodiscard]] Handle insert(T value);

    /**
     * @brief Free a slot and hand its value back.
     * @param handle Live handle.
     * @return The value that was stored.
     */
    T remove(Handle handle);

    [[nodiscard]] T       &operator[](Handle handle);
    [[nodiscard]] const T &operator[](Handle handle) const;

    /**
     * @brief Check a handle without faulting.
     * @return kOutOfBounds if never issued, kStaleHandle if freed.
     */
    [[nodiscard]] core::ExpectedVoid validate(Handle handle) const;

    /**
     * @brief Lookup by handle.
     * @return Pointer to the value, or nullptr for an invalid handle.
     */
    [[nodiscard]] T       *find(Handle handle);
    [[nodiscard]] const T *find(Handle handle) const;

    [[nodiscard]] bool contains(Handle handle) const { return validate(handle).has_value(); }

    /// @brief Number of live slots.
    [[nodiscard]] core::usize size()     const { return _live; }
    /// @brief Number of slots ever created (live and free).
    [[nodiscard]] core::usize capacity() const { return _slots.size(); }
    [[nodiscard]] bool        empty()    const { return _live == 0; }

    void reserve(core::usize capacity);

    /// @brief Free every slot.  All handles become invalid.
    void clear();

private:
    [[noreturn]] void fault(Handle handle, const core::Error &error) const;

    std::vector<std::optional<T>> _slots;
    std::vector<Handle>           _freeList;
    core::usize                   _live = 0;
};

} // namespace svo::memory

    #include "SlotArena.inl"

#endif // SVO_MEMORY_SLOT_ARENA_HPP
