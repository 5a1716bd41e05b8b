/**
 * @file SlotArena.inl
 * @brief Template implementation of SlotArena.
 * @see   SlotArena.hpp
 */

#ifndef SVO_MEMORY_SLOT_ARENA_INL
    #define SVO_MEMORY_SLOT_ARENA_INL

    #include <svo/core/Assert.hpp>
    #include <svo/core/Format.hpp>
    #include <svo/core/Log.hpp>

    #include <utility>

namespace svo::memory {

template <core::Slottable T>
SlotArena<T>::SlotArena(core::usize capacity)
{
    reserve(capacity);
}

template <core::Slottable T>
Handle SlotArena<T>::insert(T value)
{
    if (!_freeList.empty()) {
        const Handle handle = _freeList.back();
        _freeList.pop_back();
        _slots[handle].emplace(std::move(value));
        ++_live;
        return handle;
    }

    SVO_VERIFY(_slots.size() < kNullHandle);
    _slots.emplace_back(std::in_place, std::move(value));
    ++_live;
    return static_cast<Handle>(_slots.size() - 1);
}

template <core::Slottable T>
T SlotArena<T>::remove(Handle handle)
{
    if (auto status = validate(handle); !status.has_value()) [[unlikely]]
        fault(handle, status.error());

    T value = std::move(*_slots[handle]);
    _slots[handle].reset();
    _freeList.push_back(handle);
    --_live;
    return value;
}

template <core::Slottable T>
T &SlotArena<T>::operator[](Handle handle)
{
    if (auto status = validate(handle); !status.has_value()) [[unlikely]]
        fault(handle, status.error());
    return *_slots[handle];
}

template <core::Slottable T>
const T &SlotArena<T>::operator[](Handle handle) const
{
    return const_cast<SlotArena *>(this)->operator[](handle);
}

template <core::Slottable T>
core::ExpectedVoid SlotArena<T>::validate(Handle handle) const
{
    if (handle >= _slots.size())
        return core::makeError(core::ErrorCode::kOutOfBounds,
                               core::concat("handle ", handle, " was never issued (capacity ", _slots.size(), ")"));
    if (!_slots[handle].has_value())
        return core::makeError(core::ErrorCode::kStaleHandle,
                               core::concat("handle ", handle, " refers to a freed slot"));
    return {};
}

template <core::Slottable T>
T *SlotArena<T>::find(Handle handle)
{
    if (handle >= _slots.size() || !_slots[handle].has_value())
        return nullptr;
    return &*_slots[handle];
}

template <core::Slottable T>
const T *SlotArena<T>::find(Handle handle) const
{
    return const_cast<SlotArena *>(this)->find(handle);
}

template <core::Slottable T>
void SlotArena<T>::reserve(core::usize capacity)
{
    _slots.reserve(capacity);
}

template <core::Slottable T>
void SlotArena<T>::clear()
{
    _slots.clear();
    _freeList.clear();
    _live = 0;
}

template <core::Slottable T>
void SlotArena<T>::fault(Handle handle, const core::Error &error) const
{
    core::Log::fatal("ARENA", core::concat(core::toString(error.code()), " on handle ", handle, ": ", error.message()));
    core::detail::assertFail("arena handle is live");
}

} // namespace svo::memory

#endif // SVO_MEMORY_SLOT_ARENA_INL
