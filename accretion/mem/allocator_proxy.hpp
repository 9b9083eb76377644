/*******************************************************************************
 * accretion/mem/allocator_proxy.hpp
 *
 * Part of Project Accretion
 *
 * Copyright (C) 2026 The Accretion Authors
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef ACCRETION_MEM_ALLOCATOR_PROXY_HEADER
#define ACCRETION_MEM_ALLOCATOR_PROXY_HEADER

#include <accretion/mem/counter_bank.hpp>
#include <accretion/mem/profile_gate.hpp>

#include <cstddef>

namespace accretion {
namespace mem {

/*!
 * AllocatorProxy forwards every request unchanged to an Underlying allocator
 * and, if the ProfileGate reads enabled at the time of the call, records the
 * size delta in a CounterBank. Failed requests (nullptr results) are passed
 * through without bookkeeping.
 *
 * Underlying must provide
 * \code
 * void* Allocate(size_t size, size_t alignment);
 * void* AllocateZeroed(size_t size, size_t alignment);
 * void* Reallocate(void* ptr, size_t old_size, size_t new_size, size_t alignment);
 * void Deallocate(void* ptr, size_t size, size_t alignment);
 * size_t AccountedSize(const void* ptr, size_t requested) const;
 * \endcode
 *
 * AccountedSize() yields the number of bytes booked for a block: either the
 * requested size, or the real block size if the Underlying allocator cannot be
 * told the size on deallocation (e.g. the libc free()).
 *
 * No method allocates, logs, or blocks on its own account.
 */
template <typename Underlying>
class AllocatorProxy
{
public:
    constexpr AllocatorProxy(
        ProfileGate& gate, CounterBank& counters,
        const Underlying& underlying = Underlying()) noexcept
        : gate_(gate), counters_(counters), underlying_(underlying) { }

    void * Allocate(size_t size, size_t alignment) {
        void* ptr = underlying_.Allocate(size, alignment);
        if (ptr && gate_.IsEnabled())
            counters_.OnAlloc(underlying_.AccountedSize(ptr, size));
        return ptr;
    }

    //! zero-fill is done by the Underlying allocator, bookkeeping is the same
    //! as Allocate().
    void * AllocateZeroed(size_t size, size_t alignment) {
        void* ptr = underlying_.AllocateZeroed(size, alignment);
        if (ptr && gate_.IsEnabled())
            counters_.OnAlloc(underlying_.AccountedSize(ptr, size));
        return ptr;
    }

    //! size must be the size the block was allocated with
    void Deallocate(void* ptr, size_t size, size_t alignment) {
        if (!ptr) return;
        // the block size can only be queried before releasing it
        if (gate_.IsEnabled())
            counters_.OnDealloc(underlying_.AccountedSize(ptr, size));
        underlying_.Deallocate(ptr, size, alignment);
    }

    //! On failure the old block remains valid and nothing is recorded.
    void * Reallocate(void* ptr, size_t old_size, size_t new_size,
                      size_t alignment) {
        // the old block size is only queried if the call is booked
        bool enabled = gate_.IsEnabled();
        size_t old_accounted =
            enabled ? underlying_.AccountedSize(ptr, old_size) : 0;
        void* out = underlying_.Reallocate(ptr, old_size, new_size, alignment);
        if (out && enabled) {
            counters_.OnRealloc(
                old_accounted, underlying_.AccountedSize(out, new_size));
        }
        return out;
    }

    //! number of bytes booked for the block ptr
    size_t AccountedSize(const void* ptr, size_t requested) const {
        return underlying_.AccountedSize(ptr, requested);
    }

    ProfileGate& gate() const { return gate_; }

    CounterBank& counters() const { return counters_; }

    Underlying& underlying() { return underlying_; }

private:
    ProfileGate& gate_;
    CounterBank& counters_;
    Underlying underlying_;
};

} // namespace mem
} // namespace accretion

#endif // !ACCRETION_MEM_ALLOCATOR_PROXY_HEADER

/******************************************************************************/
