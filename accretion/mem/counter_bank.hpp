/*******************************************************************************
 * accretion/mem/counter_bank.hpp
 *
 * Part of Project Accretion
 *
 * Copyright (C) 2026 The Accretion Authors
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef ACCRETION_MEM_COUNTER_BANK_HEADER
#define ACCRETION_MEM_COUNTER_BANK_HEADER

#include <accretion/common/atomic_max.hpp>
#include <accretion/mem/alloc_snapshot.hpp>

#include <atomic>
#include <cstdint>

namespace accretion {
namespace mem {

/*!
 * Fixed set of allocation counters. Every counter is an independent atomic
 * cell updated with relaxed ordering; there is no cross-counter atomicity. The
 * methods only perform atomic operations on these cells, they never allocate
 * or block, and thus are safe to call from inside malloc().
 *
 * live_bytes_ is signed: freeing blocks which were allocated while bookkeeping
 * was off makes it go negative instead of wrapping around.
 */
class CounterBank
{
public:
    constexpr CounterBank() noexcept = default;

    //! non-copyable: process-wide state
    CounterBank(const CounterBank&) = delete;
    //! non-copyable: process-wide state
    CounterBank& operator = (const CounterBank&) = delete;

    //! record a new allocation of size bytes
    void OnAlloc(size_t size) noexcept {
        total_alloc_bytes_.fetch_add(size, std::memory_order_relaxed);
        alloc_calls_.fetch_add(1, std::memory_order_relaxed);
        AddLive(size);
    }

    //! record a deallocation of size bytes
    void OnDealloc(size_t size) noexcept {
        total_dealloc_bytes_.fetch_add(size, std::memory_order_relaxed);
        dealloc_calls_.fetch_add(1, std::memory_order_relaxed);
        SubLive(size);
    }

    //! record a reallocation from old_size to new_size bytes: growth counts as
    //! allocation of the delta, shrinking as deallocation of the delta.
    void OnRealloc(size_t old_size, size_t new_size) noexcept {
        realloc_calls_.fetch_add(1, std::memory_order_relaxed);
        if (new_size >= old_size) {
            size_t delta = new_size - old_size;
            total_alloc_bytes_.fetch_add(delta, std::memory_order_relaxed);
            AddLive(delta);
        }
        else {
            size_t delta = old_size - new_size;
            total_dealloc_bytes_.fetch_add(delta, std::memory_order_relaxed);
            SubLive(delta);
        }
    }

    //! zero all seven counters, starting a new observation epoch
    void Reset() noexcept {
        live_bytes_.store(0, std::memory_order_relaxed);
        peak_live_bytes_.store(0, std::memory_order_relaxed);
        total_alloc_bytes_.store(0, std::memory_order_relaxed);
        total_dealloc_bytes_.store(0, std::memory_order_relaxed);
        alloc_calls_.store(0, std::memory_order_relaxed);
        dealloc_calls_.store(0, std::memory_order_relaxed);
        realloc_calls_.store(0, std::memory_order_relaxed);
    }

    //! load each counter once
    AllocProfileSnapshot Snapshot() const noexcept {
        AllocProfileSnapshot s;
        s.live_bytes = live_bytes_.load(std::memory_order_relaxed);
        s.peak_live_bytes = peak_live_bytes_.load(std::memory_order_relaxed);
        s.total_alloc_bytes = total_alloc_bytes_.load(std::memory_order_relaxed);
        s.total_dealloc_bytes =
            total_dealloc_bytes_.load(std::memory_order_relaxed);
        s.alloc_calls = alloc_calls_.load(std::memory_order_relaxed);
        s.dealloc_calls = dealloc_calls_.load(std::memory_order_relaxed);
        s.realloc_calls = realloc_calls_.load(std::memory_order_relaxed);
        return s;
    }

private:
    std::atomic<ssize_t> live_bytes_ { 0 };
    std::atomic<ssize_t> peak_live_bytes_ { 0 };
    std::atomic<uint64_t> total_alloc_bytes_ { 0 };
    std::atomic<uint64_t> total_dealloc_bytes_ { 0 };
    std::atomic<uint64_t> alloc_calls_ { 0 };
    std::atomic<uint64_t> dealloc_calls_ { 0 };
    std::atomic<uint64_t> realloc_calls_ { 0 };

    void AddLive(size_t size) noexcept {
        ssize_t inc = static_cast<ssize_t>(size);
        ssize_t live = live_bytes_.fetch_add(inc, std::memory_order_relaxed) + inc;
        common::AtomicRaiseMax(peak_live_bytes_, live);
    }

    void SubLive(size_t size) noexcept {
        live_bytes_.fetch_sub(
            static_cast<ssize_t>(size), std::memory_order_relaxed);
    }
};

} // namespace mem
} // namespace accretion

#endif // !ACCRETION_MEM_COUNTER_BANK_HEADER

/******************************************************************************/
