/*******************************************************************************
 * accretion/common/atomic_max.hpp
 *
 * Lock-free maximum update of an atomic value.
 *
 * Part of Project Accretion
 *
 * Copyright (C) 2026 The Accretion Authors
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef ACCRETION_COMMON_ATOMIC_MAX_HEADER
#define ACCRETION_COMMON_ATOMIC_MAX_HEADER

#include <atomic>

namespace accretion {
namespace common {

/*!
 * Atomically raise target to value, if value is larger than the currently
 * stored value. This is a compare-and-swap retry loop: when another thread
 * changed target concurrently, compare_exchange_weak() reloads the new current
 * value and the comparison is repeated. Hence the stored value is always the
 * maximum of all values passed to this function, and no larger value is ever
 * overwritten by a smaller one.
 *
 * Returns true if this call replaced the stored value.
 */
template <typename Type>
inline bool AtomicRaiseMax(
    std::atomic<Type>& target, const Type& value,
    std::memory_order order = std::memory_order_relaxed) noexcept {

    Type current = target.load(std::memory_order_relaxed);
    while (value > current) {
        if (target.compare_exchange_weak(
                current, value, order, std::memory_order_relaxed))
            return true;
    }
    return false;
}

} // namespace common
} // namespace accretion

#endif // !ACCRETION_COMMON_ATOMIC_MAX_HEADER

/******************************************************************************/
