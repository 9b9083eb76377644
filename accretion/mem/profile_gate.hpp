/*******************************************************************************
 * accretion/mem/profile_gate.hpp
 *
 * Part of Project Accretion
 *
 * Copyright (C) 2026 The Accretion Authors
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef ACCRETION_MEM_PROFILE_GATE_HEADER
#define ACCRETION_MEM_PROFILE_GATE_HEADER

#include <atomic>

namespace accretion {
namespace mem {

/*!
 * Boolean switch which decides whether allocator calls perform bookkeeping. It
 * is read on every allocator call and written rarely, hence relaxed ordering: a
 * call racing with a transition may be counted or not.
 */
class ProfileGate
{
public:
    constexpr ProfileGate() noexcept = default;

    //! non-copyable: process-wide state
    ProfileGate(const ProfileGate&) = delete;
    //! non-copyable: process-wide state
    ProfileGate& operator = (const ProfileGate&) = delete;

    //! start or stop bookkeeping from now on
    void Enable(bool enabled) noexcept {
        enabled_.store(enabled, std::memory_order_relaxed);
    }

    //! current gate value
    bool IsEnabled() const noexcept {
        return enabled_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<bool> enabled_ { false };
};

} // namespace mem
} // namespace accretion

#endif // !ACCRETION_MEM_PROFILE_GATE_HEADER

/******************************************************************************/
