/*******************************************************************************
 * accretion/mem/alloc_snapshot.hpp
 *
 * Point-in-time copy of the allocation counters.
 *
 * Part of Project Accretion
 *
 * Copyright (C) 2026 The Accretion Authors
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef ACCRETION_MEM_ALLOC_SNAPSHOT_HEADER
#define ACCRETION_MEM_ALLOC_SNAPSHOT_HEADER

#include <cstdint>
#include <cstdlib>
#include <ostream>

#if defined(_MSC_VER)
// windows/msvc is a mess.
#include <BaseTsd.h>
using ssize_t = SSIZE_T;
#else
#include <sys/types.h>
#endif

namespace accretion {
namespace mem {

/*!
 * Immutable copy of all seven counters of a CounterBank. The counters are
 * loaded independently, so under concurrent allocation the values need not
 * belong to the same instant, and net_bytes() may transiently disagree with
 * live_bytes or even be negative.
 */
struct AllocProfileSnapshot {
    //! bytes currently allocated and not yet freed
    ssize_t  live_bytes = 0;
    //! highest live_bytes observed since the last reset
    ssize_t  peak_live_bytes = 0;
    //! cumulative allocated bytes
    uint64_t total_alloc_bytes = 0;
    //! cumulative deallocated bytes
    uint64_t total_dealloc_bytes = 0;
    //! number of allocate and allocate-zeroed calls
    uint64_t alloc_calls = 0;
    //! number of deallocate calls
    uint64_t dealloc_calls = 0;
    //! number of reallocate calls
    uint64_t realloc_calls = 0;

    //! total allocated minus total deallocated bytes
    int64_t net_bytes() const {
        return static_cast<int64_t>(total_alloc_bytes)
               - static_cast<int64_t>(total_dealloc_bytes);
    }
};

//! one-line rendering for log output
std::ostream& operator << (std::ostream& os, const AllocProfileSnapshot& s);

//! print a multi-line allocator profile summary block
void PrintAllocProfileSummary(std::ostream& os, const AllocProfileSnapshot& s);

} // namespace mem
} // namespace accretion

#endif // !ACCRETION_MEM_ALLOC_SNAPSHOT_HEADER

/******************************************************************************/
