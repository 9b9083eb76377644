/*******************************************************************************
 * accretion/mem/alloc_profile.hpp
 *
 * Process-wide allocation profiler: control surface of the malloc overlay.
 *
 * Part of Project Accretion
 *
 * Copyright (C) 2026 The Accretion Authors
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef ACCRETION_MEM_ALLOC_PROFILE_HEADER
#define ACCRETION_MEM_ALLOC_PROFILE_HEADER

#include <accretion/mem/alloc_snapshot.hpp>
#include <accretion/mem/allocator_proxy.hpp>
#include <accretion/mem/system_allocator.hpp>

namespace accretion {
namespace mem {

//! the proxy installed as the allocator of the whole process
using SystemAllocatorProxy = AllocatorProxy<SystemAllocator>;

//! access the installed proxy, its gate and its counters
SystemAllocatorProxy& GlobalAllocatorProxy();

//! start or stop bookkeeping of all heap operations from now on
void EnableAllocProfiling(bool enabled);

//! returns whether heap operations are currently booked
bool IsAllocProfilingEnabled();

//! zero all seven counters, starting a new observation epoch
void ResetAllocCounters();

//! returns a point-in-time copy of the counters, does not block or allocate
AllocProfileSnapshot GetAllocSnapshot();

//! returns true for the values "1", "true", "TRUE", "yes" and "YES"
bool ParseAllocProfileFlag(const char* value);

//! read ACCRETION_ALLOC_PROFILE and ACCRETION_ALLOC_PROFILE_REPORT once at
//! startup, and set the gate and the exit report switch accordingly.
void InitAllocProfileFromEnv();

//! print a one-line status to stderr, without allocating
void PrintAllocProfileStatus();

} // namespace mem
} // namespace accretion

#endif // !ACCRETION_MEM_ALLOC_PROFILE_HEADER

/******************************************************************************/
