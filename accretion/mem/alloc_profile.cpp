/*******************************************************************************
 * accretion/mem/alloc_profile.cpp
 *
 * Installs an AllocatorProxy in front of the libc allocator by exporting the
 * libc heap symbols, and implements the profiler's control surface.
 *
 * Part of Project Accretion
 *
 * Copyright (C) 2026 The Accretion Authors
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#ifndef _GNU_SOURCE
#define _GNU_SOURCE
#endif

#include <accretion/mem/alloc_profile.hpp>
#include <accretion/mem/diagnostics.hpp>
#include <tlx/logger.hpp>

#include <atomic>
#include <cerrno>
#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <malloc.h>
#include <unistd.h>

namespace accretion {
namespace mem {

/******************************************************************************/
// Process-wide profiler state. All three objects are constant-initialized, so
// they are usable by the very first malloc() call of the process.

static ProfileGate s_gate;

static CounterBank s_counters;

static SystemAllocatorProxy s_proxy(s_gate, s_counters);

//! print status line in the destructor
static std::atomic<bool> s_report_at_exit { false };

SystemAllocatorProxy& GlobalAllocatorProxy() {
    return s_proxy;
}

/******************************************************************************/
// Control surface

void EnableAllocProfiling(bool enabled) {
    s_gate.Enable(enabled);
}

bool IsAllocProfilingEnabled() {
    return s_gate.IsEnabled();
}

void ResetAllocCounters() {
    s_counters.Reset();
}

AllocProfileSnapshot GetAllocSnapshot() {
    return s_counters.Snapshot();
}

bool ParseAllocProfileFlag(const char* value) {
    if (!value) return false;

    static const char* const truthy[] = { "1", "true", "TRUE", "yes", "YES" };

    for (const char* t : truthy) {
        if (strcmp(value, t) == 0) return true;
    }
    return false;
}

void InitAllocProfileFromEnv() {
    static constexpr bool debug = false;

    const char* env_profile = getenv("ACCRETION_ALLOC_PROFILE");
    const char* env_report = getenv("ACCRETION_ALLOC_PROFILE_REPORT");

    bool enabled = ParseAllocProfileFlag(env_profile);
    s_report_at_exit.store(
        ParseAllocProfileFlag(env_report), std::memory_order_relaxed);
    s_gate.Enable(enabled);

    LOG << "alloc_profile: ACCRETION_ALLOC_PROFILE="
        << (env_profile ? env_profile : "<unset>")
        << " -> profiling " << (enabled ? "enabled" : "disabled");
}

void PrintAllocProfileStatus() {
    AllocProfileSnapshot s = s_counters.Snapshot();
    fprintf(stderr, ACCRETION_PPREFIX
            "%s, live: %zd, peak: %zd, total: %" PRIu64 " / %" PRIu64 ", "
            "net: %" PRId64 ", "
            "calls: %" PRIu64 " / %" PRIu64 " / %" PRIu64 "\n",
            s_gate.IsEnabled() ? "enabled" : "disabled",
            s.live_bytes, s.peak_live_bytes,
            s.total_alloc_bytes, s.total_dealloc_bytes, s.net_bytes(),
            s.alloc_calls, s.dealloc_calls, s.realloc_calls);
}

static __attribute__ ((destructor)) void FinishAllocProfile() { // NOLINT
    if (s_report_at_exit.load(std::memory_order_relaxed))
        PrintAllocProfileStatus();
}

} // namespace mem
} // namespace accretion

/******************************************************************************/
// exported symbols that overlay the libc functions

using namespace accretion::mem; // NOLINT

//! free() and realloc() are not told the size of the block: SystemAllocator
//! looks it up itself and ignores the size arguments.
static constexpr size_t unknown_size = 0;

static constexpr size_t default_alignment = SystemAllocator::default_alignment;

static inline bool IsPowerOfTwo(size_t x) {
    return x != 0 && (x & (x - 1)) == 0;
}

static inline size_t PageSize() {
    return static_cast<size_t>(sysconf(_SC_PAGESIZE));
}

//! aligned allocation for the entry points which report failure in errno
static inline void * AllocateAligned(size_t size, size_t alignment) {
    void* ptr = s_proxy.Allocate(size, alignment);
    if (!ptr) errno = ENOMEM;
    return ptr;
}

extern "C" {

//! exported malloc symbol that overrides loading from libc
void * malloc(size_t size) noexcept {
    return s_proxy.Allocate(size, default_alignment);
}

//! exported free symbol that overrides loading from libc
void free(void* ptr) noexcept {
    //! free(nullptr) is no operation
    s_proxy.Deallocate(ptr, unknown_size, default_alignment);
}

//! exported calloc() symbol that overrides loading from libc
void * calloc(size_t nmemb, size_t size) noexcept {
    size_t total;
    if (__builtin_mul_overflow(nmemb, size, &total)) {
        errno = ENOMEM;
        return nullptr;
    }
    return s_proxy.AllocateZeroed(total, default_alignment);
}

//! exported realloc() symbol that overrides loading from libc
void * realloc(void* ptr, size_t size) noexcept {

    if (ptr == nullptr) { //! special case ptr == 0 -> malloc()
        return malloc(size);
    }

    if (size == 0) { //! special case size == 0 -> free()
        free(ptr);
        return nullptr;
    }

    return s_proxy.Reallocate(ptr, unknown_size, size, default_alignment);
}

//! exported reallocarray() symbol, libc's would bypass our realloc()
void * reallocarray(void* ptr, size_t nmemb, size_t size) noexcept {
    size_t total;
    if (__builtin_mul_overflow(nmemb, size, &total)) {
        errno = ENOMEM;
        return nullptr;
    }
    return realloc(ptr, total);
}

//! exported posix_memalign() symbol that overrides loading from libc
int posix_memalign(void** memptr, size_t alignment, size_t size) noexcept {
    if (!IsPowerOfTwo(alignment) || alignment % sizeof(void*) != 0)
        return EINVAL;

    // posix_memalign() does not modify errno
    int saved_errno = errno;
    void* ptr = s_proxy.Allocate(size, alignment);
    errno = saved_errno;
    if (!ptr) return ENOMEM;

    *memptr = ptr;
    return 0;
}

//! exported aligned_alloc() symbol that overrides loading from libc
void * aligned_alloc(size_t alignment, size_t size) noexcept {
    if (!IsPowerOfTwo(alignment)) {
        errno = EINVAL;
        return nullptr;
    }
    return AllocateAligned(size, alignment);
}

//! exported memalign() symbol, a non-power-of-two alignment is rounded up
void * memalign(size_t alignment, size_t size) noexcept {
    if (alignment > (SIZE_MAX >> 1) + 1) {
        errno = EINVAL;
        return nullptr;
    }
    size_t align = 1;
    while (align < alignment) align <<= 1;
    return AllocateAligned(size, align);
}

//! exported valloc() symbol that overrides loading from libc
void * valloc(size_t size) noexcept {
    return AllocateAligned(size, PageSize());
}

//! exported pvalloc() symbol, the size is rounded up to whole pages
void * pvalloc(size_t size) noexcept {
    size_t page = PageSize();
    if (size > SIZE_MAX - page) {
        errno = ENOMEM;
        return nullptr;
    }
    size_t rounded = size == 0 ? page : (size + page - 1) & ~(page - 1);
    return AllocateAligned(rounded, page);
}

//! exported malloc_usable_size() symbol, also answers for init heap blocks
size_t malloc_usable_size(void* ptr) noexcept {
    return s_proxy.AccountedSize(ptr, unknown_size);
}

} // extern "C"

/******************************************************************************/
