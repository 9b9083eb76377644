/*******************************************************************************
 * accretion/mem/system_allocator.cpp
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

#include <accretion/mem/diagnostics.hpp>
#include <accretion/mem/system_allocator.hpp>
#include <tlx/define.hpp>

#include <dlfcn.h>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace accretion {
namespace mem {

constexpr size_t SystemAllocator::default_alignment;

/******************************************************************************/
// function pointers to the real procedures, loaded using dlsym()

using malloc_type = void* (*)(size_t);
using free_type = void (*)(void*);
using calloc_type = void* (*)(size_t, size_t);
using realloc_type = void* (*)(void*, size_t);
using posix_memalign_type = int (*)(void**, size_t, size_t);
using usable_size_type = size_t (*)(void*);

//! published last, after all other pointers are set.
static std::atomic<malloc_type> real_malloc { nullptr };
static free_type real_free = nullptr;
static calloc_type real_calloc = nullptr;
static realloc_type real_realloc = nullptr;
static posix_memalign_type real_posix_memalign = nullptr;
static usable_size_type real_usable_size = nullptr;

/******************************************************************************/
// a simple memory heap for allocations prior to dlsym loading

static constexpr size_t kInitHeapSize = 1024 * 1024;

alignas(64) static char init_heap[kInitHeapSize];
static std::atomic<size_t> init_heap_use { 0 };

//! Each init heap allocation is prefixed with its size and a sentinel
static constexpr size_t padding = 16;    /* bytes (>= 2*sizeof(size_t)) */

//! round up init heap allocations to this size
static constexpr size_t init_alignment = 16;

//! a sentinel value prefixed to each allocation
static constexpr size_t sentinel = 0xDEADC0DE;

static constexpr int log_operations_init_heap = 0;

void * SystemAllocator::InitHeapAllocate(
    size_t size, size_t alignment) noexcept {

    alignment = std::max(alignment, init_alignment);

    if (size > kInitHeapSize || alignment > kInitHeapSize) {
        fprintf(stderr, ACCRETION_PPREFIX
                "init heap request %zu too large\n", size);
        return nullptr;
    }

    size_t aligned_size =
        (size + init_alignment - 1) & ~(init_alignment - 1);
    size_t reserve = padding + (alignment - 1) + aligned_size;

    size_t offset = init_heap_use.fetch_add(reserve, std::memory_order_relaxed);
    if (offset + reserve > kInitHeapSize) {
        fprintf(stderr, ACCRETION_PPREFIX "init heap full !!!\n");
        return nullptr;
    }

    uintptr_t base = reinterpret_cast<uintptr_t>(init_heap + offset + padding);
    char* ret = reinterpret_cast<char*>(
        (base + alignment - 1) & ~(static_cast<uintptr_t>(alignment) - 1));

    //! prepend allocation size and check sentinel
    *reinterpret_cast<size_t*>(ret - padding) = aligned_size;
    *reinterpret_cast<size_t*>(ret - sizeof(size_t)) = sentinel;

    if (log_operations_init_heap) {
        fprintf(stderr, ACCRETION_PPREFIX
                "malloc(%zu / %zu) = %p   on init heap\n",
                size, aligned_size, static_cast<void*>(ret));
    }

    // the init heap is never reused, hence it is still zero.
    return ret;
}

//! size prefix of an init heap allocation
static size_t InitHeapSize(const void* ptr) noexcept {
    const char* p = static_cast<const char*>(ptr);

    if (*reinterpret_cast<const size_t*>(p - sizeof(size_t)) != sentinel) {
        fprintf(stderr, ACCRETION_PPREFIX
                "init heap block %p has no sentinel !!! memory corruption?\n",
                ptr);
        return 0;
    }

    return *reinterpret_cast<const size_t*>(p - padding);
}

/******************************************************************************/
// Initialize function pointers to the real underlying malloc implementation.

template <typename FunctionType>
static FunctionType LoadSymbol(void* handle, const char* name) {
    void* sym = dlsym(handle, name);
    if (!sym) {
        const char* error = dlerror();
        fprintf(stderr, ACCRETION_PPREFIX "dlsym(%s) failed: %s\n",
                name, error ? error : "unknown error");
        exit(EXIT_FAILURE);
    }
    return reinterpret_cast<FunctionType>(sym);
}

static __attribute__ ((constructor(101))) void ResolveSystemAllocator() { // NOLINT

    // try to use AddressSanitizer's malloc first.
    void* asan_malloc = dlsym(RTLD_DEFAULT, "__interceptor_malloc");

    void* handle = asan_malloc ? RTLD_DEFAULT : RTLD_NEXT;
    bool asan = (asan_malloc != nullptr);

    malloc_type m = LoadSymbol<malloc_type>(
        handle, asan ? "__interceptor_malloc" : "malloc");
    real_free = LoadSymbol<free_type>(
        handle, asan ? "__interceptor_free" : "free");
    real_calloc = LoadSymbol<calloc_type>(
        handle, asan ? "__interceptor_calloc" : "calloc");
    real_realloc = LoadSymbol<realloc_type>(
        handle, asan ? "__interceptor_realloc" : "realloc");
    real_posix_memalign = LoadSymbol<posix_memalign_type>(
        handle, asan ? "__interceptor_posix_memalign" : "posix_memalign");
    real_usable_size = LoadSymbol<usable_size_type>(
        handle, asan ? "__interceptor_malloc_usable_size"
        : "malloc_usable_size");

    if (asan)
        fprintf(stderr, ACCRETION_PPREFIX "using AddressSanitizer's malloc\n");

    // switch over: from now on allocations go to libc
    real_malloc.store(m, std::memory_order_release);
}

/******************************************************************************/
// SystemAllocator

bool SystemAllocator::Resolved() noexcept {
    return real_malloc.load(std::memory_order_acquire) != nullptr;
}

bool SystemAllocator::OnInitHeap(const void* ptr) noexcept {
    return static_cast<const char*>(ptr) >= init_heap &&
           static_cast<const char*>(ptr) < init_heap + kInitHeapSize;
}

size_t SystemAllocator::InitHeapUsed() noexcept {
    return std::min(init_heap_use.load(std::memory_order_relaxed),
                    kInitHeapSize);
}

void* SystemAllocator::Allocate(size_t size, size_t alignment) noexcept {
    malloc_type m = real_malloc.load(std::memory_order_acquire);

    if (TLX_UNLIKELY(!m))
        return InitHeapAllocate(size, alignment);

    if (alignment <= default_alignment)
        return m(size);

    // posix_memalign() reports failure by its return value only
    void* ptr = nullptr;
    if (real_posix_memalign(&ptr, alignment, size) != 0)
        return nullptr;
    return ptr;
}

void* SystemAllocator::AllocateZeroed(size_t size, size_t alignment) noexcept {
    if (TLX_UNLIKELY(!Resolved()))
        return InitHeapAllocate(size, alignment);

    if (alignment <= default_alignment)
        return real_calloc(1, size);

    void* ptr = Allocate(size, alignment);
    if (ptr) memset(ptr, 0, size);
    return ptr;
}

void* SystemAllocator::Reallocate(
    void* ptr, size_t old_size, size_t new_size, size_t alignment) noexcept {

    if (!ptr)
        return Allocate(new_size, alignment);

    if (TLX_UNLIKELY(OnInitHeap(ptr))) {
        size_t init_size = InitHeapSize(ptr);

        //! keep old area
        if (init_size >= new_size) return ptr;

        //! allocate new area and copy data, the old one is never reused
        void* newptr = Allocate(new_size, alignment);
        if (!newptr) return nullptr;
        memcpy(newptr, ptr, init_size);
        return newptr;
    }

    if (alignment <= default_alignment)
        return real_realloc(ptr, new_size);

    // over-aligned blocks cannot be resized by realloc()
    size_t old_used = AccountedSize(ptr, old_size);
    void* newptr = Allocate(new_size, alignment);
    if (!newptr) return nullptr;
    memcpy(newptr, ptr, std::min(old_used, new_size));
    real_free(ptr);
    return newptr;
}

void SystemAllocator::Deallocate(
    void* ptr, size_t /* size */, size_t /* alignment */) noexcept {

    if (!ptr) return;

    if (TLX_UNLIKELY(OnInitHeap(ptr))) {
        // don't do any real deallocation.
        if (log_operations_init_heap) {
            fprintf(stderr, ACCRETION_PPREFIX
                    "free(%p) -> %zu   on init heap\n", ptr, InitHeapSize(ptr));
        }
        return;
    }

    if (TLX_UNLIKELY(!real_free)) {
        fprintf(stderr, ACCRETION_PPREFIX
                "free(%p) outside init heap and without real_free !!!\n", ptr);
        return;
    }

    real_free(ptr);
}

size_t SystemAllocator::AccountedSize(
    const void* ptr, size_t requested) const noexcept {

    if (!ptr) return 0;

    if (TLX_UNLIKELY(OnInitHeap(ptr)))
        return InitHeapSize(ptr);

    if (TLX_UNLIKELY(!real_usable_size))
        return requested;

    return real_usable_size(const_cast<void*>(ptr));
}

} // namespace mem
} // namespace accretion

/******************************************************************************/
