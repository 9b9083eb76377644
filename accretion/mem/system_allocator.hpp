/*******************************************************************************
 * accretion/mem/system_allocator.hpp
 *
 * Access to the real libc allocator underneath the malloc overlay.
 *
 * Part of Project Accretion
 *
 * Copyright (C) 2026 The Accretion Authors
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef ACCRETION_MEM_SYSTEM_ALLOCATOR_HEADER
#define ACCRETION_MEM_SYSTEM_ALLOCATOR_HEADER

#include <cstddef>

namespace accretion {
namespace mem {

/*!
 * The underlying allocator of the installed AllocatorProxy: the libc functions
 * which the malloc overlay hides. Their addresses are loaded using dlsym()
 * during process startup. Until then, requests are served from a static init
 * heap, since dlsym() and early static initializers may already call malloc().
 *
 * Bookkeeping uses the usable size of a block, because free() is not told the
 * size of the block it releases.
 *
 * All methods are async-signal-unsafe but never call back into the overlay.
 */
class SystemAllocator
{
public:
    //! alignment guaranteed by plain malloc()
    static constexpr size_t default_alignment = alignof(std::max_align_t);

    constexpr SystemAllocator() noexcept = default;

    void * Allocate(size_t size, size_t alignment) noexcept;

    void * AllocateZeroed(size_t size, size_t alignment) noexcept;

    //! new_size must be non-zero, realloc(ptr, 0) is handled by the overlay.
    void * Reallocate(void* ptr, size_t old_size, size_t new_size,
                      size_t alignment) noexcept;

    void Deallocate(void* ptr, size_t size, size_t alignment) noexcept;

    //! usable size of the block, requested is ignored. Zero for nullptr.
    size_t AccountedSize(const void* ptr, size_t requested) const noexcept;

    //! true once the real libc functions have been resolved
    static bool Resolved() noexcept;

    //! serve a block from the static init heap, used before Resolved(). The
    //! block is zero, it is never reclaimed, and nullptr is returned once
    //! the init heap is exhausted.
    static void * InitHeapAllocate(size_t size, size_t alignment) noexcept;

    //! true if ptr was served from the init heap
    static bool OnInitHeap(const void* ptr) noexcept;

    //! number of bytes used on the init heap
    static size_t InitHeapUsed() noexcept;
};

} // namespace mem
} // namespace accretion

#endif // !ACCRETION_MEM_SYSTEM_ALLOCATOR_HEADER

/******************************************************************************/
