/*******************************************************************************
 * tests/mem/alloc_profile_test.cpp
 *
 * Part of Project Accretion
 *
 * Copyright (C) 2026 The Accretion Authors
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <accretion/mem/alloc_profile.hpp>
#include <gtest/gtest.h>

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

#include <malloc.h>
#include <unistd.h>

using namespace accretion;

static constexpr size_t default_alignment =
    mem::SystemAllocator::default_alignment;

//! touch memory such that the compiler does not optimize away the allocation
static void Touch(void* ptr, size_t size) {
    volatile char* p = static_cast<volatile char*>(ptr);
    for (size_t i = 0; i < size; i += 64) p[i] = static_cast<char>(i);
}

//! keeps new-expressions from being elided
static void* volatile s_escape = nullptr;

class AllocProfile : public ::testing::Test
{
protected:
    void SetUp() final {
        mem::EnableAllocProfiling(true);
        mem::ResetAllocCounters();
    }

    void TearDown() final {
        mem::EnableAllocProfiling(false);
        mem::ResetAllocCounters();
    }
};

TEST(AllocProfileFlag, TruthyValues) {
    ASSERT_TRUE(mem::ParseAllocProfileFlag("1"));
    ASSERT_TRUE(mem::ParseAllocProfileFlag("true"));
    ASSERT_TRUE(mem::ParseAllocProfileFlag("TRUE"));
    ASSERT_TRUE(mem::ParseAllocProfileFlag("yes"));
    ASSERT_TRUE(mem::ParseAllocProfileFlag("YES"));

    ASSERT_FALSE(mem::ParseAllocProfileFlag(nullptr));
    ASSERT_FALSE(mem::ParseAllocProfileFlag(""));
    ASSERT_FALSE(mem::ParseAllocProfileFlag("0"));
    ASSERT_FALSE(mem::ParseAllocProfileFlag("True"));
    ASSERT_FALSE(mem::ParseAllocProfileFlag("Yes"));
    ASSERT_FALSE(mem::ParseAllocProfileFlag("on"));
    ASSERT_FALSE(mem::ParseAllocProfileFlag("1 "));
    ASSERT_FALSE(mem::ParseAllocProfileFlag("yes please"));
}

TEST(AllocProfileFlag, InitFromEnv) {
    setenv("ACCRETION_ALLOC_PROFILE", "YES", 1);
    mem::InitAllocProfileFromEnv();
    ASSERT_TRUE(mem::IsAllocProfilingEnabled());

    setenv("ACCRETION_ALLOC_PROFILE", "enabled", 1);
    mem::InitAllocProfileFromEnv();
    ASSERT_FALSE(mem::IsAllocProfilingEnabled());

    setenv("ACCRETION_ALLOC_PROFILE", "1", 1);
    mem::InitAllocProfileFromEnv();
    ASSERT_TRUE(mem::IsAllocProfilingEnabled());

    unsetenv("ACCRETION_ALLOC_PROFILE");
    mem::InitAllocProfileFromEnv();
    ASSERT_FALSE(mem::IsAllocProfilingEnabled());
}

TEST(AllocProfileDeathTest, ReportAtExit) {
    EXPECT_EXIT(
        {
            setenv("ACCRETION_ALLOC_PROFILE", "1", 1);
            setenv("ACCRETION_ALLOC_PROFILE_REPORT", "yes", 1);
            mem::InitAllocProfileFromEnv();
            void* p = malloc(100);
            Touch(p, 100);
            free(p);
            exit(0);
        },
        ::testing::ExitedWithCode(0),
        "alloc_profile ### enabled, live: -?[0-9]+, peak: [0-9]+, "
        "total: [0-9]+ / [0-9]+, net: -?[0-9]+, "
        "calls: [0-9]+ / [0-9]+ / [0-9]+");
}

TEST(AllocProfileFlag, EnableDisable) {
    mem::EnableAllocProfiling(true);
    ASSERT_TRUE(mem::IsAllocProfilingEnabled());
    ASSERT_TRUE(mem::GlobalAllocatorProxy().gate().IsEnabled());

    mem::EnableAllocProfiling(false);
    ASSERT_FALSE(mem::IsAllocProfilingEnabled());
}

TEST_F(AllocProfile, MallocFree) {
    void* p = malloc(1024 * 1024);
    ASSERT_TRUE(p);
    Touch(p, 1024 * 1024);
    size_t used = malloc_usable_size(p);
    ASSERT_GE(used, 1024u * 1024u);

    mem::AllocProfileSnapshot s = mem::GetAllocSnapshot();
    ASSERT_EQ(1u, s.alloc_calls);
    ASSERT_EQ(static_cast<ssize_t>(used), s.live_bytes);
    ASSERT_EQ(static_cast<ssize_t>(used), s.peak_live_bytes);
    ASSERT_EQ(used, s.total_alloc_bytes);

    free(p);

    s = mem::GetAllocSnapshot();
    ASSERT_EQ(1u, s.dealloc_calls);
    ASSERT_EQ(0, s.live_bytes);
    ASSERT_EQ(static_cast<ssize_t>(used), s.peak_live_bytes);
    ASSERT_EQ(used, s.total_dealloc_bytes);
    ASSERT_EQ(0, s.net_bytes());
}

TEST_F(AllocProfile, FreeNullIsNoOp) {
    free(nullptr);

    mem::AllocProfileSnapshot s = mem::GetAllocSnapshot();
    ASSERT_EQ(0u, s.dealloc_calls);
    ASSERT_EQ(0, s.live_bytes);
}

TEST_F(AllocProfile, ReallocGrowAndShrink) {
    char* p = static_cast<char*>(malloc(100));
    ASSERT_TRUE(p);
    memset(p, 'x', 100);
    size_t used0 = malloc_usable_size(p);

    mem::ResetAllocCounters();

    p = static_cast<char*>(realloc(p, 100000));
    ASSERT_TRUE(p);
    size_t used1 = malloc_usable_size(p);
    for (size_t i = 0; i < 100; ++i) ASSERT_EQ('x', p[i]);

    mem::AllocProfileSnapshot s = mem::GetAllocSnapshot();
    ASSERT_EQ(1u, s.realloc_calls);
    ASSERT_EQ(0u, s.alloc_calls);
    ASSERT_EQ(0u, s.dealloc_calls);
    ASSERT_EQ(static_cast<ssize_t>(used1 - used0), s.live_bytes);
    ASSERT_EQ(used1 - used0, s.total_alloc_bytes);

    p = static_cast<char*>(realloc(p, 10));
    ASSERT_TRUE(p);
    size_t used2 = malloc_usable_size(p);

    s = mem::GetAllocSnapshot();
    ASSERT_EQ(2u, s.realloc_calls);
    ASSERT_EQ(static_cast<ssize_t>(used2) - static_cast<ssize_t>(used0),
              s.live_bytes);
    ASSERT_EQ(s.live_bytes, s.net_bytes());

    free(p);
}

TEST_F(AllocProfile, ReallocSpecialCases) {
    // realloc(nullptr, n) is malloc(n)
    void* p = realloc(nullptr, 256);
    ASSERT_TRUE(p);
    Touch(p, 256);

    mem::AllocProfileSnapshot s = mem::GetAllocSnapshot();
    ASSERT_EQ(1u, s.alloc_calls);
    ASSERT_EQ(0u, s.realloc_calls);

    // realloc(p, 0) is free(p)
    ASSERT_EQ(nullptr, realloc(p, 0));

    s = mem::GetAllocSnapshot();
    ASSERT_EQ(1u, s.dealloc_calls);
    ASSERT_EQ(0u, s.realloc_calls);
    ASSERT_EQ(0, s.live_bytes);
}

TEST_F(AllocProfile, CallocZeroesAndCounts) {
    unsigned char* p = static_cast<unsigned char*>(calloc(1000, 8));
    ASSERT_TRUE(p);
    for (size_t i = 0; i < 8000; ++i) ASSERT_EQ(0, p[i]);

    mem::AllocProfileSnapshot s = mem::GetAllocSnapshot();
    ASSERT_EQ(1u, s.alloc_calls);
    ASSERT_EQ(static_cast<ssize_t>(malloc_usable_size(p)), s.live_bytes);

    free(p);
    ASSERT_EQ(0, mem::GetAllocSnapshot().live_bytes);
}

TEST_F(AllocProfile, CallocOverflowFails) {
    errno = 0;
    void* p = calloc(SIZE_MAX / 2, 4);
    ASSERT_EQ(nullptr, p);
    ASSERT_EQ(ENOMEM, errno);

    mem::AllocProfileSnapshot s = mem::GetAllocSnapshot();
    ASSERT_EQ(0u, s.alloc_calls);
    ASSERT_EQ(0u, s.total_alloc_bytes);
}

TEST_F(AllocProfile, FailedMallocIsNotCounted) {
    // larger than any address space
    void* p = malloc(SIZE_MAX - 4096);
    ASSERT_EQ(nullptr, p);

    mem::AllocProfileSnapshot s = mem::GetAllocSnapshot();
    ASSERT_EQ(0u, s.alloc_calls);
    ASSERT_EQ(0, s.live_bytes);
    ASSERT_EQ(0, s.peak_live_bytes);
}

TEST_F(AllocProfile, AlignedAllocations) {
    void* p = nullptr;
    ASSERT_EQ(0, posix_memalign(&p, 256, 1000));
    ASSERT_EQ(0u, reinterpret_cast<uintptr_t>(p) % 256);
    Touch(p, 1000);

    void* q = aligned_alloc(4096, 8192);
    ASSERT_TRUE(q);
    ASSERT_EQ(0u, reinterpret_cast<uintptr_t>(q) % 4096);
    Touch(q, 8192);

    void* r = memalign(64, 100);
    ASSERT_TRUE(r);
    ASSERT_EQ(0u, reinterpret_cast<uintptr_t>(r) % 64);
    Touch(r, 100);

    mem::AllocProfileSnapshot s = mem::GetAllocSnapshot();
    ASSERT_EQ(3u, s.alloc_calls);
    ASSERT_EQ(static_cast<ssize_t>(
                  malloc_usable_size(p) + malloc_usable_size(q)
                  + malloc_usable_size(r)), s.live_bytes);

    free(p);
    free(q);
    free(r);

    s = mem::GetAllocSnapshot();
    ASSERT_EQ(3u, s.dealloc_calls);
    ASSERT_EQ(0, s.live_bytes);
}

TEST_F(AllocProfile, InvalidAlignmentIsRejected) {
    void* p = nullptr;
    ASSERT_EQ(EINVAL, posix_memalign(&p, 3, 100));
    ASSERT_EQ(EINVAL, posix_memalign(&p, 2, 100));

    errno = 0;
    ASSERT_EQ(nullptr, aligned_alloc(48, 96));
    ASSERT_EQ(EINVAL, errno);

    ASSERT_EQ(0u, mem::GetAllocSnapshot().alloc_calls);
}

TEST_F(AllocProfile, PosixMemalignFailureKeepsErrno) {
    size_t huge = SIZE_MAX - 4096;
    void* p = nullptr;

    errno = 0;
    ASSERT_EQ(ENOMEM, posix_memalign(&p, 256, huge));
    ASSERT_EQ(0, errno);
    ASSERT_EQ(nullptr, p);

    errno = 0;
    ASSERT_EQ(nullptr, aligned_alloc(256, huge));
    ASSERT_EQ(ENOMEM, errno);

    mem::AllocProfileSnapshot s = mem::GetAllocSnapshot();
    ASSERT_EQ(0u, s.alloc_calls);
    ASSERT_EQ(0u, s.total_alloc_bytes);
}

TEST_F(AllocProfile, Reallocarray) {
    char* p = static_cast<char*>(malloc(64));
    ASSERT_TRUE(p);
    memset(p, 'a', 64);
    size_t used0 = malloc_usable_size(p);

    mem::ResetAllocCounters();

    // overflow of nmemb * size leaves the block and the counters untouched
    errno = 0;
    ASSERT_EQ(nullptr, reallocarray(p, SIZE_MAX / 2, 4));
    ASSERT_EQ(ENOMEM, errno);
    ASSERT_EQ(0u, mem::GetAllocSnapshot().realloc_calls);
    ASSERT_EQ(0u, mem::GetAllocSnapshot().total_alloc_bytes);
    ASSERT_EQ('a', p[63]);

    p = static_cast<char*>(reallocarray(p, 1000, 8));
    ASSERT_TRUE(p);
    size_t used1 = malloc_usable_size(p);
    ASSERT_GE(used1, 8000u);
    for (size_t i = 0; i < 64; ++i) ASSERT_EQ('a', p[i]);

    mem::AllocProfileSnapshot s = mem::GetAllocSnapshot();
    ASSERT_EQ(1u, s.realloc_calls);
    ASSERT_EQ(0u, s.alloc_calls);
    ASSERT_EQ(0u, s.dealloc_calls);
    ASSERT_EQ(static_cast<ssize_t>(used1) - static_cast<ssize_t>(used0),
              s.live_bytes);

    free(p);
    ASSERT_EQ(-static_cast<ssize_t>(used0), mem::GetAllocSnapshot().live_bytes);
}

TEST_F(AllocProfile, Valloc) {
    size_t page = static_cast<size_t>(sysconf(_SC_PAGESIZE));

    void* p = valloc(10);
    ASSERT_TRUE(p);
    ASSERT_EQ(0u, reinterpret_cast<uintptr_t>(p) % page);
    Touch(p, 10);

    mem::AllocProfileSnapshot s = mem::GetAllocSnapshot();
    ASSERT_EQ(1u, s.alloc_calls);
    ASSERT_EQ(static_cast<ssize_t>(malloc_usable_size(p)), s.live_bytes);

    free(p);
    s = mem::GetAllocSnapshot();
    ASSERT_EQ(1u, s.dealloc_calls);
    ASSERT_EQ(0, s.live_bytes);
}

TEST_F(AllocProfile, PvallocRoundsUpToPages) {
    size_t page = static_cast<size_t>(sysconf(_SC_PAGESIZE));

    void* p = pvalloc(page + 1);
    ASSERT_TRUE(p);
    ASSERT_EQ(0u, reinterpret_cast<uintptr_t>(p) % page);
    ASSERT_GE(malloc_usable_size(p), 2 * page);
    Touch(p, 2 * page);

    // pvalloc(0) returns a whole page
    void* q = pvalloc(0);
    ASSERT_TRUE(q);
    ASSERT_EQ(0u, reinterpret_cast<uintptr_t>(q) % page);
    ASSERT_GE(malloc_usable_size(q), page);
    Touch(q, page);

    mem::AllocProfileSnapshot s = mem::GetAllocSnapshot();
    ASSERT_EQ(2u, s.alloc_calls);
    ASSERT_EQ(static_cast<ssize_t>(malloc_usable_size(p)
                                   + malloc_usable_size(q)), s.live_bytes);

    free(p);
    free(q);
    s = mem::GetAllocSnapshot();
    ASSERT_EQ(2u, s.dealloc_calls);
    ASSERT_EQ(0, s.live_bytes);
}

TEST_F(AllocProfile, MallocUsableSize) {
    ASSERT_EQ(0u, malloc_usable_size(nullptr));

    void* p = malloc(100);
    ASSERT_TRUE(p);
    size_t used = malloc_usable_size(p);
    ASSERT_GE(used, 100u);

    // size queries are not booked
    mem::AllocProfileSnapshot s = mem::GetAllocSnapshot();
    ASSERT_EQ(1u, s.alloc_calls);
    ASSERT_EQ(0u, s.dealloc_calls);
    ASSERT_EQ(0u, s.realloc_calls);
    ASSERT_EQ(static_cast<ssize_t>(used), s.live_bytes);

    free(p);
    ASSERT_EQ(0, mem::GetAllocSnapshot().live_bytes);
}

TEST_F(AllocProfile, InitHeapBlocksThroughOverlay) {
    char* p = static_cast<char*>(
        mem::SystemAllocator::InitHeapAllocate(100, default_alignment));
    ASSERT_TRUE(p);
    ASSERT_EQ(112u, malloc_usable_size(p));

    // shrinking keeps the block, its size stays the same
    ASSERT_EQ(p, realloc(p, 40));

    mem::AllocProfileSnapshot s = mem::GetAllocSnapshot();
    ASSERT_EQ(1u, s.realloc_calls);
    ASSERT_EQ(0, s.live_bytes);
    ASSERT_EQ(0u, s.total_alloc_bytes);
    ASSERT_EQ(0u, s.total_dealloc_bytes);

    // the block was allocated before counting, hence live goes negative
    free(p);
    s = mem::GetAllocSnapshot();
    ASSERT_EQ(1u, s.dealloc_calls);
    ASSERT_EQ(112u, s.total_dealloc_bytes);
    ASSERT_EQ(-112, s.live_bytes);
}

TEST_F(AllocProfile, PrintStatusLine) {
    testing::internal::CaptureStderr();

    mem::ResetAllocCounters();
    void* p = malloc(100);
    ASSERT_TRUE(p);
    size_t used = malloc_usable_size(p);

    // disable before printing, nothing below is counted
    mem::EnableAllocProfiling(false);
    mem::PrintAllocProfileStatus();
    free(p);

    std::string err = testing::internal::GetCapturedStderr();
    std::string u = std::to_string(used);

    ASSERT_EQ("alloc_profile ### disabled, live: " + u + ", peak: " + u
              + ", total: " + u + " / 0, net: " + u
              + ", calls: 1 / 0 / 0\n", err);
}

TEST_F(AllocProfile, NewDeleteAreCounted) {
    std::vector<char>* v = new std::vector<char>(5000, 'v');
    s_escape = v;
    ASSERT_EQ('v', (*v)[4999]);

    mem::AllocProfileSnapshot s = mem::GetAllocSnapshot();
    ASSERT_EQ(2u, s.alloc_calls);
    ASSERT_GE(s.live_bytes, 5000);

    delete v;
    s_escape = nullptr;

    s = mem::GetAllocSnapshot();
    ASSERT_EQ(2u, s.dealloc_calls);
    ASSERT_EQ(0, s.live_bytes);
}

TEST_F(AllocProfile, DisabledGateLeavesCountersUnchanged) {
    void* keep = malloc(64);
    Touch(keep, 64);

    mem::EnableAllocProfiling(false);
    mem::AllocProfileSnapshot before = mem::GetAllocSnapshot();

    char* p = static_cast<char*>(malloc(100));
    char* q = static_cast<char*>(malloc(50));
    ASSERT_TRUE(p && q);
    memset(p, 'p', 100);
    memset(q, 'q', 50);
    free(p);
    q = static_cast<char*>(realloc(q, 10));
    ASSERT_EQ('q', q[9]);
    free(q);
    void* z = calloc(10, 10);
    free(z);

    mem::AllocProfileSnapshot after = mem::GetAllocSnapshot();
    ASSERT_EQ(before.live_bytes, after.live_bytes);
    ASSERT_EQ(before.peak_live_bytes, after.peak_live_bytes);
    ASSERT_EQ(before.total_alloc_bytes, after.total_alloc_bytes);
    ASSERT_EQ(before.total_dealloc_bytes, after.total_dealloc_bytes);
    ASSERT_EQ(before.alloc_calls, after.alloc_calls);
    ASSERT_EQ(before.dealloc_calls, after.dealloc_calls);
    ASSERT_EQ(before.realloc_calls, after.realloc_calls);

    mem::EnableAllocProfiling(true);
    free(keep);
    ASSERT_EQ(0, mem::GetAllocSnapshot().live_bytes);
}

TEST_F(AllocProfile, ResetZeroesAllCounters) {
    void* p = malloc(4000);
    Touch(p, 4000);
    p = realloc(p, 40000);
    free(p);

    mem::ResetAllocCounters();

    mem::AllocProfileSnapshot s = mem::GetAllocSnapshot();
    ASSERT_EQ(0, s.live_bytes);
    ASSERT_EQ(0, s.peak_live_bytes);
    ASSERT_EQ(0u, s.total_alloc_bytes);
    ASSERT_EQ(0u, s.total_dealloc_bytes);
    ASSERT_EQ(0u, s.alloc_calls);
    ASSERT_EQ(0u, s.dealloc_calls);
    ASSERT_EQ(0u, s.realloc_calls);
}

TEST_F(AllocProfile, ConcurrentThreadsPairedCalls) {
    static constexpr size_t num_threads = 8;
    static constexpr size_t calls_per_thread = 10000;
    static constexpr size_t size = 200;

    std::vector<std::thread> threads;
    threads.reserve(num_threads);

    for (size_t t = 0; t < num_threads; ++t) {
        threads.emplace_back(
            []() {
                for (size_t i = 0; i < calls_per_thread; ++i) {
                    void* p = malloc(size);
                    Touch(p, size);
                    free(p);
                }
            });
    }
    for (std::thread& t : threads) t.join();

    // thread creation allocates too, hence only lower bounds on the totals.
    mem::AllocProfileSnapshot s = mem::GetAllocSnapshot();
    ASSERT_GE(s.alloc_calls, num_threads * calls_per_thread);
    ASSERT_GE(s.dealloc_calls, num_threads * calls_per_thread);
    ASSERT_GE(s.total_alloc_bytes, num_threads * calls_per_thread * size);
    ASSERT_GE(s.total_dealloc_bytes, num_threads * calls_per_thread * size);
    ASSERT_EQ(s.live_bytes, s.net_bytes());
    ASSERT_GE(s.peak_live_bytes, static_cast<ssize_t>(size));
}

/******************************************************************************/
