/*******************************************************************************
 * benchmarks/mem/alloc_profile_benchmark.cpp
 *
 * Host program for the allocation profiler: runs synthetic multi-threaded
 * allocation workloads and prints the allocator profile summary.
 *
 * Part of Project Accretion
 *
 * Copyright (C) 2026 The Accretion Authors
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <accretion/mem/alloc_profile.hpp>
#include <tlx/cmdline_parser.hpp>
#include <tlx/die.hpp>
#include <tlx/logger.hpp>
#include <tlx/thread_pool.hpp>
#include <tlx/timestamp.hpp>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace accretion; // NOLINT

static constexpr bool debug = false;

/******************************************************************************/

//! common command line switches of all workloads
struct WorkloadConfig {
    size_t threads = 4;
    size_t iterations = 100000;
    size_t size = 64;
    bool enable = false;

    void AddOptions(tlx::CmdlineParser& clp) {
        clp.add_size_t(
            't', "threads", threads, "number of threads (default: 4)");
        clp.add_size_t(
            'n', "iterations", iterations,
            "iterations per thread (default: 100000)");
        clp.add_size_t(
            's', "size", size, "(maximum) allocation size (default: 64)");
        clp.add_bool(
            'e', "enable", enable,
            "enable profiling regardless of ACCRETION_ALLOC_PROFILE");
    }

    //! set up gate and counters, returns the start time
    double Start() const {
        if (enable) mem::EnableAllocProfiling(true);
        if (!mem::IsAllocProfilingEnabled()) {
            std::cout << "Allocation profiling is disabled, set "
                      << "ACCRETION_ALLOC_PROFILE=1 or pass --enable."
                      << std::endl;
        }
        mem::ResetAllocCounters();
        return tlx::timestamp();
    }

    //! print summary of the run, returns the final snapshot
    mem::AllocProfileSnapshot Finish(const char* name, double ts_start) const {
        double elapsed = tlx::timestamp() - ts_start;
        mem::AllocProfileSnapshot s = mem::GetAllocSnapshot();

        std::cout << name << ": threads=" << threads
                  << " iterations=" << iterations
                  << " size=" << size
                  << " time=" << elapsed << "s" << std::endl;

        if (mem::IsAllocProfilingEnabled())
            mem::PrintAllocProfileSummary(std::cout, s);

        LOG << "final snapshot: " << s;
        return s;
    }
};

/******************************************************************************/

//! every thread performs paired malloc()/free() of a fixed size
int BenchmarkPaired(int argc, char* argv[]) {
    tlx::CmdlineParser clp;
    clp.set_description("paired malloc()/free() calls of a fixed size");

    WorkloadConfig cfg;
    cfg.AddOptions(clp);

    if (!clp.process(argc, argv)) return -1;

    tlx::ThreadPool pool(cfg.threads);
    double ts_start = cfg.Start();

    for (size_t t = 0; t < cfg.threads; ++t) {
        pool.enqueue(
            [&cfg]() {
                for (size_t i = 0; i < cfg.iterations; ++i) {
                    volatile char* p =
                        static_cast<volatile char*>(malloc(cfg.size));
                    die_unless(p);
                    p[0] = static_cast<char>(i);
                    free(const_cast<char*>(p));
                }
            });
    }
    pool.loop_until_empty();

    mem::AllocProfileSnapshot s = cfg.Finish("paired", ts_start);

    if (mem::IsAllocProfilingEnabled()) {
        // the pool's job queue allocates as well, hence lower bounds.
        uint64_t calls = cfg.threads * cfg.iterations;
        die_unless(s.alloc_calls >= calls);
        die_unless(s.dealloc_calls >= calls);
        die_unless(s.total_alloc_bytes >= calls * cfg.size);
        die_unless(s.total_dealloc_bytes >= calls * cfg.size);
        die_unequal(s.live_bytes, s.net_bytes());
    }

    return 0;
}

/******************************************************************************/

//! every thread runs a random mix of malloc(), realloc() and free()
int BenchmarkChurn(int argc, char* argv[]) {
    tlx::CmdlineParser clp;
    clp.set_description("random mix of malloc(), realloc() and free()");

    WorkloadConfig cfg;
    cfg.size = 4096;
    cfg.AddOptions(clp);

    size_t max_blocks = 1024;
    clp.add_size_t(
        'b', "blocks", max_blocks,
        "maximum live blocks per thread (default: 1024)");

    if (!clp.process(argc, argv)) return -1;

    die_unless(cfg.size > 0);

    tlx::ThreadPool pool(cfg.threads);
    double ts_start = cfg.Start();

    for (size_t t = 0; t < cfg.threads; ++t) {
        pool.enqueue(
            [&cfg, max_blocks, t]() {
                std::default_random_engine rng(
                    static_cast<unsigned>(std::random_device { } () + t));
                std::vector<void*> blocks;
                blocks.reserve(max_blocks);

                for (size_t i = 0; i < cfg.iterations; ++i) {
                    size_t op = rng() % 3;
                    size_t size = 1 + rng() % cfg.size;

                    if (op == 0 && blocks.size() < max_blocks) {
                        void* p = malloc(size);
                        die_unless(p);
                        memset(p, 0, size);
                        blocks.push_back(p);
                    }
                    else if (op == 1 && !blocks.empty()) {
                        size_t k = rng() % blocks.size();
                        void* p = realloc(blocks[k], size);
                        die_unless(p);
                        blocks[k] = p;
                    }
                    else if (!blocks.empty()) {
                        free(blocks.back());
                        blocks.pop_back();
                    }
                }

                for (void* p : blocks) free(p);
            });
    }
    pool.loop_until_empty();

    mem::AllocProfileSnapshot s = cfg.Finish("churn", ts_start);

    if (mem::IsAllocProfilingEnabled()) {
        die_unequal(s.live_bytes, s.net_bytes());
        die_unless(s.peak_live_bytes >= s.live_bytes);
    }

    return 0;
}

/******************************************************************************/

void Usage(const char* argv0) {
    std::cout
        << "Usage: " << argv0 << " <benchmark>" << std::endl
        << std::endl
        << "    paired  - paired malloc()/free() of a fixed size" << std::endl
        << "    churn   - random mix of malloc(), realloc() and free()"
        << std::endl
        << std::endl
        << "Set ACCRETION_ALLOC_PROFILE=1 to enable allocation profiling."
        << std::endl;
}

int main(int argc, char* argv[]) {

    mem::InitAllocProfileFromEnv();

    if (argc <= 1) {
        Usage(argv[0]);
        return 0;
    }

    std::string benchmark = argv[1];

    if (benchmark == "paired") {
        return BenchmarkPaired(argc - 1, argv + 1);
    }
    else if (benchmark == "churn") {
        return BenchmarkChurn(argc - 1, argv + 1);
    }
    else {
        Usage(argv[0]);
        return -1;
    }
}

/******************************************************************************/
