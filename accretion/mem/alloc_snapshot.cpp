/*******************************************************************************
 * accretion/mem/alloc_snapshot.cpp
 *
 * Part of Project Accretion
 *
 * Copyright (C) 2026 The Accretion Authors
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#include <accretion/mem/alloc_snapshot.hpp>
#include <tlx/string/format_si_iec_units.hpp>

#include <string>

namespace accretion {
namespace mem {

//! byte count followed by IEC units, if non-negative
static std::string FormatBytes(int64_t bytes) {
    if (bytes < 0) return std::to_string(bytes);
    return std::to_string(bytes) + " ("
           + tlx::format_iec_units(static_cast<uint64_t>(bytes)) + "B)";
}

std::ostream& operator << (std::ostream& os, const AllocProfileSnapshot& s) {
    return os << "live=" << s.live_bytes
              << " peak=" << s.peak_live_bytes
              << " alloc=" << s.total_alloc_bytes
              << " dealloc=" << s.total_dealloc_bytes
              << " net=" << s.net_bytes()
              << " calls=" << s.alloc_calls
              << '/' << s.dealloc_calls
              << '/' << s.realloc_calls;
}

void PrintAllocProfileSummary(std::ostream& os, const AllocProfileSnapshot& s) {
    os << "-- Allocator profile summary --" << std::endl
       << "  alloc live bytes: " << FormatBytes(s.live_bytes) << std::endl
       << "  alloc peak live bytes: " << FormatBytes(s.peak_live_bytes)
       << std::endl
       << "  alloc total bytes: "
       << FormatBytes(static_cast<int64_t>(s.total_alloc_bytes)) << std::endl
       << "  dealloc total bytes: "
       << FormatBytes(static_cast<int64_t>(s.total_dealloc_bytes)) << std::endl
       << "  alloc net bytes: " << s.net_bytes() << std::endl
       << "  alloc calls: " << s.alloc_calls
       << " dealloc calls: " << s.dealloc_calls
       << " realloc calls: " << s.realloc_calls << std::endl;
}

} // namespace mem
} // namespace accretion

/******************************************************************************/
