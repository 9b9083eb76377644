/*******************************************************************************
 * accretion/mem/diagnostics.hpp
 *
 * Prefix of the diagnostics written by the allocator overlay. These are
 * printed with fprintf() only, since the overlay must not allocate.
 *
 * Part of Project Accretion
 *
 * Copyright (C) 2026 The Accretion Authors
 *
 * All rights reserved. Published under the BSD-2 license in the LICENSE file.
 ******************************************************************************/

#pragma once
#ifndef ACCRETION_MEM_DIAGNOSTICS_HEADER
#define ACCRETION_MEM_DIAGNOSTICS_HEADER

//! output
#define ACCRETION_PPREFIX "alloc_profile ### "

#endif // !ACCRETION_MEM_DIAGNOSTICS_HEADER

/******************************************************************************/
