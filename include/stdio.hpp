/*
 * Standard I/O
 *
 * Copyright (C) 2009-2011 Udo Steinberg <udo@hypervisor.org>
 * Economic rights: Technische Universitaet Dresden (Germany)
 *
 * Copyright (C) 2012 Udo Steinberg, Intel Corporation.
 *
 * This file is part of the Palisade secure VM service.
 *
 * Palisade is free software: you can redistribute it and/or modify it
 * under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation.
 *
 * Palisade is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License version 2 for more details.
 */

#pragma once

#include "console.hpp"
#include "string.hpp"

// Returns the current CPU ID or a placeholder value if the CPU ID is not yet known.
//
// This function is only intended to be called from the trace macro below.
int trace_id();

// Emit a log message to all configured consoles.
//
// The first parameter is one of the TRACE_ values defined below. Messages will only be printed, if the trace
// value is included in trace_mask.
#define trace(T, format, ...)                                                                                \
    do {                                                                                                     \
        if (EXPECT_FALSE((trace_mask & (T)) == (T))) {                                                       \
            Console::print("[%3d][%s:%d] " format, trace_id(), FILENAME, __LINE__, ##__VA_ARGS__);           \
        }                                                                                                    \
    } while (0)

// Possible trace events.
enum
{
    TRACE_CPU = 1UL << 0,
    TRACE_APIC = 1UL << 2,
    TRACE_IPI = 1UL << 3,
    TRACE_DOORBELL = 1UL << 5,
    TRACE_PROTOCOL = 1UL << 6,
    TRACE_ERROR = 1UL << 31,
};

// Enabled trace events.
constexpr unsigned trace_mask =
#ifdef DEBUG
    TRACE_IPI | TRACE_DOORBELL |
#endif
    TRACE_CPU | TRACE_APIC | TRACE_PROTOCOL | TRACE_ERROR;
