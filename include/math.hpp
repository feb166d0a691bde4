/*
 * Math Helper Functions
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

#include "compiler.hpp"
#include "types.hpp"

// The index of the most significant set bit or -1, if no bit is set.
constexpr inline long bit_scan_reverse(mword val)
{
    if (EXPECT_FALSE(val == 0)) {
        return -1;
    }

    static_assert(sizeof(mword) == sizeof(long long), "builtin call has wrong size");
    return static_cast<long>(sizeof(long long) * 8) - __builtin_clzll(val) - 1;
}

// The index of the least significant set bit or -1, if no bit is set.
constexpr inline long bit_scan_forward(mword val)
{
    if (EXPECT_FALSE(val == 0)) {
        return -1;
    }

    static_assert(sizeof(mword) == sizeof(long), "builtin call has wrong size");
    return __builtin_ctzl(val);
}

// Round down or up to a power-of-two alignment.
constexpr inline mword align_dn(mword val, mword align) { return val & ~(align - 1); }
constexpr inline mword align_up(mword val, mword align) { return align_dn(val + align - 1, align); }
