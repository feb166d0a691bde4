/*
 * String Functions
 *
 * Copyright (C) 2009-2011 Udo Steinberg <udo@hypervisor.org>
 * Economic rights: Technische Universitaet Dresden (Germany)
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

#include "string.hpp"

// The compiler emits calls to these functions for struct copies and IPI message transfers, so they must exist
// in the freestanding build. USED keeps them alive with link-time optimization.

USED void* memcpy(void* d, void const* s, size_t n)
{
    void* dummy;
    asm volatile("rep; movsb" : "=D"(dummy), "+S"(s), "+c"(n) : "0"(d) : "memory");
    return d;
}

USED void* memmove(void* d, void const* s, size_t n)
{
    if (d < s) {
        return memcpy(d, s, n);
    }

    // Copy backwards for overlapping buffers where the destination is above the source.
    char* d_end = static_cast<char*>(d) + n - 1;
    char const* s_end = static_cast<char const*>(s) + n - 1;

    asm volatile("std; rep movsb; cld" : "+S"(s_end), "+D"(d_end), "+c"(n) : : "memory");
    return d;
}

USED void* memset(void* d, int c, size_t n)
{
    void* dummy;
    asm volatile("rep; stosb" : "=D"(dummy), "+c"(n) : "0"(d), "a"(c) : "memory");
    return d;
}

USED int memcmp(void const* s1, void const* s2, size_t n)
{
    auto const* p1 = static_cast<unsigned char const*>(s1);
    auto const* p2 = static_cast<unsigned char const*>(s2);

    for (; n; p1++, p2++, n--) {
        if (*p1 != *p2) {
            return *p1 - *p2;
        }
    }

    return 0;
}
