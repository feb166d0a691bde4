/*
 * CPU Set
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

#include "bitmap.hpp"
#include "config.hpp"
#include "types.hpp"

// A set of CPUs identified by their dense CPU index (not their APIC ID).
//
// Single-bit operations are atomic, so a Cpuset can be shared between CPUs. Iteration and the comparison
// operators are not atomic and should only be used on sets that are not concurrently modified, for example
// a set returned by take.
class Cpuset
{
private:
    Bitmap<mword, NUM_CPU> bits{false};

    explicit Cpuset(Bitmap<mword, NUM_CPU> const& b) : bits(b) {}

public:
    Cpuset() = default;

    bool chk(unsigned cpu) const { return bits.atomic_fetch(cpu); }

    bool set(unsigned cpu) { return bits[cpu].atomic_fetch_set(); }

    void clr(unsigned cpu) { bits[cpu].atomic_clear(); }

    /// Merge another Cpuset into this one. This effectively calculates the
    /// union of both sets.
    ///
    /// See the note at Bitmap::atomic_union for the properties of this
    /// function with respect to concurrency.
    void merge(Cpuset const& s) { bits.atomic_union(s.bits); }

    /// Atomically remove all CPUs from this set and return them.
    Cpuset take() { return Cpuset{bits.atomic_take()}; }

    bool empty() const { return bits.empty(); }

    unsigned count() const
    {
        unsigned n{0};

        for_each([&n](unsigned) { n++; });
        return n;
    }

    /// Call fn with the index of each CPU in the set in ascending order.
    template <typename FN> void for_each(FN&& fn) const
    {
        for (long cpu{bits.next(0)}; cpu >= 0; cpu = bits.next(static_cast<size_t>(cpu) + 1)) {
            fn(static_cast<unsigned>(cpu));
        }
    }

    bool operator==(Cpuset const& other) const { return bits == other.bits; }
    bool operator!=(Cpuset const& other) const { return not(*this == other); }
};
