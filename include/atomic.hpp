/*
 * Atomic Operations
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

#pragma once

#include "compiler.hpp"

class Atomic
{
public:
    // Memory orderings for the operations below. The default for all operations is sequential
    // consistency. Weaker orderings are only used where the pairing is documented at the call site.
    enum Memory_order
    {
        RELAXED = __ATOMIC_RELAXED,
        ACQUIRE = __ATOMIC_ACQUIRE,
        RELEASE = __ATOMIC_RELEASE,
        ACQ_REL = __ATOMIC_ACQ_REL,
        SEQ_CST = __ATOMIC_SEQ_CST,
    };

    // Compare ptr with o and replace it by n if they match.
    //
    // On failure, o is updated with the value that was found. This makes retry loops cheap, because the
    // caller does not have to reload the value.
    template <typename T, Memory_order O = SEQ_CST> static inline bool cmp_swap(T& ptr, T& o, T n)
    {
        return __atomic_compare_exchange_n(&ptr, &o, n, false, O, O == RELEASE or O == ACQ_REL ? RELAXED : O);
    }

    template <typename T, Memory_order O = SEQ_CST> static inline T exchange(T& ptr, T n)
    {
        return __atomic_exchange_n(&ptr, n, O);
    }

    template <typename T, Memory_order O = SEQ_CST> static inline T load(T const& ptr)
    {
        return __atomic_load_n(&ptr, O);
    }

    template <typename T, Memory_order O = SEQ_CST> static inline void store(T& ptr, T n)
    {
        __atomic_store_n(&ptr, n, O);
    }

    template <typename T, Memory_order O = SEQ_CST> static inline T add(T& ptr, T v)
    {
        return __atomic_add_fetch(&ptr, v, O);
    }

    template <typename T, Memory_order O = SEQ_CST> static inline T fetch_add(T& ptr, T v)
    {
        return __atomic_fetch_add(&ptr, v, O);
    }

    template <typename T, Memory_order O = SEQ_CST> static inline T sub(T& ptr, T v)
    {
        return __atomic_sub_fetch(&ptr, v, O);
    }

    template <typename T, Memory_order O = SEQ_CST> static inline T fetch_sub(T& ptr, T v)
    {
        return __atomic_fetch_sub(&ptr, v, O);
    }

    template <typename T, Memory_order O = SEQ_CST> static inline void set_mask(T& ptr, T v)
    {
        __atomic_fetch_or(&ptr, v, O);
    }

    // Clear the bits in v and return the previous value.
    template <typename T, Memory_order O = SEQ_CST> static inline T clr_mask(T& ptr, T v)
    {
        return __atomic_fetch_and(&ptr, static_cast<T>(~v), O);
    }

    template <typename T> static inline bool test_set_bit(T& val, unsigned long bit)
    {
        auto const bitmask{static_cast<T>(1) << bit};
        return __atomic_fetch_or(&val, bitmask, __ATOMIC_SEQ_CST) & bitmask;
    }

    template <typename T> static inline bool test_clr_bit(T& val, unsigned long bit)
    {
        auto const bitmask{static_cast<T>(1) << bit};
        return __atomic_fetch_and(&val, static_cast<T>(~bitmask), __ATOMIC_SEQ_CST) & bitmask;
    }
};
