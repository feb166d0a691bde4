/*
 * Generic Lock Guard
 *
 * Copyright (C) 2009-2011 Udo Steinberg <udo@hypervisor.org>
 * Economic rights: Technische Universitaet Dresden (Germany)
 *
 * Copyright (C) 2015 Alexander Boettcher, Genode Labs GmbH
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

// Hold a lock for the lifetime of the guard.
//
// T needs lock and unlock members. Spinlock is the usual choice.
template <typename T> class Lock_guard
{
private:
    T& lock_;

public:
    Lock_guard(Lock_guard const&) = delete;
    Lock_guard& operator=(Lock_guard const&) = delete;

    ALWAYS_INLINE inline explicit Lock_guard(T& l) : lock_(l) { lock_.lock(); }

    ALWAYS_INLINE inline ~Lock_guard() { lock_.unlock(); }
};
