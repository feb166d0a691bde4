/*
 * Generic Console
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
#include "spinlock.hpp"
#include "types.hpp"

#include <stdarg.h>

// A sink for log output.
//
// Concrete consoles (the serial port, a memory log) implement putc and register themselves with enable. All
// output that goes through print or vprint is formatted once per registered console.
class Console
{
private:
    enum
    {
        MODE_FLAGS = 0,
        MODE_WIDTH = 1,
        MODE_PRECS = 2,
        FLAG_SIGNED = 1UL << 0,
        FLAG_ALT_FORM = 1UL << 1,
        FLAG_ZERO_PAD = 1UL << 2,
    };

    static Console* list;
    static Spinlock lock;

    Console* next{nullptr};
    bool enabled{false};

    void print_num(uint64 val, unsigned base, unsigned width, unsigned flags);

    void print_str(char const* s, unsigned width, unsigned precs);

    void vprintf(char const* format, va_list args);

    static void vprint_locked(char const* format, va_list ap);

protected:
    ~Console() = default;

    virtual void putc(int c) = 0;

public:
    // Add a console to the list of consoles that receive output.
    static void enable(Console* c);

    // Remove a previously enabled console.
    static void disable(Console* c);

    FORMAT(1, 2) static void print(char const* format, ...);

    static void vprint(char const* format, va_list ap);
};
