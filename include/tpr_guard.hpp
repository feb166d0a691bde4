/*
 * Software Priority Guard
 *
 * Copyright (C) 2024 The Palisade Authors.
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

// Raise the software priority of the current CPU for the lifetime of the guard.
//
// The constructor raises the priority to the given level and the destructor restores the level that was
// active before. Raising to the current level is allowed, lowering is a bug and panics.
//
// Typical usage is:
//
// {
//     Tpr_guard g{TPR_SYNCH};
//
//     ... interrupts at or below TPR_SYNCH are held off ...
// }
//
// The same caveat as for Scope_guard applies: calling a [[noreturn]] function while a Tpr_guard is live
// skips the destructor.
class Tpr_guard
{
private:
    uint8 previous;

public:
    Tpr_guard() = delete;
    Tpr_guard(Tpr_guard const&) = delete;
    Tpr_guard& operator=(Tpr_guard const&) = delete;

    explicit Tpr_guard(uint8 level);
    ~Tpr_guard();

    // The software priority of the current CPU.
    static uint8 current();
};
