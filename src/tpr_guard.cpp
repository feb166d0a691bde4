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

#include "tpr_guard.hpp"
#include "panic.hpp"
#include "platform.hpp"

Tpr_guard::Tpr_guard(uint8 level) : previous(current())
{
    if (EXPECT_FALSE(level < previous)) {
        panic("Attempted to lower TPR from %u to %u", previous, level);
    }

    Platform::get().set_tpr(level);
}

Tpr_guard::~Tpr_guard() { Platform::get().set_tpr(previous); }

uint8 Tpr_guard::current() { return Platform::get().get_tpr(); }
