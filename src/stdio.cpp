/*
 * Standard I/O
 *
 * Copyright (C) 2022 Julian Stecklina, Cyberus Technology
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

#include "stdio.hpp"
#include "platform.hpp"

// This trivial function does not live in the header to avoid pulling platform.hpp into every user of trace.
int trace_id() { return Platform::installed() ? static_cast<int>(Platform::get().current_cpu()) : -1; }
