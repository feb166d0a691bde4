/*
 * Per-CPU Directory
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

#include "assert.hpp"
#include "config.hpp"
#include "cpuset.hpp"
#include "ipi.hpp"
#include "optional.hpp"
#include "types.hpp"
#include "vlapic.hpp"

// The state of a single physical CPU.
//
// The vlapic and the IPI board are owned by the CPU itself. Other CPUs only read the APIC ID and the IPI
// flag, set bits in ipi_requests, and read the IPI board of a CPU whose IPI they are handling.
struct Per_cpu {
    uint32 apic_id{0};

    // Set once the CPU handles IPIs. Accessed atomically.
    bool ipi_online{false};

    // The CPUs whose IPI boards hold a message for this CPU.
    Cpuset ipi_requests;

    Ipi_board ipi_board;

    Vlapic vlapic;
};

// A fixed arena of Per_cpu slots indexed by the dense CPU index.
//
// Slots are created while only the boot CPU runs and are never destroyed.
class Percpu
{
private:
    static Per_cpu cpus[NUM_CPU];
    static unsigned num_cpus;

public:
    // Create the slot for the next CPU. Returns its CPU index or nothing, if all slots are taken.
    static Optional<unsigned> create(uint32 apic_id);

    static unsigned count() { return num_cpus; }

    static Per_cpu& get_remote(unsigned cpu)
    {
        assert(cpu < num_cpus);
        return cpus[cpu];
    }

    // The slot of the CPU that executes this call.
    static Per_cpu& current();

    static Optional<unsigned> find_by_apic_id(uint32 apic_id);

    // Drop all slots. Only valid while no other CPU runs.
    static void reset();
};
