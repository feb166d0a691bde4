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

#include "percpu.hpp"
#include "platform.hpp"
#include "stdio.hpp"

Per_cpu Percpu::cpus[NUM_CPU];
unsigned Percpu::num_cpus;

Optional<unsigned> Percpu::create(uint32 apic_id)
{
    if (num_cpus >= NUM_CPU) {
        trace(TRACE_ERROR, "No per-CPU slot left for APIC ID %#x", apic_id);
        return {};
    }

    unsigned const cpu{num_cpus++};

    cpus[cpu].apic_id = apic_id;
    cpus[cpu].vlapic = Vlapic{apic_id};

    trace(TRACE_CPU, "CPU %u has APIC ID %#x", cpu, apic_id);

    return cpu;
}

Per_cpu& Percpu::current() { return get_remote(Platform::get().current_cpu()); }

Optional<unsigned> Percpu::find_by_apic_id(uint32 apic_id)
{
    for (unsigned cpu{0}; cpu < num_cpus; cpu++) {
        if (cpus[cpu].apic_id == apic_id) {
            return cpu;
        }
    }

    return {};
}

void Percpu::reset()
{
    for (auto& slot : cpus) {
        slot = Per_cpu{};
    }

    num_cpus = 0;
}
