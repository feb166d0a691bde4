/*
 * Per-CPU APIC Emulation
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

#include "apic_emulation.hpp"
#include "config.hpp"
#include "cpuset.hpp"
#include "ipi.hpp"
#include "optional.hpp"
#include "percpu.hpp"
#include "platform.hpp"
#include "stdio.hpp"
#include "tpr_guard.hpp"

namespace
{

// Carries a guest ICR write to the CPUs it addresses. Each receiver checks the destination itself.
struct Apic_ipi_message {
    uint64 icr;

    void invoke() const { Percpu::current().vlapic.accept_ipi(Icr{icr}); }
};

} // namespace

void Apic_emulation::send_icr(Icr const& icr)
{
    Apic_ipi_message const message{icr.value()};

    // The sender has already posted to itself, if it is addressed.
    if (icr.shorthand() != Icr::DSH_NONE or icr.is_broadcast()) {
        Ipi::send_multicast(Ipi_target::all_but_self(), message);
        return;
    }

    if (not icr.logical()) {
        Optional<unsigned> const cpu{Percpu::find_by_apic_id(icr.destination())};

        if (not cpu.has_value()) {
            trace(TRACE_APIC, "Dropping IPI to APIC ID %#x without CPU", icr.destination());
            return;
        }

        Ipi::send_multicast(Ipi_target::single(*cpu), message);
        return;
    }

    unsigned const self{Platform::get().current_cpu()};
    Cpuset targets;

    for (unsigned cpu{0}; cpu < Percpu::count(); cpu++) {
        if (cpu != self and icr.matches(Percpu::get_remote(cpu).apic_id)) {
            targets.set(cpu);
        }
    }

    if (targets.empty()) {
        trace(TRACE_APIC, "Dropping IPI to logical destination %#x without CPU", icr.destination());
        return;
    }

    Ipi::send_multicast(Ipi_target::multiple(targets), message);
}

Result<uint64, Apic_error> Apic_emulation::read_register(Guest_cpu_state& cpu_state, Lazy_eoi_channel* channel,
                                                         uint64 reg)
{
    Tpr_guard guard{TPR_IPI};

    return Percpu::current().vlapic.read_register(cpu_state, channel, reg);
}

Result_void<Apic_error> Apic_emulation::write_register(Guest_cpu_state& cpu_state, Lazy_eoi_channel* channel,
                                                       uint64 reg, uint64 value)
{
    Optional<Icr> icr;

    {
        Tpr_guard guard{TPR_IPI};
        Vlapic& vlapic{Percpu::current().vlapic};

        TRY_OR_RETURN(vlapic.write_register(cpu_state, channel, reg, value));
        icr = vlapic.take_pending_icr();
    }

    // Sending an IPI needs a priority below TPR_IPI.
    if (icr.has_value()) {
        send_icr(*icr);
    }

    return Ok_void({});
}

void Apic_emulation::update(Guest_cpu_state& cpu_state, Lazy_eoi_channel* channel)
{
    Tpr_guard guard{TPR_IPI};

    Percpu::current().vlapic.present_interrupts(cpu_state, channel);
}

Result_void<Apic_error> Apic_emulation::activate()
{
    Tpr_guard guard{TPR_IPI};

    return Percpu::current().vlapic.activate();
}

void Apic_emulation::configure_vector(uint8 vector, bool allowed)
{
    Tpr_guard guard{TPR_IPI};

    Percpu::current().vlapic.configure_vector(vector, allowed);
}

void Apic_emulation::register_doorbell(Hv_doorbell* doorbell, bool multi_vmpl)
{
    Tpr_guard guard{TPR_IPI};

    Percpu::current().vlapic.attach_doorbell(doorbell, multi_vmpl);
}
