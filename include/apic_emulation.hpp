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

#pragma once

#include "guest_cpu_state.hpp"
#include "hv_doorbell.hpp"
#include "icr.hpp"
#include "result.hpp"
#include "types.hpp"
#include "vlapic.hpp"

// Entry points into the emulated APIC of the current CPU.
//
// The vlapic of a CPU is modified by its own trap handlers and by IPIs from other CPUs. All functions here
// run the vlapic code at TPR_IPI to keep both apart.
class Apic_emulation
{
private:
    // Deliver the vector of an ICR write to the other CPUs it addresses.
    static void send_icr(Icr const& icr);

public:
    static Result<uint64, Apic_error> read_register(Guest_cpu_state& cpu_state, Lazy_eoi_channel* channel,
                                                    uint64 reg);

    // An ICR write that targets other CPUs sends an IPI after register emulation is complete.
    static Result_void<Apic_error> write_register(Guest_cpu_state& cpu_state, Lazy_eoi_channel* channel,
                                                  uint64 reg, uint64 value);

    // Called before each guest entry.
    static void update(Guest_cpu_state& cpu_state, Lazy_eoi_channel* channel);

    static Result_void<Apic_error> activate();

    static void configure_vector(uint8 vector, bool allowed);

    static void register_doorbell(Hv_doorbell* doorbell, bool multi_vmpl);
};
