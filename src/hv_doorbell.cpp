/*
 * #HV Doorbell Page
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

#include "hv_doorbell.hpp"
#include "assert.hpp"
#include "stdio.hpp"

Hv_ext_int_info* Hv_doorbell::select_descriptor(bool multi_vmpl, unsigned vmpl)
{
    if (not multi_vmpl) {
        return &per_vmpl[0];
    }

    assert(vmpl > 0 and vmpl < NUM_VMPL);

    uint32 const event{Hv_ext_int_status::vmpl_event_mask(vmpl)};

    if ((Atomic::load<uint32, Atomic::RELAXED>(per_vmpl[0].status) & event) == 0) {
        return nullptr;
    }

    Atomic::clr_mask<uint32, Atomic::RELAXED>(per_vmpl[0].status, event);
    return &per_vmpl[vmpl];
}

uint32 Hv_doorbell::process_events()
{
    uint32& status{per_vmpl[0].status};
    uint32 const flags{Atomic::load<uint32, Atomic::RELAXED>(status)};
    uint32 acknowledged{0};

    Atomic::clr_mask<uint32, Atomic::RELAXED>(status, Hv_ext_int_status::NO_FURTHER_SIGNAL);

    // IPI and timer events only wake us up. There is no work attached to them.
    if (flags & Hv_ext_int_status::IPI_PENDING) {
        Atomic::clr_mask<uint32, Atomic::RELAXED>(status, Hv_ext_int_status::IPI_PENDING);
        acknowledged |= Hv_ext_int_status::IPI_PENDING;
    }

    if (flags & Hv_ext_int_status::TIMER_PENDING) {
        Atomic::clr_mask<uint32, Atomic::RELAXED>(status, Hv_ext_int_status::TIMER_PENDING);
        acknowledged |= Hv_ext_int_status::TIMER_PENDING;
    }

    trace(TRACE_DOORBELL, "Doorbell events %#x acknowledged %#x", flags, acknowledged);

    return acknowledged;
}

bool Hv_doorbell::no_eoi_required() const
{
    return Atomic::load<uint32, Atomic::RELAXED>(per_vmpl[0].status) & Hv_ext_int_status::NO_EOI_REQUIRED;
}
