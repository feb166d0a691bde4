/*
 * Guest CPU State Interface
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

#include "result.hpp"
#include "types.hpp"

// The register state of the virtual CPU the emulated APIC belongs to.
//
// The platform layer implements this on top of the VMSA (SEV-SNP) or the TD VP state (TDX).
class Guest_cpu_state
{
protected:
    ~Guest_cpu_state() = default;

public:
    virtual uint8 get_tpr() const = 0;
    virtual void set_tpr(uint8 tpr) = 0;

    // RFLAGS.IF of the guest.
    virtual bool interrupts_enabled() const = 0;

    // The guest is in an STI or MOV SS interrupt shadow.
    virtual bool in_interrupt_shadow() const = 0;

    // Inject the vector as an event on the next guest entry. Returns false, if an event is already pending.
    virtual bool try_deliver_interrupt_immediately(uint8 vector) = 0;

    // Queue the vector as a virtual interrupt that the hardware delivers once the guest can take it.
    virtual void queue_interrupt(uint8 vector) = 0;

    // Return and clear the vector of an injected event that the guest has not taken yet. 0 means none.
    virtual uint8 check_and_clear_pending_interrupt_event() = 0;

    // Return and clear a queued virtual interrupt that the guest has not taken yet. 0 means none.
    virtual uint8 check_and_clear_pending_virtual_interrupt() = 0;
};

enum class Guest_memory_error
{
    // The page backing the shared area is not accessible.
    INACCESSIBLE,
};

// The lazy EOI flag in the calling area that the guest shares with Palisade.
//
// While the flag is set, the guest does not need to write the EOI register for the interrupt that is in
// service. The guest clears the flag instead of performing an EOI.
class Lazy_eoi_channel
{
protected:
    ~Lazy_eoi_channel() = default;

public:
    virtual Result<bool, Guest_memory_error> no_eoi_required() const = 0;
    virtual Result_void<Guest_memory_error> set_no_eoi_required(bool required) = 0;
};
