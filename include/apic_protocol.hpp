/*
 * APIC Guest Protocol
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
#include "result.hpp"
#include "types.hpp"
#include "vlapic.hpp"

// The guest registers of a protocol request. Results are returned in the same registers.
struct Request_params {
    uint64 rcx;
    uint64 rdx;
    uint64 r8;
};

enum class Protocol_error
{
    // The request number is unknown.
    UNSUPPORTED_CALL,

    // The request is known, but its parameters are not acceptable.
    INVALID_PARAMETER,
};

// The number of guest CPUs that use APIC emulation.
//
// The platform enables the counter at boot, if the hypervisor supports alternate interrupt injection. After
// that, it can only be raised while it is non-zero. Once it has dropped to zero, APIC emulation stays off.
class Apic_registration
{
private:
    static uint32 count;

public:
    static void enable();

    // Raise or drop the registration count. Returns whether emulation is still registered afterwards.
    //
    // Dropping a count that is already zero is a benign race with another CPU and is not an error.
    static Result<bool, Apic_error> change(bool increment);

    static bool active();
};

// Dispatcher for APIC requests of the guest.
class Apic_protocol
{
public:
    enum Request
    {
        // rcx <- supported features (none beyond the base set)
        QUERY_FEATURES = 0,

        // rcx = register, rdx <- value
        READ_REGISTER = 1,

        // rcx = register, rdx = value
        WRITE_REGISTER = 2,

        // rcx bits 0-7 = vector, bit 8 = allowed
        CONFIGURE_VECTOR = 3,

        // rcx = 1 activates emulation on this CPU, rcx = 0 drops the registration. rcx <- still registered
        CONFIGURE = 4,
    };

    static Result_void<Protocol_error> handle(uint32 request, Request_params& params, Guest_cpu_state& cpu_state,
                                              Lazy_eoi_channel* channel);
};
