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

#include "apic_protocol.hpp"
#include "apic_emulation.hpp"
#include "atomic.hpp"
#include "stdio.hpp"

uint32 Apic_registration::count;

void Apic_registration::enable() { Atomic::store<uint32, Atomic::RELAXED>(count, 1); }

Result<bool, Apic_error> Apic_registration::change(bool increment)
{
    uint32 current{Atomic::load<uint32, Atomic::RELAXED>(count)};
    uint32 next;

    do {
        if (increment) {
            // A registration that has dropped to zero cannot be revived.
            if (current == 0 or current == ~0U) {
                return Err(Apic_error::REGISTRATION);
            }
            next = current + 1;
        } else {
            if (current == 0) {
                return Ok(false);
            }
            next = current - 1;
        }
    } while (not Atomic::cmp_swap<uint32, Atomic::RELAXED>(count, current, next));

    return Ok(next > 0);
}

bool Apic_registration::active() { return Atomic::load<uint32, Atomic::RELAXED>(count) > 0; }

namespace
{

Protocol_error to_protocol_error(Apic_error err)
{
    trace(TRACE_PROTOCOL, "APIC request failed with error %d", static_cast<int>(err));
    return Protocol_error::INVALID_PARAMETER;
}

Result_void<Protocol_error> configure(Request_params& params)
{
    switch (params.rcx) {
    case 1: {
        TRY_OR_RETURN(Apic_registration::change(true).map_err(to_protocol_error));

        auto const activated{Apic_emulation::activate()};

        if (activated.is_err()) {
            // Undo the registration we took above. The result of the drop does not matter anymore.
            bool const still_registered{Apic_registration::change(false).unwrap_or_else([] { return false; })};
            trace(TRACE_PROTOCOL, "Activation failed, registration %s", still_registered ? "kept" : "dropped");

            return Err(to_protocol_error(activated.unwrap_err()));
        }

        params.rcx = 1;
        return Ok_void({});
    }
    case 0:
        params.rcx = TRY_OR_RETURN(Apic_registration::change(false).map_err(to_protocol_error));
        return Ok_void({});
    default:
        return Err(Protocol_error::INVALID_PARAMETER);
    }
}

} // namespace

Result_void<Protocol_error> Apic_protocol::handle(uint32 request, Request_params& params,
                                                  Guest_cpu_state& cpu_state, Lazy_eoi_channel* channel)
{
    switch (request) {
    case QUERY_FEATURES:
        params.rcx = 0;
        return Ok_void({});

    case READ_REGISTER:
        params.rdx = TRY_OR_RETURN(
            Apic_emulation::read_register(cpu_state, channel, params.rcx).map_err(to_protocol_error));
        return Ok_void({});

    case WRITE_REGISTER:
        TRY_OR_RETURN(
            Apic_emulation::write_register(cpu_state, channel, params.rcx, params.rdx).map_err(to_protocol_error));
        return Ok_void({});

    case CONFIGURE_VECTOR:
        if (params.rcx > 0x1ff) {
            return Err(Protocol_error::INVALID_PARAMETER);
        }

        Apic_emulation::configure_vector(static_cast<uint8>(params.rcx & 0xff), params.rcx & 0x100);
        return Ok_void({});

    case CONFIGURE:
        return configure(params);

    default:
        trace(TRACE_PROTOCOL, "Unsupported APIC request %u", request);
        return Err(Protocol_error::UNSUPPORTED_CALL);
    }
}
