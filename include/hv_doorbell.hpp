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

#pragma once

#include "atomic.hpp"
#include "types.hpp"

// Bits of the status word of an extended interrupt descriptor.
struct Hv_ext_int_status {
    enum
    {
        PENDING_VECTOR = 0xffU,
        NMI_PENDING = 1U << 8,
        MC_PENDING = 1U << 9,
        LEVEL_SENSITIVE = 1U << 10,
        IPI_PENDING = 1U << 11,
        TIMER_PENDING = 1U << 12,
        GUEST_MSR_ACCESS = 1U << 13,
        MULTIPLE_VECTORS = 1U << 14,
        NO_FURTHER_SIGNAL = 1U << 15,
        NO_EOI_REQUIRED = 1U << 16,
        VMPL1_EVENTS = 1U << 17,
        VMPL2_EVENTS = 1U << 18,
        VMPL3_EVENTS = 1U << 19,
        VECTOR_31 = 1U << 31,
    };

    static uint8 pending_vector(uint32 status) { return static_cast<uint8>(status & PENDING_VECTOR); }

    // The event flag for the given VMPL (1 to 3) in the status word of descriptor 0.
    static uint32 vmpl_event_mask(unsigned vmpl) { return VMPL1_EVENTS << (vmpl - 1); }
};

// An extended interrupt descriptor as written by the hypervisor.
//
// All fields are modified concurrently by the hypervisor and must only be accessed atomically.
struct Hv_ext_int_info {
    // Vectors 32 to 255, in groups of 32. irr[0] holds vectors 32 to 63.
    static constexpr unsigned IRR_WORDS{7};

    uint32 status;
    uint32 irr[IRR_WORDS];

    // Move all interrupts the hypervisor has signaled in this descriptor into the sink.
    //
    // The sink provides:
    //
    //   bool signal_host_interrupt(uint8 vector, bool level_sensitive)
    //     Post a single vector, if it passes the allow-list. Returns whether it was posted.
    //
    //   uint32 host_allowed_mask(unsigned group)
    //     The allow-list for vectors group * 32 to group * 32 + 31.
    //
    //   void signal_host_vectors(unsigned group, uint32 bits)
    //     Post already filtered edge-triggered vectors of the given group.
    //
    // Every update of the status word is a compare-and-swap, so signals that the hypervisor raises while we
    // drain are never lost. They are either consumed here or remain for the next pass.
    template <typename SINK> void drain(SINK& sink)
    {
        uint32 flags{Atomic::load<uint32, Atomic::RELAXED>(status)};

        // A level-sensitive vector is consumed together with its level flag.
        if (flags & Hv_ext_int_status::LEVEL_SENSITIVE) {
            uint32 consumed;
            do {
                consumed = flags & ~(Hv_ext_int_status::PENDING_VECTOR | Hv_ext_int_status::LEVEL_SENSITIVE);
            } while (not Atomic::cmp_swap<uint32, Atomic::RELAXED>(status, flags, consumed));

            sink.signal_host_interrupt(Hv_ext_int_status::pending_vector(flags), true);
            flags = consumed;
        }

        if (flags & Hv_ext_int_status::MULTIPLE_VECTORS) {
            // The flag is cleared before the IRR is scanned, so vectors that are signaled later set it again.
            Atomic::clr_mask<uint32, Atomic::RELAXED>(status, Hv_ext_int_status::MULTIPLE_VECTORS);

            // Vector 31 does not fit into the IRR words, which start at vector 32.
            if (flags & Hv_ext_int_status::VECTOR_31) {
                Atomic::clr_mask<uint32, Atomic::RELAXED>(status, Hv_ext_int_status::VECTOR_31);
                sink.signal_host_interrupt(31, false);
            }

            for (unsigned i{0}; i < IRR_WORDS; i++) {
                uint32 const bits{Atomic::exchange<uint32, Atomic::RELAXED>(irr[i], 0)};
                unsigned const group{i + 1};

                if (bits != 0) {
                    sink.signal_host_vectors(group, bits & sink.host_allowed_mask(group));
                }
            }
        } else if (Hv_ext_int_status::pending_vector(flags) != 0) {
            // If this fails, the hypervisor has signaled another interrupt in the meantime. It is consumed
            // in another pass.
            uint32 expected{flags};
            if (Atomic::cmp_swap<uint32, Atomic::RELAXED>(status, expected,
                                                          flags & ~Hv_ext_int_status::PENDING_VECTOR)) {
                sink.signal_host_interrupt(Hv_ext_int_status::pending_vector(flags), false);
            }
        }
    }
};

// The page that the hypervisor uses to signal interrupts and events to Palisade.
//
// Without multi-VMPL support, only descriptor 0 is used. With it, the hypervisor keeps one descriptor per
// VMPL and announces pending events for VMPL 1 to 3 in the status word of descriptor 0.
struct Hv_doorbell {
    static constexpr unsigned NUM_VMPL{4};

    Hv_ext_int_info per_vmpl[NUM_VMPL];

    // Select the descriptor that carries interrupts for the given VMPL.
    //
    // Returns nullptr, if there is nothing pending for the VMPL. The event flag of the VMPL is consumed.
    Hv_ext_int_info* select_descriptor(bool multi_vmpl, unsigned vmpl);

    // Acknowledge the doorbell events that carry no interrupt and return the ones that were acknowledged.
    //
    // The no-further-signal bit is cleared first. Signals that arrive afterwards prevent a return to a lower
    // VMPL until they are processed.
    uint32 process_events();

    // Whether the hypervisor has marked the current host interrupt as not requiring an EOI.
    bool no_eoi_required() const;
};

static_assert(sizeof(Hv_ext_int_info) == 32, "Extended interrupt descriptor layout is fixed");
static_assert(sizeof(Hv_doorbell) <= 4096, "The doorbell must fit into a single page");
