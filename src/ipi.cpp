/*
 * Cross-CPU Messaging
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

#include "ipi.hpp"
#include "assert.hpp"
#include "atomic.hpp"
#include "icr.hpp"
#include "percpu.hpp"
#include "platform.hpp"
#include "stdio.hpp"
#include "string.hpp"
#include "tpr_guard.hpp"

Cpuset Ipi::resolve(Ipi_target const& target, unsigned self, bool& include_self)
{
    Cpuset receivers;

    include_self = false;

    switch (target.kind()) {
    case Ipi_target::SINGLE:
        assert(target.cpu() < Percpu::count());

        if (target.cpu() == self) {
            include_self = true;
        } else {
            receivers.set(target.cpu());
        }
        break;

    case Ipi_target::MULTIPLE:
        target.cpus().for_each([&](unsigned cpu) {
            assert(cpu < Percpu::count());

            if (cpu == self) {
                include_self = true;
            } else {
                receivers.set(cpu);
            }
        });
        break;

    case Ipi_target::ALL:
        include_self = true;
        [[fallthrough]];

    case Ipi_target::ALL_BUT_SELF:
        for (unsigned cpu{0}; cpu < Percpu::count(); cpu++) {
            if (cpu != self and Atomic::load(Percpu::get_remote(cpu).ipi_online)) {
                receivers.set(cpu);
            }
        }
        break;
    }

    return receivers;
}

void Ipi::notify(Ipi_target const& target, Cpuset const& receivers)
{
    Icr const icr{Icr::fixed(IPI_VECTOR)};

    // A broadcast needs a single notification. CPUs that are not IPI-online find no request and ignore it.
    if (target.is_broadcast()) {
        Platform::get().post_irq(icr.with_shorthand(Icr::DSH_ALL_BUT_SELF).value()).expect("Failed to post IPI");
        return;
    }

    receivers.for_each([&icr](unsigned cpu) {
        Platform::get()
            .post_irq(icr.with_destination(Percpu::get_remote(cpu).apic_id).value())
            .expect("Failed to post IPI");
    });
}

void Ipi::receive_single(Ipi_board& board)
{
    switch (board.request) {
    case Ipi_request::SHARED:
        board.shared_handler(board.message);
        break;
    case Ipi_request::MUT:
        board.mut_handler(board.message);
        break;
    }
}

void Ipi::send(Ipi_target const& target, Ipi_payload const& payload)
{
    // Sending from an IPI handler would deadlock with our own sender, so this panics above TPR_SYNCH.
    Tpr_guard synch_guard{TPR_SYNCH};

    unsigned const self{Platform::get().current_cpu()};
    Ipi_board& board{Percpu::get_remote(self).ipi_board};

    assert(Atomic::load(board.pending) == 0);
    assert(payload.size <= sizeof(board.message));

    // No other CPU looks at the board until we announce the request below.
    board.request = payload.request;
    board.shared_handler = payload.shared_handler;
    board.mut_handler = payload.mut_handler;
    memcpy(board.message, payload.message, payload.size);

    bool include_self;
    Cpuset const receivers{resolve(target, self, include_self)};

    receivers.for_each([&board, self](unsigned cpu) {
        Atomic::add(board.pending, static_cast<size_t>(1));
        Percpu::get_remote(cpu).ipi_requests.set(self);
    });

    if (not receivers.empty()) {
        trace(TRACE_IPI, "Sending IPI to %u CPUs%s", receivers.count(), include_self ? " and self" : "");
        notify(target, receivers);
    }

    if (include_self) {
        Tpr_guard ipi_guard{TPR_IPI};
        receive_single(board);
    }

    // Pairs with the release decrement of the receivers. Afterwards, nobody but us looks at the board.
    while (Atomic::load<size_t, Atomic::ACQUIRE>(board.pending) != 0) {
        Platform::get().relax();
    }

    if (payload.request == Ipi_request::MUT) {
        memcpy(payload.result, board.message, payload.size);
    }
}

void Ipi::handle_ipi_interrupt()
{
    Tpr_guard ipi_guard{TPR_IPI};

    Cpuset const senders{Percpu::current().ipi_requests.take()};

    senders.for_each([](unsigned sender) {
        Ipi_board& board{Percpu::get_remote(sender).ipi_board};

        receive_single(board);

        // The sender may reuse its board as soon as this decrement is visible.
        Atomic::sub<size_t, Atomic::RELEASE>(board.pending, 1);
    });
}

void Ipi::start_cpu()
{
    Per_cpu& cpu{Percpu::current()};

    Atomic::store(cpu.ipi_online, true);
    trace(TRACE_IPI, "CPU with APIC ID %#x accepts IPIs", cpu.apic_id);
}
