/*
 * Configuration
 *
 * Copyright (C) 2009-2011 Udo Steinberg <udo@hypervisor.org>
 * Economic rights: Technische Universitaet Dresden (Germany)
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

// The maximum number of physical CPUs that can take part in IPI rounds.
#define NUM_CPU 128

// The number of possible interrupt vectors
#define NUM_INT_VECTORS 256

// Vectors below this one are reserved for exceptions and are never accepted from the host, unless the guest
// explicitly allows them after activating APIC emulation.
#define NUM_EXC 31

// The size of the per-CPU buffer that carries an IPI message to its receivers.
#define IPI_BUFFER_SIZE 1024

// The interrupt vector that is used to notify a CPU about pending IPI messages.
#define IPI_VECTOR 0xe0

// The privilege level the guest operating system runs at.
#define GUEST_VMPL 1

// Software priority levels.
//
// Only the ordering of these values matters: IPI handlers run at TPR_IPI, which must be strictly above
// TPR_SYNCH. Otherwise, an IPI handler could try to send an IPI itself and deadlock with its sender.
#define TPR_NORMAL 0
#define TPR_SYNCH 2
#define TPR_IPI 0xe

static_assert(TPR_IPI > TPR_SYNCH, "IPI handlers must run above the IPI send priority");
static_assert(TPR_SYNCH > TPR_NORMAL, "Sending IPIs must raise the priority");
