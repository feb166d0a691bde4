/*
 * Platform Abstraction
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

#include "assert.hpp"
#include "result.hpp"
#include "types.hpp"
#include "x86.hpp"

enum class Host_error
{
    // The hypervisor rejected or failed a request.
    REQUEST_FAILED,

    // The request is not available on this platform.
    NOT_SUPPORTED,
};

// The services the interrupt core needs from the SEV-SNP or TDX platform layer.
//
// There is exactly one platform object. It is installed once during early boot, before any secondary CPU is
// started, and is never replaced afterwards.
class Platform
{
private:
    static inline Platform* instance{nullptr};

protected:
    ~Platform() = default;

public:
    static void install(Platform* p) { instance = p; }

    static bool installed() { return instance != nullptr; }

    static Platform& get()
    {
        assert(instance != nullptr);
        return *instance;
    }

    // The dense index of the CPU that executes this call.
    virtual unsigned current_cpu() = 0;

    // The software task priority of the current CPU.
    //
    // This is the priority of the service layer itself, not the TPR of the guest.
    virtual uint8 get_tpr() = 0;
    virtual void set_tpr(uint8 tpr) = 0;

    // Ask the host to deliver an interrupt as described by an x2APIC ICR value.
    virtual Result_void<Host_error> post_irq(uint64 icr) = 0;

    // Signal the end of a level-triggered host interrupt that was delivered to the given VMPL.
    virtual Result_void<Host_error> specific_eoi(uint8 vector, uint8 vmpl) = 0;

    // Called from every busy-wait loop.
    //
    // Interrupts that arrive while a CPU spins at a priority below their own are taken here.
    virtual void relax() { ::relax(); }
};
