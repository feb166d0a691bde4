/*
 * Virtual x2APIC
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

#include "bitmap.hpp"
#include "config.hpp"
#include "guest_cpu_state.hpp"
#include "hv_doorbell.hpp"
#include "icr.hpp"
#include "optional.hpp"
#include "result.hpp"
#include "types.hpp"

// One bit per interrupt vector, stored as eight 32-bit words like the APIC register file.
using Vector_bitmap = Bitmap<uint32, NUM_INT_VECTORS>;

enum class Apic_error
{
    // The register does not exist or does not support the access.
    INVALID_REGISTER,

    // The value does not fit into the register.
    INVALID_VALUE,

    // The ICR value requests a delivery that cannot be emulated.
    UNSUPPORTED_ICR,

    // APIC emulation was activated twice.
    ALREADY_ACTIVE,

    // The system-wide APIC emulation registration cannot be changed this way.
    REGISTRATION,
};

// The emulated local APIC of a single virtual CPU.
//
// Each instance belongs to exactly one CPU and is only ever touched by that CPU. Callers serialize access by
// running at TPR_IPI, because IPI handlers post into the same state.
class Vlapic
{
public:
    // x2APIC MSR numbers of the emulated registers.
    enum Register
    {
        APIC_ID = 0x802,
        TPR = 0x808,
        PPR = 0x80a,
        EOI = 0x80b,
        ISR0 = 0x810,
        ISR7 = 0x817,
        TMR0 = 0x818,
        TMR7 = 0x81f,
        IRR0 = 0x820,
        IRR7 = 0x827,
        ICR = 0x830,
        SELF_IPI = 0x83f,
    };

private:
    // Nesting is limited by the number of priority classes.
    static constexpr unsigned ISR_STACK_SIZE{16};

    // Vectors below this are reserved and cannot be sent as interrupts.
    static constexpr uint8 MIN_VECTOR{16};

    Vector_bitmap irr{false};
    Vector_bitmap allowed_irr{false};

    // Level-triggered vectors and the subset of them that came from the host.
    Vector_bitmap tmr{false};
    Vector_bitmap host_tmr{false};

    // In-service vectors with the most recent one on top.
    uint8 isr_stack[ISR_STACK_SIZE]{};
    unsigned isr_stack_index{0};

    uint32 apic_id{0};

    Hv_doorbell* doorbell{nullptr};
    bool multi_vmpl{false};

    bool activated{false};
    bool update_required{false};
    bool interrupt_delivered{false};
    bool interrupt_queued{false};
    bool lazy_eoi_pending{false};

    // An ICR write that still has to be sent to other CPUs.
    Optional<Icr> pending_icr;

    static uint8 priority_class(uint8 vector) { return vector >> 4; }

    uint8 isr_top() const { return isr_stack_index != 0 ? isr_stack[isr_stack_index - 1] : 0; }

    uint8 scan_irr() const;

    uint32 get_isr(unsigned word) const;

    void push_isr(uint8 vector);

    void rewind_pending_interrupt(uint8 vector);

    bool deliver_interrupt_immediately(uint8 vector, Guest_cpu_state& cpu_state);

    bool lazy_eoi_consumed(Lazy_eoi_channel const* channel) const;

    void update_lazy_eoi(Lazy_eoi_channel* channel, bool offer);

    Result_void<Apic_error> handle_icr_write(uint64 value);

public:
    Vlapic() = default;
    explicit Vlapic(uint32 apic_id_) : apic_id(apic_id_) {}

    uint32 id() const { return apic_id; }

    bool is_active() const { return activated; }

    // Switch from the default host interrupt policy to the explicit allow-list.
    //
    // This can only happen once.
    Result_void<Apic_error> activate();

    // Allow or disallow the host to signal the given vector.
    void configure_vector(uint8 vector, bool allowed);

    // Use the given doorbell page as the source of host interrupts.
    void attach_doorbell(Hv_doorbell* db, bool multi_vmpl_)
    {
        doorbell = db;
        multi_vmpl = multi_vmpl_;
    }

    // Mark a vector as pending.
    void post_interrupt(uint8 vector, bool level_sensitive);

    // Post a vector that was received as IPI, if the ICR addresses this APIC.
    //
    // Returns whether the vector was posted.
    bool accept_ipi(Icr const& icr);

    // Interface for Hv_ext_int_info::drain.
    bool signal_host_interrupt(uint8 vector, bool level_sensitive);
    uint32 host_allowed_mask(unsigned group) const;
    void signal_host_vectors(unsigned group, uint32 bits);

    // Move all interrupts the host has signaled through the doorbell page into the IRR.
    void consume_host_interrupts();

    // Take back interrupts that were handed to the guest CPU but not taken by it and complete a lazy EOI that
    // the guest has consumed.
    void check_delivered_interrupts(Guest_cpu_state& cpu_state, Lazy_eoi_channel* channel);

    // Hand the highest priority pending interrupt to the guest CPU.
    //
    // This must be called before each guest entry. It does nothing, if no event has happened since the last
    // call that requires interrupt state to be reevaluated.
    void present_interrupts(Guest_cpu_state& cpu_state, Lazy_eoi_channel* channel);

    // Complete the interrupt on top of the in-service stack.
    void perform_eoi();

    Result<uint64, Apic_error> read_register(Guest_cpu_state& cpu_state, Lazy_eoi_channel* channel,
                                             uint64 reg);

    Result_void<Apic_error> write_register(Guest_cpu_state& cpu_state, Lazy_eoi_channel* channel, uint64 reg,
                                           uint64 value);

    // Return an ICR write that targets other CPUs. It has to be sent after register emulation has finished.
    Optional<Icr> take_pending_icr();

    // The processor priority for the given task priority.
    uint8 ppr(uint8 tpr) const;

    // Introspection.
    uint8 highest_pending() const { return scan_irr(); }
    bool is_pending(uint8 vector) const { return irr.get(vector); }
    bool is_level_triggered(uint8 vector) const { return tmr.get(vector); }
    bool is_host_level_triggered(uint8 vector) const { return host_tmr.get(vector); }
    unsigned isr_depth() const { return isr_stack_index; }
    uint8 in_service() const { return isr_top(); }
    bool needs_update() const { return update_required; }
    bool has_lazy_eoi() const { return lazy_eoi_pending; }
};
