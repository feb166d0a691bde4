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

#include "vlapic.hpp"
#include "assert.hpp"
#include "panic.hpp"
#include "platform.hpp"
#include "stdio.hpp"

Result_void<Apic_error> Vlapic::activate()
{
    if (activated) {
        return Err(Apic_error::ALREADY_ACTIVE);
    }

    activated = true;
    trace(TRACE_APIC, "APIC emulation activated for APIC ID %#x", apic_id);

    return Ok_void({});
}

void Vlapic::configure_vector(uint8 vector, bool allowed) { allowed_irr.set(vector, allowed); }

uint8 Vlapic::scan_irr() const
{
    long const highest{irr.highest()};

    // Vector 0 is never valid, so it doubles as "nothing pending".
    return highest < 0 ? 0 : static_cast<uint8>(highest);
}

uint32 Vlapic::get_isr(unsigned word) const
{
    uint32 value{0};

    for (unsigned i{0}; i < isr_stack_index; i++) {
        if (isr_stack[i] / 32 == word) {
            value |= 1U << (isr_stack[i] % 32);
        }
    }

    return value;
}

void Vlapic::push_isr(uint8 vector)
{
    if (EXPECT_FALSE(isr_stack_index >= ISR_STACK_SIZE)) {
        panic("ISR stack overflow while delivering vector %u", vector);
    }

    isr_stack[isr_stack_index++] = vector;
}

void Vlapic::rewind_pending_interrupt(uint8 vector)
{
    if (EXPECT_FALSE(isr_stack_index == 0 or isr_top() != vector)) {
        panic("Cannot rewind vector %u: in service is %u at depth %u", vector, isr_top(), isr_stack_index);
    }

    irr.set(vector, true);
    isr_stack_index--;
    update_required = true;
}

uint8 Vlapic::ppr(uint8 tpr) const
{
    uint8 const isr{isr_top()};

    return priority_class(isr) > priority_class(tpr) ? isr : tpr;
}

void Vlapic::post_interrupt(uint8 vector, bool level_sensitive)
{
    irr.set(vector, true);

    if (level_sensitive) {
        tmr.set(vector, true);
    }

    update_required = true;
}

bool Vlapic::accept_ipi(Icr const& icr)
{
    if (icr.shorthand() == Icr::DSH_NONE and not icr.matches(apic_id)) {
        return false;
    }

    post_interrupt(icr.vector(), false);
    return true;
}

bool Vlapic::signal_host_interrupt(uint8 vector, bool level_sensitive)
{
    // Until the guest takes control of the allow-list, everything except the exception vectors is accepted.
    bool const allowed{activated ? allowed_irr.get(vector) : vector >= NUM_EXC};

    if (not allowed) {
        trace(TRACE_APIC, "Dropping host vector %u", vector);
        return false;
    }

    post_interrupt(vector, level_sensitive);

    if (level_sensitive) {
        host_tmr.set(vector, true);
    }

    return true;
}

uint32 Vlapic::host_allowed_mask(unsigned group) const { return activated ? allowed_irr.word(group) : ~0U; }

void Vlapic::signal_host_vectors(unsigned group, uint32 bits)
{
    while (bits != 0) {
        unsigned const bit{static_cast<unsigned>(bit_scan_reverse(bits))};

        bits &= ~(1U << bit);
        post_interrupt(static_cast<uint8>(group * 32 + bit), false);
    }
}

void Vlapic::consume_host_interrupts()
{
    if (doorbell == nullptr) {
        return;
    }

    Hv_ext_int_info* const descriptor{doorbell->select_descriptor(multi_vmpl, GUEST_VMPL)};

    if (descriptor != nullptr) {
        descriptor->drain(*this);
    }
}

bool Vlapic::lazy_eoi_consumed(Lazy_eoi_channel const* channel) const
{
    if (channel == nullptr) {
        return false;
    }

    // If the flag cannot be read, the EOI stays outstanding and is checked again on the next exit.
    auto const flag{channel->no_eoi_required()};

    return flag.is_ok() and not flag.unwrap();
}

void Vlapic::check_delivered_interrupts(Guest_cpu_state& cpu_state, Lazy_eoi_channel* channel)
{
    if (interrupt_delivered) {
        uint8 const vector{cpu_state.check_and_clear_pending_interrupt_event()};

        if (vector != 0) {
            rewind_pending_interrupt(vector);
            lazy_eoi_pending = false;
        }

        interrupt_delivered = false;
    }

    if (interrupt_queued) {
        uint8 const vector{cpu_state.check_and_clear_pending_virtual_interrupt()};

        if (vector != 0) {
            rewind_pending_interrupt(vector);
            lazy_eoi_pending = false;
        }

        interrupt_queued = false;
    }

    // A rewind above cancels the lazy EOI. The guest flag is reset when the interrupt is presented again.
    if (lazy_eoi_pending and lazy_eoi_consumed(channel)) {
        assert(isr_stack_index != 0);
        perform_eoi();
    }
}

bool Vlapic::deliver_interrupt_immediately(uint8 vector, Guest_cpu_state& cpu_state)
{
    if (not cpu_state.interrupts_enabled() or cpu_state.in_interrupt_shadow()) {
        return false;
    }

    if (priority_class(vector) <= priority_class(ppr(cpu_state.get_tpr()))) {
        return false;
    }

    return cpu_state.try_deliver_interrupt_immediately(vector);
}

void Vlapic::update_lazy_eoi(Lazy_eoi_channel* channel, bool offer)
{
    lazy_eoi_pending = false;

    if (channel == nullptr) {
        return;
    }

    if (channel->set_no_eoi_required(offer).is_err()) {
        trace(TRACE_APIC, "Failed to update the lazy EOI flag");
        return;
    }

    lazy_eoi_pending = offer;
}

void Vlapic::present_interrupts(Guest_cpu_state& cpu_state, Lazy_eoi_channel* channel)
{
    consume_host_interrupts();

    if (not update_required) {
        return;
    }

    check_delivered_interrupts(cpu_state, channel);

    uint8 const vector{scan_irr()};
    bool offer_lazy_eoi{false};

    // TPR is not considered here. An interrupt below TPR is queued, so it fires as soon as the guest lowers
    // TPR.
    if (priority_class(vector) > priority_class(isr_top())) {
        bool lazy_eoi_possible;

        if (deliver_interrupt_immediately(vector, cpu_state)) {
            interrupt_delivered = true;
            lazy_eoi_possible = true;
        } else {
            cpu_state.queue_interrupt(vector);
            interrupt_queued = true;

            // With another interrupt in service, a lazy EOI would be ambiguous.
            lazy_eoi_possible = isr_stack_index == 0;
        }

        // The interrupt is in service from now on. It is taken back, if the guest did not take it when we
        // check next time.
        irr.set(vector, false);
        push_isr(vector);

        // Level-triggered interrupts need an explicit EOI at their source. Another pending interrupt needs the
        // explicit EOI to be presented.
        offer_lazy_eoi = lazy_eoi_possible and not tmr.get(vector) and irr.empty();
    }

    update_lazy_eoi(channel, offer_lazy_eoi);
    update_required = false;
}

void Vlapic::perform_eoi()
{
    if (isr_stack_index == 0) {
        return;
    }

    uint8 const vector{isr_stack[--isr_stack_index]};

    if (tmr.get(vector)) {
        if (host_tmr.get(vector)) {
            Platform::get().specific_eoi(vector, GUEST_VMPL).expect("Host EOI failed");
            host_tmr.set(vector, false);
        }

        tmr.set(vector, false);
    }

    update_required = true;
    lazy_eoi_pending = false;
}

Result<uint64, Apic_error> Vlapic::read_register(Guest_cpu_state& cpu_state, Lazy_eoi_channel* channel,
                                                 uint64 reg)
{
    // Undelivered interrupts must show up in IRR again.
    check_delivered_interrupts(cpu_state, channel);

    switch (reg) {
    case APIC_ID:
        return Ok(static_cast<uint64>(apic_id));
    case TPR:
        return Ok(static_cast<uint64>(cpu_state.get_tpr()));
    case PPR:
        return Ok(static_cast<uint64>(ppr(cpu_state.get_tpr())));
    case ISR0 ... ISR7:
        return Ok(static_cast<uint64>(get_isr(static_cast<unsigned>(reg - ISR0))));
    case TMR0 ... TMR7:
        return Ok(static_cast<uint64>(tmr.word(reg - TMR0)));
    case IRR0 ... IRR7:
        return Ok(static_cast<uint64>(irr.word(reg - IRR0)));
    default:
        return Err(Apic_error::INVALID_REGISTER);
    }
}

Result_void<Apic_error> Vlapic::handle_icr_write(uint64 value)
{
    Icr const icr{value};

    if (icr.delivery_mode() != Icr::DLV_FIXED or icr.level_triggered() or not icr.asserted() or
        icr.vector() < MIN_VECTOR) {
        return Err(Apic_error::UNSUPPORTED_ICR);
    }

    switch (icr.shorthand()) {
    case Icr::DSH_SELF:
        post_interrupt(icr.vector(), false);
        break;
    case Icr::DSH_ALL_WITH_SELF:
        post_interrupt(icr.vector(), false);
        pending_icr = icr;
        break;
    case Icr::DSH_ALL_BUT_SELF:
        pending_icr = icr;
        break;
    case Icr::DSH_NONE:
        if (icr.matches(apic_id)) {
            post_interrupt(icr.vector(), false);

            // Nobody else can match a physical destination that is our own.
            if (not icr.logical() and icr.destination() == apic_id) {
                break;
            }
        }

        pending_icr = icr;
        break;
    }

    return Ok_void({});
}

Result_void<Apic_error> Vlapic::write_register(Guest_cpu_state& cpu_state, Lazy_eoi_channel* channel,
                                               uint64 reg, uint64 value)
{
    // Undelivered interrupts must be taken back before they are acknowledged or reprioritized.
    check_delivered_interrupts(cpu_state, channel);

    switch (reg) {
    case TPR:
        if (value > 0xff) {
            return Err(Apic_error::INVALID_VALUE);
        }
        cpu_state.set_tpr(static_cast<uint8>(value));
        return Ok_void({});
    case EOI:
        perform_eoi();
        return Ok_void({});
    case ICR:
        return handle_icr_write(value);
    case SELF_IPI:
        if (value > 0xff or value < MIN_VECTOR) {
            return Err(Apic_error::INVALID_VALUE);
        }
        post_interrupt(static_cast<uint8>(value), false);
        return Ok_void({});
    default:
        return Err(Apic_error::INVALID_REGISTER);
    }
}

Optional<Icr> Vlapic::take_pending_icr() { return pending_icr.take(); }
