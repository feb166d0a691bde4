/*
 * Guest State Test Doubles
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

#include <vector>

// A guest CPU that records what it is handed. Injected events stay pending until the test lets the guest run.
class Fake_guest_cpu final : public Guest_cpu_state
{
public:
    uint8 tpr{0};
    bool interrupts_on{true};
    bool shadow{false};

    // The vectors that are handed to the guest but not taken yet.
    uint8 pending_event{0};
    uint8 pending_virtual{0};

    std::vector<uint8> delivered;
    std::vector<uint8> queued;

    uint8 get_tpr() const override { return tpr; }
    void set_tpr(uint8 t) override { tpr = t; }

    bool interrupts_enabled() const override { return interrupts_on; }
    bool in_interrupt_shadow() const override { return shadow; }

    bool try_deliver_interrupt_immediately(uint8 vector) override
    {
        if (pending_event != 0) {
            return false;
        }

        pending_event = vector;
        delivered.push_back(vector);
        return true;
    }

    void queue_interrupt(uint8 vector) override
    {
        pending_virtual = vector;
        queued.push_back(vector);
    }

    uint8 check_and_clear_pending_interrupt_event() override
    {
        uint8 const vector{pending_event};

        pending_event = 0;
        return vector;
    }

    uint8 check_and_clear_pending_virtual_interrupt() override
    {
        uint8 const vector{pending_virtual};

        pending_virtual = 0;
        return vector;
    }

    // Let the guest run and take everything it was handed.
    void run()
    {
        pending_event = 0;
        pending_virtual = 0;
    }
};

// The lazy EOI flag of the guest calling area.
class Fake_lazy_eoi final : public Lazy_eoi_channel
{
public:
    bool flag{false};
    bool inaccessible{false};

    Result<bool, Guest_memory_error> no_eoi_required() const override
    {
        if (inaccessible) {
            return Err(Guest_memory_error::INACCESSIBLE);
        }

        return Ok(flag);
    }

    Result_void<Guest_memory_error> set_no_eoi_required(bool required) override
    {
        if (inaccessible) {
            return Err(Guest_memory_error::INACCESSIBLE);
        }

        flag = required;
        return Ok_void({});
    }
};
