/*
 * x2APIC Interrupt Command Register
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

#include "types.hpp"

// A 64-bit x2APIC ICR value.
//
// The same encoding is used for guest writes to the virtual ICR and for the interrupt requests that are
// handed to the host with Platform::post_irq.
class Icr
{
public:
    enum Delivery_mode
    {
        DLV_FIXED = 0,
        DLV_LOWEST = 1,
        DLV_SMI = 2,
        DLV_NMI = 4,
        DLV_INIT = 5,
        DLV_SIPI = 6,
        DLV_EXTINT = 7,
    };

    enum Shorthand
    {
        DSH_NONE = 0,
        DSH_SELF = 1,
        DSH_ALL_WITH_SELF = 2,
        DSH_ALL_BUT_SELF = 3,
    };

    // The physical destination that addresses every CPU.
    static constexpr uint32 BROADCAST{0xffffffff};

private:
    enum
    {
        VECTOR_MASK = 0xffULL,
        DELIVERY_SHIFT = 8,
        DELIVERY_MASK = 0x7ULL << DELIVERY_SHIFT,
        LOGICAL = 1ULL << 11,
        ASSERT = 1ULL << 14,
        LEVEL = 1ULL << 15,
        SHORTHAND_SHIFT = 18,
        SHORTHAND_MASK = 0x3ULL << SHORTHAND_SHIFT,
        DESTINATION_SHIFT = 32,
    };

    uint64 raw{0};

    Icr with_bits(uint64 mask, uint64 bits) const { return Icr{(raw & ~mask) | (bits & mask)}; }

public:
    Icr() = default;
    explicit Icr(uint64 val) : raw(val) {}

    // A fixed, edge-triggered and asserted interrupt with the given vector.
    static Icr fixed(uint8 vector) { return Icr{}.with_vector(vector).with_assert(true); }

    uint64 value() const { return raw; }

    uint8 vector() const { return static_cast<uint8>(raw & VECTOR_MASK); }
    Delivery_mode delivery_mode() const
    {
        return static_cast<Delivery_mode>((raw & DELIVERY_MASK) >> DELIVERY_SHIFT);
    }
    bool logical() const { return raw & LOGICAL; }
    bool asserted() const { return raw & ASSERT; }
    bool level_triggered() const { return raw & LEVEL; }
    Shorthand shorthand() const { return static_cast<Shorthand>((raw & SHORTHAND_MASK) >> SHORTHAND_SHIFT); }
    uint32 destination() const { return static_cast<uint32>(raw >> DESTINATION_SHIFT); }

    Icr with_vector(uint8 v) const { return with_bits(VECTOR_MASK, v); }
    Icr with_delivery_mode(Delivery_mode m) const
    {
        return with_bits(DELIVERY_MASK, static_cast<uint64>(m) << DELIVERY_SHIFT);
    }
    Icr with_logical(bool l) const { return with_bits(LOGICAL, l ? LOGICAL : 0); }
    Icr with_assert(bool a) const { return with_bits(ASSERT, a ? ASSERT : 0); }
    Icr with_level_triggered(bool l) const { return with_bits(LEVEL, l ? LEVEL : 0); }
    Icr with_shorthand(Shorthand s) const
    {
        return with_bits(SHORTHAND_MASK, static_cast<uint64>(s) << SHORTHAND_SHIFT);
    }
    Icr with_destination(uint32 d) const
    {
        return Icr{(raw & 0xffffffffULL) | static_cast<uint64>(d) << DESTINATION_SHIFT};
    }

    // Whether the destination field names every CPU. Only meaningful without a shorthand.
    bool is_broadcast() const { return not logical() and destination() == BROADCAST; }

    // Check whether the destination field addresses the CPU with the given APIC ID.
    //
    // In logical mode, bits 16-31 of the destination are the cluster ID and bits 0-15 a bitmask of CPUs in
    // that cluster. A CPU belongs to cluster apic_id >> 4 and has position apic_id & 0xf in it.
    bool matches(uint32 apic_id) const
    {
        uint32 const dest{destination()};

        if (logical()) {
            return (dest >> 16) == (apic_id >> 4) and (dest & (1U << (apic_id & 0xf))) != 0;
        }

        return dest == BROADCAST or dest == apic_id;
    }

    bool operator==(Icr const& other) const { return raw == other.raw; }
    bool operator!=(Icr const& other) const { return raw != other.raw; }
};
