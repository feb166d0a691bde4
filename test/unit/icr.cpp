/*
 * Interrupt Command Register Tests
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

#include "icr.hpp"

#include <catch2/catch.hpp>

TEST_CASE("ICR fields are decoded", "[icr]")
{
    // Fixed, logical, asserted, level, all-but-self, destination 0x12345678
    Icr const icr{0x12345678000cc845ULL};

    CHECK(icr.vector() == 0x45);
    CHECK(icr.delivery_mode() == Icr::DLV_FIXED);
    CHECK(icr.logical());
    CHECK(icr.asserted());
    CHECK(icr.level_triggered());
    CHECK(icr.shorthand() == Icr::DSH_ALL_BUT_SELF);
    CHECK(icr.destination() == 0x12345678);
}

TEST_CASE("ICR builders only change their field", "[icr]")
{
    Icr const icr{Icr::fixed(0xe0).with_destination(7)};

    CHECK(icr.value() == 0x00000007000040e0ULL);

    CHECK(icr.with_delivery_mode(Icr::DLV_NMI).value() == 0x00000007000044e0ULL);
    CHECK(icr.with_shorthand(Icr::DSH_SELF).value() == 0x00000007000440e0ULL);
    CHECK(icr.with_vector(0x31).with_destination(0xffffffff).value() == 0xffffffff00004031ULL);
    CHECK(icr.with_assert(false).with_level_triggered(true).value() == 0x00000007000080e0ULL);
}

TEST_CASE("Logical destinations match cluster and bit", "[icr]")
{
    Icr const icr{Icr::fixed(0x40).with_logical(true).with_destination(0x00010002)};

    CHECK(icr.matches(0x11));
    CHECK_FALSE(icr.matches(0x22));
    CHECK_FALSE(icr.matches(0x10));
    CHECK_FALSE(icr.matches(0x01));
    CHECK_FALSE(icr.is_broadcast());

    Icr const cluster_zero{icr.with_destination(0x0000000f)};

    for (uint32 apic_id{0}; apic_id < 4; apic_id++) {
        CHECK(cluster_zero.matches(apic_id));
    }
    CHECK_FALSE(cluster_zero.matches(4));
}

TEST_CASE("Physical destinations match the APIC ID or everyone", "[icr]")
{
    Icr const icr{Icr::fixed(0x40).with_destination(0x22)};

    CHECK(icr.matches(0x22));
    CHECK_FALSE(icr.matches(0x11));

    Icr const broadcast{icr.with_destination(Icr::BROADCAST)};

    CHECK(broadcast.is_broadcast());
    CHECK(broadcast.matches(0x11));
    CHECK(broadcast.matches(0x22));
}
