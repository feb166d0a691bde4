/*
 * Atomic Tests
 *
 * Copyright (C) 2019 Julian Stecklina, Cyberus Technology GmbH.
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

#include <catch2/catch.hpp>

#include "atomic.hpp"
#include "types.hpp"

TEST_CASE("Atomic read-modify-write operations return new value", "[atomic]")
{
    const int old_value{128};
    int value_to_modify{old_value};

    SECTION("add") { CHECK(Atomic::add(value_to_modify, 1) == old_value + 1); };
    SECTION("sub") { CHECK(Atomic::sub(value_to_modify, 1) == old_value - 1); };
}

TEST_CASE("Atomic fetch operations return old value", "[atomic]")
{
    size_t pending{2};

    CHECK(Atomic::fetch_add(pending, static_cast<size_t>(1)) == 2);
    CHECK(Atomic::fetch_sub<size_t, Atomic::RELEASE>(pending, 3) == 3);
    CHECK(Atomic::load<size_t, Atomic::ACQUIRE>(pending) == 0);
}

TEST_CASE("Compare-and-swap reports the current value on failure", "[atomic]")
{
    uint32 status{0x4045};
    uint32 expected{0x45};

    CHECK_FALSE(Atomic::cmp_swap<uint32, Atomic::RELAXED>(status, expected, 0U));
    CHECK(expected == 0x4045);
    CHECK(status == 0x4045);

    CHECK(Atomic::cmp_swap<uint32, Atomic::RELAXED>(status, expected, 0x4000U));
    CHECK(status == 0x4000);
}

TEST_CASE("Atomic mask and bit operations", "[atomic]")
{
    uint32 status{0xf0};

    CHECK(Atomic::exchange(status, 0x0fU) == 0xf0);

    Atomic::set_mask(status, 0x100U);
    CHECK(status == 0x10f);

    CHECK(Atomic::clr_mask(status, 0x101U) == 0x10f);
    CHECK(status == 0x0e);

    CHECK_FALSE(Atomic::test_set_bit(status, 31));
    CHECK(Atomic::test_set_bit(status, 31));
    CHECK(Atomic::test_clr_bit(status, 31));
    CHECK_FALSE(Atomic::test_clr_bit(status, 31));
    CHECK(status == 0x0e);
}
