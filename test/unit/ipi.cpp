/*
 * Cross-CPU Messaging Tests
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

#include "atomic.hpp"
#include "fake_platform.hpp"
#include "percpu.hpp"
#include "tpr_guard.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <vector>

namespace
{

std::atomic<unsigned> hits[Fake_platform::MAX_CPUS];

void reset_hits()
{
    for (auto& h : hits) {
        h = 0;
    }
}

std::vector<unsigned> hit_counts(unsigned cpus)
{
    std::vector<unsigned> counts;

    for (unsigned cpu{0}; cpu < cpus; cpu++) {
        counts.push_back(hits[cpu].load());
    }

    return counts;
}

// Counts on which CPU it was handled.
struct Count_message {
    unsigned weight;

    void invoke() const { hits[Platform::get().current_cpu()] += weight; }
};

// Is modified by its receiver.
struct Update_message {
    uint32 value;
    uint32 handled_on;

    void invoke()
    {
        value += 1;
        handled_on = Platform::get().current_cpu();
    }
};

} // namespace

TEST_CASE("Multicast IPIs reach each target once", "[ipi]")
{
    Fake_system system{{0x0, 0x1, 0x2, 0x3}};
    reset_hits();

    SECTION("All CPUs")
    {
        Ipi::send_multicast(Ipi_target::all(), Count_message{1});

        CHECK(hit_counts(4) == std::vector<unsigned>{1, 1, 1, 1});

        // A broadcast is a single notification.
        CHECK(system.platform.posted_count() == 1);
    }

    SECTION("All other CPUs")
    {
        Ipi::send_multicast(Ipi_target::all_but_self(), Count_message{1});

        CHECK(hit_counts(4) == std::vector<unsigned>{0, 1, 1, 1});
        CHECK(system.platform.posted_count() == 1);
    }

    SECTION("A set of CPUs")
    {
        Cpuset targets;
        targets.set(1);
        targets.set(3);

        Ipi::send_multicast(Ipi_target::multiple(targets), Count_message{2});

        CHECK(hit_counts(4) == std::vector<unsigned>{0, 2, 0, 2});
        CHECK(system.platform.posted_count() == 2);

        // Each notification goes to the APIC ID of its CPU.
        std::vector<uint64> const expected{Icr::fixed(IPI_VECTOR).with_destination(0x1).value(),
                                           Icr::fixed(IPI_VECTOR).with_destination(0x3).value()};
        CHECK(system.platform.posted == expected);
    }

    SECTION("A set that includes the sender")
    {
        Cpuset targets;
        targets.set(0);
        targets.set(2);

        Ipi::send_multicast(Ipi_target::multiple(targets), Count_message{1});

        CHECK(hit_counts(4) == std::vector<unsigned>{1, 0, 1, 0});
        CHECK(system.platform.posted_count() == 1);
    }

    SECTION("An empty set")
    {
        Ipi::send_multicast(Ipi_target::multiple(Cpuset{}), Count_message{1});

        CHECK(hit_counts(4) == std::vector<unsigned>{0, 0, 0, 0});
        CHECK(system.platform.posted_count() == 0);
    }

    SECTION("Only the sender")
    {
        Ipi::send_multicast(Ipi_target::single(0), Count_message{1});

        CHECK(hit_counts(4) == std::vector<unsigned>{1, 0, 0, 0});
        CHECK(system.platform.posted_count() == 0);
    }

    // The board is free for the next message.
    CHECK(Percpu::get_remote(0).ipi_board.pending == 0);
    CHECK(Tpr_guard::current() == TPR_NORMAL);
}

TEST_CASE("Unicast IPIs return the modified message", "[ipi]")
{
    Fake_system system{{0x10, 0x11, 0x12}};

    Update_message message{4, 0};

    SECTION("Another CPU")
    {
        Ipi::send_unicast(2, message);

        CHECK(message.value == 5);
        CHECK(message.handled_on == 2);
        CHECK(system.platform.posted_count() == 1);
    }

    SECTION("The sender itself")
    {
        message.handled_on = 7;
        Ipi::send_unicast(0, message);

        CHECK(message.value == 5);
        CHECK(message.handled_on == 0);
        CHECK(system.platform.posted_count() == 0);
    }

    SECTION("Repeated round trips")
    {
        Ipi::send_unicast(1, message);
        Ipi::send_unicast(2, message);

        CHECK(message.value == 6);
        CHECK(message.handled_on == 2);
    }
}

TEST_CASE("CPUs can send IPIs to each other at the same time", "[ipi]")
{
    constexpr unsigned CPUS{4};

    Fake_system system{{0x0, 0x1, 0x2, 0x3}};
    reset_hits();

    // Every CPU broadcasts a few times while it handles the broadcasts of the others.
    system.run_everywhere([](unsigned) {
        for (unsigned i{0}; i < 16; i++) {
            Ipi::send_multicast(Ipi_target::all(), Count_message{1});
        }
    });

    CHECK(hit_counts(CPUS) == std::vector<unsigned>(CPUS, CPUS * 16));

    for (unsigned cpu{0}; cpu < CPUS; cpu++) {
        CHECK(Percpu::get_remote(cpu).ipi_board.pending == 0);
    }
}

TEST_CASE("CPUs that do not take IPIs are skipped by broadcasts", "[ipi]")
{
    Fake_system system{{0x0, 0x1, 0x2}};
    reset_hits();

    Atomic::store(Percpu::get_remote(2).ipi_online, false);

    Ipi::send_multicast(Ipi_target::all(), Count_message{1});

    CHECK(hit_counts(3) == std::vector<unsigned>{1, 1, 0});
}
