/*
 * Platform Test Doubles
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

#include "config.hpp"
#include "icr.hpp"
#include "ipi.hpp"
#include "percpu.hpp"
#include "platform.hpp"

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

// A platform where host threads stand in for physical CPUs.
//
// The thread that creates the platform is CPU 0. IPI notifications set a per-CPU flag. A CPU takes the IPI
// in relax() or service_ipis(), if its priority is below TPR_IPI, like a real CPU with interrupts enabled.
class Fake_platform final : public Platform
{
public:
    static constexpr unsigned MAX_CPUS{8};

    struct Eoi {
        uint8 vector;
        uint8 vmpl;
    };

    // The CPU index of the calling thread.
    static inline thread_local unsigned this_cpu{0};

    uint8 tpr[MAX_CPUS]{};
    std::atomic<bool> ipi_pending[MAX_CPUS]{};
    std::atomic<unsigned> ipis_handled{0};

    std::mutex log_lock;
    std::vector<uint64> posted;
    std::vector<Eoi> eois;

    Fake_platform()
    {
        this_cpu = 0;
        Platform::install(this);
    }

    ~Fake_platform() { Platform::install(nullptr); }

    unsigned current_cpu() override { return this_cpu; }

    uint8 get_tpr() override { return tpr[this_cpu]; }
    void set_tpr(uint8 t) override { tpr[this_cpu] = t; }

    Result_void<Host_error> post_irq(uint64 value) override
    {
        {
            std::lock_guard<std::mutex> guard{log_lock};
            posted.push_back(value);
        }

        Icr const icr{value};

        if (icr.vector() != IPI_VECTOR) {
            return Err(Host_error::NOT_SUPPORTED);
        }

        for (unsigned cpu{0}; cpu < Percpu::count(); cpu++) {
            if (is_addressed(icr, cpu)) {
                ipi_pending[cpu] = true;
            }
        }

        return Ok_void({});
    }

    Result_void<Host_error> specific_eoi(uint8 vector, uint8 vmpl) override
    {
        std::lock_guard<std::mutex> guard{log_lock};

        eois.push_back({vector, vmpl});
        return Ok_void({});
    }

    void relax() override
    {
        service_ipis();
        std::this_thread::yield();
    }

    // Take a pending IPI notification, if the current priority allows it.
    void service_ipis()
    {
        if (tpr[this_cpu] < TPR_IPI and ipi_pending[this_cpu].exchange(false)) {
            Ipi::handle_ipi_interrupt();
            ipis_handled++;
        }
    }

    size_t posted_count()
    {
        std::lock_guard<std::mutex> guard{log_lock};
        return posted.size();
    }

private:
    bool is_addressed(Icr const& icr, unsigned cpu) const
    {
        switch (icr.shorthand()) {
        case Icr::DSH_SELF:
            return cpu == this_cpu;
        case Icr::DSH_ALL_WITH_SELF:
            return true;
        case Icr::DSH_ALL_BUT_SELF:
            return cpu != this_cpu;
        case Icr::DSH_NONE:
            return icr.matches(Percpu::get_remote(cpu).apic_id);
        }

        return false;
    }
};

// A system of CPUs with the given APIC IDs. The calling thread is CPU 0. All other CPUs run on their own
// thread and handle IPIs until the system is destroyed.
class Fake_system
{
private:
    std::atomic<bool> stop{false};
    std::atomic<unsigned> started{0};

    std::atomic<void (*)(unsigned)> job{nullptr};
    std::atomic<unsigned> generation{0};
    std::atomic<unsigned> finished{0};

    std::vector<std::thread> threads;

    void cpu_loop(unsigned cpu)
    {
        unsigned seen{0};

        Fake_platform::this_cpu = cpu;
        Ipi::start_cpu();
        started++;

        while (not stop.load()) {
            platform.service_ipis();

            unsigned const current{generation.load()};
            if (current != seen) {
                seen = current;
                job.load()(cpu);
                finished++;
            }

            std::this_thread::yield();
        }
    }

public:
    Fake_platform platform;

    explicit Fake_system(std::vector<uint32> const& apic_ids)
    {
        Percpu::reset();

        for (uint32 apic_id : apic_ids) {
            Percpu::create(apic_id);
        }

        Ipi::start_cpu();

        for (unsigned cpu{1}; cpu < apic_ids.size(); cpu++) {
            threads.emplace_back([this, cpu]() { cpu_loop(cpu); });
        }

        // Broadcasts only reach CPUs that are IPI-online.
        while (started.load() != threads.size()) {
            std::this_thread::yield();
        }
    }

    ~Fake_system()
    {
        stop = true;

        for (auto& t : threads) {
            t.join();
        }

        Percpu::reset();
    }

    // Run fn with the CPU index on all CPUs at the same time and wait until each is done.
    void run_everywhere(void (*fn)(unsigned))
    {
        finished = 0;
        job = fn;
        generation++;

        fn(0);

        // CPU 0 keeps handling IPIs while it waits for the others.
        while (finished.load() != threads.size()) {
            platform.relax();
        }
    }
};
