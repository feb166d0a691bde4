/*
 * Cross-CPU Messaging
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
#include "cpuset.hpp"
#include "types.hpp"
#include "util.hpp"

enum class Ipi_request
{
    // Every receiver gets a read-only view of the message.
    SHARED,

    // A single receiver may modify the message and the sender gets the result back.
    MUT,
};

// The per-CPU mailbox that carries an IPI message from its sender to the receivers.
//
// The board belongs to its CPU. It is only written by that CPU before it notifies the receivers. Receivers
// read it until they decrement pending. Once pending is zero, the board belongs to the sender alone again.
// Nothing but this protocol enforces the ownership.
struct Ipi_board {
    // The number of receivers that have not finished handling the message.
    size_t pending{0};

    Ipi_request request{Ipi_request::SHARED};

    // Only the handler that matches request is valid.
    void (*shared_handler)(void const*){nullptr};
    void (*mut_handler)(void*){nullptr};

    alignas(16) char message[IPI_BUFFER_SIZE];
};

// The set of CPUs an IPI is sent to.
//
// CPUs are identified by their dense CPU index, not by their APIC ID.
class Ipi_target
{
public:
    enum Kind
    {
        SINGLE,
        MULTIPLE,
        ALL_BUT_SELF,
        ALL,
    };

private:
    Kind kind_;
    unsigned cpu_{0};
    Cpuset cpus_;

    explicit Ipi_target(Kind kind) : kind_(kind) {}

public:
    static Ipi_target single(unsigned cpu)
    {
        Ipi_target t{SINGLE};
        t.cpu_ = cpu;
        return t;
    }

    static Ipi_target multiple(Cpuset const& cpus)
    {
        Ipi_target t{MULTIPLE};
        t.cpus_ = cpus;
        return t;
    }

    static Ipi_target all_but_self() { return Ipi_target{ALL_BUT_SELF}; }
    static Ipi_target all() { return Ipi_target{ALL}; }

    Kind kind() const { return kind_; }
    unsigned cpu() const { return cpu_; }
    Cpuset const& cpus() const { return cpus_; }

    bool is_broadcast() const { return kind_ == ALL_BUT_SELF or kind_ == ALL; }
};

// A type-erased message as it is handed to Ipi::send.
struct Ipi_payload {
    Ipi_request request;

    void (*shared_handler)(void const*);
    void (*mut_handler)(void*);

    void const* message;
    size_t size;

    // Where a modified message is copied back to. Only used for Ipi_request::MUT.
    void* result;
};

// Synchronous message passing between physical CPUs.
//
// The sender copies the message into its Ipi_board, notifies all receivers with an interrupt on IPI_VECTOR
// and spins until each of them has handled the message. Sending happens at TPR_SYNCH and handling at TPR_IPI,
// so a CPU that waits for its own IPI still handles IPIs from others.
//
// Messages are copied between CPUs as raw bytes. They must be trivially copyable and must not point to
// memory that is only valid on the sending CPU. The compiler checks the former. The latter is an obligation
// of each message type.
class Ipi
{
private:
    template <typename T> static void invoke_shared(void const* message)
    {
        static_cast<T const*>(message)->invoke();
    }

    template <typename T> static void invoke_mut(void* message) { static_cast<T*>(message)->invoke(); }

    template <typename T> static constexpr bool fits_board()
    {
        return sizeof(T) <= IPI_BUFFER_SIZE and alignof(T) <= alignof(Ipi_board);
    }

    // Compute the CPUs that need a notification. include_self is set, if the sender is a target as well.
    static Cpuset resolve(Ipi_target const& target, unsigned self, bool& include_self);

    static void notify(Ipi_target const& target, Cpuset const& receivers);

    static void receive_single(Ipi_board& board);

    static void send(Ipi_target const& target, Ipi_payload const& payload);

public:
    // Run msg.invoke() on every CPU in target and wait until all of them are done.
    //
    // T needs a void invoke() const member.
    template <typename T> static void send_multicast(Ipi_target const& target, T const& msg)
    {
        static_assert(is_trivially_copyable<T>::value, "IPI messages are copied as raw bytes");
        static_assert(fits_board<T>(), "IPI message does not fit into the IPI board");

        send(target, {Ipi_request::SHARED, &invoke_shared<T>, nullptr, &msg, sizeof(T), nullptr});
    }

    // Run msg.invoke() on the given CPU and copy the possibly modified message back into msg.
    //
    // T needs a void invoke() member.
    template <typename T> static void send_unicast(unsigned cpu, T& msg)
    {
        static_assert(is_trivially_copyable<T>::value, "IPI messages are copied as raw bytes");
        static_assert(fits_board<T>(), "IPI message does not fit into the IPI board");

        send(Ipi_target::single(cpu), {Ipi_request::MUT, nullptr, &invoke_mut<T>, &msg, sizeof(T), &msg});
    }

    // Handle all messages that were sent to the current CPU.
    //
    // This is the handler for IPI_VECTOR.
    static void handle_ipi_interrupt();

    // Make the current CPU a target of broadcast IPIs.
    static void start_cpu();
};
