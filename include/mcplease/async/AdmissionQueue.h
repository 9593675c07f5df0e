//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AdmissionQueue.h
// Purpose: Bounded FIFO admission semaphore capping concurrent tool executions (backpressure)
//==========================================================================================================
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace mcplease {

//==========================================================================================================
// AdmissionQueue
// Purpose: Grants at most `capacity` concurrent slots. Callers beyond the cap wait in FIFO order;
//          when `maxQueueDepth` callers are already waiting, new callers fail immediately.
// Notes:
//   - Acquire() throws errors::QueueFullError when the backlog is full, errors::TimeoutError when
//     the wait exceeds the timeout, and errors::ResourceError after Close().
//   - SetCapacity() may lower the cap below the current in-flight count; no new slot is granted
//     until enough slots are released.
//==========================================================================================================
class AdmissionQueue {
public:
    struct Options {
        std::size_t capacity{4};
        std::size_t maxQueueDepth{16};
    };

    //==========================================================================================================
    // Slot
    // Purpose: RAII handle for one admitted execution; releases on destruction.
    //==========================================================================================================
    class Slot {
    public:
        Slot() = default;
        ~Slot();
        Slot(Slot&& other) noexcept;
        Slot& operator=(Slot&& other) noexcept;
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

        bool Valid() const { return owner != nullptr; }
        void Release();

    private:
        friend class AdmissionQueue;
        explicit Slot(AdmissionQueue* q) : owner(q) {}
        AdmissionQueue* owner{nullptr};
    };

    struct Stats {
        std::size_t capacity{0};
        std::size_t inFlight{0};
        std::size_t waiting{0};
        std::size_t maxQueueDepth{0};
        std::uint64_t admitted{0};
        std::uint64_t rejected{0};
        std::uint64_t timedOut{0};
    };

    AdmissionQueue();
    explicit AdmissionQueue(const Options& opts);

    //==========================================================================================================
    // Acquire
    // Purpose: Obtain a slot, waiting FIFO up to `timeout`.
    // Returns:
    //   A valid Slot.
    //==========================================================================================================
    Slot Acquire(std::chrono::milliseconds timeout);

    // Non-blocking variant; nullopt when no slot is free or others are already queued.
    std::optional<Slot> TryAcquire();

    void SetCapacity(std::size_t capacity);
    std::size_t Capacity() const;

    // Fails all current and future waiters; used during shutdown.
    void Close();

    Stats GetStats() const;

private:
    void release();

    mutable std::mutex mtx;
    std::condition_variable cv;
    std::deque<std::uint64_t> waiters;
    std::uint64_t nextTicket{0};
    std::size_t capacity;
    std::size_t maxQueueDepth;
    std::size_t inFlight{0};
    bool closed{false};
    std::uint64_t admitted{0};
    std::uint64_t rejected{0};
    std::uint64_t timedOut{0};
};

} // namespace mcplease
