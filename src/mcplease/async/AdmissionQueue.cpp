//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AdmissionQueue.cpp
// Purpose: AdmissionQueue implementation (ticketed FIFO over a mutex/condition_variable)
//==========================================================================================================

#include "mcplease/async/AdmissionQueue.h"

#include <algorithm>
#include <format>

#include "logging/Logger.h"
#include "mcplease/errors/Errors.h"

namespace mcplease {

AdmissionQueue::Slot::~Slot() {
    Release();
}

AdmissionQueue::Slot::Slot(Slot&& other) noexcept : owner(other.owner) {
    other.owner = nullptr;
}

AdmissionQueue::Slot& AdmissionQueue::Slot::operator=(Slot&& other) noexcept {
    if (this != &other) {
        Release();
        owner = other.owner;
        other.owner = nullptr;
    }
    return *this;
}

void AdmissionQueue::Slot::Release() {
    if (owner != nullptr) {
        owner->release();
        owner = nullptr;
    }
}

AdmissionQueue::AdmissionQueue() : AdmissionQueue(Options{}) {}

AdmissionQueue::AdmissionQueue(const Options& opts)
    : capacity(std::max<std::size_t>(1, opts.capacity)), maxQueueDepth(opts.maxQueueDepth) {}

AdmissionQueue::Slot AdmissionQueue::Acquire(std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    std::unique_lock<std::mutex> lock(mtx);
    if (closed) {
        throw errors::ResourceError("Admission queue closed");
    }
    if (waiters.empty() && inFlight < capacity) {
        ++inFlight;
        ++admitted;
        return Slot(this);
    }
    if (waiters.size() >= maxQueueDepth) {
        ++rejected;
        LOG_WARN("Admission queue full (inFlight={} waiting={} depth={})", inFlight, waiters.size(), maxQueueDepth);
        throw errors::QueueFullError(std::format("Request queue is full ({} waiting)", waiters.size()));
    }

    const std::uint64_t ticket = nextTicket++;
    waiters.push_back(ticket);
    const bool granted = cv.wait_for(lock, timeout, [&] {
        return closed || (waiters.front() == ticket && inFlight < capacity);
    });
    waiters.erase(std::find(waiters.begin(), waiters.end(), ticket));
    if (closed) {
        cv.notify_all();
        throw errors::ResourceError("Admission queue closed");
    }
    if (!granted) {
        ++timedOut;
        // The next waiter may now be at the front
        cv.notify_all();
        throw errors::TimeoutError(std::format("Timed out after {} ms waiting for an execution slot", timeout.count()));
    }
    ++inFlight;
    ++admitted;
    // Wake the next ticket in case more capacity is free
    cv.notify_all();
    return Slot(this);
}

std::optional<AdmissionQueue::Slot> AdmissionQueue::TryAcquire() {
    std::lock_guard<std::mutex> lock(mtx);
    if (closed || !waiters.empty() || inFlight >= capacity) {
        return std::nullopt;
    }
    ++inFlight;
    ++admitted;
    return Slot(this);
}

void AdmissionQueue::release() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (inFlight > 0) {
            --inFlight;
        }
    }
    cv.notify_all();
}

void AdmissionQueue::SetCapacity(std::size_t newCapacity) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        newCapacity = std::max<std::size_t>(1, newCapacity);
        if (newCapacity == capacity) {
            return;
        }
        LOG_INFO("Admission capacity {} -> {}", capacity, newCapacity);
        capacity = newCapacity;
    }
    cv.notify_all();
}

std::size_t AdmissionQueue::Capacity() const {
    std::lock_guard<std::mutex> lock(mtx);
    return capacity;
}

void AdmissionQueue::Close() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        closed = true;
    }
    cv.notify_all();
}

AdmissionQueue::Stats AdmissionQueue::GetStats() const {
    std::lock_guard<std::mutex> lock(mtx);
    Stats s;
    s.capacity = capacity;
    s.inFlight = inFlight;
    s.waiting = waiters.size();
    s.maxQueueDepth = maxQueueDepth;
    s.admitted = admitted;
    s.rejected = rejected;
    s.timedOut = timedOut;
    return s;
}

} // namespace mcplease
