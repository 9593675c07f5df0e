//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PeriodicTask.h
// Purpose: Owned, cancellable background loop used for sweeps (sessions, rate windows, health snapshots)
//==========================================================================================================
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

namespace mcplease {

//==========================================================================================================
// PeriodicTask
// Purpose: Runs a callback every `interval` on a std::jthread until stopped.
// Notes:
//   - Stop() interrupts the wait immediately and joins the thread; a running callback finishes first.
//   - Exceptions from the callback are logged and do not end the loop.
//   - The destructor stops the task, so the loop never outlives its owner.
//==========================================================================================================
class PeriodicTask {
public:
    using Callback = std::function<void()>;

    PeriodicTask(std::string name, std::chrono::milliseconds interval, Callback callback);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void Start();
    void Stop();
    bool IsRunning() const { return running.load(); }

    // Number of completed callback runs (successful or not).
    std::size_t Runs() const { return runs.load(); }

private:
    void loop(std::stop_token st);

    std::string name;
    std::chrono::milliseconds interval;
    Callback callback;
    std::mutex waitMutex;
    std::condition_variable_any waitCondition;
    std::jthread worker;
    std::atomic<bool> running{false};
    std::atomic<std::size_t> runs{0};
};

} // namespace mcplease
