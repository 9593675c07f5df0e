//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PeriodicTask.cpp
// Purpose: PeriodicTask implementation (jthread + stop_token aware condition wait)
//==========================================================================================================

#include "mcplease/async/PeriodicTask.h"

#include "logging/Logger.h"

namespace mcplease {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, Callback callback)
    : name(std::move(name)), interval(interval), callback(std::move(callback)) {}

PeriodicTask::~PeriodicTask() {
    Stop();
}

void PeriodicTask::Start() {
    FUNC_SCOPE();
    bool expected = false;
    if (!running.compare_exchange_strong(expected, true)) {
        return;
    }
    worker = std::jthread([this](std::stop_token st) { loop(st); });
    LOG_DEBUG("PeriodicTask '{}' started (interval={} ms)", name, interval.count());
}

void PeriodicTask::Stop() {
    FUNC_SCOPE();
    if (!running.exchange(false)) {
        return;
    }
    if (worker.joinable()) {
        worker.request_stop();
        worker.join();
    }
    LOG_DEBUG("PeriodicTask '{}' stopped after {} runs", name, runs.load());
}

void PeriodicTask::loop(std::stop_token st) {
    while (!st.stop_requested()) {
        {
            std::unique_lock<std::mutex> lock(waitMutex);
            // Returns early only when stop is requested
            waitCondition.wait_for(lock, st, interval, [] { return false; });
        }
        if (st.stop_requested()) {
            break;
        }
        try {
            callback();
        } catch (const std::exception& e) {
            LOG_ERROR("PeriodicTask '{}' callback failed: {}", name, e.what());
        }
        runs.fetch_add(1);
    }
}

} // namespace mcplease
