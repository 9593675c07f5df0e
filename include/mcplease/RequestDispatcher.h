//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestDispatcher.h
// Purpose: Routes initialize / tools/list / tools/call and wraps tool execution with recovery
//==========================================================================================================
#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "mcplease/JSONRPCTypes.h"
#include "mcplease/Protocol.h"
#include "mcplease/async/AdmissionQueue.h"
#include "mcplease/async/PeriodicTask.h"
#include "mcplease/errors/ErrorController.h"
#include "mcplease/tools/ToolRegistry.h"

namespace mcplease {

// Correlation data the orchestrator passes down for error accounting.
struct DispatchContext {
    std::optional<std::string> sessionId;
    std::optional<std::string> userId;
    std::optional<std::string> requestId;
};

//==========================================================================================================
// RequestDispatcher
// Purpose: Turns an authorized request into a response.
// Notes:
//   - tools/call runs under an admission slot with a per-call timeout. A failure goes through
//     ErrorController::Handle; when recovery succeeds the call is retried exactly once, otherwise
//     (or when the retry fails) a canned message is returned with isError=true.
//   - The admission capacity follows the current degradation level.
//   - A call that times out keeps its slot until the tool actually finishes, so executions that ignore
//     the stop request still count against the cap.
//==========================================================================================================
class RequestDispatcher {
public:
    struct Options {
        Implementation serverInfo{"mcplease", "1.0.0", "Request-processing core for AI-assisted coding tools"};
        std::chrono::milliseconds toolTimeout{30000};
        std::chrono::milliseconds admissionTimeout{30000};
        AdmissionQueue::Options admission;
    };

    RequestDispatcher(tools::ToolRegistry& registry, errors::ErrorController& errorController);
    RequestDispatcher(tools::ToolRegistry& registry, errors::ErrorController& errorController, Options opts);
    ~RequestDispatcher();

    RequestDispatcher(const RequestDispatcher&) = delete;
    RequestDispatcher& operator=(const RequestDispatcher&) = delete;

    //==========================================================================================================
    // Dispatch
    // Purpose: Route one request by method.
    // Returns:
    //   A response carrying exactly one of result/error; never null.
    //==========================================================================================================
    std::unique_ptr<JSONRPCResponse> Dispatch(const JSONRPCRequest& request, const DispatchContext& ctx = {});

    // Fails queued and future tool calls; used on shutdown.
    void Close();

    AdmissionQueue::Stats AdmissionStats() const { return admission.GetStats(); }

    // User-facing text returned when a tool fails in the given category.
    static std::string FallbackMessage(errors::ErrorCategory category);

private:
    std::unique_ptr<JSONRPCResponse> handleInitialize(const JSONRPCRequest& request);
    std::unique_ptr<JSONRPCResponse> handleListTools(const JSONRPCRequest& request);
    std::unique_ptr<JSONRPCResponse> handleCallTool(const JSONRPCRequest& request, const DispatchContext& ctx);

    CallToolResult runOnce(tools::ITool& tool, const std::string& name, const JSONValue& arguments,
                           AdmissionQueue::Slot& slot);
    void park(std::future<CallToolResult> future, AdmissionQueue::Slot slot);
    void reapParked();

    // Timed-out execution that still occupies an admission slot.
    struct Parked {
        std::future<CallToolResult> future;
        AdmissionQueue::Slot slot;
    };

    tools::ToolRegistry& registry;
    errors::ErrorController& errorController;
    Options options;
    AdmissionQueue admission;

    std::mutex parkedMutex;
    std::vector<Parked> parked;
    PeriodicTask reaper;
};

} // namespace mcplease
