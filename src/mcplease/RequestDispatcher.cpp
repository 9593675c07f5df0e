//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestDispatcher.cpp
// Purpose: RequestDispatcher implementation
//==========================================================================================================

#include "mcplease/RequestDispatcher.h"

#include <algorithm>
#include <array>
#include <format>
#include <stop_token>

#include "logging/Logger.h"
#include "mcplease/errors/Errors.h"

namespace mcplease {

namespace {

// Pipeline-level members that are never forwarded as tool arguments.
constexpr std::chrono::milliseconds kReapInterval{20};

constexpr std::array<const char*, 6> kReservedParams{
    "name", "session_id", "clientInfo", "credentials", "authorization", "token"};

JSONValue toolArguments(const JSONValue& params) {
    if (const JSONValue* args = FindMember(params, "arguments")) {
        return args->IsNull() ? JSONValue{JSONValue::Object{}} : *args;
    }
    JSONValue::Object rest;
    if (auto obj = std::get_if<JSONValue::Object>(&params.value)) {
        for (const auto& [k, v] : *obj) {
            if (std::find_if(kReservedParams.begin(), kReservedParams.end(),
                             [&](const char* r) { return k == r; }) == kReservedParams.end()) {
                rest[k] = v;
            }
        }
    }
    return JSONValue{std::move(rest)};
}

CallToolResult fallbackResult(const errors::ErrorContext& ctx) {
    CallToolResult result;
    result.isError = true;
    result.content.push_back(MakeTextContent(RequestDispatcher::FallbackMessage(ctx.category)));
    JSONValue meta{JSONValue::Object{}};
    SetMember(meta, "fallback_used", JSONValue(true));
    SetMember(meta, "error_code", JSONValue(ctx.code));
    SetMember(meta, "category", JSONValue(errors::ToString(ctx.category)));
    SetMember(meta, "severity", JSONValue(errors::ToString(ctx.severity)));
    result.meta = std::move(meta);
    return result;
}

errors::HandleRequest handleRequestFor(const DispatchContext& ctx, const std::string& tool, bool recover) {
    errors::HandleRequest req;
    req.attributes["tool"] = tool;
    req.attributes["method"] = Methods::CallTool;
    req.sessionId = ctx.sessionId;
    req.userId = ctx.userId;
    req.requestId = ctx.requestId;
    req.attemptRecovery = recover;
    return req;
}

} // namespace

RequestDispatcher::RequestDispatcher(tools::ToolRegistry& reg, errors::ErrorController& ec)
    : RequestDispatcher(reg, ec, Options{}) {}

RequestDispatcher::RequestDispatcher(tools::ToolRegistry& reg, errors::ErrorController& ec, Options opts)
    : registry(reg),
      errorController(ec),
      options(std::move(opts)),
      admission(options.admission),
      reaper("parked-tool-reaper", kReapInterval, [this]() { reapParked(); }) {}

RequestDispatcher::~RequestDispatcher() {
    Close();
    reaper.Stop();
}

void RequestDispatcher::Close() {
    admission.Close();
}

std::string RequestDispatcher::FallbackMessage(errors::ErrorCategory category) {
    using errors::ErrorCategory;
    switch (category) {
        case ErrorCategory::AIModel:
            return "The AI model is temporarily unavailable. A full answer could not be generated; please try again shortly.";
        case ErrorCategory::Network:
            return "A network problem prevented this request from completing. Please try again.";
        case ErrorCategory::Resource:
            return "The server is short on resources and could not complete this request. Please retry later.";
        case ErrorCategory::Configuration:
            return "The server configuration prevented this request from completing.";
        case ErrorCategory::UserInput:
            return "The tool arguments could not be processed. Please check the input and try again.";
        default:
            return "The tool could not complete this request. Please try again later.";
    }
}

std::unique_ptr<JSONRPCResponse> RequestDispatcher::Dispatch(const JSONRPCRequest& request, const DispatchContext& ctx) {
    switch (MethodFromString(request.method)) {
        case Method::Initialize:
            return handleInitialize(request);
        case Method::ListTools:
            return handleListTools(request);
        case Method::CallTool:
            return handleCallTool(request, ctx);
        case Method::Unknown:
            break;
    }
    LOG_DEBUG("Unsupported method '{}'", request.method);
    JSONValue data{JSONValue::Object{}};
    SetMember(data, "supported_methods", MakeStringArray(SupportedMethodNames()));
    return CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                               std::format("Method '{}' not supported", request.method), data);
}

/////////////////////////////////////////// initialize ///////////////////////////////////////////

std::unique_ptr<JSONRPCResponse> RequestDispatcher::handleInitialize(const JSONRPCRequest& request) {
    const JSONValue params = request.params.value_or(JSONValue{JSONValue::Object{}});
    const std::string version = GetStringMember(params, "protocolVersion").value_or(PROTOCOL_VERSION);
    const auto& supported = SupportedProtocolVersions();
    if (std::find(supported.begin(), supported.end(), version) == supported.end()) {
        LOG_WARN("Client requested unsupported protocol version {}", version);
        JSONValue data{JSONValue::Object{}};
        SetMember(data, "supported_versions", MakeStringArray(supported));
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::InvalidParams,
                                   std::format("Unsupported protocol version: {}", version), data);
    }

    JSONValue capabilities{JSONValue::Object{}};
    SetMember(capabilities, "tools", JSONValue{JSONValue::Object{}});
    SetMember(capabilities, "resources", JSONValue{JSONValue::Object{}});
    SetMember(capabilities, "prompts", JSONValue{JSONValue::Object{}});

    JSONValue serverInfo{JSONValue::Object{}};
    SetMember(serverInfo, "name", JSONValue(options.serverInfo.name));
    SetMember(serverInfo, "version", JSONValue(options.serverInfo.version));
    SetMember(serverInfo, "description", JSONValue(options.serverInfo.description));

    JSONValue result{JSONValue::Object{}};
    SetMember(result, "protocolVersion", JSONValue(version));
    SetMember(result, "capabilities", std::move(capabilities));
    SetMember(result, "serverInfo", std::move(serverInfo));
    LOG_INFO("Initialized session for protocol {}", version);
    return std::make_unique<JSONRPCResponse>(request.id, std::move(result));
}

/////////////////////////////////////////// tools/list ///////////////////////////////////////////

std::unique_ptr<JSONRPCResponse> RequestDispatcher::handleListTools(const JSONRPCRequest& request) {
    JSONValue::Array list;
    for (const auto& tool : registry.List()) {
        list.push_back(std::make_shared<JSONValue>(ToJSON(tool)));
    }
    JSONValue result{JSONValue::Object{}};
    SetMember(result, "tools", JSONValue(std::move(list)));
    return std::make_unique<JSONRPCResponse>(request.id, std::move(result));
}

/////////////////////////////////////////// tools/call ///////////////////////////////////////////

void RequestDispatcher::park(std::future<CallToolResult> future, AdmissionQueue::Slot slot) {
    std::lock_guard<std::mutex> lock(parkedMutex);
    parked.push_back(Parked{std::move(future), std::move(slot)});
    reaper.Start();
}

// Frees the slots of timed-out executions that have since finished.
void RequestDispatcher::reapParked() {
    std::lock_guard<std::mutex> lock(parkedMutex);
    const std::size_t freed = std::erase_if(parked, [](const Parked& p) {
        return p.future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    });
    if (freed > 0) {
        LOG_DEBUG("Released {} admission slots held by timed-out tool executions", freed);
    }
}

CallToolResult RequestDispatcher::runOnce(tools::ITool& tool, const std::string& name, const JSONValue& arguments,
                                          AdmissionQueue::Slot& slot) {
    std::stop_source stop;
    std::future<CallToolResult> future = tool.Execute(arguments, stop.get_token());
    if (future.wait_for(options.toolTimeout) != std::future_status::ready) {
        stop.request_stop();
        park(std::move(future), std::move(slot));
        throw errors::TimeoutError(std::format("Tool '{}' timed out after {} ms", name, options.toolTimeout.count()));
    }
    try {
        return future.get();
    } catch (const std::exception&) {
        throw;
    } catch (...) {
        throw errors::ToolExecutionError(std::format("Tool '{}' raised a non-standard exception", name));
    }
}

std::unique_ptr<JSONRPCResponse> RequestDispatcher::handleCallTool(const JSONRPCRequest& request, const DispatchContext& ctx) {
    const JSONValue params = request.params.value_or(JSONValue{JSONValue::Object{}});
    const std::string name = GetStringMember(params, "name").value_or("");
    if (name.empty()) {
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::InvalidParams, "Tool name is required");
    }
    auto tool = registry.Find(name);
    if (!tool) {
        JSONValue data{JSONValue::Object{}};
        SetMember(data, "available_tools", MakeStringArray(registry.Names()));
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                                   std::format("Tool '{}' not found", name), data);
    }
    const JSONValue arguments = toolArguments(params);

    const errors::DegradationConfig degradation = errorController.GetDegradationConfig();
    // Degradation can only lower the configured concurrency
    admission.SetCapacity(std::min(options.admission.capacity, degradation.maxConcurrentRequests));
    if (degradation.disableAIFeatures && tool->RequiresModel()) {
        LOG_WARN("AI features disabled at degradation level {}; serving fallback for {}", degradation.level, name);
        CallToolResult result;
        result.isError = true;
        result.content.push_back(MakeTextContent(FallbackMessage(errors::ErrorCategory::AIModel)));
        JSONValue meta{JSONValue::Object{}};
        SetMember(meta, "fallback_used", JSONValue(true));
        SetMember(meta, "category", JSONValue(errors::ToString(errors::ErrorCategory::AIModel)));
        SetMember(meta, "degradation_level", JSONValue(static_cast<int64_t>(degradation.level)));
        result.meta = std::move(meta);
        return std::make_unique<JSONRPCResponse>(request.id, ToJSON(result));
    }

    AdmissionQueue::Slot slot;
    try {
        slot = admission.Acquire(options.admissionTimeout);
    } catch (const errors::ResourceError& e) {
        // Queue full, admission wait expired, or shutting down
        errorController.Handle(e, handleRequestFor(ctx, name, false));
        JSONValue data{JSONValue::Object{}};
        SetMember(data, "error", JSONValue(std::string(e.what())));
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::ToolExecutionError, "Server busy", data);
    } catch (const errors::TimeoutError& e) {
        errorController.Handle(e, handleRequestFor(ctx, name, false));
        JSONValue data{JSONValue::Object{}};
        SetMember(data, "error", JSONValue(std::string(e.what())));
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::ToolExecutionError, "Server busy", data);
    }

    try {
        return std::make_unique<JSONRPCResponse>(request.id, ToJSON(runOnce(*tool, name, arguments, slot)));
    } catch (const std::exception& first) {
        const errors::ErrorContext firstCtx = errorController.Handle(first, handleRequestFor(ctx, name, true));
        if (!firstCtx.recoverySuccessful) {
            LOG_WARN("Tool {} failed without recovery ({}); returning fallback", name, firstCtx.code);
            return std::make_unique<JSONRPCResponse>(request.id, ToJSON(fallbackResult(firstCtx)));
        }
        try {
            if (!slot.Valid()) {
                // The first execution is parked with its slot; the retry queues for a new one
                slot = admission.Acquire(options.admissionTimeout);
            }
            LOG_INFO("Retrying tool {} after recovery ({})", name, firstCtx.code);
            return std::make_unique<JSONRPCResponse>(request.id, ToJSON(runOnce(*tool, name, arguments, slot)));
        } catch (const std::exception& second) {
            errors::HandleRequest retryReq = handleRequestFor(ctx, name, false);
            retryReq.priorRetries = firstCtx.recovery.retryCount;
            retryReq.attributes["retry"] = "true";
            const errors::ErrorContext secondCtx = errorController.Handle(second, retryReq);
            LOG_WARN("Retry of tool {} failed ({}); returning fallback", name, secondCtx.code);
            return std::make_unique<JSONRPCResponse>(request.id, ToJSON(fallbackResult(secondCtx)));
        }
    }
}

} // namespace mcplease
