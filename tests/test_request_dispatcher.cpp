//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_request_dispatcher.cpp
// Purpose: GoogleTests for RequestDispatcher routing, tool execution, retry/fallback and admission
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

#include "mcplease/JSONRPCTypes.h"
#include "mcplease/RequestDispatcher.h"
#include "mcplease/errors/ErrorController.h"
#include "mcplease/errors/Errors.h"

using namespace mcplease;
using namespace std::chrono_literals;

namespace {

//==========================================================================================================
// ScriptedTool
// Purpose: Tool whose behavior is supplied by the test; counts executions.
//==========================================================================================================
class ScriptedTool : public tools::ITool {
public:
    using Body = std::function<CallToolResult(const JSONValue&, std::stop_token)>;

    ScriptedTool(std::string name, Body body, bool needsModel = false)
        : name(std::move(name)), body(std::move(body)), needsModel(needsModel) {}

    Tool Descriptor() const override { return Tool{name, "scripted test tool", JSONValue{JSONValue::Object{}}}; }
    bool RequiresModel() const override { return needsModel; }
    std::future<CallToolResult> Execute(const JSONValue& arguments, std::stop_token st) override {
        ++calls;
        return std::async(std::launch::async, body, arguments, st);
    }

    std::atomic<int> calls{0};

private:
    std::string name;
    Body body;
    bool needsModel;
};

CallToolResult textResult(const std::string& text) {
    CallToolResult r;
    r.content.push_back(MakeTextContent(text));
    return r;
}

errors::ErrorController::Options fastErrors() {
    errors::ErrorController::Options o;
    o.retryBackoffBase = 0ms;
    return o;
}

JSONRPCRequest call(const std::string& paramsJson) {
    return JSONRPCRequest(JSONRPCId{int64_t{1}}, "tools/call", ParseJSON(paramsJson));
}

int errorCode(const JSONRPCResponse& res) {
    EXPECT_TRUE(res.IsError());
    return static_cast<int>(GetIntMember(*res.error, "code").value_or(0));
}

std::string errorMessage(const JSONRPCResponse& res) {
    return GetStringMember(*res.error, "message").value_or("");
}

const JSONValue* errorData(const JSONRPCResponse& res) {
    return FindMember(*res.error, "data");
}

bool isErrorResult(const JSONRPCResponse& res) {
    return std::get<bool>(FindMember(*res.result, "isError")->value);
}

std::string firstText(const JSONRPCResponse& res) {
    const auto& items = std::get<JSONValue::Array>(FindMember(*res.result, "content")->value);
    return items.empty() ? std::string{} : GetStringMember(*items.front(), "text").value_or("");
}

const JSONValue& meta(const JSONRPCResponse& res) {
    return *FindMember(*res.result, "meta");
}

} // namespace

class RequestDispatcherTest : public ::testing::Test {
protected:
    tools::ToolRegistry registry;
    errors::ErrorController errorController{fastErrors()};
};

TEST_F(RequestDispatcherTest, InitializeAdvertisesServer) {
    RequestDispatcher dispatcher(registry, errorController);
    JSONRPCRequest req(JSONRPCId{std::string("init")}, "initialize",
                       ParseJSON(R"({"protocolVersion":"2024-11-05","clientInfo":{"name":"t"}})"));
    auto res = dispatcher.Dispatch(req);
    ASSERT_FALSE(res->IsError());
    EXPECT_EQ(std::get<std::string>(res->id), "init");
    EXPECT_EQ(GetStringMember(*res->result, "protocolVersion").value_or(""), "2024-11-05");
    const JSONValue* info = FindMember(*res->result, "serverInfo");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(GetStringMember(*info, "name").value_or(""), "mcplease");
    const JSONValue* caps = FindMember(*res->result, "capabilities");
    ASSERT_NE(caps, nullptr);
    EXPECT_NE(FindMember(*caps, "tools"), nullptr);
}

TEST_F(RequestDispatcherTest, InitializeWithoutParamsUsesCurrentVersion) {
    RequestDispatcher dispatcher(registry, errorController);
    auto res = dispatcher.Dispatch(JSONRPCRequest(JSONRPCId{int64_t{1}}, "initialize"));
    ASSERT_FALSE(res->IsError());
    EXPECT_EQ(GetStringMember(*res->result, "protocolVersion").value_or(""), PROTOCOL_VERSION);
}

TEST_F(RequestDispatcherTest, InitializeRejectsUnknownVersion) {
    RequestDispatcher dispatcher(registry, errorController);
    JSONRPCRequest req(JSONRPCId{int64_t{1}}, "initialize", ParseJSON(R"({"protocolVersion":"1999-01-01"})"));
    auto res = dispatcher.Dispatch(req);
    EXPECT_EQ(errorCode(*res), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(errorMessage(*res), "Unsupported protocol version: 1999-01-01");
    const JSONValue* data = errorData(*res);
    ASSERT_NE(data, nullptr);
    const auto& versions = std::get<JSONValue::Array>(FindMember(*data, "supported_versions")->value);
    ASSERT_EQ(versions.size(), 1u);
    EXPECT_EQ(std::get<std::string>(versions[0]->value), PROTOCOL_VERSION);
}

TEST_F(RequestDispatcherTest, ListToolsInRegistrationOrder) {
    registry.Register(std::make_shared<ScriptedTool>("beta", [](const JSONValue&, std::stop_token) {
        return textResult("b");
    }));
    registry.Register(std::make_shared<ScriptedTool>("alpha", [](const JSONValue&, std::stop_token) {
        return textResult("a");
    }));
    RequestDispatcher dispatcher(registry, errorController);
    auto res = dispatcher.Dispatch(JSONRPCRequest(JSONRPCId{int64_t{2}}, "tools/list"));
    ASSERT_FALSE(res->IsError());
    const auto& list = std::get<JSONValue::Array>(FindMember(*res->result, "tools")->value);
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(GetStringMember(*list[0], "name").value_or(""), "beta");
    EXPECT_EQ(GetStringMember(*list[1], "name").value_or(""), "alpha");
    EXPECT_NE(FindMember(*list[0], "inputSchema"), nullptr);
}

TEST_F(RequestDispatcherTest, UnknownMethodListsSupportedMethods) {
    RequestDispatcher dispatcher(registry, errorController);
    auto res = dispatcher.Dispatch(JSONRPCRequest(JSONRPCId{int64_t{3}}, "prompts/list"));
    EXPECT_EQ(errorCode(*res), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(errorMessage(*res), "Method 'prompts/list' not supported");
    const auto& methods = std::get<JSONValue::Array>(FindMember(*errorData(*res), "supported_methods")->value);
    EXPECT_EQ(methods.size(), 3u);
}

TEST_F(RequestDispatcherTest, CallWithoutNameIsInvalidParams) {
    RequestDispatcher dispatcher(registry, errorController);
    auto res = dispatcher.Dispatch(call(R"({"arguments":{}})"));
    EXPECT_EQ(errorCode(*res), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(errorMessage(*res), "Tool name is required");
}

TEST_F(RequestDispatcherTest, CallUnknownToolListsAvailable) {
    registry.Register(std::make_shared<ScriptedTool>("known", [](const JSONValue&, std::stop_token) {
        return textResult("ok");
    }));
    RequestDispatcher dispatcher(registry, errorController);
    auto res = dispatcher.Dispatch(call(R"({"name":"missing"})"));
    EXPECT_EQ(errorCode(*res), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(errorMessage(*res), "Tool 'missing' not found");
    const auto& names = std::get<JSONValue::Array>(FindMember(*errorData(*res), "available_tools")->value);
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(std::get<std::string>(names[0]->value), "known");
}

//==========================================================================================================
// Without an "arguments" member the remaining params are the arguments, minus routing and auth fields.
//==========================================================================================================
TEST_F(RequestDispatcherTest, ReservedParamsAreNotPassedToTool) {
    auto echo = std::make_shared<ScriptedTool>("echo", [](const JSONValue& args, std::stop_token) {
        return textResult(SerializeJSON(args));
    });
    registry.Register(echo);
    RequestDispatcher dispatcher(registry, errorController);
    auto res = dispatcher.Dispatch(call(R"({"name":"echo","x":"1","session_id":"s","token":"t"})"));
    ASSERT_FALSE(res->IsError());
    EXPECT_FALSE(isErrorResult(*res));
    EXPECT_EQ(firstText(*res), R"({"x":"1"})");
}

TEST_F(RequestDispatcherTest, RecoveredFailureIsRetriedOnce) {
    std::atomic<int> attempts{0};
    auto flaky = std::make_shared<ScriptedTool>("flaky", [&attempts](const JSONValue&, std::stop_token) {
        if (attempts.fetch_add(1) == 0) {
            throw errors::ModelUnavailableError("warming up");
        }
        return textResult("second time lucky");
    });
    registry.Register(flaky);
    RequestDispatcher dispatcher(registry, errorController);

    auto res = dispatcher.Dispatch(call(R"({"name":"flaky"})"));
    ASSERT_FALSE(res->IsError());
    EXPECT_FALSE(isErrorResult(*res));
    EXPECT_EQ(firstText(*res), "second time lucky");
    EXPECT_EQ(flaky->calls.load(), 2);
    ASSERT_EQ(errorController.History().size(), 1u);
    EXPECT_TRUE(errorController.History()[0].recoverySuccessful);
}

TEST_F(RequestDispatcherTest, FailedRetryReturnsFallback) {
    auto broken = std::make_shared<ScriptedTool>("broken", [](const JSONValue&, std::stop_token) -> CallToolResult {
        throw errors::ModelUnavailableError("model offline");
    });
    registry.Register(broken);
    RequestDispatcher dispatcher(registry, errorController);

    auto res = dispatcher.Dispatch(call(R"({"name":"broken"})"));
    ASSERT_FALSE(res->IsError());
    EXPECT_TRUE(isErrorResult(*res));
    EXPECT_EQ(firstText(*res), RequestDispatcher::FallbackMessage(errors::ErrorCategory::AIModel));
    EXPECT_TRUE(std::get<bool>(FindMember(meta(*res), "fallback_used")->value));
    EXPECT_EQ(GetStringMember(meta(*res), "category").value_or(""), "ai_model");
    EXPECT_EQ(GetStringMember(meta(*res), "severity").value_or(""), "medium");
    EXPECT_EQ(GetStringMember(meta(*res), "error_code").value_or("").rfind("AI_-MODELUNAVA-", 0), 0u);
    EXPECT_EQ(broken->calls.load(), 2);

    const auto history = errorController.History();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_TRUE(history[0].recoveryAttempted);
    EXPECT_FALSE(history[1].recoveryAttempted);
    EXPECT_EQ(history[1].attributes.at("retry"), "true");
    EXPECT_EQ(history[1].attributes.at("tool"), "broken");
}

TEST_F(RequestDispatcherTest, UnrecoverableFailureIsNotRetried) {
    auto strict = std::make_shared<ScriptedTool>("strict", [](const JSONValue&, std::stop_token) -> CallToolResult {
        throw std::invalid_argument("Missing required argument: code");
    });
    registry.Register(strict);
    RequestDispatcher dispatcher(registry, errorController);

    auto res = dispatcher.Dispatch(call(R"({"name":"strict"})"));
    ASSERT_FALSE(res->IsError());
    EXPECT_TRUE(isErrorResult(*res));
    EXPECT_EQ(GetStringMember(meta(*res), "category").value_or(""), "user_input");
    EXPECT_EQ(strict->calls.load(), 1);
}

TEST_F(RequestDispatcherTest, SlowToolTimesOut) {
    auto slow = std::make_shared<ScriptedTool>("slow", [](const JSONValue&, std::stop_token st) {
        const auto deadline = std::chrono::steady_clock::now() + 2s;
        while (!st.stop_requested() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(5ms);
        }
        return textResult("late");
    });
    registry.Register(slow);
    RequestDispatcher::Options opts;
    opts.toolTimeout = 50ms;
    RequestDispatcher dispatcher(registry, errorController, opts);

    auto res = dispatcher.Dispatch(call(R"({"name":"slow"})"));
    ASSERT_FALSE(res->IsError());
    EXPECT_TRUE(isErrorResult(*res));
    EXPECT_EQ(GetStringMember(meta(*res), "category").value_or(""), "network");
    const auto history = errorController.History();
    ASSERT_FALSE(history.empty());
    EXPECT_EQ(history[0].kind, "TimeoutError");
    EXPECT_EQ(history[0].message, "Tool 'slow' timed out after 50 ms");
}

//==========================================================================================================
// A tool that ignores the stop request keeps its slot after timing out, so the retry waits for it
// and never runs alongside it.
//==========================================================================================================
TEST_F(RequestDispatcherTest, TimedOutExecutionKeepsItsSlot) {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    auto stubborn = std::make_shared<ScriptedTool>("stubborn", [&running, &peak](const JSONValue&, std::stop_token) {
        const int now = ++running;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(600ms);
        --running;
        return textResult("too late");
    });
    registry.Register(stubborn);
    RequestDispatcher::Options opts;
    opts.toolTimeout = 50ms;
    opts.admissionTimeout = 5s;
    opts.admission.capacity = 1;
    RequestDispatcher dispatcher(registry, errorController, opts);

    auto res = dispatcher.Dispatch(call(R"({"name":"stubborn"})"));
    ASSERT_FALSE(res->IsError());
    EXPECT_TRUE(isErrorResult(*res));
    EXPECT_EQ(stubborn->calls.load(), 2);
    EXPECT_EQ(peak.load(), 1);
    EXPECT_EQ(dispatcher.AdmissionStats().inFlight, 1u);

    const auto deadline = std::chrono::steady_clock::now() + 3s;
    while (dispatcher.AdmissionStats().inFlight != 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(dispatcher.AdmissionStats().inFlight, 0u);
    EXPECT_EQ(running.load(), 0);
}

//==========================================================================================================
// One slot and no queue: a second concurrent call is refused while the first holds the slot.
//==========================================================================================================
TEST_F(RequestDispatcherTest, FullQueueAnswersServerBusy) {
    std::promise<void> started;
    std::promise<void> gate;
    std::shared_future<void> gateFuture = gate.get_future().share();
    auto blocking = std::make_shared<ScriptedTool>("blocking", [&started, gateFuture](const JSONValue&, std::stop_token) {
        started.set_value();
        gateFuture.wait();
        return textResult("done");
    });
    registry.Register(blocking);
    RequestDispatcher::Options opts;
    opts.admission.capacity = 1;
    opts.admission.maxQueueDepth = 0;
    RequestDispatcher dispatcher(registry, errorController, opts);

    auto first = std::async(std::launch::async, [&] { return dispatcher.Dispatch(call(R"({"name":"blocking"})")); });
    started.get_future().wait();

    auto busy = dispatcher.Dispatch(call(R"({"name":"blocking"})"));
    EXPECT_EQ(errorCode(*busy), JSONRPCErrorCodes::ToolExecutionError);
    EXPECT_EQ(errorMessage(*busy), "Server busy");
    EXPECT_EQ(GetStringMember(*errorData(*busy), "error").value_or(""), "Request queue is full (0 waiting)");

    gate.set_value();
    auto done = first.get();
    ASSERT_FALSE(done->IsError());
    EXPECT_EQ(firstText(*done), "done");
    EXPECT_EQ(dispatcher.AdmissionStats().rejected, 1u);
    EXPECT_EQ(dispatcher.AdmissionStats().inFlight, 0u);
}

TEST_F(RequestDispatcherTest, AdmissionWaitTimesOut) {
    std::promise<void> started;
    std::promise<void> gate;
    std::shared_future<void> gateFuture = gate.get_future().share();
    auto blocking = std::make_shared<ScriptedTool>("blocking", [&started, gateFuture](const JSONValue&, std::stop_token) {
        started.set_value();
        gateFuture.wait();
        return textResult("done");
    });
    registry.Register(blocking);
    RequestDispatcher::Options opts;
    opts.admission.capacity = 1;
    opts.admission.maxQueueDepth = 4;
    opts.admissionTimeout = 30ms;
    RequestDispatcher dispatcher(registry, errorController, opts);

    auto first = std::async(std::launch::async, [&] { return dispatcher.Dispatch(call(R"({"name":"blocking"})")); });
    started.get_future().wait();

    auto busy = dispatcher.Dispatch(call(R"({"name":"blocking"})"));
    EXPECT_EQ(errorCode(*busy), JSONRPCErrorCodes::ToolExecutionError);
    EXPECT_EQ(errorMessage(*busy), "Server busy");
    EXPECT_NE(GetStringMember(*errorData(*busy), "error").value_or("").find("Timed out"), std::string::npos);

    gate.set_value();
    EXPECT_FALSE(first.get()->IsError());
    EXPECT_EQ(dispatcher.AdmissionStats().timedOut, 1u);
}

TEST_F(RequestDispatcherTest, ClosedDispatcherRefusesToolCalls) {
    registry.Register(std::make_shared<ScriptedTool>("t", [](const JSONValue&, std::stop_token) {
        return textResult("ok");
    }));
    RequestDispatcher dispatcher(registry, errorController);
    dispatcher.Close();
    auto res = dispatcher.Dispatch(call(R"({"name":"t"})"));
    EXPECT_EQ(errorCode(*res), JSONRPCErrorCodes::ToolExecutionError);
    EXPECT_EQ(GetStringMember(*errorData(*res), "error").value_or(""), "Admission queue closed");
}

//==========================================================================================================
// At the highest degradation level model-backed tools are skipped; plain tools keep working.
//==========================================================================================================
TEST_F(RequestDispatcherTest, DisabledAIServesFallbackWithoutRunningTool) {
    auto modelTool = std::make_shared<ScriptedTool>("model", [](const JSONValue&, std::stop_token) {
        return textResult("generated");
    }, true);
    auto plainTool = std::make_shared<ScriptedTool>("plain", [](const JSONValue&, std::stop_token) {
        return textResult("plain result");
    });
    registry.Register(modelTool);
    registry.Register(plainTool);

    errors::HandleRequest quiet;
    quiet.attemptRecovery = false;
    for (int i = 0; i < 6; ++i) {
        errorController.Handle(errors::ResourceError("out of memory"), quiet);
    }
    ASSERT_EQ(errorController.DegradationLevel(), 3);

    RequestDispatcher dispatcher(registry, errorController);
    auto res = dispatcher.Dispatch(call(R"({"name":"model"})"));
    ASSERT_FALSE(res->IsError());
    EXPECT_TRUE(isErrorResult(*res));
    EXPECT_EQ(GetIntMember(meta(*res), "degradation_level").value_or(-1), 3);
    EXPECT_EQ(GetStringMember(meta(*res), "category").value_or(""), "ai_model");
    EXPECT_EQ(modelTool->calls.load(), 0);

    auto plain = dispatcher.Dispatch(call(R"({"name":"plain"})"));
    ASSERT_FALSE(plain->IsError());
    EXPECT_EQ(firstText(*plain), "plain result");
    EXPECT_EQ(dispatcher.AdmissionStats().capacity, 1u);
}
