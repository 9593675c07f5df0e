//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_server_pipeline.cpp
// Purpose: GoogleTests for the Server request pipeline (policy, sessions, permissions, dispatch, shutdown)
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_set>

#include "mcplease/JSONRPCTypes.h"
#include "mcplease/Server.h"
#include "mcplease/auth/SignedTokenScheme.h"
#include "mcplease/errors/Errors.h"
#include "mcplease/tools/CodingTools.h"

using namespace mcplease;
using namespace std::chrono_literals;

namespace {

ClientEndpoint localEndpoint(const std::string& address = "127.0.0.1") {
    ClientEndpoint ep;
    ep.address = address;
    ep.port = 8000;
    ep.scheme = "http";
    return ep;
}

JSONRPCRequest makeRequest(int64_t id, const std::string& method, const std::string& paramsJson = "{}") {
    return JSONRPCRequest(JSONRPCId{id}, method, ParseJSON(paramsJson));
}

int errorCode(const JSONRPCResponse& res) {
    EXPECT_TRUE(res.IsError());
    return static_cast<int>(GetIntMember(*res.error, "code").value_or(0));
}

std::string errorMessage(const JSONRPCResponse& res) {
    return GetStringMember(*res.error, "message").value_or("");
}

std::string errorDataString(const JSONRPCResponse& res, const std::string& key) {
    const JSONValue* data = FindMember(*res.error, "data");
    return data ? GetStringMember(*data, key).value_or("") : std::string{};
}

std::string metaSessionId(const JSONRPCResponse& res) {
    const JSONValue* meta = FindMember(*res.result, "meta");
    return meta ? GetStringMember(*meta, "session_id").value_or("") : std::string{};
}

bool resultIsError(const JSONRPCResponse& res) {
    const JSONValue* v = FindMember(*res.result, "isError");
    return v != nullptr && std::get<bool>(v->value);
}

std::string firstText(const JSONRPCResponse& res) {
    const JSONValue* content = FindMember(*res.result, "content");
    if (content == nullptr) return {};
    const auto& items = std::get<JSONValue::Array>(content->value);
    return items.empty() ? std::string{} : GetStringMember(*items.front(), "text").value_or("");
}

const char* kCompletionCall =
    R"({"name":"code_completion","arguments":{"code":"def add(a, b):","language":"python"}})";

//==========================================================================================================
// UnavailableModel
// Purpose: Model adapter whose backend is always down.
//==========================================================================================================
class UnavailableModel : public tools::IModelAdapter {
public:
    std::string Generate(const std::string&, const tools::GenerationOptions&, std::stop_token) override {
        throw errors::ModelUnavailableError("model backend is not reachable");
    }
    bool IsReady() const override { return false; }
    bool Restart() override { return false; }
};

//==========================================================================================================
// ThrowingContextStore
// Purpose: Context store that fails every write; used to show context errors never fail a request.
//==========================================================================================================
class ThrowingContextStore : public context::IContextStore {
public:
    bool AppendEntry(const std::string&, const std::optional<std::string>&, context::ConversationEntry) override {
        throw std::runtime_error("context backend offline");
    }
    std::optional<context::ConversationContext> GetContext(const std::string&) override { return std::nullopt; }
    bool DeleteContext(const std::string&) override { return false; }
    std::size_t CleanupExpired() override { return 0; }
    void SetMaxContentSize(std::size_t) override {}
    JSONValue GetStats() const override { return JSONValue{JSONValue::Object{}}; }
};

ServerOptions authOptions(std::shared_ptr<auth::SignedTokenScheme> scheme) {
    ServerOptions opts;
    opts.session.requireAuth = true;
    opts.schemes.push_back(std::move(scheme));
    return opts;
}

std::shared_ptr<auth::SignedTokenScheme> testScheme() {
    auth::SignedTokenScheme::Options so;
    so.secret = "pipeline-test-secret";
    return std::make_shared<auth::SignedTokenScheme>(so);
}

std::string issueFor(auth::SignedTokenScheme& scheme, const std::string& user,
                     std::unordered_set<std::string> permissions) {
    auth::Identity id;
    id.userId = user;
    id.username = user;
    id.permissions = std::move(permissions);
    return scheme.Issue(id).token;
}


bool waitUntil(const std::function<bool()>& pred, std::chrono::milliseconds limit = 3000ms) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

//==========================================================================================================
// HeldTool
// Purpose: Tool "held" that finishes after `hold`, when the gate opens, or when stop is requested.
//==========================================================================================================
class HeldTool : public tools::ITool {
public:
    explicit HeldTool(std::chrono::milliseconds hold) : hold(hold), gate(opener.get_future().share()) {}

    Tool Descriptor() const override { return Tool{"held", "holds its caller", JSONValue{JSONValue::Object{}}}; }
    std::future<CallToolResult> Execute(const JSONValue&, std::stop_token st) override {
        return std::async(std::launch::async, [this, st]() {
            const auto deadline = std::chrono::steady_clock::now() + hold;
            while (std::chrono::steady_clock::now() < deadline && !st.stop_requested() &&
                   gate.wait_for(5ms) != std::future_status::ready) {
            }
            CallToolResult r;
            r.content.push_back(MakeTextContent("held done"));
            finished.store(true);
            return r;
        });
    }

    void Open() { opener.set_value(); }

    std::atomic<bool> finished{false};

private:
    std::chrono::milliseconds hold;
    std::promise<void> opener;
    std::shared_future<void> gate;
};

//==========================================================================================================
// BrokenListingTool
// Purpose: Registers normally, then fails every descriptor lookup once broken.
//==========================================================================================================
class BrokenListingTool : public tools::ITool {
public:
    Tool Descriptor() const override {
        if (broken.load()) {
            throw std::runtime_error("descriptor storage corrupted");
        }
        return Tool{"broken", "fails to describe itself", JSONValue{JSONValue::Object{}}};
    }
    std::future<CallToolResult> Execute(const JSONValue&, std::stop_token) override {
        std::promise<CallToolResult> p;
        p.set_value(CallToolResult{});
        return p.get_future();
    }

    std::atomic<bool> broken{false};
};

//==========================================================================================================
// FixedTextTool
// Purpose: Tool "fixed" that answers with a preset text.
//==========================================================================================================
class FixedTextTool : public tools::ITool {
public:
    explicit FixedTextTool(std::string text) : text(std::move(text)) {}

    Tool Descriptor() const override { return Tool{"fixed", "answers with preset text", JSONValue{JSONValue::Object{}}}; }
    std::future<CallToolResult> Execute(const JSONValue&, std::stop_token) override {
        CallToolResult r;
        r.content.push_back(MakeTextContent(text));
        std::promise<CallToolResult> p;
        p.set_value(std::move(r));
        return p.get_future();
    }

private:
    std::string text;
};

const char* kHeldCall = R"({"name":"held","arguments":{}})";

} // namespace

//==========================================================================================================
// Anonymous client lists tools, then calls code_completion and gets a normal result tagged with its session.
//==========================================================================================================
TEST(ServerPipeline, AnonymousListAndCompletion) {
    Server server;
    tools::RegisterCodingTools(server.Tools(), nullptr);

    auto list = server.HandleRequest(makeRequest(1, "tools/list"), localEndpoint());
    ASSERT_FALSE(list->IsError());
    const JSONValue* toolsValue = FindMember(*list->result, "tools");
    ASSERT_NE(toolsValue, nullptr);
    EXPECT_EQ(std::get<JSONValue::Array>(toolsValue->value).size(), 3u);
    EXPECT_EQ(metaSessionId(*list).rfind("anon_", 0), 0u);

    auto call = server.HandleRequest(makeRequest(2, "tools/call", kCompletionCall), localEndpoint());
    ASSERT_FALSE(call->IsError());
    EXPECT_FALSE(resultIsError(*call));
    EXPECT_NE(firstText(*call).find("Code completion for python"), std::string::npos);
    const std::string sid = metaSessionId(*call);
    EXPECT_EQ(sid.rfind("anon_", 0), 0u);
    EXPECT_EQ(std::get<int64_t>(call->id), 2);

    auto ctx = server.Context().GetContext(sid);
    ASSERT_TRUE(ctx.has_value());
    ASSERT_EQ(ctx->history.size(), 2u);
    EXPECT_EQ(ctx->history[0].role, "user");
    EXPECT_EQ(ctx->history[0].content, "Called tool: code_completion");
    EXPECT_EQ(ctx->history[1].role, "assistant");
}

TEST(ServerPipeline, AuthRequiredWithoutCredentialsCreatesNoSession) {
    Server server(authOptions(testScheme()));
    tools::RegisterCodingTools(server.Tools(), nullptr);

    auto res = server.HandleRequest(makeRequest(1, "tools/list"), localEndpoint());
    EXPECT_EQ(errorCode(*res), JSONRPCErrorCodes::AuthenticationRequired);
    EXPECT_EQ(errorMessage(*res), "Authentication required");
    EXPECT_EQ(errorDataString(*res, "error"), "Invalid or missing credentials");
    EXPECT_TRUE(server.Sessions().ListSessions().empty());
}

TEST(ServerPipeline, AuthRequiredRejectsForgedToken) {
    auto scheme = testScheme();
    Server server(authOptions(scheme));

    auth::SignedTokenScheme::Options otherOpts;
    otherOpts.secret = "someone-elses-secret";
    auth::SignedTokenScheme other(otherOpts);
    const std::string forged = issueFor(other, "mallory", {"tools/list"});

    auto res = server.HandleRequest(makeRequest(1, "tools/list", R"({"token":")" + forged + R"("})"),
                                    localEndpoint());
    EXPECT_EQ(errorCode(*res), JSONRPCErrorCodes::AuthenticationRequired);
    EXPECT_TRUE(server.Sessions().ListSessions().empty());
}

//==========================================================================================================
// A valid token opens an authenticated session; the session id can be presented on later requests.
//==========================================================================================================
TEST(ServerPipeline, AuthenticatedSessionIsReusable) {
    auto scheme = testScheme();
    Server server(authOptions(scheme));
    tools::RegisterCodingTools(server.Tools(), nullptr);
    const std::string token = issueFor(*scheme, "alice", {"read", "tools/list", "tools/call"});

    auto first = server.HandleRequest(makeRequest(1, "tools/list", R"({"token":")" + token + R"("})"),
                                      localEndpoint());
    ASSERT_FALSE(first->IsError());
    const std::string sid = metaSessionId(*first);
    EXPECT_EQ(sid.rfind("auth_alice_", 0), 0u);

    auto second = server.HandleRequest(makeRequest(2, "tools/list", R"({"session_id":")" + sid + R"("})"),
                                       localEndpoint());
    ASSERT_FALSE(second->IsError());
    EXPECT_EQ(metaSessionId(*second), sid);
    EXPECT_EQ(server.Sessions().ListSessions().size(), 1u);
}

TEST(ServerPipeline, BearerHeaderFromEndpointAuthenticates) {
    auto scheme = testScheme();
    Server server(authOptions(scheme));
    ClientEndpoint ep = localEndpoint();
    ep.authorization = "bearer " + issueFor(*scheme, "bob", {"tools/list"});

    auto res = server.HandleRequest(makeRequest(1, "tools/list"), ep);
    ASSERT_FALSE(res->IsError());
    EXPECT_EQ(metaSessionId(*res).rfind("auth_bob_", 0), 0u);
}

TEST(ServerPipeline, MissingPermissionIsDenied) {
    auto scheme = testScheme();
    Server server(authOptions(scheme));
    const std::string token = issueFor(*scheme, "carol", {"read"});

    auto res = server.HandleRequest(makeRequest(1, "tools/list", R"({"token":")" + token + R"("})"),
                                    localEndpoint());
    EXPECT_EQ(errorCode(*res), JSONRPCErrorCodes::PermissionDenied);
    EXPECT_EQ(errorMessage(*res), "Permission denied");
    EXPECT_EQ(errorDataString(*res, "error"), "Insufficient permissions for tools/list");
}

TEST(ServerPipeline, AddressOutsideAllowListIsDenied) {
    ServerOptions opts;
    opts.policy = security::NetworkPolicy{};
    opts.policy.AllowNetwork("10.0.0.0/8");
    Server server(std::move(opts));

    auto res = server.HandleRequest(makeRequest(1, "tools/list"), localEndpoint("203.0.113.1"));
    EXPECT_EQ(errorCode(*res), JSONRPCErrorCodes::NetworkAccessDenied);
    EXPECT_EQ(errorMessage(*res), "Network access denied");
    EXPECT_EQ(errorDataString(*res, "error"), "IP 203.0.113.1 not in allowed list");
    EXPECT_EQ(errorDataString(*res, "client_ip"), "203.0.113.1");
    EXPECT_TRUE(server.Sessions().ListSessions().empty());

    auto inside = server.HandleRequest(makeRequest(2, "tools/list"), localEndpoint("10.1.2.3"));
    EXPECT_FALSE(inside->IsError());
}

TEST(ServerPipeline, ThirdRequestOverRateLimitIsRejected) {
    ServerOptions opts;
    opts.policy.rateLimitPerAddress = 2;
    Server server(std::move(opts));

    EXPECT_FALSE(server.HandleRequest(makeRequest(1, "tools/list"), localEndpoint())->IsError());
    EXPECT_FALSE(server.HandleRequest(makeRequest(2, "tools/list"), localEndpoint())->IsError());
    auto third = server.HandleRequest(makeRequest(3, "tools/list"), localEndpoint());
    EXPECT_EQ(errorCode(*third), JSONRPCErrorCodes::RateLimitExceeded);
    EXPECT_EQ(errorDataString(*third, "error"), "Rate limit exceeded for IP 127.0.0.1");

    // Other addresses have their own window
    EXPECT_FALSE(server.HandleRequest(makeRequest(4, "tools/list"), localEndpoint("127.0.0.2"))->IsError());
}

//==========================================================================================================
// A tool whose model is down yields a success-shaped fallback result, not a JSON-RPC error.
//==========================================================================================================
TEST(ServerPipeline, UnavailableModelReturnsFallback) {
    Server server;
    tools::RegisterCodingTools(server.Tools(), std::make_shared<UnavailableModel>());

    auto res = server.HandleRequest(makeRequest(7, "tools/call", kCompletionCall), localEndpoint());
    ASSERT_FALSE(res->IsError());
    EXPECT_TRUE(resultIsError(*res));
    EXPECT_EQ(firstText(*res), RequestDispatcher::FallbackMessage(errors::ErrorCategory::AIModel));
    const JSONValue* meta = FindMember(*res->result, "meta");
    ASSERT_NE(meta, nullptr);
    EXPECT_TRUE(std::get<bool>(FindMember(*meta, "fallback_used")->value));
    EXPECT_EQ(GetStringMember(*meta, "category").value_or(""), "ai_model");
    EXPECT_EQ(GetStringMember(*meta, "session_id").value_or("").rfind("anon_", 0), 0u);

    // Initial failure plus the failed retry
    EXPECT_EQ(server.Errors().History().size(), 2u);
}

TEST(ServerPipeline, DispatcherErrorsPassThrough) {
    Server server;
    auto res = server.HandleRequest(makeRequest(1, "resources/list"), localEndpoint());
    EXPECT_EQ(errorCode(*res), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(errorMessage(*res), "Method 'resources/list' not supported");
}

TEST(ServerPipeline, ContextFailureDoesNotFailRequest) {
    ServerOptions opts;
    opts.contextStore = std::make_shared<ThrowingContextStore>();
    Server server(std::move(opts));
    tools::RegisterCodingTools(server.Tools(), nullptr);

    auto res = server.HandleRequest(makeRequest(1, "tools/call", kCompletionCall), localEndpoint());
    ASSERT_FALSE(res->IsError());
    EXPECT_FALSE(resultIsError(*res));
}

TEST(ServerPipeline, StopRejectsNewRequestsAndReleasesSessions) {
    Server server;
    auto ok = server.HandleRequest(makeRequest(1, "tools/list"), localEndpoint());
    ASSERT_FALSE(ok->IsError());
    const std::string sid = metaSessionId(*ok);
    EXPECT_EQ(GetStringMember(server.HealthCheck(), "status").value_or(""), "healthy");

    server.Start();
    EXPECT_TRUE(server.IsRunning());
    server.Stop();
    EXPECT_FALSE(server.IsRunning());
    EXPECT_FALSE(server.IsAccepting());
    EXPECT_FALSE(server.Sessions().Validate(sid).has_value());

    auto rejected = server.HandleRequest(makeRequest(2, "tools/list"), localEndpoint());
    EXPECT_EQ(errorCode(*rejected), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(errorMessage(*rejected), "Server is shutting down");
    EXPECT_EQ(GetStringMember(server.HealthCheck(), "status").value_or(""), "stopped");

    // Second stop is a no-op
    server.Stop();
}

TEST(ServerPipeline, StatusCountsRequests) {
    ServerOptions opts;
    opts.policy.rateLimitPerAddress = 1;
    Server server(std::move(opts));
    tools::RegisterCodingTools(server.Tools(), nullptr);

    server.HandleRequest(makeRequest(1, "tools/list"), localEndpoint());
    server.HandleRequest(makeRequest(2, "tools/list"), localEndpoint());

    const JSONValue status = server.GetStatus();
    const JSONValue* requests = FindMember(status, "requests");
    ASSERT_NE(requests, nullptr);
    EXPECT_EQ(GetIntMember(*requests, "total").value_or(-1), 2);
    EXPECT_EQ(GetIntMember(*requests, "rejected").value_or(-1), 1);
    EXPECT_EQ(GetIntMember(*requests, "in_flight").value_or(-1), 0);
    EXPECT_EQ(GetStringMember(status, "protocol_version").value_or(""), PROTOCOL_VERSION);
    EXPECT_EQ(std::get<JSONValue::Array>(FindMember(status, "tools")->value).size(), 3u);
}

//==========================================================================================================
// An exception escaping the pipeline becomes a sanitized -32603 and is recorded without recovery.
//==========================================================================================================
TEST(ServerPipeline, UnexpectedFailureBecomesInternalError) {
    Server server;
    auto tool = std::make_shared<BrokenListingTool>();
    server.Tools().Register(tool);
    tool->broken.store(true);
    const std::size_t before = server.Errors().History().size();

    auto res = server.HandleRequest(makeRequest(1, "tools/list"), localEndpoint());
    EXPECT_EQ(errorCode(*res), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(errorMessage(*res), "Internal error");

    const auto history = server.Errors().History();
    ASSERT_EQ(history.size(), before + 1);
    const errors::ErrorContext& ctx = history.back();
    EXPECT_FALSE(ctx.recoveryAttempted);
    EXPECT_FALSE(ctx.code.empty());
    EXPECT_EQ(errorDataString(*res, "error_code"), ctx.code);
    EXPECT_EQ(errorDataString(*res, "category"), errors::ToString(ctx.category));
    EXPECT_EQ(errorDataString(*res, "severity"), errors::ToString(ctx.severity));
    EXPECT_EQ(ctx.attributes.at("method"), "tools/list");
    // Internal detail stays out of the response
    EXPECT_EQ(SerializeJSON(*res->error).find("corrupted"), std::string::npos);
}

//==========================================================================================================
// Stop() waits for an in-flight call, which then completes normally.
//==========================================================================================================
TEST(ServerPipeline, StopDrainsInFlightCall) {
    ServerOptions opts;
    opts.drainTimeout = 5s;
    Server server(std::move(opts));
    auto tool = std::make_shared<HeldTool>(300ms);
    server.Tools().Register(tool);
    server.Start();

    std::unique_ptr<JSONRPCResponse> res;
    std::thread caller([&]() {
        res = server.HandleRequest(makeRequest(1, "tools/call", kHeldCall), localEndpoint());
    });
    ASSERT_TRUE(waitUntil([&]() { return server.Dispatcher().AdmissionStats().inFlight == 1; }));

    server.Stop();
    EXPECT_TRUE(tool->finished.load());
    caller.join();

    ASSERT_TRUE(res);
    ASSERT_FALSE(res->IsError());
    EXPECT_FALSE(resultIsError(*res));
    EXPECT_EQ(firstText(*res), "held done");
}

//==========================================================================================================
// A drain that outlives drainTimeout is abandoned; Stop() returns while the call is still running.
//==========================================================================================================
TEST(ServerPipeline, StopGivesUpAfterDrainTimeout) {
    ServerOptions opts;
    opts.drainTimeout = 50ms;
    Server server(std::move(opts));
    auto tool = std::make_shared<HeldTool>(5s);
    server.Tools().Register(tool);
    server.Start();

    std::unique_ptr<JSONRPCResponse> res;
    std::thread caller([&]() {
        res = server.HandleRequest(makeRequest(1, "tools/call", kHeldCall), localEndpoint());
    });
    ASSERT_TRUE(waitUntil([&]() { return server.Dispatcher().AdmissionStats().inFlight == 1; }));

    const auto began = std::chrono::steady_clock::now();
    server.Stop();
    EXPECT_LT(std::chrono::steady_clock::now() - began, 2s);
    EXPECT_FALSE(tool->finished.load());
    EXPECT_FALSE(server.IsRunning());

    tool->Open();
    caller.join();
    EXPECT_TRUE(res);
}

//==========================================================================================================
// The health snapshot task runs on its interval while started and stops with the server.
//==========================================================================================================
TEST(ServerPipeline, HealthSnapshotsRunUntilStop) {
    ServerOptions opts;
    opts.healthInterval = 20ms;
    Server server(std::move(opts));
    EXPECT_TRUE(server.LastHealthSnapshot().IsNull());
    EXPECT_EQ(server.HealthSnapshotCount(), 0u);

    server.Start();
    ASSERT_TRUE(waitUntil([&]() { return server.HealthSnapshotCount() >= 2; }));
    const JSONValue snapshot = server.LastHealthSnapshot();
    EXPECT_EQ(GetStringMember(snapshot, "status").value_or(""), "healthy");
    EXPECT_EQ(GetIntMember(snapshot, "degradation_level").value_or(-1), 0);

    server.Stop();
    const std::size_t taken = server.HealthSnapshotCount();
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(server.HealthSnapshotCount(), taken);
}

//==========================================================================================================
// The conversation summary of a long result is clipped without splitting a UTF-8 character.
//==========================================================================================================
TEST(ServerPipeline, ResultSummaryKeepsUtf8Whole) {
    Server server;
    const std::string prefix(199, 'a');
    server.Tools().Register(std::make_shared<FixedTextTool>(prefix + "\xE2\x82\xAC tail"));

    auto res = server.HandleRequest(makeRequest(1, "tools/call", R"({"name":"fixed","arguments":{}})"), localEndpoint());
    ASSERT_FALSE(res->IsError());
    auto ctx = server.Context().GetContext(metaSessionId(*res));
    ASSERT_TRUE(ctx.has_value());
    ASSERT_FALSE(ctx->history.empty());
    EXPECT_EQ(ctx->history.back().content, prefix + "...");
}
