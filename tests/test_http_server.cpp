//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_http_server.cpp
// Purpose: GoogleTests for the HTTP acceptor wired to the Server pipeline
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "mcplease/HTTPServer.hpp"
#include "mcplease/JSONRPCTypes.h"
#include "mcplease/Server.h"
#include "mcplease/auth/StoredTokenScheme.h"
#include "mcplease/errors/Errors.h"
#include "mcplease/tools/CodingTools.h"

namespace http = boost::beast::http;
using namespace mcplease;
using namespace std::chrono_literals;

namespace {

//==========================================================================================================
// httpRequest
// Purpose: Send a single HTTP request and capture the response (synchronously).
//==========================================================================================================
static http::response<http::string_body> httpRequest(http::verb verb,
                                                     unsigned short port,
                                                     const std::string& target,
                                                     const std::string& body,
                                                     const std::optional<std::string>& authorization = std::nullopt) {
    using boost::asio::ip::tcp;
    boost::asio::io_context ioc;
    tcp::resolver resolver{ioc};
    auto r = resolver.resolve("127.0.0.1", std::to_string(port));
    tcp::socket socket{ioc};
    boost::asio::connect(socket, r);

    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, "127.0.0.1");
    req.set(http::field::content_type, "application/json");
    req.set(http::field::user_agent, "mcplease-tests");
    if (authorization.has_value()) {
        req.set(http::field::authorization, authorization.value());
    }
    req.body() = body;
    req.prepare_payload();
    http::write(socket, req);

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(socket, buffer, res);

    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    return res;
}

static http::response<http::string_body> httpPost(unsigned short port, const std::string& body,
                                                  const std::optional<std::string>& authorization = std::nullopt) {
    return httpRequest(http::verb::post, port, "/mcp/rpc", body, authorization);
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
// GatedTool
// Purpose: Tool that holds its execution until the test opens the gate (or 5 s pass).
//==========================================================================================================
class GatedTool : public tools::ITool {
public:
    explicit GatedTool(std::shared_future<void> gate) : gate(std::move(gate)) {}

    Tool Descriptor() const override { return Tool{"gated", "waits for the gate", JSONValue{JSONValue::Object{}}}; }
    std::future<CallToolResult> Execute(const JSONValue&, std::stop_token) override {
        return std::async(std::launch::async, [g = gate]() {
            g.wait_for(5s);
            CallToolResult r;
            r.content.push_back(MakeTextContent("opened"));
            return r;
        });
    }

private:
    std::shared_future<void> gate;
};

std::string callGated(int id) {
    return R"({"jsonrpc":"2.0","id":)" + std::to_string(id) + R"(,"method":"tools/call","params":{"name":"gated"}})";
}

// Loopback-only server with a listener on an ephemeral port.
ServerOptions loopbackOptions() {
    ServerOptions opts;
    opts.policy.allowedPorts.clear();
    opts.drainTimeout = std::chrono::milliseconds(500);
    return opts;
}

HTTPServer::Options ephemeral() {
    HTTPServer::Options o;
    o.address = "127.0.0.1";
    o.port = "0";
    return o;
}

//==========================================================================================================
// HttpFixture
// Purpose: Server + HTTP acceptor started on 127.0.0.1:<ephemeral>.
//==========================================================================================================
class HttpFixture : public ::testing::Test {
protected:
    void start(ServerOptions opts = loopbackOptions()) {
        server = std::make_unique<Server>(std::move(opts));
        tools::RegisterCodingTools(server->Tools(), nullptr);
        auto acceptor = std::make_unique<HTTPServer>(ephemeral());
        listener = acceptor.get();
        server->AddAcceptor(std::move(acceptor));
        server->Start();
        port = listener->BoundPort();
        ASSERT_NE(port, 0);
    }

    void TearDown() override {
        if (server) server->Stop();
    }

    std::unique_ptr<Server> server;
    HTTPServer* listener{nullptr};
    unsigned short port{0};
};

} // namespace

TEST_F(HttpFixture, ToolsListOverHttp) {
    start();
    auto res = httpPost(port, R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
    EXPECT_EQ(static_cast<int>(res.result()), 200);
    EXPECT_EQ(std::string(res[http::field::content_type]), "application/json");

    const JSONValue body = ParseJSON(res.body());
    EXPECT_EQ(GetIntMember(body, "id").value_or(0), 1);
    const JSONValue* result = FindMember(body, "result");
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(std::get<JSONValue::Array>(FindMember(*result, "tools")->value).size(), 3u);
    const JSONValue* meta = FindMember(*result, "meta");
    ASSERT_NE(meta, nullptr);
    EXPECT_EQ(GetStringMember(*meta, "session_id").value_or("").rfind("anon_", 0), 0u);

    auto sessions = server->Sessions().ListSessions();
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions.front().client.userAgent, "mcplease-tests");
}

//==========================================================================================================
// Undecodable bodies are answered by the acceptor itself with HTTP 200 and a JSON-RPC error.
//==========================================================================================================
TEST_F(HttpFixture, MalformedBodies) {
    start();
    auto parse = httpPost(port, "{\"jsonrpc\":");
    EXPECT_EQ(static_cast<int>(parse.result()), 200);
    const JSONValue p = ParseJSON(parse.body());
    EXPECT_TRUE(FindMember(p, "id")->IsNull());
    EXPECT_EQ(GetIntMember(*FindMember(p, "error"), "code").value_or(0), JSONRPCErrorCodes::ParseError);

    auto invalid = httpPost(port, R"({"jsonrpc":"2.0","id":"x9"})");
    const JSONValue i = ParseJSON(invalid.body());
    EXPECT_EQ(GetStringMember(i, "id").value_or(""), "x9");
    EXPECT_EQ(GetIntMember(*FindMember(i, "error"), "code").value_or(0), JSONRPCErrorCodes::InvalidRequest);
}

TEST_F(HttpFixture, WrongPathAndVerb) {
    start();
    auto notFound = httpRequest(http::verb::post, port, "/other", R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
    EXPECT_EQ(static_cast<int>(notFound.result()), 404);
    auto get = httpRequest(http::verb::get, port, "/mcp/rpc", "");
    EXPECT_EQ(static_cast<int>(get.result()), 400);
}

TEST_F(HttpFixture, AuthorizationHeaderReachesSessionManager) {
    auto stored = std::make_shared<auth::StoredTokenScheme>();
    ServerOptions opts = loopbackOptions();
    opts.session.requireAuth = true;
    opts.schemes.push_back(stored);
    start(std::move(opts));

    auth::Identity id;
    id.userId = "quinn";
    id.username = "quinn";
    id.permissions = {"tools/list"};
    const std::string token = stored->Issue(id).token;
    const std::string body = R"({"jsonrpc":"2.0","id":5,"method":"tools/list"})";

    auto denied = httpPost(port, body);
    EXPECT_EQ(static_cast<int>(denied.result()), 200);
    EXPECT_EQ(GetIntMember(*FindMember(ParseJSON(denied.body()), "error"), "code").value_or(0),
              JSONRPCErrorCodes::AuthenticationRequired);

    auto allowed = httpPost(port, body, std::string("Bearer ") + token);
    const JSONValue ok = ParseJSON(allowed.body());
    ASSERT_NE(FindMember(ok, "result"), nullptr);
    EXPECT_EQ(GetStringMember(*FindMember(*FindMember(ok, "result"), "meta"), "session_id").value_or("").rfind("auth_quinn_", 0),
              0u);
}

TEST_F(HttpFixture, ConnectionLimitAnswers429) {
    ServerOptions opts = loopbackOptions();
    opts.policy.maxConnectionsPerAddress = 1;
    start(std::move(opts));

    // Hold one admitted connection open from 127.0.0.1
    server->Network().RegisterConnection("127.0.0.1");
    auto res = httpPost(port, R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
    EXPECT_EQ(static_cast<int>(res.result()), 429);
    server->Network().UnregisterConnection("127.0.0.1");

    auto again = httpPost(port, R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
    EXPECT_EQ(static_cast<int>(again.result()), 200);
}

//==========================================================================================================
// Tool calls holding every execution slot must not keep the acceptor from answering other requests.
//==========================================================================================================
TEST_F(HttpFixture, SlowToolsDoNotStallTheAcceptor) {
    ServerOptions opts = loopbackOptions();
    opts.dispatcher.admission.capacity = 4;
    opts.drainTimeout = 6s;
    start(std::move(opts));
    std::promise<void> gate;
    server->Tools().Register(std::make_shared<GatedTool>(gate.get_future().share()));

    std::vector<std::future<http::response<http::string_body>>> calls;
    for (int i = 0; i < 4; ++i) {
        calls.push_back(std::async(std::launch::async, [this, i] { return httpPost(port, callGated(10 + i)); }));
    }
    EXPECT_TRUE(waitUntil([this] { return server->Dispatcher().AdmissionStats().inFlight == 4; }));

    const auto began = std::chrono::steady_clock::now();
    auto list = httpPost(port, R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
    EXPECT_LT(std::chrono::steady_clock::now() - began, 1s);
    EXPECT_EQ(static_cast<int>(list.result()), 200);
    EXPECT_NE(FindMember(ParseJSON(list.body()), "result"), nullptr);

    gate.set_value();
    for (auto& c : calls) {
        const JSONValue body = ParseJSON(c.get().body());
        const JSONValue* result = FindMember(body, "result");
        ASSERT_NE(result, nullptr);
        const auto& content = std::get<JSONValue::Array>(FindMember(*result, "content")->value);
        ASSERT_FALSE(content.empty());
        EXPECT_EQ(GetStringMember(*content.front(), "text").value_or(""), "opened");
    }
}

TEST_F(HttpFixture, FullAdmissionQueueAnswersServerBusy) {
    ServerOptions opts = loopbackOptions();
    opts.dispatcher.admission.capacity = 1;
    opts.dispatcher.admission.maxQueueDepth = 1;
    opts.drainTimeout = 6s;
    start(std::move(opts));
    std::promise<void> gate;
    server->Tools().Register(std::make_shared<GatedTool>(gate.get_future().share()));

    auto running = std::async(std::launch::async, [this] { return httpPost(port, callGated(1)); });
    EXPECT_TRUE(waitUntil([this] { return server->Dispatcher().AdmissionStats().inFlight == 1; }));
    auto queued = std::async(std::launch::async, [this] { return httpPost(port, callGated(2)); });
    EXPECT_TRUE(waitUntil([this] { return server->Dispatcher().AdmissionStats().waiting == 1; }));

    const JSONValue busy = ParseJSON(httpPost(port, callGated(3)).body());
    const JSONValue* error = FindMember(busy, "error");
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(GetIntMember(*error, "code").value_or(0), JSONRPCErrorCodes::ToolExecutionError);
    EXPECT_EQ(GetStringMember(*error, "message").value_or(""), "Server busy");
    EXPECT_EQ(GetStringMember(*FindMember(*error, "data"), "error").value_or(""), "Request queue is full (1 waiting)");

    gate.set_value();
    EXPECT_NE(FindMember(ParseJSON(running.get().body()), "result"), nullptr);
    EXPECT_NE(FindMember(ParseJSON(queued.get().body()), "result"), nullptr);
}

TEST(HTTPServerFactory, ParsesListenUris) {
    HTTPServerFactory factory;
    auto acceptor = factory.CreateTransportAcceptor("http://127.0.0.1:0/custom/rpc");
    auto* server = dynamic_cast<HTTPServer*>(acceptor.get());
    ASSERT_NE(server, nullptr);
    server->SetRequestHandler([](const JSONRPCRequest& req, const ClientEndpoint& endpoint) {
        JSONValue result{JSONValue::Object{}};
        SetMember(result, "scheme", JSONValue(endpoint.scheme));
        return std::make_unique<JSONRPCResponse>(req.id, std::move(result));
    });
    ASSERT_NO_THROW(server->Start().get());

    auto ok = httpRequest(http::verb::post, server->BoundPort(), "/custom/rpc",
                          R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    EXPECT_EQ(static_cast<int>(ok.result()), 200);
    EXPECT_EQ(GetStringMember(*FindMember(ParseJSON(ok.body()), "result"), "scheme").value_or(""), "http");
    auto old = httpRequest(http::verb::post, server->BoundPort(), "/mcp/rpc", R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    EXPECT_EQ(static_cast<int>(old.result()), 404);
    ASSERT_NO_THROW(server->Stop().get());
}

TEST(HTTPServerFactory, RejectsMalformedAddresses) {
    HTTPServerFactory factory;
    EXPECT_THROW(factory.CreateTransportAcceptor("http://[::1:8000"), errors::ConfigurationError);

    auto badPort = factory.CreateTransportAcceptor("http://127.0.0.1:http");
    EXPECT_THROW(badPort->Start().get(), errors::ConfigurationError);
    auto outOfRange = factory.CreateTransportAcceptor("http://127.0.0.1:70000");
    EXPECT_THROW(outOfRange->Start().get(), errors::ConfigurationError);
}
