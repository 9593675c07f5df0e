//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: Request orchestrator: network policy, sessions, permissions, dispatch and enrichment
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "mcplease/JSONRPCTypes.h"
#include "mcplease/Protocol.h"
#include "mcplease/RequestDispatcher.h"
#include "mcplease/Transport.h"
#include "mcplease/auth/CredentialScheme.h"
#include "mcplease/context/ContextStore.h"
#include "mcplease/errors/ErrorController.h"
#include "mcplease/security/NetworkPolicy.h"
#include "mcplease/security/NetworkPolicyEnforcer.h"
#include "mcplease/security/SessionManager.h"
#include "mcplease/tools/ToolRegistry.h"

namespace mcplease {

//==========================================================================================================
// ServerOptions
// Purpose: Everything the orchestrator needs to build its components.
// Fields:
//   policy/network: Network policy and enforcer options.
//   session/schemes: Session manager options and the ordered credential schemes.
//   errors: Error controller options.
//   dispatcher: Server info, timeouts and admission limits.
//   contextStore: Conversation store; an InMemoryContextStore is created when null.
//   maintenanceInterval: Period of the context cleanup task.
//   healthInterval: Period of the health snapshot task.
//   drainTimeout: How long Stop() waits for in-flight requests.
//==========================================================================================================
struct ServerOptions {
    security::NetworkPolicy policy{security::NetworkPolicy::DefaultPolicy()};
    security::NetworkPolicyEnforcer::Options network;
    security::SessionManager::Options session;
    std::vector<std::shared_ptr<auth::ICredentialScheme>> schemes;
    errors::ErrorController::Options errors;
    RequestDispatcher::Options dispatcher;
    std::shared_ptr<context::IContextStore> contextStore;
    std::chrono::milliseconds maintenanceInterval{std::chrono::seconds(300)};
    std::chrono::milliseconds healthInterval{std::chrono::seconds(60)};
    std::chrono::milliseconds drainTimeout{std::chrono::seconds(10)};
};

//==========================================================================================================
// Server
// Purpose: Owns the request-processing components and runs every request through the pipeline
//          access -> rate limit -> session -> permission -> dispatch -> enrichment.
// Notes:
//   - HandleRequest is safe to call from any number of transport threads.
//   - HandleRequest never throws; every failure becomes a JSON-RPC error response.
//==========================================================================================================
class Server {
public:
    explicit Server(ServerOptions options = {});
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    //==========================================================================================================
    // HandleRequest
    // Purpose: Process one decoded request arriving from `endpoint`.
    // Args:
    //   request: Decoded JSON-RPC request.
    //   endpoint: Peer address, local port, scheme and transport headers.
    // Returns:
    //   Response carrying exactly one of result/error.
    //==========================================================================================================
    std::unique_ptr<JSONRPCResponse> HandleRequest(const JSONRPCRequest& request, const ClientEndpoint& endpoint);

    // Wires an acceptor to HandleRequest and to the connection limiter. Started by Start().
    void AddAcceptor(std::unique_ptr<ITransportAcceptor> acceptor);

    //==========================================================================================================
    // Start
    // Purpose: Start background sweeps and every registered acceptor.
    //==========================================================================================================
    void Start();

    //==========================================================================================================
    // Stop
    // Purpose: Stop accepting, drain in-flight requests (bounded by drainTimeout), stop acceptors and
    //          sweeps, then release session and network state.
    // Notes:
    //   Idempotent.
    //==========================================================================================================
    void Stop();

    bool IsRunning() const;
    bool IsAccepting() const;

    JSONValue GetStatus() const;
    // {status: healthy|degraded|stopped, degradation_level, components: {...}}
    JSONValue HealthCheck() const;

    // Most recent HealthCheck() taken by the periodic snapshot task; null before the first run.
    JSONValue LastHealthSnapshot() const;
    std::size_t HealthSnapshotCount() const;

    /////////////////////////////////////////// Components ///////////////////////////////////////////
    tools::ToolRegistry& Tools();
    security::NetworkPolicyEnforcer& Network();
    security::SessionManager& Sessions();
    errors::ErrorController& Errors();
    context::IContextStore& Context();
    RequestDispatcher& Dispatcher();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcplease
