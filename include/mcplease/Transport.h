//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Server-side transport seam: acceptors deliver decoded requests plus the caller's endpoint
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>

namespace mcplease {

// Forward declarations
class JSONRPCRequest;
class JSONRPCResponse;

//==========================================================================================================
// ClientEndpoint
// Purpose: What the transport knows about the peer of one request.
// Fields:
//   address: Peer IP address in text form.
//   port: Local port the request arrived on.
//   scheme: "http", "https", "ws", "wss", "stdio", ...
//   userAgent/authorization: Header values when the transport has them (may be empty).
//==========================================================================================================
struct ClientEndpoint {
    std::string address{"127.0.0.1"};
    std::uint16_t port{0};
    std::string scheme{"stdio"};
    std::string userAgent;
    std::string authorization;
};

//==========================================================================================================
// ITransportAcceptor
// Purpose: Server-side acceptor interface which owns the listen lifecycle and dispatches incoming
//          JSON-RPC requests to the registered handler.
// Notes:
//   - Implementations should bind/listen in Start(), stop/teardown in Stop(), and invoke the
//     registered handler for each incoming request.
//   - The handler must always return a response; transports do not synthesize results.
//==========================================================================================================
class ITransportAcceptor {
public:
    using RequestHandler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&, const ClientEndpoint&)>;
    using ErrorHandler = std::function<void(const std::string& error)>;
    // Connection admission hooks. Connect returns false to refuse the peer.
    using ConnectHandler = std::function<bool(const std::string& address)>;
    using DisconnectHandler = std::function<void(const std::string& address)>;

    virtual ~ITransportAcceptor() = default;

    //==========================================================================================================
    // Starts the acceptor (binds/listens/spawns accept loop as needed).
    // Returns:
    //   Future that completes when the accept loop is running.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Stops the acceptor and releases resources (closes listener and active sessions gracefully).
    // Returns:
    //   Future that completes when the acceptor has stopped.
    //==========================================================================================================
    virtual std::future<void> Stop() = 0;

    virtual void SetRequestHandler(RequestHandler handler) = 0;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;

    // Transports without a notion of connections ignore these.
    virtual void SetConnectionHandlers(ConnectHandler onConnect, DisconnectHandler onDisconnect) {
        (void)onConnect;
        (void)onDisconnect;
    }
};

//==========================================================================================================
// ITransportAcceptorFactory
// Purpose: Factory for creating acceptors from a URI-like configuration string.
//==========================================================================================================
class ITransportAcceptorFactory {
public:
    virtual ~ITransportAcceptorFactory() = default;
    virtual std::unique_ptr<ITransportAcceptor> CreateTransportAcceptor(const std::string& config) = 0;
};

} // namespace mcplease
