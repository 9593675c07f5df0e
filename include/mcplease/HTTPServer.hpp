//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS JSON-RPC acceptor using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "mcplease/JSONRPCTypes.h"
#include "mcplease/Transport.h"

namespace mcplease {

class HTTPServer : public ITransportAcceptor {
public:
    //==========================================================================================================
    // Options
    // Purpose: Configuration for bind address/port, the JSON-RPC path, and TLS files.
    // Fields:
    //   address: Bind address (default: 0.0.0.0)
    //   port: Listen port (default: 8000; "0" picks a free port, see BoundPort())
    //   rpcPath: JSON-RPC request path
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //   maxBodyBytes: Request bodies above this size are refused by the parser
    //   workerThreads: Threads running the request handler; bounds how many requests can be inside the
    //                  pipeline (including those queued for a tool slot) at once
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        std::string port{"8000"};
        std::string rpcPath{"/mcp/rpc"};
        std::string scheme{"http"};
        std::string certFile;
        std::string keyFile;
        std::size_t maxBodyBytes{1024 * 1024};
        std::size_t workerThreads{32};
    };

    explicit HTTPServer(const Options& opts);
    ~HTTPServer();

    //==========================================================================================================
    // Binds the listener and starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the listener is bound; holds the exception when binding fails.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops the server: closes acceptor, stops I/O context, and joins background thread.
    // Returns:
    //   Future that completes when shutdown has finished.
    //==========================================================================================================
    std::future<void> Stop() override;

    void SetRequestHandler(RequestHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    //==========================================================================================================
    // SetConnectionHandlers
    // Purpose: Admission hooks run per accepted socket.
    // Notes:
    //   - When onConnect returns false the peer receives 429 and the socket is closed.
    //   - onDisconnect runs once for every admitted socket.
    //==========================================================================================================
    void SetConnectionHandlers(ConnectHandler onConnect, DisconnectHandler onDisconnect) override;

    // Port the listener is bound to; 0 before Start().
    std::uint16_t BoundPort() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// HTTPServerFactory
// Purpose: Factory for creating HTTP/HTTPS acceptors from a configuration string:
//            - "http://<address>:<port>[/<rpcPath>]" (e.g., http://127.0.0.1:8000)
//            - "https://<address>:<port>?cert=<pem>&key=<pem>"
//          Unknown parameters are ignored. If scheme is omitted, defaults to http.
//==========================================================================================================
class HTTPServerFactory : public ITransportAcceptorFactory {
public:
    std::unique_ptr<ITransportAcceptor> CreateTransportAcceptor(const std::string& config) override;
};

} // namespace mcplease
