//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcplease/HTTPServer.cpp
// Purpose: HTTP/HTTPS JSON-RPC acceptor using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <optional>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "logging/Logger.h"
#include "mcplease/HTTPServer.hpp"
#include "mcplease/JSONRPCTypes.h"
#include "mcplease/errors/Errors.h"

#include <openssl/ssl.h>

namespace mcplease {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

constexpr std::size_t kIoThreads = 4;

http::response<http::string_body> jsonResponse(http::status status, unsigned version, std::string body) {
    http::response<http::string_body> res{status, version};
    res.set(http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

} // namespace

class HTTPServer::Impl {
public:
    HTTPServer::Options opts;
    std::atomic<bool> running{false};

    net::io_context ioc;
    // Runs the request handler, which may block on tool execution, away from the I/O threads
    net::thread_pool workers;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::vector<std::thread> ioThreads;
    std::atomic<std::uint16_t> boundPort{0};

    ITransportAcceptor::RequestHandler requestHandler;
    ITransportAcceptor::ErrorHandler errorHandler;
    ITransportAcceptor::ConnectHandler connectHandler;
    ITransportAcceptor::DisconnectHandler disconnectHandler;

    explicit Impl(const HTTPServer::Options& o) : opts(o), workers(std::max<std::size_t>(o.workerThreads, 1)) {
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("HTTPServer: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        }
    }

    ~Impl() {
        ioc.stop();
        for (auto& t : ioThreads) {
            if (t.joinable()) t.join();
        }
        workers.stop();
        workers.join();
    }

    void setError(const std::string& msg) {
        if (errorHandler) { errorHandler(msg); }
    }

    // Releases the connection slot taken by connectHandler.
    class ConnectionGuard {
    public:
        ConnectionGuard(Impl& impl, std::string address) : impl(impl), address(std::move(address)) {
            admitted = !impl.connectHandler || impl.connectHandler(this->address);
        }
        ~ConnectionGuard() {
            if (admitted && impl.connectHandler && impl.disconnectHandler) {
                impl.disconnectHandler(address);
            }
        }
        ConnectionGuard(const ConnectionGuard&) = delete;
        ConnectionGuard& operator=(const ConnectionGuard&) = delete;
        bool Admitted() const { return admitted; }

    private:
        Impl& impl;
        std::string address;
        bool admitted{false};
    };

    ClientEndpoint endpointFor(const tcp::socket& socket) const {
        ClientEndpoint ep;
        boost::system::error_code ec;
        auto remote = socket.remote_endpoint(ec);
        ep.address = ec ? std::string{} : remote.address().to_string();
        ep.port = boundPort.load();
        ep.scheme = opts.scheme;
        return ep;
    }

    void logSessionError(const char* what, const std::exception& e) {
        if (!running.load()) {
            // Suppress shutdown-related errors; log at DEBUG only in debug builds
#ifdef _DEBUG
            LOG_DEBUG("HTTPServer {} session suppressed during shutdown: {}", what, e.what());
#endif
        } else {
            setError(std::string("HTTPServer ") + what + " session error: " + e.what());
        }
    }

    template <class Stream>
    net::awaitable<void> serveOne(Stream& stream, ClientEndpoint endpoint) {
        ConnectionGuard guard(*this, endpoint.address);
        boost::beast::flat_buffer buffer;
        http::request_parser<http::string_body> parser;
        parser.body_limit(opts.maxBodyBytes);
        co_await http::async_read(stream, buffer, parser, net::use_awaitable);
        http::request<http::string_body> req = parser.release();

        http::response<http::string_body> res;
        if (!guard.Admitted()) {
            res = jsonResponse(http::status::too_many_requests, req.version(),
                               "{\"error\":\"Connection limit exceeded\"}");
        } else {
            endpoint.userAgent = std::string(req[http::field::user_agent]);
            endpoint.authorization = std::string(req[http::field::authorization]);
            JSONRPCRequest rpc;
            if (auto early = screen(req, rpc)) {
                res = std::move(*early);
            } else {
                std::string body = co_await net::co_spawn(
                    workers,
                    [this, rpc = std::move(rpc), endpoint]() -> net::awaitable<std::string> {
                        co_return invoke(rpc, endpoint);
                    },
                    net::use_awaitable);
                res = jsonResponse(http::status::ok, req.version(), std::move(body));
            }
        }
        co_await http::async_write(stream, res, net::use_awaitable);
    }

    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            const ClientEndpoint endpoint = endpointFor(socket);
            boost::beast::tcp_stream stream(std::move(socket));
            co_await serveOne(stream, endpoint);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            logSessionError("plain", e);
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            const ClientEndpoint endpoint = endpointFor(socket);
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serveOne(tls, endpoint);
            boost::system::error_code ec;
            tls.shutdown(ec);
        } catch (const std::exception& e) {
            logSessionError("TLS", e);
        }
        co_return;
    }

    // Answers what the acceptor can settle itself (path, verb, undecodable bodies). nullopt leaves a
    // decoded request in `rpc` for the request handler.
    std::optional<http::response<http::string_body>> screen(const http::request<http::string_body>& req,
                                                            JSONRPCRequest& rpc) {
        const std::string target = std::string(req.target());
        if (target != opts.rpcPath) {
            return jsonResponse(http::status::not_found, req.version(), "{\"error\":\"Not found\"}");
        }
        if (req.method() != http::verb::post) {
            return jsonResponse(http::status::bad_request, req.version(), "{\"error\":\"POST required\"}");
        }

        switch (rpc.Decode(req.body())) {
            case DecodeStatus::ParseError: {
                auto err = CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error");
                return jsonResponse(http::status::ok, req.version(), err->Serialize());
            }
            case DecodeStatus::InvalidRequest: {
                auto err = CreateErrorResponse(rpc.id, JSONRPCErrorCodes::InvalidRequest, "Invalid Request");
                return jsonResponse(http::status::ok, req.version(), err->Serialize());
            }
            case DecodeStatus::Ok:
                break;
        }
        return std::nullopt;
    }

    // Runs on a worker thread; returns the serialized JSON-RPC response.
    std::string invoke(const JSONRPCRequest& rpc, const ClientEndpoint& endpoint) {
        std::unique_ptr<JSONRPCResponse> out;
        try {
            out = requestHandler ? requestHandler(rpc, endpoint) : nullptr;
        } catch (const std::exception& e) {
            setError(std::string("Request handler error: ") + e.what());
            out = CreateErrorResponse(rpc.id, JSONRPCErrorCodes::InternalError, "Internal error");
        }
        if (!out) {
            out = CreateErrorResponse(rpc.id, JSONRPCErrorCodes::InternalError, "No response from handler");
        }
        return out->Serialize();
    }

    // Validates the port strictly and binds the listener on the calling thread.
    void bind() {
        if (opts.port.empty() ||
            !std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
            throw errors::ConfigurationError("HTTPServer invalid port: '" + opts.port + "'");
        }
        if (opts.port.size() > 5 || std::stoul(opts.port) > 65535ul) {
            throw errors::ConfigurationError("HTTPServer invalid port (out of range): " + opts.port);
        }
        tcp::resolver resolver(ioc);
        auto r = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *r.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort.store(acceptor->local_endpoint().port());
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (opts.scheme == "https") {
                    net::co_spawn(ioc, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            if (!running.load()) {
                // operation_aborted when the acceptor is closed
#ifdef _DEBUG
                LOG_DEBUG("HTTPServer accept suppressed during shutdown: {}", e.what());
#endif
            } else {
                setError(std::string("HTTPServer accept error: ") + e.what());
            }
        }
        co_return;
    }
};

HTTPServer::HTTPServer(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

HTTPServer::~HTTPServer() {
    Stop().get();
}

std::future<void> HTTPServer::Start() {
    std::promise<void> ready;
    auto fut = ready.get_future();
    if (pImpl->running.load()) {
        ready.set_value();
        return fut;
    }
    try {
        pImpl->bind();
    } catch (const std::exception& e) {
        LOG_ERROR("HTTPServer failed to listen on {}:{}: {}", pImpl->opts.address, pImpl->opts.port, e.what());
        pImpl->setError(e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running.store(true);
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    for (std::size_t i = 0; i < kIoThreads; ++i) {
        pImpl->ioThreads.emplace_back([this]() {
            try {
                pImpl->ioc.run();
            } catch (const std::exception& e) {
                pImpl->setError(e.what());
            }
        });
    }
    LOG_INFO("HTTPServer listening on {}://{}:{}{}", pImpl->opts.scheme, pImpl->opts.address,
             pImpl->boundPort.load(), pImpl->opts.rpcPath);
    ready.set_value();
    return fut;
}

std::future<void> HTTPServer::Stop() {
    std::promise<void> done;
    auto fut = done.get_future();
    pImpl->running.store(false);
    if (pImpl->acceptor) {
        boost::system::error_code ec;
        pImpl->acceptor->close(ec);
    }
    pImpl->ioc.stop();
    for (auto& t : pImpl->ioThreads) {
        if (t.joinable()) t.join();
    }
    pImpl->ioThreads.clear();
    pImpl->workers.stop();
    pImpl->workers.join();
    done.set_value();
    return fut;
}

void HTTPServer::SetRequestHandler(RequestHandler handler) {
    pImpl->requestHandler = std::move(handler);
}

void HTTPServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

void HTTPServer::SetConnectionHandlers(ConnectHandler onConnect, DisconnectHandler onDisconnect) {
    pImpl->connectHandler = std::move(onConnect);
    pImpl->disconnectHandler = std::move(onDisconnect);
}

std::uint16_t HTTPServer::BoundPort() const {
    return pImpl->boundPort.load();
}

std::unique_ptr<ITransportAcceptor> HTTPServerFactory::CreateTransportAcceptor(const std::string& config) {
    HTTPServer::Options opts;
    opts.scheme = "http";

    std::string cfg = config;
    auto trim = [](std::string& s) {
        auto notSpace = [](unsigned char c) { return !std::isspace(c); };
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
        s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    };
    trim(cfg);

    auto startsWith = [](const std::string& s, const char* pfx) { return s.rfind(pfx, 0) == 0; };
    if (startsWith(cfg, "http://")) {
        cfg = cfg.substr(7);
    } else if (startsWith(cfg, "https://")) {
        opts.scheme = "https";
        cfg = cfg.substr(8);
    }

    std::string hostPortPath = cfg;
    std::string query;
    auto qpos = cfg.find('?');
    if (qpos != std::string::npos) {
        hostPortPath = cfg.substr(0, qpos);
        query = cfg.substr(qpos + 1);
    }

    // Optional path overrides rpcPath
    std::string hostPort = hostPortPath;
    auto slash = hostPortPath.find('/');
    if (slash != std::string::npos) {
        hostPort = hostPortPath.substr(0, slash);
        const std::string path = hostPortPath.substr(slash);
        if (path.size() > 1) {
            opts.rpcPath = path;
        }
    }
    trim(hostPort);

    // host[:port], IPv6 in [addr]:port form
    if (!hostPort.empty()) {
        if (hostPort.front() == '[') {
            auto rb = hostPort.find(']');
            if (rb == std::string::npos) {
                throw errors::ConfigurationError("Malformed listen address: " + config);
            }
            opts.address = hostPort.substr(1, rb - 1);
            if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
                opts.port = hostPort.substr(rb + 2);
            }
        } else {
            auto colon = hostPort.rfind(':');
            if (colon != std::string::npos) {
                opts.address = hostPort.substr(0, colon);
                opts.port = hostPort.substr(colon + 1);
            } else {
                opts.address = hostPort;
            }
        }
        trim(opts.address);
        trim(opts.port);
        if (opts.port.empty()) opts.port = "8000";
    }

    if (!query.empty()) {
        std::stringstream ss(query);
        std::string kv;
        while (std::getline(ss, kv, '&')) {
            auto eq = kv.find('=');
            std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
            std::string val = (eq == std::string::npos) ? std::string() : kv.substr(eq + 1);
            if (key == "cert") opts.certFile = val;
            else if (key == "key") opts.keyFile = val;
        }
    }

    return std::make_unique<HTTPServer>(opts);
}

} // namespace mcplease
