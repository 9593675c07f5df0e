//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: Request orchestrator implementation
//==========================================================================================================
#include "mcplease/Server.h"

#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <format>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "logging/Logger.h"
#include "mcplease/async/PeriodicTask.h"
#include "mcplease/errors/Errors.h"

namespace mcplease {

namespace {

constexpr std::size_t kSummaryLength = 200;

bool startsWithBearer(const std::string& s) {
    const std::string pfx = "Bearer ";
    if (s.size() < pfx.size()) {
        return false;
    }
    for (size_t i = 0; i < pfx.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != std::tolower(static_cast<unsigned char>(pfx[i]))) {
            return false;
        }
    }
    return true;
}

std::optional<std::string> bearerToken(const std::string& header) {
    if (!startsWithBearer(header)) {
        return std::nullopt;
    }
    std::string token = header.substr(7);
    const auto first = token.find_first_not_of(' ');
    if (first == std::string::npos) {
        return std::nullopt;
    }
    return token.substr(first);
}

// Credentials in order of precedence: params.credentials, params.authorization, params.token,
// then the transport's Authorization header.
std::optional<auth::Credentials> extractCredentials(const JSONValue& params, const ClientEndpoint& endpoint) {
    if (const JSONValue* creds = FindMember(params, "credentials")) {
        if (auto obj = std::get_if<JSONValue::Object>(&creds->value)) {
            auth::Credentials out;
            for (const auto& [k, v] : *obj) {
                if (!v) continue;
                if (auto s = std::get_if<std::string>(&v->value)) {
                    if (k == "token") {
                        out.token = *s;
                    } else {
                        out.attributes[k] = *s;
                    }
                }
            }
            return out;
        }
    }
    if (auto header = GetStringMember(params, "authorization")) {
        if (auto token = bearerToken(*header)) {
            return auth::Credentials{token, {}};
        }
    }
    if (auto token = GetStringMember(params, "token")) {
        return auth::Credentials{token, {}};
    }
    if (auto token = bearerToken(endpoint.authorization)) {
        return auth::Credentials{token, {}};
    }
    return std::nullopt;
}

std::optional<std::string> explicitSessionId(const JSONValue& params) {
    if (auto sid = GetStringMember(params, "session_id")) {
        return sid;
    }
    if (const JSONValue* info = FindMember(params, "clientInfo")) {
        return GetStringMember(*info, "session_id");
    }
    return std::nullopt;
}

security::ClientInfo clientInfoFor(const JSONValue& params, const ClientEndpoint& endpoint) {
    security::ClientInfo info;
    info.address = endpoint.address;
    info.userAgent = endpoint.userAgent;
    if (const JSONValue* ci = FindMember(params, "clientInfo")) {
        if (auto obj = std::get_if<JSONValue::Object>(&ci->value)) {
            for (const auto& [k, v] : *obj) {
                if (!v || k == "session_id") continue;
                if (auto s = std::get_if<std::string>(&v->value)) {
                    info.attributes[k] = *s;
                }
            }
        }
    }
    info.attributes["scheme"] = endpoint.scheme;
    return info;
}

JSONValue denialData(const std::string& reason, const std::string& address) {
    JSONValue data{JSONValue::Object{}};
    SetMember(data, "error", JSONValue(reason));
    SetMember(data, "client_ip", JSONValue(address));
    return data;
}

// First text item of a tools/call result, clipped for the conversation log.
std::string summarizeResult(const JSONValue& result) {
    if (const JSONValue* content = FindMember(result, "content")) {
        if (auto items = std::get_if<JSONValue::Array>(&content->value)) {
            for (const auto& item : *items) {
                if (!item) continue;
                if (GetStringMember(*item, "type").value_or("") != "text") continue;
                if (auto text = GetStringMember(*item, "text")) {
                    if (text->size() > kSummaryLength) {
                        return context::TruncateUtf8(*text, kSummaryLength) + "...";
                    }
                    return *text;
                }
            }
        }
    }
    return "Tool executed successfully";
}

JSONValue count(std::size_t n) {
    return JSONValue(static_cast<int64_t>(n));
}

} // namespace

/////////////////////////////////////////// Server::Impl ///////////////////////////////////////////
class Server::Impl {
public:
    explicit Impl(ServerOptions opts)
        : options(std::move(opts)),
          network(options.policy, options.network),
          sessions(options.session, options.schemes),
          errorController(options.errors),
          dispatcher(registry, errorController, options.dispatcher),
          contextStore(options.contextStore ? options.contextStore
                                            : std::make_shared<context::InMemoryContextStore>()),
          createdAt(std::chrono::steady_clock::now()) {
        maintenance = std::make_unique<PeriodicTask>("context-maintenance", options.maintenanceInterval, [this]() {
            const std::size_t removed = contextStore->CleanupExpired();
            if (removed > 0) {
                LOG_DEBUG("Removed {} expired conversation contexts", removed);
            }
        });
        healthMonitor = std::make_unique<PeriodicTask>("health-snapshot", options.healthInterval,
                                                       [this]() { snapshotHealth(); });
    }

    // Counts a request as in flight for the drain in Stop().
    class InFlight {
    public:
        explicit InFlight(Impl& impl) : impl(impl) {
            std::lock_guard<std::mutex> lock(impl.drainMutex);
            ++impl.inFlight;
        }
        ~InFlight() {
            std::lock_guard<std::mutex> lock(impl.drainMutex);
            if (--impl.inFlight == 0) {
                impl.drainCv.notify_all();
            }
        }
        InFlight(const InFlight&) = delete;
        InFlight& operator=(const InFlight&) = delete;

    private:
        Impl& impl;
    };

    std::unique_ptr<JSONRPCResponse> handle(const JSONRPCRequest& request, const ClientEndpoint& endpoint);
    std::unique_ptr<JSONRPCResponse> pipeline(const JSONRPCRequest& request, const ClientEndpoint& endpoint,
                                              std::optional<security::SecuritySession>& session);
    void appendContext(const security::SecuritySession& session, const std::string& role,
                       const std::string& content, std::unordered_map<std::string, std::string> metadata);
    void enrich(JSONRPCResponse& response, const JSONRPCRequest& request, const security::SecuritySession& session);
    void releaseState();
    JSONValue healthCheck();
    void snapshotHealth();

    ServerOptions options;
    tools::ToolRegistry registry;
    security::NetworkPolicyEnforcer network;
    security::SessionManager sessions;
    errors::ErrorController errorController;
    RequestDispatcher dispatcher;
    std::shared_ptr<context::IContextStore> contextStore;
    std::unique_ptr<PeriodicTask> maintenance;
    std::unique_ptr<PeriodicTask> healthMonitor;
    std::vector<std::unique_ptr<ITransportAcceptor>> acceptors;
    std::mutex acceptorMutex;

    std::atomic<bool> accepting{true};
    std::atomic<bool> running{false};
    std::atomic<bool> stopped{false};
    std::mutex lifecycleMutex;

    std::mutex drainMutex;
    std::condition_variable drainCv;
    std::size_t inFlight{0};

    mutable std::mutex healthMutex;
    JSONValue lastHealth;
    std::size_t healthSnapshots{0};

    std::atomic<std::uint64_t> requestsTotal{0};
    std::atomic<std::uint64_t> requestsRejected{0};
    std::atomic<std::uint64_t> requestsFailed{0};
    std::chrono::steady_clock::time_point createdAt;
};

std::unique_ptr<JSONRPCResponse> Server::Impl::handle(const JSONRPCRequest& request, const ClientEndpoint& endpoint) {
    FUNC_SCOPE();
    InFlight guard(*this);
    ++requestsTotal;
    if (!accepting.load()) {
        ++requestsRejected;
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, "Server is shutting down");
    }

    std::optional<security::SecuritySession> session;
    try {
        return pipeline(request, endpoint, session);
    } catch (const std::exception& e) {
        ++requestsFailed;
        errors::HandleRequest req;
        req.attributes["method"] = request.method;
        req.attributes["client_ip"] = endpoint.address;
        req.requestId = IdToString(request.id);
        if (session.has_value()) {
            req.sessionId = session->sessionId;
            req.userId = session->UserId();
        }
        req.attemptRecovery = false;
        const errors::ErrorContext ctx = errorController.Handle(e, req);

        JSONValue data{JSONValue::Object{}};
        SetMember(data, "error_code", JSONValue(ctx.code));
        SetMember(data, "category", JSONValue(errors::ToString(ctx.category)));
        SetMember(data, "severity", JSONValue(errors::ToString(ctx.severity)));
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, "Internal error", data);
    }
}

std::unique_ptr<JSONRPCResponse> Server::Impl::pipeline(const JSONRPCRequest& request, const ClientEndpoint& endpoint,
                                                        std::optional<security::SecuritySession>& session) {
    const JSONValue params = request.params.value_or(JSONValue{JSONValue::Object{}});

    /////////////////////////////////////////// Network policy ///////////////////////////////////////////
    const security::AccessDecision access = network.ValidateAccess(endpoint.address, endpoint.port, endpoint.scheme);
    if (!access) {
        ++requestsRejected;
        LOG_WARN("Network access denied for {}: {}", endpoint.address, access.reason);
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::NetworkAccessDenied, "Network access denied",
                                   denialData(access.reason, endpoint.address));
    }
    const security::AccessDecision rate = network.CheckRateLimit(endpoint.address);
    if (!rate) {
        ++requestsRejected;
        LOG_WARN("{}", rate.reason);
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::RateLimitExceeded, "Rate limit exceeded",
                                   denialData(rate.reason, endpoint.address));
    }

    /////////////////////////////////////////// Session ///////////////////////////////////////////
    if (auto sid = explicitSessionId(params)) {
        session = sessions.Validate(*sid);
        if (!session.has_value()) {
            LOG_DEBUG("Session {} unknown or expired; re-authenticating", *sid);
        }
    }
    if (!session.has_value()) {
        session = sessions.Authenticate(extractCredentials(params, endpoint), clientInfoFor(params, endpoint));
    }
    if (!session.has_value()) {
        ++requestsRejected;
        JSONValue data{JSONValue::Object{}};
        SetMember(data, "error", JSONValue("Invalid or missing credentials"));
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::AuthenticationRequired, "Authentication required",
                                   data);
    }

    if (!network.TouchClientSession(session->sessionId)) {
        network.CreateClientSession(session->UserId(), session->sessionId, endpoint.address, endpoint.userAgent,
                                    session->permissions);
    }

    const std::string permission = RequiredPermission(request.method);
    if (!sessions.CheckPermission(session->sessionId, permission)) {
        ++requestsRejected;
        LOG_WARN("Session {} lacks '{}' for {}", session->sessionId, permission, request.method);
        JSONValue data{JSONValue::Object{}};
        SetMember(data, "error", JSONValue(std::format("Insufficient permissions for {}", request.method)));
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::PermissionDenied, "Permission denied", data);
    }

    /////////////////////////////////////////// Dispatch ///////////////////////////////////////////
    const bool isToolCall = MethodFromString(request.method) == Method::CallTool;
    const std::string toolName = GetStringMember(params, "name").value_or("");
    if (isToolCall) {
        appendContext(*session, "user", std::format("Called tool: {}", toolName),
                      {{"tool", toolName}, {"method", request.method}});
    }

    DispatchContext dctx;
    dctx.sessionId = session->sessionId;
    dctx.userId = session->UserId();
    dctx.requestId = IdToString(request.id);
    auto response = dispatcher.Dispatch(request, dctx);

    enrich(*response, request, *session);
    return response;
}

void Server::Impl::appendContext(const security::SecuritySession& session, const std::string& role,
                                 const std::string& content, std::unordered_map<std::string, std::string> metadata) {
    try {
        const errors::DegradationConfig degradation = errorController.GetDegradationConfig();
        contextStore->SetMaxContentSize(degradation.enabled ? degradation.maxContextSize : 0);

        context::ConversationEntry entry;
        entry.role = role;
        entry.content = content;
        entry.timestamp = std::chrono::system_clock::now();
        entry.metadata = std::move(metadata);
        const std::string uid = session.UserId();
        if (!contextStore->AppendEntry(session.sessionId, uid.empty() ? std::nullopt : std::optional<std::string>(uid),
                                       std::move(entry))) {
            LOG_DEBUG("Context entry for session {} was not stored", session.sessionId);
        }
    } catch (const std::exception& e) {
        LOG_WARN("Context update failed for session {}: {}", session.sessionId, e.what());
    }
}

void Server::Impl::enrich(JSONRPCResponse& response, const JSONRPCRequest& request,
                          const security::SecuritySession& session) {
    if (response.IsError()) {
        return;
    }
    if (!response.result.has_value() || !response.result->IsObject()) {
        response.result = JSONValue{JSONValue::Object{}};
    }
    JSONValue meta{JSONValue::Object{}};
    if (const JSONValue* existing = FindMember(*response.result, "meta")) {
        if (existing->IsObject()) {
            meta = *existing;
        }
    }
    SetMember(meta, "session_id", JSONValue(session.sessionId));
    SetMember(*response.result, "meta", std::move(meta));

    if (MethodFromString(request.method) == Method::CallTool) {
        const std::string toolName =
            request.params.has_value() ? GetStringMember(*request.params, "name").value_or("") : std::string{};
        appendContext(session, "assistant", summarizeResult(*response.result),
                      {{"tool", toolName}, {"method", request.method}});
    }
}

void Server::Impl::releaseState() {
    for (const auto& s : sessions.ListSessions()) {
        sessions.Revoke(s.sessionId);
        network.RevokeClientSession(s.sessionId);
        contextStore->DeleteContext(s.sessionId);
    }
}

JSONValue Server::Impl::healthCheck() {
    const int level = errorController.DegradationLevel();
    std::string overall = "healthy";
    if (stopped.load()) {
        overall = "stopped";
    } else if (level > 0) {
        overall = "degraded";
    }

    const AdmissionQueue::Stats q = dispatcher.AdmissionStats();
    JSONValue admission{JSONValue::Object{}};
    SetMember(admission, "capacity", count(q.capacity));
    SetMember(admission, "in_flight", count(q.inFlight));
    SetMember(admission, "waiting", count(q.waiting));
    SetMember(admission, "rejected", count(q.rejected));
    SetMember(admission, "timed_out", count(q.timedOut));

    JSONValue components{JSONValue::Object{}};
    SetMember(components, "network", network.GetSecurityStats());
    SetMember(components, "sessions", sessions.GetSessionStats());
    SetMember(components, "errors", errorController.GetStatistics().ToJSON());
    SetMember(components, "context", contextStore->GetStats());
    SetMember(components, "admission", std::move(admission));

    JSONValue health{JSONValue::Object{}};
    SetMember(health, "status", JSONValue(overall));
    SetMember(health, "degradation_level", JSONValue(static_cast<int64_t>(level)));
    SetMember(health, "components", std::move(components));
    return health;
}

// Keeps the latest health report and logs transitions in status or degradation level.
void Server::Impl::snapshotHealth() {
    JSONValue health = healthCheck();
    const std::string status = GetStringMember(health, "status").value_or("");
    const int64_t level = GetIntMember(health, "degradation_level").value_or(0);

    std::lock_guard<std::mutex> lock(healthMutex);
    if (healthSnapshots == 0) {
        LOG_DEBUG("Health snapshot: {} (degradation level {})", status, level);
    } else {
        const std::string previous = GetStringMember(lastHealth, "status").value_or("");
        const int64_t previousLevel = GetIntMember(lastHealth, "degradation_level").value_or(0);
        if (status != previous || level != previousLevel) {
            LOG_WARN("Health changed from {} (level {}) to {} (level {})", previous, previousLevel, status, level);
        }
    }
    lastHealth = std::move(health);
    ++healthSnapshots;
}

/////////////////////////////////////////// Server ///////////////////////////////////////////
Server::Server(ServerOptions options) : pImpl(std::make_unique<Impl>(std::move(options))) {
    FUNC_SCOPE();
}

Server::~Server() {
    FUNC_SCOPE();
    Stop();
}

std::unique_ptr<JSONRPCResponse> Server::HandleRequest(const JSONRPCRequest& request, const ClientEndpoint& endpoint) {
    return pImpl->handle(request, endpoint);
}

void Server::AddAcceptor(std::unique_ptr<ITransportAcceptor> acceptor) {
    FUNC_SCOPE();
    if (!acceptor) {
        return;
    }
    Impl* impl = pImpl.get();
    acceptor->SetRequestHandler([impl](const JSONRPCRequest& req, const ClientEndpoint& endpoint) {
        return impl->handle(req, endpoint);
    });
    acceptor->SetErrorHandler([](const std::string& err) {
        LOG_ERROR("Transport error: {}", err);
    });
    acceptor->SetConnectionHandlers(
        [impl](const std::string& address) {
            const security::AccessDecision d = impl->network.CheckConnectionLimit(address);
            if (!d) {
                LOG_WARN("{}", d.reason);
                return false;
            }
            impl->network.RegisterConnection(address);
            return true;
        },
        [impl](const std::string& address) { impl->network.UnregisterConnection(address); });

    std::lock_guard<std::mutex> lock(pImpl->acceptorMutex);
    pImpl->acceptors.push_back(std::move(acceptor));
}

void Server::Start() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> life(pImpl->lifecycleMutex);
    if (pImpl->running.load() || pImpl->stopped.load()) {
        return;
    }
    pImpl->network.Start();
    pImpl->sessions.Start();
    pImpl->maintenance->Start();
    pImpl->healthMonitor->Start();
    {
        std::lock_guard<std::mutex> lock(pImpl->acceptorMutex);
        for (auto& acceptor : pImpl->acceptors) {
            acceptor->Start().get();
        }
    }
    pImpl->accepting.store(true);
    pImpl->running.store(true);
    LOG_INFO("Server started ({} tools, {} acceptors)", pImpl->registry.Size(), pImpl->acceptors.size());
}

void Server::Stop() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> life(pImpl->lifecycleMutex);
    if (pImpl->stopped.exchange(true)) {
        return;
    }
    pImpl->accepting.store(false);

    {
        std::unique_lock<std::mutex> lock(pImpl->drainMutex);
        const bool drained = pImpl->drainCv.wait_for(lock, pImpl->options.drainTimeout,
                                                     [this]() { return pImpl->inFlight == 0; });
        if (!drained) {
            LOG_WARN("Shutdown drain timed out with {} requests in flight", pImpl->inFlight);
        }
    }

    {
        std::lock_guard<std::mutex> lock(pImpl->acceptorMutex);
        for (auto& acceptor : pImpl->acceptors) {
            try {
                acceptor->Stop().get();
            } catch (const std::exception& e) {
                LOG_ERROR("Acceptor stop failed: {}", e.what());
            }
        }
    }

    pImpl->dispatcher.Close();
    pImpl->errorController.Shutdown();
    pImpl->healthMonitor->Stop();
    pImpl->maintenance->Stop();
    pImpl->sessions.Stop();
    pImpl->network.Stop();
    pImpl->releaseState();
    const bool wasRunning = pImpl->running.exchange(false);
    if (wasRunning) {
        LOG_INFO("Server stopped");
    }
}

bool Server::IsRunning() const {
    return pImpl->running.load();
}

bool Server::IsAccepting() const {
    return pImpl->accepting.load();
}

JSONValue Server::GetStatus() const {
    const auto& info = pImpl->options.dispatcher.serverInfo;
    JSONValue serverInfo{JSONValue::Object{}};
    SetMember(serverInfo, "name", JSONValue(info.name));
    SetMember(serverInfo, "version", JSONValue(info.version));
    SetMember(serverInfo, "description", JSONValue(info.description));

    JSONValue requests{JSONValue::Object{}};
    SetMember(requests, "total", count(pImpl->requestsTotal.load()));
    SetMember(requests, "rejected", count(pImpl->requestsRejected.load()));
    SetMember(requests, "failed", count(pImpl->requestsFailed.load()));
    {
        std::lock_guard<std::mutex> lock(pImpl->drainMutex);
        SetMember(requests, "in_flight", count(pImpl->inFlight));
    }

    const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - pImpl->createdAt);

    JSONValue status{JSONValue::Object{}};
    SetMember(status, "server_info", std::move(serverInfo));
    SetMember(status, "protocol_version", JSONValue(PROTOCOL_VERSION));
    SetMember(status, "running", JSONValue(pImpl->running.load()));
    SetMember(status, "accepting", JSONValue(pImpl->accepting.load()));
    SetMember(status, "uptime_seconds", JSONValue(static_cast<int64_t>(uptime.count())));
    SetMember(status, "requests", std::move(requests));
    SetMember(status, "tools", MakeStringArray(pImpl->registry.Names()));
    SetMember(status, "degradation", pImpl->errorController.GetDegradationConfig().ToJSON());
    return status;
}

JSONValue Server::HealthCheck() const {
    return pImpl->healthCheck();
}

JSONValue Server::LastHealthSnapshot() const {
    std::lock_guard<std::mutex> lock(pImpl->healthMutex);
    return pImpl->lastHealth;
}

std::size_t Server::HealthSnapshotCount() const {
    std::lock_guard<std::mutex> lock(pImpl->healthMutex);
    return pImpl->healthSnapshots;
}

tools::ToolRegistry& Server::Tools() {
    return pImpl->registry;
}

security::NetworkPolicyEnforcer& Server::Network() {
    return pImpl->network;
}

security::SessionManager& Server::Sessions() {
    return pImpl->sessions;
}

errors::ErrorController& Server::Errors() {
    return pImpl->errorController;
}

context::IContextStore& Server::Context() {
    return *pImpl->contextStore;
}

RequestDispatcher& Server::Dispatcher() {
    return pImpl->dispatcher;
}

} // namespace mcplease
