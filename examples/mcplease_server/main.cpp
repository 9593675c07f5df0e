//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: mcplease server: coding tools behind the request pipeline on an HTTP(S) acceptor
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcplease/HTTPServer.hpp"
#include "mcplease/Server.h"
#include "mcplease/ServerConfig.h"
#include "mcplease/errors/Errors.h"
#include "mcplease/tools/CodingTools.h"
#include "mcplease/version.h"

using namespace mcplease;

namespace {

std::atomic<bool> gStopRequested{false};

void onSignal(int) {
    gStopRequested.store(true);
}

} // namespace

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--listen")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

//==========================================================================================================
// Issues a token for `userId` with the configured scheme and prints it. Stored tokens only live as long
// as the issuing process, so this is useful with the signed scheme and a shared MCPLEASE_JWT_SECRET.
//==========================================================================================================
static int issueToken(Server& server, const std::string& userId, const std::string& permissions) {
    const auto& schemes = server.Sessions().Schemes();
    if (schemes.empty()) {
        LOG_ERROR("No credential scheme configured");
        return 1;
    }
    auth::Identity identity;
    identity.userId = userId;
    identity.username = userId;
    for (const auto& p : SplitList(permissions)) {
        identity.permissions.insert(p);
    }
    const auth::IssuedCredentials issued = schemes.front()->Issue(identity);
    std::cout << issued.token << std::endl;
    LOG_INFO("Issued {} token for {} (expires in {} s)", issued.tokenType, userId, issued.expiresIn.count());
    return 0;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    ServerConfig config;
    try {
        config = LoadServerConfigFromEnv();
    } catch (const errors::ConfigurationError& e) {
        LOG_ERROR("Invalid configuration: {}", e.what());
        return 2;
    }
    if (auto v = getArgValue(argc, argv, "--listen"); v.has_value()) {
        config.listenUri = v.value();
    }
    Logger::setLogLevelFromString(config.logLevel);
    if (!config.logFile.empty()) {
        Logger::setLogFile(config.logFile);
    }

    ServerOptions options;
    try {
        options = MakeServerOptions(config);
    } catch (const errors::ConfigurationError& e) {
        LOG_ERROR("Invalid configuration: {}", e.what());
        return 2;
    }

    Server server(std::move(options));
    // No model backend is wired here; tools answer with their placeholder text.
    tools::RegisterCodingTools(server.Tools(), nullptr);

    if (auto user = getArgValue(argc, argv, "--issue-token"); user.has_value()) {
        const std::string perms = getArgValue(argc, argv, "--permissions").value_or("read,tools/list,tools/call");
        return issueToken(server, user.value(), perms);
    }

    LOG_INFO("mcplease {} starting (auth={}, profile={})", getVersionString(),
             config.requireAuth ? "required" : "anonymous", config.policyProfile);

    try {
        HTTPServerFactory factory;
        server.AddAcceptor(factory.CreateTransportAcceptor(config.listenUri));
        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);
        server.Start();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start: {}", e.what());
        server.Stop();
        return 1;
    }

    while (!gStopRequested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    LOG_INFO("Shutdown requested");
    server.Stop();
    return 0;
}
