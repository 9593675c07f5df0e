//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Failure taxonomy: exception kinds, categories and severities
//==========================================================================================================

#pragma once

#include <stdexcept>
#include <string>


namespace mcplease {
namespace errors {

/////////////////////////////////////////// Classification ///////////////////////////////////////////
// Kind of failure, used to pick recovery strategies and to prefix error codes.
enum class ErrorCategory {
    Protocol,
    AIModel,
    Security,
    Network,
    Configuration,
    Resource,
    System,
    UserInput,
    External
};

// How serious a failure is; drives log level and dashboards.
enum class ErrorSeverity {
    Low,
    Medium,
    High,
    Critical
};

// Wire names: "protocol", "ai_model", ... and "low" .. "critical".
const char* ToString(ErrorCategory category);
const char* ToString(ErrorSeverity severity);

/////////////////////////////////////////// Exception kinds ///////////////////////////////////////////
//==========================================================================================================
// McpleaseError
// Purpose: Root of the server's exception hierarchy. Kind() is the short type name used in error codes.
//==========================================================================================================
class McpleaseError : public std::runtime_error {
public:
    explicit McpleaseError(const std::string& message) : std::runtime_error(message) {}
    virtual const char* Kind() const noexcept { return "McpleaseError"; }
};

#define MCPLEASE_DECLARE_ERROR(Name, Base)                                          \
    class Name : public Base {                                                     \
    public:                                                                        \
        explicit Name(const std::string& message) : Base(message) {}               \
        const char* Kind() const noexcept override { return #Name; }               \
    }

MCPLEASE_DECLARE_ERROR(ProtocolError, McpleaseError);
MCPLEASE_DECLARE_ERROR(SecurityError, McpleaseError);
MCPLEASE_DECLARE_ERROR(AuthenticationError, SecurityError);
MCPLEASE_DECLARE_ERROR(AuthorizationError, SecurityError);
MCPLEASE_DECLARE_ERROR(ModelError, McpleaseError);
MCPLEASE_DECLARE_ERROR(ModelNotFoundError, ModelError);
MCPLEASE_DECLARE_ERROR(ModelUnavailableError, ModelError);
MCPLEASE_DECLARE_ERROR(NetworkError, McpleaseError);
MCPLEASE_DECLARE_ERROR(ConnectionError, NetworkError);
MCPLEASE_DECLARE_ERROR(TimeoutError, NetworkError);
MCPLEASE_DECLARE_ERROR(ConfigurationError, McpleaseError);
MCPLEASE_DECLARE_ERROR(ResourceError, McpleaseError);
MCPLEASE_DECLARE_ERROR(QueueFullError, ResourceError);
MCPLEASE_DECLARE_ERROR(ExternalServiceError, McpleaseError);
MCPLEASE_DECLARE_ERROR(ToolExecutionError, McpleaseError);
// Process-level stop (signal, forced termination); always critical.
MCPLEASE_DECLARE_ERROR(TerminationError, McpleaseError);

#undef MCPLEASE_DECLARE_ERROR

} // namespace errors
} // namespace mcplease
