//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Protocol constants, method routing enum and tool data structures
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace mcplease {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Protocol revision announced by initialize
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// Revisions accepted from clients during initialize
inline const std::vector<std::string>& SupportedProtocolVersions() {
    static const std::vector<std::string> versions{PROTOCOL_VERSION};
    return versions;
}

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information
struct Implementation {
    std::string name;
    std::string version;
    std::string description;

    Implementation() = default;
    Implementation(std::string name, std::string version, std::string description = {})
        : name(std::move(name)), version(std::move(version)), description(std::move(description)) {}
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Tool descriptor as advertised by tools/list
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

// Result of a tool invocation; content holds {type, text} items
struct CallToolResult {
    std::vector<JSONValue> content;  // Array of content items
    bool isError = false;
    std::optional<JSONValue> meta;   // serialized as meta
};

// Builds a {type: "text", text} content item.
JSONValue MakeTextContent(const std::string& text);

// Builds the wire object {content, isError, meta?}.
JSONValue ToJSON(const CallToolResult& result);

// Builds the wire object {name, description, inputSchema}.
JSONValue ToJSON(const Tool& tool);

///////////////////////////////////////// Methods ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";
}

// Closed set of methods the dispatcher routes; everything else is Unknown.
enum class Method {
    Initialize,
    ListTools,
    CallTool,
    Unknown
};

Method MethodFromString(std::string_view name);
const char* MethodName(Method method);
std::vector<std::string> SupportedMethodNames();

// Permission required to invoke a wire method (unlisted methods require "read").
std::string RequiredPermission(std::string_view method);

} // namespace mcplease
