//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Method routing table, permission table and protocol object builders
//==========================================================================================================

#include "mcplease/Protocol.h"

#include <array>
#include <utility>

namespace mcplease {

namespace {

struct MethodEntry {
    std::string_view wire;
    Method method;
};

constexpr std::array<MethodEntry, 3> kRoutedMethods{{
    {Methods::Initialize, Method::Initialize},
    {Methods::ListTools, Method::ListTools},
    {Methods::CallTool, Method::CallTool},
}};

struct PermissionEntry {
    std::string_view method;
    const char* permission;
};

constexpr std::array<PermissionEntry, 7> kMethodPermissions{{
    {Methods::Initialize, "read"},
    {Methods::ListTools, "tools/list"},
    {Methods::CallTool, "tools/call"},
    {Methods::ListResources, "read"},
    {Methods::ReadResource, "read"},
    {Methods::ListPrompts, "read"},
    {Methods::GetPrompt, "read"},
}};

} // namespace

Method MethodFromString(std::string_view name) {
    for (const auto& e : kRoutedMethods) {
        if (e.wire == name) return e.method;
    }
    return Method::Unknown;
}

const char* MethodName(Method method) {
    for (const auto& e : kRoutedMethods) {
        if (e.method == method) return e.wire.data();
    }
    return "unknown";
}

std::vector<std::string> SupportedMethodNames() {
    std::vector<std::string> out;
    for (const auto& e : kRoutedMethods) out.emplace_back(e.wire);
    return out;
}

std::string RequiredPermission(std::string_view method) {
    for (const auto& e : kMethodPermissions) {
        if (e.method == method) return e.permission;
    }
    return "read";
}

JSONValue MakeTextContent(const std::string& text) {
    JSONValue::Object item;
    item["type"] = std::make_shared<JSONValue>(std::string("text"));
    item["text"] = std::make_shared<JSONValue>(text);
    return JSONValue{std::move(item)};
}

JSONValue ToJSON(const CallToolResult& result) {
    JSONValue::Object obj;
    JSONValue::Array content;
    for (const auto& v : result.content) content.push_back(std::make_shared<JSONValue>(v));
    obj["content"] = std::make_shared<JSONValue>(std::move(content));
    obj["isError"] = std::make_shared<JSONValue>(result.isError);
    if (result.meta.has_value()) {
        obj["meta"] = std::make_shared<JSONValue>(result.meta.value());
    }
    return JSONValue{std::move(obj)};
}

JSONValue ToJSON(const Tool& tool) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(tool.name);
    obj["description"] = std::make_shared<JSONValue>(tool.description);
    obj["inputSchema"] = std::make_shared<JSONValue>(tool.inputSchema);
    return JSONValue{std::move(obj)};
}

} // namespace mcplease
