//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Tool interface and thread-safe registry consulted by the dispatcher
//==========================================================================================================
#pragma once

#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcplease/Protocol.h"

namespace mcplease {
namespace tools {

//==========================================================================================================
// ITool
// Purpose: One callable tool.
// Notes:
//   - Execute returns a future; failures are delivered as exceptions through the future.
//   - `st` is signalled when the caller gives up (timeout or shutdown); tools should stop promptly.
//   - RequiresModel() marks tools that are disabled when AI features are degraded off.
//==========================================================================================================
class ITool {
public:
    virtual ~ITool() = default;
    virtual Tool Descriptor() const = 0;
    virtual bool RequiresModel() const { return false; }
    virtual std::future<CallToolResult> Execute(const JSONValue& arguments, std::stop_token st) = 0;
};

class ToolRegistry {
public:
    // Replaces any tool with the same name; listing keeps first-registration order.
    void Register(std::shared_ptr<ITool> tool);
    bool Unregister(const std::string& name);

    std::shared_ptr<ITool> Find(const std::string& name) const;
    std::vector<Tool> List() const;
    std::vector<std::string> Names() const;
    std::size_t Size() const;

private:
    mutable std::mutex mtx;
    std::vector<std::string> order;
    std::unordered_map<std::string, std::shared_ptr<ITool>> tools;
};

} // namespace tools
} // namespace mcplease
