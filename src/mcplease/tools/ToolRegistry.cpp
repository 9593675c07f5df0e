//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: ToolRegistry implementation
//==========================================================================================================

#include "mcplease/tools/ToolRegistry.h"

#include <algorithm>
#include <stdexcept>

#include "logging/Logger.h"

namespace mcplease {
namespace tools {

void ToolRegistry::Register(std::shared_ptr<ITool> tool) {
    if (!tool) {
        throw std::invalid_argument("Cannot register a null tool");
    }
    const std::string name = tool->Descriptor().name;
    if (name.empty()) {
        throw std::invalid_argument("Tool name must not be empty");
    }
    std::lock_guard<std::mutex> lock(mtx);
    if (tools.find(name) == tools.end()) {
        order.push_back(name);
    }
    tools[name] = std::move(tool);
    LOG_INFO("Registered tool: {}", name);
}

bool ToolRegistry::Unregister(const std::string& name) {
    std::lock_guard<std::mutex> lock(mtx);
    if (tools.erase(name) == 0) {
        return false;
    }
    order.erase(std::remove(order.begin(), order.end(), name), order.end());
    return true;
}

std::shared_ptr<ITool> ToolRegistry::Find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = tools.find(name);
    return it == tools.end() ? nullptr : it->second;
}

std::vector<Tool> ToolRegistry::List() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<Tool> out;
    out.reserve(order.size());
    for (const auto& name : order) {
        out.push_back(tools.at(name)->Descriptor());
    }
    return out;
}

std::vector<std::string> ToolRegistry::Names() const {
    std::lock_guard<std::mutex> lock(mtx);
    return order;
}

std::size_t ToolRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return tools.size();
}

} // namespace tools
} // namespace mcplease
