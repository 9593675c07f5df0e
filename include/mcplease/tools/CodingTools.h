//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CodingTools.h
// Purpose: code_completion, code_explanation and debug_assistance tools backed by an IModelAdapter
//==========================================================================================================
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "mcplease/tools/ModelAdapter.h"
#include "mcplease/tools/ToolRegistry.h"

namespace mcplease {
namespace tools {

//==========================================================================================================
// CodingTool
// Purpose: Shared plumbing for the model-backed tools.
// Notes:
//   - Execute runs on a detached worker and reports through a promise, so a caller that times out
//     never blocks on the future's destructor.
//   - Without an adapter the tools answer with a descriptive placeholder instead of failing.
//   - Adapter exceptions propagate unchanged.
//==========================================================================================================
class CodingTool : public ITool, public std::enable_shared_from_this<CodingTool> {
public:
    explicit CodingTool(std::shared_ptr<IModelAdapter> adapter) : adapter(std::move(adapter)) {}

    bool RequiresModel() const override { return true; }
    std::future<CallToolResult> Execute(const JSONValue& arguments, std::stop_token st) override;

    // Synchronous body; public for direct use in tests.
    CallToolResult Run(const JSONValue& arguments, std::stop_token st);

protected:
    virtual std::string prompt(const JSONValue& arguments) const = 0;
    virtual std::string placeholder(const JSONValue& arguments) const = 0;
    virtual GenerationOptions generationOptions(const JSONValue&) const { return GenerationOptions{}; }

    static std::string requireString(const JSONValue& arguments, const char* key);
    static std::optional<std::string> optionalString(const JSONValue& arguments, const char* key);

    std::shared_ptr<IModelAdapter> adapter;
};

class CodeCompletionTool : public CodingTool {
public:
    using CodingTool::CodingTool;
    Tool Descriptor() const override;

protected:
    std::string prompt(const JSONValue& arguments) const override;
    std::string placeholder(const JSONValue& arguments) const override;
    GenerationOptions generationOptions(const JSONValue& arguments) const override;
};

class CodeExplanationTool : public CodingTool {
public:
    using CodingTool::CodingTool;
    Tool Descriptor() const override;

protected:
    std::string prompt(const JSONValue& arguments) const override;
    std::string placeholder(const JSONValue& arguments) const override;
};

class DebugAssistanceTool : public CodingTool {
public:
    using CodingTool::CodingTool;
    Tool Descriptor() const override;

protected:
    std::string prompt(const JSONValue& arguments) const override;
    std::string placeholder(const JSONValue& arguments) const override;
};

// Registers the three coding tools; `adapter` may be null.
void RegisterCodingTools(ToolRegistry& registry, std::shared_ptr<IModelAdapter> adapter);

} // namespace tools
} // namespace mcplease
