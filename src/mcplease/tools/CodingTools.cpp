//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CodingTools.cpp
// Purpose: Prompt construction and execution for the coding tools
//==========================================================================================================

#include "mcplease/tools/CodingTools.h"

#include <format>
#include <stdexcept>
#include <thread>

#include "logging/Logger.h"
#include "mcplease/errors/Errors.h"

namespace mcplease {
namespace tools {

namespace {

const JSONValue& completionSchema() {
    static const JSONValue schema = ParseJSON(R"json({
        "type": "object",
        "properties": {
            "code": {"type": "string", "description": "Current code context around cursor position"},
            "language": {"type": "string", "description": "Programming language (e.g., python, javascript, java)"},
            "cursor_position": {"type": "integer", "description": "Cursor position in the code (optional)", "minimum": 0},
            "max_completions": {"type": "integer", "description": "Maximum number of completion suggestions",
                                "minimum": 1, "maximum": 10, "default": 3}
        },
        "required": ["code", "language"]
    })json");
    return schema;
}

const JSONValue& explanationSchema() {
    static const JSONValue schema = ParseJSON(R"json({
        "type": "object",
        "properties": {
            "code": {"type": "string", "description": "Code to explain and analyze"},
            "language": {"type": "string", "description": "Programming language of the code"},
            "detail_level": {"type": "string", "enum": ["brief", "detailed", "comprehensive"],
                             "description": "Level of detail for the explanation", "default": "detailed"},
            "focus": {"type": "string", "enum": ["functionality", "performance", "security", "best_practices"],
                      "description": "Specific aspect to focus on (optional)"}
        },
        "required": ["code", "language"]
    })json");
    return schema;
}

const JSONValue& debugSchema() {
    static const JSONValue schema = ParseJSON(R"json({
        "type": "object",
        "properties": {
            "code": {"type": "string", "description": "Code that has issues or needs debugging"},
            "error_message": {"type": "string", "description": "Error message or stack trace (if available)"},
            "language": {"type": "string", "description": "Programming language of the code"},
            "expected_behavior": {"type": "string", "description": "What the code should do (optional)"},
            "actual_behavior": {"type": "string", "description": "What the code actually does (optional)"}
        },
        "required": ["code", "language"]
    })json");
    return schema;
}

std::string head(const std::string& s, std::size_t n) {
    return s.size() <= n ? s : s.substr(0, n);
}

} // namespace

/////////////////////////////////////////// CodingTool ///////////////////////////////////////////

std::string CodingTool::requireString(const JSONValue& arguments, const char* key) {
    auto v = GetStringMember(arguments, key);
    if (!v.has_value() || v->empty()) {
        throw std::invalid_argument(std::format("Missing required argument: {}", key));
    }
    return *v;
}

std::optional<std::string> CodingTool::optionalString(const JSONValue& arguments, const char* key) {
    auto v = GetStringMember(arguments, key);
    if (v.has_value() && v->empty()) {
        return std::nullopt;
    }
    return v;
}

CallToolResult CodingTool::Run(const JSONValue& arguments, std::stop_token st) {
    if (!arguments.IsObject()) {
        throw std::invalid_argument("Tool arguments must be an object");
    }
    const std::string text = prompt(arguments);  // validates arguments
    CallToolResult result;
    if (!adapter) {
        result.content.push_back(MakeTextContent(placeholder(arguments)));
        return result;
    }
    std::string generated = adapter->Generate(text, generationOptions(arguments), st);
    if (st.stop_requested()) {
        throw errors::ToolExecutionError("Tool execution cancelled");
    }
    result.content.push_back(MakeTextContent(generated));
    return result;
}

std::future<CallToolResult> CodingTool::Execute(const JSONValue& arguments, std::stop_token st) {
    std::promise<CallToolResult> promise;
    auto future = promise.get_future();
    std::thread([self = shared_from_this(), arguments, st, promise = std::move(promise)]() mutable {
        try {
            promise.set_value(self->Run(arguments, st));
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    }).detach();
    return future;
}

/////////////////////////////////////////// code_completion ///////////////////////////////////////////

Tool CodeCompletionTool::Descriptor() const {
    return Tool{"code_completion", "Provides intelligent code completion suggestions based on context",
                completionSchema()};
}

GenerationOptions CodeCompletionTool::generationOptions(const JSONValue& arguments) const {
    GenerationOptions opts;
    // Roughly one line per suggestion
    opts.maxTokens = 50 * static_cast<int>(GetIntMember(arguments, "max_completions").value_or(3));
    return opts;
}

std::string CodeCompletionTool::prompt(const JSONValue& arguments) const {
    const std::string code = requireString(arguments, "code");
    const std::string language = requireString(arguments, "language");
    const auto maxCompletions = GetIntMember(arguments, "max_completions").value_or(3);
    if (maxCompletions < 1 || maxCompletions > 10) {
        throw std::out_of_range(std::format("max_completions must be between 1 and 10, got {}", maxCompletions));
    }
    std::string cursor;
    if (auto pos = GetIntMember(arguments, "cursor_position")) {
        if (*pos < 0) {
            throw std::out_of_range("cursor_position must be non-negative");
        }
        cursor = std::format("\nThe cursor is at offset {}.", *pos);
    }
    LOG_INFO("Code completion requested for {}", language);
    return std::format(
        "You are an expert {0} programmer. Complete the following code with proper syntax and best practices.\n\n"
        "Code to complete:\n```{0}\n{1}\n```{2}\n\n"
        "Offer up to {3} completion(s). Complete the code naturally and concisely:",
        language, code, cursor, maxCompletions);
}

std::string CodeCompletionTool::placeholder(const JSONValue& arguments) const {
    const std::string code = requireString(arguments, "code");
    const std::string language = requireString(arguments, "language");
    return std::format("# Code completion for {}\n# Context: {}...\n# AI adapter not available", language, head(code, 50));
}

/////////////////////////////////////////// code_explanation ///////////////////////////////////////////

Tool CodeExplanationTool::Descriptor() const {
    return Tool{"code_explanation", "Explains code functionality, purpose, and provides technical analysis",
                explanationSchema()};
}

std::string CodeExplanationTool::prompt(const JSONValue& arguments) const {
    const std::string code = requireString(arguments, "code");
    const std::string language = requireString(arguments, "language");
    const std::string detail = optionalString(arguments, "detail_level").value_or("detailed");
    if (detail != "brief" && detail != "detailed" && detail != "comprehensive") {
        throw std::invalid_argument(std::format("Unsupported detail_level: {}", detail));
    }
    LOG_INFO("Code explanation requested for {} with {} detail", language, detail);
    if (auto focus = optionalString(arguments, "focus")) {
        return std::format(
            "You are an expert {0} programmer. Explain this code and answer the specific question.\n\n"
            "Code:\n```{0}\n{1}\n```\n\nQuestion: Focus on {2}\n\nProvide a {3} technical explanation:",
            language, code, *focus, detail);
    }
    return std::format(
        "You are an expert {0} programmer. Explain what this code does.\n\n"
        "Code:\n```{0}\n{1}\n```\n\n"
        "Provide a {2} technical explanation covering:\n"
        "- What the code does\n- How it works\n- Key concepts used\n- Any notable patterns or techniques",
        language, code, detail);
}

std::string CodeExplanationTool::placeholder(const JSONValue& arguments) const {
    const std::string code = requireString(arguments, "code");
    const std::string language = requireString(arguments, "language");
    const std::string detail = optionalString(arguments, "detail_level").value_or("detailed");
    return std::format("# Code Explanation ({})\n\nThis {} code:\n```{}\n{}\n```\n\n"
                       "AI adapter not available for detailed explanation.",
                       detail, language, language, code);
}

/////////////////////////////////////////// debug_assistance ///////////////////////////////////////////

Tool DebugAssistanceTool::Descriptor() const {
    return Tool{"debug_assistance", "Provides debugging help, error analysis, and troubleshooting suggestions",
                debugSchema()};
}

std::string DebugAssistanceTool::prompt(const JSONValue& arguments) const {
    const std::string code = requireString(arguments, "code");
    const std::string language = requireString(arguments, "language");
    LOG_INFO("Debug assistance requested for {}", language);
    std::string out = std::format(
        "You are an expert {0} programmer and debugger. Analyze this code and provide debugging assistance.\n\n"
        "Code:\n```{0}\n{1}\n```\n", language, code);
    if (auto err = optionalString(arguments, "error_message")) out += std::format("\nError message: {}", *err);
    if (auto exp = optionalString(arguments, "expected_behavior")) out += std::format("\nExpected behavior: {}", *exp);
    if (auto act = optionalString(arguments, "actual_behavior")) out += std::format("\nActual behavior: {}", *act);
    out += "\n\nPlease provide:\n1. Analysis of the issue\n2. Explanation of what's causing the problem\n"
           "3. Specific suggestions to fix it\n4. Best practices to prevent similar issues";
    return out;
}

std::string DebugAssistanceTool::placeholder(const JSONValue& arguments) const {
    const std::string code = requireString(arguments, "code");
    const std::string language = requireString(arguments, "language");
    std::string out = std::format("# Debug Analysis for {0}\n\n**Code:**\n```{0}\n{1}\n```\n\n", language, code);
    if (auto err = optionalString(arguments, "error_message")) out += std::format("**Error:** {}\n\n", *err);
    if (auto exp = optionalString(arguments, "expected_behavior")) out += std::format("**Expected:** {}\n\n", *exp);
    if (auto act = optionalString(arguments, "actual_behavior")) out += std::format("**Actual:** {}\n\n", *act);
    out += "AI adapter not available for detailed debugging analysis.";
    return out;
}

void RegisterCodingTools(ToolRegistry& registry, std::shared_ptr<IModelAdapter> adapter) {
    registry.Register(std::make_shared<CodeCompletionTool>(adapter));
    registry.Register(std::make_shared<CodeExplanationTool>(adapter));
    registry.Register(std::make_shared<DebugAssistanceTool>(adapter));
}

} // namespace tools
} // namespace mcplease
