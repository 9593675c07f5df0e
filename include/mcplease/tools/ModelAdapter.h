//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ModelAdapter.h
// Purpose: Seam to the text-generation backend used by the coding tools
//==========================================================================================================
#pragma once

#include <stop_token>
#include <string>

namespace mcplease {
namespace tools {

struct GenerationOptions {
    int maxTokens{150};
    double temperature{0.3};
};

//==========================================================================================================
// IModelAdapter
// Purpose: Generates text for a prompt.
// Notes:
//   - Generate throws errors::ModelUnavailableError / ModelNotFoundError / TimeoutError on failure;
//     those flow into the error controller's recovery chains.
//   - Implementations should poll `st` and abandon work once stop is requested.
//   - Restart() backs the model-restart recovery step; false means it could not restart.
//==========================================================================================================
class IModelAdapter {
public:
    virtual ~IModelAdapter() = default;
    virtual std::string Generate(const std::string& prompt, const GenerationOptions& options, std::stop_token st) = 0;
    virtual bool IsReady() const = 0;
    virtual bool Restart() = 0;
};

} // namespace tools
} // namespace mcplease
