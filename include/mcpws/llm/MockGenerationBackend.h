//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MockGenerationBackend.h
// Purpose: Canned generation backend for tests and --mock-llm runs
//==========================================================================================================

#pragma once

#include <chrono>

#include "mcpws/llm/GenerationBackend.h"

namespace mcpws {
namespace llm {

//==========================================================================================================
// MockGenerationBackend
// Purpose: Deterministic responses without a model.
//   GenerateResponse -> "Mock response to: <first 50 chars of prompt>..."
//   GenerateStreamingResponse -> "Mock ", "streaming ", "response ", "to ", "your ", "request "
//                                (chunkDelay before each chunk)
//==========================================================================================================
class MockGenerationBackend : public IGenerationBackend {
public:
    explicit MockGenerationBackend(std::chrono::milliseconds chunkDelay = std::chrono::milliseconds(100));

    std::string Kind() const override { return "mock"; }
    std::future<void> Initialize() override;
    std::future<std::string> GenerateResponse(const std::string& prompt, const GenerationOptions& options) override;
    std::unique_ptr<IChunkStream> GenerateStreamingResponse(const std::string& prompt,
                                                            const GenerationOptions& options) override;
    std::future<std::string> GenerateWithContext(const std::vector<ChatMessage>& messages,
                                                 const GenerationOptions& options) override;
    std::future<std::string> GenerateWithFunctionContext(const std::string& userMessage,
                                                         const std::vector<FunctionResult>& results,
                                                         const GenerationOptions& options) override;

private:
    std::chrono::milliseconds chunkDelay_;
};

} // namespace llm
} // namespace mcpws
