//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpGenerationBackend.h
// Purpose: Generation backend calling an OpenAI-compatible /v1/completions endpoint over Boost.Beast
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "mcpws/llm/GenerationBackend.h"

namespace mcpws {
namespace llm {

class HttpGenerationBackend : public IGenerationBackend {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   host/port/path: Completion endpoint (plain HTTP).
    //   model: Model name sent with every request.
    //   connectTimeout/readTimeout: Per-request socket deadlines.
    //   chunkDelay: Pause between words when streaming.
    //==========================================================================================================
    struct Options {
        std::string host{"127.0.0.1"};
        std::string port{"11434"};
        std::string path{"/v1/completions"};
        std::string model{"distilgpt2"};
        std::chrono::milliseconds connectTimeout{5000};
        std::chrono::milliseconds readTimeout{300000};
        std::chrono::milliseconds chunkDelay{50};
    };

    explicit HttpGenerationBackend(const Options& opts);
    ~HttpGenerationBackend() override;

    HttpGenerationBackend(const HttpGenerationBackend&) = delete;
    HttpGenerationBackend& operator=(const HttpGenerationBackend&) = delete;

    std::string Kind() const override { return "real"; }
    std::future<void> Initialize() override;
    std::future<std::string> GenerateResponse(const std::string& prompt, const GenerationOptions& options) override;
    std::unique_ptr<IChunkStream> GenerateStreamingResponse(const std::string& prompt,
                                                            const GenerationOptions& options) override;
    std::future<std::string> GenerateWithContext(const std::vector<ChatMessage>& messages,
                                                 const GenerationOptions& options) override;
    std::future<std::string> GenerateWithFunctionContext(const std::string& userMessage,
                                                         const std::vector<FunctionResult>& results,
                                                         const GenerationOptions& options) override;

    //==========================================================================================================
    // BuildRequestBody
    // Purpose: JSON body for one completion request: { model, prompt, max_tokens, temperature, stream:false }.
    //==========================================================================================================
    static std::string BuildRequestBody(const std::string& model, const std::string& prompt,
                                        const GenerationOptions& options);

    //==========================================================================================================
    // ExtractCompletionText
    // Purpose: Reads choices[0].text (or choices[0].message.content) from a completion reply.
    // Throws:
    //   GenerationError when the body is not a recognizable completion.
    //==========================================================================================================
    static std::string ExtractCompletionText(const std::string& body);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace llm
} // namespace mcpws
