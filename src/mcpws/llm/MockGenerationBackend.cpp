//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MockGenerationBackend.cpp
// Purpose: Canned generation backend
//==========================================================================================================

#include "mcpws/llm/MockGenerationBackend.h"

#include <iterator>
#include <thread>

namespace mcpws {
namespace llm {

namespace {
constexpr std::size_t kEchoChars = 50;

std::future<std::string> ready(std::string text) {
    std::promise<std::string> p;
    p.set_value(std::move(text));
    return p.get_future();
}

class MockChunkStream : public IChunkStream {
public:
    explicit MockChunkStream(std::chrono::milliseconds delay) : delay_(delay) {}

    std::optional<std::string> Next() override {
        static const char* const kWords[] = {"Mock", "streaming", "response", "to", "your", "request"};
        if (index_ >= std::size(kWords)) {
            return std::nullopt;
        }
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        return std::string(kWords[index_++]) + " ";
    }

private:
    std::chrono::milliseconds delay_;
    std::size_t index_{0};
};
} // namespace

MockGenerationBackend::MockGenerationBackend(std::chrono::milliseconds chunkDelay)
    : chunkDelay_(chunkDelay) {}

std::future<void> MockGenerationBackend::Initialize() {
    std::promise<void> p;
    p.set_value();
    return p.get_future();
}

std::future<std::string> MockGenerationBackend::GenerateResponse(const std::string& prompt, const GenerationOptions&) {
    return ready("Mock response to: " + Utf8Prefix(prompt, kEchoChars) + "...");
}

std::unique_ptr<IChunkStream> MockGenerationBackend::GenerateStreamingResponse(const std::string&,
                                                                               const GenerationOptions&) {
    return std::make_unique<MockChunkStream>(chunkDelay_);
}

std::future<std::string> MockGenerationBackend::GenerateWithContext(const std::vector<ChatMessage>& messages,
                                                                    const GenerationOptions&) {
    const std::string last = messages.empty() ? std::string() : messages.back().content;
    return ready("Mock response to: " + Utf8Prefix(last, kEchoChars) + "...");
}

std::future<std::string> MockGenerationBackend::GenerateWithFunctionContext(const std::string& userMessage,
                                                                            const std::vector<FunctionResult>& results,
                                                                            const GenerationOptions&) {
    return ready("Mock response to '" + userMessage + "' with " + std::to_string(results.size()) + " function results");
}

} // namespace llm
} // namespace mcpws
