//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GenerationBackend.h
// Purpose: Text-generation backend interface, chunk streams and prompt formatting helpers
//==========================================================================================================

#pragma once

#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcpws {
namespace llm {

// One chat turn. Roles other than "user" and "assistant" are ignored when formatting.
struct ChatMessage {
    std::string role{"user"};
    std::string content;
};

// Outcome of a tool call fed back into a prompt.
struct FunctionResult {
    std::string tool;
    bool isError{false};
    std::string error;
};

struct GenerationOptions {
    int maxTokens{256};
    double temperature{0.7};
    bool stream{false};
};

//==========================================================================================================
// GenerationError
// Purpose: Backend failure (endpoint unreachable, HTTP error status, malformed reply).
//==========================================================================================================
class GenerationError : public std::runtime_error {
public:
    explicit GenerationError(const std::string& message) : std::runtime_error(message) {}
};

//==========================================================================================================
// IChunkStream
// Purpose: Lazy, finite, non-restartable sequence of text chunks.
// Methods:
//   Next(): Blocks until the next chunk is available; std::nullopt once exhausted. Throws GenerationError
//           when the backend fails.
//==========================================================================================================
class IChunkStream {
public:
    virtual ~IChunkStream() = default;
    virtual std::optional<std::string> Next() = 0;
};

//==========================================================================================================
// IGenerationBackend
// Purpose: Strategy for producing text. Chosen once at startup (mock or real endpoint).
// Notes:
//   Futures carry GenerationError on failure.
//==========================================================================================================
class IGenerationBackend {
public:
    virtual ~IGenerationBackend() = default;

    // "mock" or "real"
    virtual std::string Kind() const = 0;

    // Prepares the backend. Idempotent; Generate* call it lazily.
    virtual std::future<void> Initialize() = 0;

    virtual std::future<std::string> GenerateResponse(const std::string& prompt, const GenerationOptions& options) = 0;

    virtual std::unique_ptr<IChunkStream> GenerateStreamingResponse(const std::string& prompt,
                                                                    const GenerationOptions& options) = 0;

    // Uses the last five messages as conversation context.
    virtual std::future<std::string> GenerateWithContext(const std::vector<ChatMessage>& messages,
                                                         const GenerationOptions& options) = 0;

    virtual std::future<std::string> GenerateWithFunctionContext(const std::string& userMessage,
                                                                 const std::vector<FunctionResult>& results,
                                                                 const GenerationOptions& options) = 0;
};

///////////////////////////////////////// Prompt helpers ///////////////////////////////////////////

// Number of trailing messages kept by FormatConversation
constexpr std::size_t kConversationWindow = 5;

//==========================================================================================================
// FormatConversation
// Purpose: Renders the last kConversationWindow messages as "User: ..." / "Assistant: ..." lines followed
//          by an open "Assistant: " turn.
//==========================================================================================================
std::string FormatConversation(const std::vector<ChatMessage>& messages);

// Prompt listing tool outcomes after the user's message.
std::string FormatFunctionContext(const std::string& userMessage, const std::vector<FunctionResult>& results);

//==========================================================================================================
// CleanResponse
// Purpose: Post-processes raw model output: drops an echoed prompt, collapses blank lines and removes a
//          trailing incomplete sentence.
//==========================================================================================================
std::string CleanResponse(const std::string& response, const std::string& prompt);

// Splits text into streaming chunks: the first word as-is, later words prefixed with one space.
std::vector<std::string> SplitWordChunks(const std::string& text);

// The first maxChars code points of UTF-8 text.
std::string Utf8Prefix(const std::string& text, std::size_t maxChars);

} // namespace llm
} // namespace mcpws
