//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PromptFormatting.cpp
// Purpose: Prompt construction and response cleanup shared by the generation backends
//==========================================================================================================

#include "mcpws/llm/GenerationBackend.h"

#include <sstream>

namespace mcpws {
namespace llm {

namespace {
constexpr const char* kWhitespace = " \t\r\n\f\v";

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string::npos) {
        return std::string();
    }
    const auto last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}

// Runs of two or more newlines become one
std::string collapseNewlines(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\n' && !out.empty() && out.back() == '\n' && i > 0 && s[i - 1] == '\n') {
            continue;
        }
        out.push_back(s[i]);
    }
    return out;
}
} // namespace

std::string FormatConversation(const std::vector<ChatMessage>& messages) {
    std::string formatted;
    const std::size_t start = messages.size() > kConversationWindow ? messages.size() - kConversationWindow : 0;
    for (std::size_t i = start; i < messages.size(); ++i) {
        const auto& m = messages[i];
        const std::string role = m.role.empty() ? std::string("user") : m.role;
        if (role == "user") {
            formatted += "User: " + m.content + "\n";
        } else if (role == "assistant") {
            formatted += "Assistant: " + m.content + "\n";
        }
    }
    formatted += "Assistant: ";
    return formatted;
}

std::string FormatFunctionContext(const std::string& userMessage, const std::vector<FunctionResult>& results) {
    std::string prompt = "User: " + userMessage + "\n";
    if (!results.empty()) {
        prompt += "\nFunction execution results:\n";
        for (const auto& r : results) {
            if (r.isError) {
                prompt += "- Error in " + (r.tool.empty() ? std::string("unknown") : r.tool) + ": " +
                          (r.error.empty() ? std::string("Unknown error") : r.error) + "\n";
            } else {
                prompt += "- " + (r.tool.empty() ? std::string("Function") : r.tool) + " executed successfully\n";
            }
        }
    }
    prompt += "\nAssistant: ";
    return prompt;
}

std::string CleanResponse(const std::string& response, const std::string& prompt) {
    std::string text = response;
    if (!prompt.empty() && text.rfind(prompt, 0) == 0) {
        text = trim(text.substr(prompt.size()));
    }
    text = trim(collapseNewlines(text));

    const auto lastDot = text.rfind('.');
    if (lastDot != std::string::npos) {
        const std::string tail = trim(text.substr(lastDot + 1));
        if (!tail.empty() && tail.back() != '!' && tail.back() != '?') {
            text = text.substr(0, lastDot + 1);
        }
    }
    return trim(text);
}

std::vector<std::string> SplitWordChunks(const std::string& text) {
    std::vector<std::string> chunks;
    std::istringstream in(text);
    std::string word;
    while (in >> word) {
        chunks.push_back(chunks.empty() ? word : " " + word);
    }
    return chunks;
}

std::string Utf8Prefix(const std::string& text, std::size_t maxChars) {
    std::size_t chars = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        // Count lead bytes only; continuation bytes are 10xxxxxx
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
            if (chars == maxChars) {
                return text.substr(0, i);
            }
            ++chars;
        }
    }
    return text;
}

} // namespace llm
} // namespace mcpws
