//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpGenerationBackend.cpp
// Purpose: Coroutine HTTP client for an OpenAI-compatible completion endpoint (Boost.Beast)
//==========================================================================================================

#include "mcpws/llm/HttpGenerationBackend.h"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "mcpws/JSONRPCTypes.h"
#include "mcpws/typed/Content.h"

namespace mcpws {
namespace llm {
namespace net = boost::asio;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

//==========================================================================================================
// WordChunkStream
// Purpose: Starts the completion on the first Next() and replays it word by word.
//==========================================================================================================
class WordChunkStream : public IChunkStream {
public:
    WordChunkStream(std::function<std::future<std::string>()> start, std::chrono::milliseconds delay)
        : start_(std::move(start)), delay_(delay) {}

    std::optional<std::string> Next() override {
        if (!started_) {
            started_ = true;
            chunks_ = SplitWordChunks(start_().get());
        }
        if (index_ >= chunks_.size()) {
            return std::nullopt;
        }
        if (index_ > 0 && delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        return chunks_[index_++];
    }

private:
    std::function<std::future<std::string>()> start_;
    std::chrono::milliseconds delay_;
    bool started_{false};
    std::vector<std::string> chunks_;
    std::size_t index_{0};
};

} // namespace

class HttpGenerationBackend::Impl {
public:
    HttpGenerationBackend::Options opts;

    net::io_context ioc;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::thread ioThread;
    std::mutex startMutex;
    std::atomic<bool> initialized{false};

    explicit Impl(const HttpGenerationBackend::Options& o) : opts(o) {}

    ~Impl() {
        workGuard.reset();
        ioc.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
    }

    void ensureStarted() {
        std::lock_guard<std::mutex> lk(startMutex);
        if (initialized.load()) {
            return;
        }
        workGuard.emplace(ioc.get_executor());
        ioThread = std::thread([this]() {
            try {
                ioc.run();
            } catch (const std::exception& e) {
                LOG_ERROR("Generation backend I/O thread error: {}", e.what());
            }
        });
        initialized.store(true);
        LOG_INFO("Generation backend ready: http://{}:{}{} model={}", opts.host, opts.port, opts.path, opts.model);
    }

    net::awaitable<std::string> coPostJson(const std::string path, const std::string body) {
        http::request<http::string_body> req{http::verb::post, path, 11};
        req.set(http::field::host, opts.host);
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, "application/json");
        req.set(http::field::connection, "close");
        req.body() = body;
        req.prepare_payload();

        tcp::resolver resolver(co_await net::this_coro::executor);
        auto results = co_await resolver.async_resolve(opts.host, opts.port, net::use_awaitable);

        boost::beast::tcp_stream stream(co_await net::this_coro::executor);
        stream.expires_after(opts.connectTimeout);
        co_await stream.async_connect(results, net::use_awaitable);

        stream.expires_after(opts.readTimeout);
        co_await http::async_write(stream, req, net::use_awaitable);
        boost::beast::flat_buffer buffer;
        http::response<http::string_body> res;
        co_await http::async_read(stream, buffer, res, net::use_awaitable);
        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);

        const unsigned status = res.result_int();
        if (status < 200 || status >= 300) {
            throw GenerationError("Completion endpoint returned HTTP " + std::to_string(status));
        }
        co_return res.body();
    }

    std::future<std::string> complete(const std::string& prompt, const GenerationOptions& options) {
        ensureStarted();
        auto done = std::make_shared<std::promise<std::string>>();
        auto fut = done->get_future();
        const std::string body = HttpGenerationBackend::BuildRequestBody(opts.model, prompt, options);
        net::co_spawn(ioc, coPostJson(opts.path, body),
                      [done, prompt](std::exception_ptr ep, std::string reply) {
                          if (ep) {
                              try {
                                  std::rethrow_exception(ep);
                              } catch (const GenerationError&) {
                                  done->set_exception(std::current_exception());
                              } catch (const std::exception& e) {
                                  done->set_exception(std::make_exception_ptr(
                                      GenerationError(std::string("Completion request failed: ") + e.what())));
                              }
                              return;
                          }
                          try {
                              done->set_value(CleanResponse(HttpGenerationBackend::ExtractCompletionText(reply), prompt));
                          } catch (const std::exception&) {
                              done->set_exception(std::current_exception());
                          }
                      });
        return fut;
    }
};

HttpGenerationBackend::HttpGenerationBackend(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

HttpGenerationBackend::~HttpGenerationBackend() = default;

std::future<void> HttpGenerationBackend::Initialize() {
    std::promise<void> ready;
    auto fut = ready.get_future();
    pImpl->ensureStarted();
    ready.set_value();
    return fut;
}

std::future<std::string> HttpGenerationBackend::GenerateResponse(const std::string& prompt,
                                                                 const GenerationOptions& options) {
    return pImpl->complete(prompt, options);
}

std::unique_ptr<IChunkStream> HttpGenerationBackend::GenerateStreamingResponse(const std::string& prompt,
                                                                               const GenerationOptions& options) {
    Impl* impl = pImpl.get();
    return std::make_unique<WordChunkStream>(
        [impl, prompt, options]() { return impl->complete(prompt, options); }, pImpl->opts.chunkDelay);
}

std::future<std::string> HttpGenerationBackend::GenerateWithContext(const std::vector<ChatMessage>& messages,
                                                                    const GenerationOptions& options) {
    return pImpl->complete(FormatConversation(messages), options);
}

std::future<std::string> HttpGenerationBackend::GenerateWithFunctionContext(const std::string& userMessage,
                                                                            const std::vector<FunctionResult>& results,
                                                                            const GenerationOptions& options) {
    return pImpl->complete(FormatFunctionContext(userMessage, results), options);
}

std::string HttpGenerationBackend::BuildRequestBody(const std::string& model, const std::string& prompt,
                                                    const GenerationOptions& options) {
    JSONValue::Object body;
    body["model"] = std::make_shared<JSONValue>(model);
    body["prompt"] = std::make_shared<JSONValue>(prompt);
    body["max_tokens"] = std::make_shared<JSONValue>(static_cast<int64_t>(options.maxTokens));
    body["temperature"] = std::make_shared<JSONValue>(options.temperature);
    body["stream"] = std::make_shared<JSONValue>(false);
    return SerializeJSON(JSONValue{body});
}

std::string HttpGenerationBackend::ExtractCompletionText(const std::string& body) {
    JSONValue doc;
    try {
        doc = ParseJSON(body);
    } catch (const JSONParseError& e) {
        throw GenerationError(std::string("Malformed completion response: ") + e.what());
    }
    const JSONValue* choices = typed::getMember(doc, "choices");
    if (choices == nullptr || !choices->IsArray() || std::get<JSONValue::Array>(choices->value).empty()) {
        throw GenerationError("Completion response has no choices");
    }
    const auto& first = std::get<JSONValue::Array>(choices->value).front();
    if (!first) {
        throw GenerationError("Completion response has no choices");
    }
    if (auto text = typed::getString(*first, "text"); text.has_value()) {
        return text.value();
    }
    if (const JSONValue* message = typed::getMember(*first, "message")) {
        if (auto content = typed::getString(*message, "content"); content.has_value()) {
            return content.value();
        }
    }
    throw GenerationError("Completion response has no text");
}

} // namespace llm
} // namespace mcpws
