//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryConnection.cpp
// Purpose: In-process connection recording frames for tests and embedding
//==========================================================================================================

#include "mcpws/InMemoryConnection.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>

#include "logging/Logger.h"
#include "mcpws/errors/Errors.h"

namespace mcpws {

class InMemoryConnection::Impl {
public:
    std::string remoteAddress;
    std::atomic<bool> open{true};
    mutable std::mutex framesMutex;
    mutable std::condition_variable framesCv;
    std::vector<std::string> frames;
    std::function<void(const std::string&)> observer;
};

InMemoryConnection::InMemoryConnection(std::string remoteAddress)
    : pImpl(std::make_unique<Impl>()) {
    pImpl->remoteAddress = std::move(remoteAddress);
}

InMemoryConnection::~InMemoryConnection() = default;

std::future<void> InMemoryConnection::Send(const std::string& frame) {
    std::promise<void> done;
    auto fut = done.get_future();
    if (!pImpl->open.load()) {
        done.set_exception(std::make_exception_ptr(errors::ConnectionClosedError("Connection is closed")));
        return fut;
    }
    std::function<void(const std::string&)> observer;
    {
        std::lock_guard<std::mutex> lk(pImpl->framesMutex);
        pImpl->frames.push_back(frame);
        observer = pImpl->observer;
    }
    pImpl->framesCv.notify_all();
    if (observer) {
        observer(frame);
    }
    done.set_value();
    return fut;
}

bool InMemoryConnection::IsOpen() const {
    return pImpl->open.load();
}

std::future<void> InMemoryConnection::Close() {
    std::promise<void> done;
    auto fut = done.get_future();
    if (pImpl->open.exchange(false)) {
        LOG_DEBUG("InMemoryConnection {} closed", pImpl->remoteAddress);
    }
    pImpl->framesCv.notify_all();
    done.set_value();
    return fut;
}

std::string InMemoryConnection::GetRemoteAddress() const {
    return pImpl->remoteAddress;
}

void InMemoryConnection::SetFrameObserver(std::function<void(const std::string&)> observer) {
    std::lock_guard<std::mutex> lk(pImpl->framesMutex);
    pImpl->observer = std::move(observer);
}

std::vector<std::string> InMemoryConnection::SentFrames() const {
    std::lock_guard<std::mutex> lk(pImpl->framesMutex);
    return pImpl->frames;
}

bool InMemoryConnection::WaitForFrames(std::size_t count, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(pImpl->framesMutex);
    return pImpl->framesCv.wait_for(lk, timeout, [this, count]() { return pImpl->frames.size() >= count; });
}

void InMemoryConnection::ClearFrames() {
    std::lock_guard<std::mutex> lk(pImpl->framesMutex);
    pImpl->frames.clear();
}

} // namespace mcpws
