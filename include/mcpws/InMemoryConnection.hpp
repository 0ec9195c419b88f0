//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryConnection.hpp
// Purpose: In-process connection for tests and embedding
//==========================================================================================================
#pragma once

#include "mcpws/Connection.h"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpws {

//==========================================================================================================
// InMemoryConnection
// Purpose: IConnection that records every delivered frame instead of writing to a socket. Sends after
//          Close() fail with errors::ConnectionClosedError.
//==========================================================================================================
class InMemoryConnection : public IConnection {
public:
    explicit InMemoryConnection(std::string remoteAddress = "in-memory");
    ~InMemoryConnection() override;

    ////////////////////////////////////////// IConnection //////////////////////////////////////////
    std::future<void> Send(const std::string& frame) override;
    bool IsOpen() const override;
    std::future<void> Close() override;
    std::string GetRemoteAddress() const override;

    //==========================================================================================================
    // Optional observer invoked synchronously for every delivered frame (outside the internal lock).
    //==========================================================================================================
    void SetFrameObserver(std::function<void(const std::string&)> observer);

    // Copy of all frames delivered so far, in order.
    std::vector<std::string> SentFrames() const;

    //==========================================================================================================
    // WaitForFrames
    // Purpose: Blocks until at least count frames were delivered or the timeout elapses.
    // Returns:
    //   true when the count was reached.
    //==========================================================================================================
    bool WaitForFrames(std::size_t count, std::chrono::milliseconds timeout) const;

    // Removes recorded frames.
    void ClearFrames();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpws
