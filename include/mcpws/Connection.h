//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Connection.h
// Purpose: Abstract message-oriented client connection used by sessions and the protocol handler
//==========================================================================================================

#pragma once

#include <future>
#include <string>

namespace mcpws {

//==========================================================================================================
// IConnection
// Purpose: One persistent, ordered, reliable, message-oriented client connection. Implementations queue
//          outbound frames in FIFO order so notifications and responses keep their emission order.
//==========================================================================================================
class IConnection {
public:
    virtual ~IConnection() = default;

    //==========================================================================================================
    // Queues one text frame for delivery.
    // Args:
    //   frame: Complete serialized JSON-RPC message.
    // Returns:
    //   Future that completes once the frame was written, or carries errors::ConnectionClosedError (or a
    //   transport error) when the connection is closed before delivery.
    //==========================================================================================================
    virtual std::future<void> Send(const std::string& frame) = 0;

    //==========================================================================================================
    // Indicates whether frames can still be delivered.
    //==========================================================================================================
    virtual bool IsOpen() const = 0;

    //==========================================================================================================
    // Closes the connection. Idempotent.
    // Returns:
    //   Future that completes when the close has been initiated.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    //==========================================================================================================
    // Peer address for diagnostics (e.g. "127.0.0.1:53211").
    //==========================================================================================================
    virtual std::string GetRemoteAddress() const = 0;
};

} // namespace mcpws
