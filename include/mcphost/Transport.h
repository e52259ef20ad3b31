//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: MCP transport interface - correlated JSON-RPC calls over one server connection
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "mcphost/JSONRPCTypes.h"

namespace mcphost {

//==========================================================================================================
// MCP Transport interface
// Purpose: One transport instance serves exactly one server connection. Implementations own request/response
//          correlation and serialize writes so concurrent callers never interleave bytes.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Sends a JSON-RPC request and blocks until the matching response arrives or the timeout expires.
    // Args:
    //   method: JSON-RPC method name.
    //   params: Optional params value.
    // Returns:
    //   The successful response (result populated).
    // Throws:
    //   McpException with ErrorKind::Timeout, ProtocolError (server error object), TransportClosed or
    //   TransportError.
    //==========================================================================================================
    virtual JSONRPCResponse Request(const std::string& method,
                                    std::optional<JSONValue> params = std::nullopt) = 0;

    //==========================================================================================================
    // Sends a JSON-RPC notification (no response expected, no correlation entry created).
    // Throws:
    //   McpException with ErrorKind::TransportClosed or TransportError.
    //==========================================================================================================
    virtual void Notify(const std::string& method, std::optional<JSONValue> params = std::nullopt) = 0;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Non-blocking liveness probe.
    //==========================================================================================================
    virtual bool IsAlive() = 0;

    //==========================================================================================================
    // Terminates the connection. Idempotent; every outstanding request fails promptly with TransportClosed.
    //==========================================================================================================
    virtual void Kill() = 0;

    //==========================================================================================================
    // Configures the per-request timeout in milliseconds (default 30000).
    //==========================================================================================================
    virtual void SetRequestTimeoutMs(uint64_t timeoutMs) = 0;

    //==========================================================================================================
    // Returns a transport session identifier for diagnostics.
    //==========================================================================================================
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Notification handling ///////////////////////////////////////////
    //==========================================================================================================
    // Registers a callback for notifications pushed by the server. Invoked on the transport's reader context.
    //==========================================================================================================
    using NotificationHandler = std::function<void(const JSONRPCNotification&)>;
    virtual void SetNotificationHandler(NotificationHandler handler) = 0;
};

// Concrete transports are declared in their respective headers:
//  - mcphost/StdioTransport.hpp
//  - mcphost/SSETransport.hpp

// Default request timeout, overridable with MCPHOST_REQUEST_TIMEOUT_MS.
constexpr uint64_t DefaultRequestTimeoutMs = 30000;

//==========================================================================================================
// ResolveRequestTimeoutMs
// Purpose: Returns the explicit value when given, else MCPHOST_REQUEST_TIMEOUT_MS, else the default.
//==========================================================================================================
uint64_t ResolveRequestTimeoutMs(const std::optional<uint64_t>& explicitMs);

} // namespace mcphost
