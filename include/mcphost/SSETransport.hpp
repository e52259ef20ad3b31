//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SSETransport.hpp
// Purpose: Streamable HTTP (POST + JSON / text/event-stream) transport for remote MCP servers
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcphost/Transport.h"

namespace mcphost {

class SSETransport : public ITransport {
public:
    //==========================================================================================================
    // Options
    // Purpose: Configuration for the remote endpoint and TLS verification.
    // Fields:
    //   url: Full endpoint URL, http:// or https:// (e.g., https://mcp.example.com/mcp)
    //   connectTimeoutMs: TCP (and TLS handshake) connect timeout in milliseconds
    //   requestTimeoutMs: Per-request timeout; unset uses MCPHOST_REQUEST_TIMEOUT_MS or 30000
    //   caFile/caPath: Optional CA bundle/path for the trust store (https only)
    //==========================================================================================================
    struct Options {
        std::string url;
        unsigned int connectTimeoutMs{10000};
        std::optional<uint64_t> requestTimeoutMs;
        std::string caFile;
        std::string caPath;
    };

    //==========================================================================================================
    // Starts the I/O thread. No connection is made until the first request.
    // Throws:
    //   McpException(TransportError) for an unsupported or malformed URL, or unusable CA settings.
    //==========================================================================================================
    explicit SSETransport(const Options& opts);
    ~SSETransport() override;

    SSETransport(const SSETransport&) = delete;
    SSETransport& operator=(const SSETransport&) = delete;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    JSONRPCResponse Request(const std::string& method, std::optional<JSONValue> params = std::nullopt) override;
    void Notify(const std::string& method, std::optional<JSONValue> params = std::nullopt) override;

    // True when not killed and the last HTTP exchange reached the server.
    bool IsAlive() override;
    void Kill() override;
    void SetRequestTimeoutMs(uint64_t timeoutMs) override;

    // Mcp-Session-Id assigned by the server (empty until one is received).
    std::string GetSessionId() const override;
    void SetNotificationHandler(NotificationHandler handler) override;

    const std::string& GetUrl() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// ParseSseEvents
// Purpose: Splits a text/event-stream body into event payloads. Multiple data: lines of one event are joined
//          with '\n'; comments and other fields are ignored; events without data are skipped.
//==========================================================================================================
std::vector<std::string> ParseSseEvents(const std::string& body);

} // namespace mcphost
