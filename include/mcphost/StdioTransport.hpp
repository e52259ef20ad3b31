//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Transport that spawns an MCP server process and speaks line-delimited JSON-RPC over its stdio
//==========================================================================================================
#pragma once

#include "mcphost/Transport.h"
#include <map>
#include <memory>
#include <optional>
#include <cstdint>
#include <string>
#include <vector>

namespace mcphost {

//==========================================================================================================
// StdioTransport
// Purpose: Spawns `command args...` with piped stdin/stdout/stderr. A stdout reader demultiplexes responses
//          to waiting callers; a stderr reader logs server diagnostics as warnings. POSIX only.
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   command: Executable name or path (resolved through PATH).
    //   args: Arguments passed after the command.
    //   env: Extra variables merged over the inherited environment.
    //   requestTimeoutMs: Per-request timeout; unset uses MCPHOST_REQUEST_TIMEOUT_MS or 30000.
    //==========================================================================================================
    struct Options {
        std::string command;
        std::vector<std::string> args;
        std::map<std::string, std::string> env;
        std::optional<uint64_t> requestTimeoutMs;
    };

    //==========================================================================================================
    // Spawns the child and starts both readers.
    // Throws:
    //   McpException(SpawnFailure) when the process cannot be started.
    //==========================================================================================================
    explicit StdioTransport(const Options& opts);
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    JSONRPCResponse Request(const std::string& method, std::optional<JSONValue> params = std::nullopt) override;
    void Notify(const std::string& method, std::optional<JSONValue> params = std::nullopt) override;

    //==========================================================================================================
    // Non-blocking waitpid probe; reaps the child when it has exited.
    //==========================================================================================================
    bool IsAlive() override;

    //==========================================================================================================
    // Stops the readers, SIGKILLs and reaps the child, and fails every pending request.
    //==========================================================================================================
    void Kill() override;

    void SetRequestTimeoutMs(uint64_t timeoutMs) override;
    std::string GetSessionId() const override;
    void SetNotificationHandler(NotificationHandler handler) override;

    // Child process id (diagnostics and tests).
    int GetPid() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphost
