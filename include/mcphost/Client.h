//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.h
// Purpose: MCP client - handshake state machine plus tools/list and tools/call over one transport
//==========================================================================================================

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcphost/JSONRPCTypes.h"
#include "mcphost/Protocol.h"
#include "mcphost/Transport.h"

namespace mcphost {

//==========================================================================================================
// ClientState
// Purpose: Connected is initial (transport up, no handshake); Ready follows a successful handshake;
//          Closed is terminal and reached only through Shutdown().
//==========================================================================================================
enum class ClientState {
    Connected,
    Ready,
    Closed
};

const char* clientStateName(ClientState state);

//==========================================================================================================
// MCP Client interface
// Purpose: The operations a tool bridge or manager needs from one connected server.
//==========================================================================================================
class IClient {
public:
    virtual ~IClient() = default;

    virtual std::string GetServerName() const = 0;
    virtual ClientState GetState() const = 0;

    // Cached tool list from the last ListTools() (or the one issued by Connect).
    virtual std::vector<McpToolDef> GetTools() const = 0;

    ////////////////////////////////////////// Tool operations /////////////////////////////////////////////////
    //==========================================================================================================
    // Sends tools/list and replaces the cached tool list wholesale.
    // Returns:
    //   The new tool list.
    // Throws:
    //   McpException(NotReady) outside Ready; transport errors from the request.
    //==========================================================================================================
    virtual std::vector<McpToolDef> ListTools() = 0;

    //==========================================================================================================
    // Sends tools/call with {name, arguments}.
    // Args:
    //   name: Tool name as advertised by the server.
    //   arguments: JSON object with the tool parameters.
    // Returns:
    //   The decoded ToolsCallResult (isError is reported, not thrown).
    // Throws:
    //   McpException(NotReady) outside Ready; ProtocolError/Timeout/Transport* from the request.
    //==========================================================================================================
    virtual ToolsCallResult CallTool(const std::string& name, const JSONValue& arguments) = 0;

    ////////////////////////////////////////// Connection lifecycle //////////////////////////////////////////
    virtual bool IsAlive() = 0;

    // Moves to Closed and kills the transport. Safe to call more than once.
    virtual void Shutdown() = 0;
};

// Standard MCP Client implementation
class Client : public IClient {
public:
    //==========================================================================================================
    // Connect
    // Purpose: Spawns a stdio server and performs the handshake.
    // Args:
    //   serverName: Logical name used in logs, errors and bridged tool names.
    //   command/args/env: Process to spawn; env entries are merged over the inherited environment.
    // Returns:
    //   A Ready client.
    // Throws:
    //   McpException(SpawnFailure) or McpException(HandshakeFailure).
    //==========================================================================================================
    static std::shared_ptr<Client> Connect(const std::string& serverName,
                                           const std::string& command,
                                           const std::vector<std::string>& args,
                                           const std::map<std::string, std::string>& env);

    //==========================================================================================================
    // ConnectSse
    // Purpose: Same as Connect over the Streamable HTTP transport.
    // Throws:
    //   McpException(TransportError) for a bad URL, McpException(HandshakeFailure) otherwise.
    //==========================================================================================================
    static std::shared_ptr<Client> ConnectSse(const std::string& serverName, const std::string& url);

    //==========================================================================================================
    // Create
    // Purpose: Wraps an existing transport in a Connected client without performing the handshake.
    //==========================================================================================================
    static std::shared_ptr<Client> Create(const std::string& serverName, std::shared_ptr<ITransport> transport);

    ~Client() override;

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    //==========================================================================================================
    // Initialize
    // Purpose: initialize request, decode InitializeResult, notifications/initialized, then Ready.
    // Returns:
    //   The server's InitializeResult.
    // Throws:
    //   McpException(HandshakeFailure) naming the server; the client then stays Connected and should be
    //   discarded. McpException(NotReady) when called outside Connected.
    //==========================================================================================================
    InitializeResult Initialize();

    std::optional<InitializeResult> GetServerInfo() const;

    // True once the server sent notifications/tools/list_changed since the last ListTools().
    bool IsToolListStale() const;

    ////////////////////////////////////////// IClient implementation //////////////////////////////////////////
    std::string GetServerName() const override;
    ClientState GetState() const override;
    std::vector<McpToolDef> GetTools() const override;
    std::vector<McpToolDef> ListTools() override;
    ToolsCallResult CallTool(const std::string& name, const JSONValue& arguments) override;
    bool IsAlive() override;
    void Shutdown() override;

private:
    Client(const std::string& serverName, std::shared_ptr<ITransport> transport);

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphost
