//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.cpp
// Purpose: MCP client implementation - handshake, tools/list, tools/call and lifecycle
//==========================================================================================================

#include <atomic>
#include <mutex>
#include <stdexcept>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcphost/Client.h"
#include "mcphost/SSETransport.hpp"
#include "mcphost/StdioTransport.hpp"
#include "mcphost/errors/Errors.h"
#include "mcphost/version.h"

namespace mcphost {

const char* clientStateName(ClientState state) {
    switch (state) {
        case ClientState::Connected: return "Connected";
        case ClientState::Ready: return "Ready";
        case ClientState::Closed: return "Closed";
    }
    return "Unknown";
}

class Client::Impl {
public:
    std::string serverName;
    std::shared_ptr<ITransport> transport;

    mutable std::mutex mutex;
    ClientState state{ClientState::Connected};
    std::optional<InitializeResult> serverInfo;
    std::vector<McpToolDef> tools;
    // Shared with the transport's notification handler, which may outlive this Impl briefly
    std::shared_ptr<std::atomic<bool>> toolsStale{std::make_shared<std::atomic<bool>>(false)};

    Impl(const std::string& name, std::shared_ptr<ITransport> t)
        : serverName(name), transport(std::move(t)) {}

    void ensureReady() const {
        std::lock_guard<std::mutex> lk(mutex);
        if (state != ClientState::Ready) {
            throw McpException(ErrorKind::NotReady,
                               fmt::format("MCP client for '{}' is not ready (state: {})", serverName,
                                           clientStateName(state)));
        }
    }

    const JSONValue& requireResult(const JSONRPCResponse& resp, const char* method) const {
        if (!resp.result.has_value()) {
            throw McpException(ErrorKind::DecodeError,
                               fmt::format("MCP {} for '{}' returned no result", method, serverName));
        }
        return resp.result.value();
    }
};

Client::Client(const std::string& serverName, std::shared_ptr<ITransport> transport)
    : pImpl(std::make_unique<Impl>(serverName, std::move(transport))) {
    FUNC_SCOPE();
    auto stale = pImpl->toolsStale;
    const std::string name = serverName;
    pImpl->transport->SetNotificationHandler([stale, name](const JSONRPCNotification& n) {
        if (n.method == Methods::ToolListChanged) {
            LOG_INFO("MCP server '{}' reports its tool list changed", name);
            stale->store(true);
        } else {
            LOG_DEBUG("MCP server '{}' sent notification '{}'", name, n.method);
        }
    });
}

Client::~Client() {
    FUNC_SCOPE();
    pImpl->transport->SetNotificationHandler(nullptr);
    Shutdown();
}

std::shared_ptr<Client> Client::Create(const std::string& serverName, std::shared_ptr<ITransport> transport) {
    FUNC_SCOPE();
    if (!transport) {
        throw std::invalid_argument("Client::Create requires a transport");
    }
    return std::shared_ptr<Client>(new Client(serverName, std::move(transport)));
}

std::shared_ptr<Client> Client::Connect(const std::string& serverName,
                                        const std::string& command,
                                        const std::vector<std::string>& args,
                                        const std::map<std::string, std::string>& env) {
    FUNC_SCOPE();
    LOG_INFO("Connecting to MCP server '{}' (command: {}, {} args)", serverName, command, args.size());
    StdioTransport::Options opts;
    opts.command = command;
    opts.args = args;
    opts.env = env;
    auto client = Create(serverName, std::make_shared<StdioTransport>(opts));
    (void)client->Initialize();
    return client;
}

std::shared_ptr<Client> Client::ConnectSse(const std::string& serverName, const std::string& url) {
    FUNC_SCOPE();
    LOG_INFO("Connecting to MCP server '{}' via SSE ({})", serverName, url);
    SSETransport::Options opts;
    opts.url = url;
    auto client = Create(serverName, std::make_shared<SSETransport>(opts));
    (void)client->Initialize();
    return client;
}

InitializeResult Client::Initialize() {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        if (pImpl->state != ClientState::Connected) {
            throw McpException(ErrorKind::NotReady,
                               fmt::format("MCP client for '{}' cannot initialize (state: {})", pImpl->serverName,
                                           clientStateName(pImpl->state)));
        }
    }

    InitializeResult result;
    try {
        const Implementation clientInfo{"mcphost", getVersionString()};
        auto resp = pImpl->transport->Request(Methods::Initialize, EncodeInitializeParams(clientInfo));
        result = DecodeInitializeResult(pImpl->requireResult(resp, Methods::Initialize));
        if (result.protocolVersion != PROTOCOL_VERSION) {
            LOG_WARN("MCP server '{}' negotiated protocol {} (requested {})", pImpl->serverName,
                     result.protocolVersion, PROTOCOL_VERSION);
        }
        pImpl->transport->Notify(Methods::Initialized);
    } catch (const McpException& e) {
        LOG_WARN("MCP initialize handshake with '{}' failed: {}", pImpl->serverName, e.what());
        throw McpException(ErrorKind::HandshakeFailure,
                           fmt::format("MCP handshake with '{}' failed: {}", pImpl->serverName, e.what()));
    }

    LOG_INFO("MCP server '{}' initialized (protocol {}, server {} {})", pImpl->serverName, result.protocolVersion,
             result.serverInfo.name, result.serverInfo.version);
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    if (pImpl->state == ClientState::Connected) {
        pImpl->state = ClientState::Ready;
    }
    pImpl->serverInfo = result;
    return result;
}

std::optional<InitializeResult> Client::GetServerInfo() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->serverInfo;
}

bool Client::IsToolListStale() const {
    return pImpl->toolsStale->load();
}

std::string Client::GetServerName() const {
    return pImpl->serverName;
}

ClientState Client::GetState() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->state;
}

std::vector<McpToolDef> Client::GetTools() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->tools;
}

std::vector<McpToolDef> Client::ListTools() {
    FUNC_SCOPE();
    pImpl->ensureReady();
    // Cleared before the request so a list_changed racing with it marks the new list stale again
    pImpl->toolsStale->store(false);
    auto resp = pImpl->transport->Request(Methods::ListTools);
    auto tools = DecodeToolsListResult(pImpl->requireResult(resp, Methods::ListTools));
    LOG_DEBUG("Fetched {} MCP tools from '{}'", tools.size(), pImpl->serverName);

    std::lock_guard<std::mutex> lk(pImpl->mutex);
    pImpl->tools = tools;
    return tools;
}

ToolsCallResult Client::CallTool(const std::string& name, const JSONValue& arguments) {
    FUNC_SCOPE();
    pImpl->ensureReady();
    auto resp = pImpl->transport->Request(Methods::CallTool, EncodeCallToolParams(name, arguments));
    auto result = DecodeToolsCallResult(pImpl->requireResult(resp, Methods::CallTool));
    LOG_DEBUG("MCP tool '{}' on '{}' returned {} content block(s){}", name, pImpl->serverName,
              result.content.size(), result.isError ? " (isError)" : "");
    return result;
}

bool Client::IsAlive() {
    return pImpl->transport->IsAlive();
}

void Client::Shutdown() {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        if (pImpl->state == ClientState::Closed) {
            return;
        }
        pImpl->state = ClientState::Closed;
    }
    LOG_INFO("Shutting down MCP client for '{}'", pImpl->serverName);
    pImpl->transport->Kill();
}

} // namespace mcphost
