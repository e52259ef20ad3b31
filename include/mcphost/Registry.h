//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Registry.h
// Purpose: Persisted registry of MCP server configurations (add/remove/enable/disable)
//==========================================================================================================

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mcphost {

enum class TransportKind {
    Stdio,
    Sse
};

// "stdio" / "sse"
const char* transportKindName(TransportKind kind);
std::optional<TransportKind> parseTransportKind(const std::string& name);

//==========================================================================================================
// ServerConfig
// Purpose: Connection settings for one MCP server.
// Fields:
//   command/args/env: Process to spawn (stdio). env entries are merged over the inherited environment.
//   enabled: Disabled servers are kept but not started or restarted.
//   transport: Stdio requires a non-empty command; Sse requires a non-empty url.
//   url: Endpoint for Sse.
//==========================================================================================================
struct ServerConfig {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool enabled{true};
    TransportKind transport{TransportKind::Stdio};
    std::optional<std::string> url;

    bool operator==(const ServerConfig& other) const;
    bool operator!=(const ServerConfig& other) const { return !(*this == other); }
};

//==========================================================================================================
// ValidateServerConfig
// Throws:
//   std::invalid_argument when the command/url requirement for the transport kind is not met.
//==========================================================================================================
void ValidateServerConfig(const ServerConfig& config);

// $HOME/.mcphost/mcp-servers.json
std::string DefaultRegistryPath();

//==========================================================================================================
// Registry
// Purpose: name -> ServerConfig map persisted as {"servers": {...}}. Every mutation rewrites the whole file.
//          Not synchronized; concurrent mutation must be serialized by the owner.
//==========================================================================================================
class Registry {
public:
    // Empty registry without a backing file (Save and mutations throw until one is loaded).
    Registry();
    ~Registry();
    Registry(Registry&&) noexcept;
    Registry& operator=(Registry&&) noexcept;
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    //==========================================================================================================
    // Load
    // Purpose: Reads the registry at path. A missing file yields an empty registry bound to that path.
    // Throws:
    //   std::runtime_error when the file cannot be read, is not valid JSON, or holds an invalid entry.
    //==========================================================================================================
    static Registry Load(const std::string& path);

    //==========================================================================================================
    // Save
    // Purpose: Writes pretty-printed JSON (sorted names) to the backing path, creating parent directories.
    // Throws:
    //   std::runtime_error when no path is set or the write fails.
    //==========================================================================================================
    void Save() const;

    //==========================================================================================================
    // Add
    // Purpose: Inserts or replaces a server, then saves.
    // Throws:
    //   std::invalid_argument for an empty name or invalid config; std::runtime_error from Save.
    //==========================================================================================================
    void Add(const std::string& name, const ServerConfig& config);

    // Returns false when the name is unknown (nothing is saved then).
    bool Remove(const std::string& name);
    bool Enable(const std::string& name);
    bool Disable(const std::string& name);

    // Sorted server names.
    std::vector<std::string> List() const;
    std::optional<ServerConfig> Get(const std::string& name) const;
    std::vector<std::pair<std::string, ServerConfig>> EnabledServers() const;

    const std::optional<std::string>& GetPath() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphost
