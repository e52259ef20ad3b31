//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Registry.cpp
// Purpose: MCP server registry - JSON file load/save and mutations
//==========================================================================================================

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcphost/JSONRPCTypes.h"
#include "mcphost/Registry.h"

namespace mcphost {

namespace fs = std::filesystem;

namespace {
//////////////////////////////////////////// Decoding helpers ////////////////////////////////////////////
[[noreturn]] void malformed(const std::string& name, const std::string& what) {
    throw std::runtime_error(fmt::format("server '{}': {}", name, what));
}

std::string stringField(const JSONValue& obj, const char* key, const std::string& name) {
    const JSONValue* v = obj.Find(key);
    if (v == nullptr || v->IsNull()) {
        return std::string();
    }
    if (!v->IsString()) {
        malformed(name, fmt::format("'{}' must be a string", key));
    }
    return std::get<std::string>(v->value);
}

ServerConfig decodeServerConfig(const std::string& name, const JSONValue& obj) {
    if (!obj.IsObject()) {
        malformed(name, "entry must be an object");
    }
    ServerConfig cfg;
    cfg.command = stringField(obj, "command", name);

    if (const JSONValue* args = obj.Find("args"); args != nullptr && !args->IsNull()) {
        if (!args->IsArray()) {
            malformed(name, "'args' must be an array of strings");
        }
        for (const auto& item : std::get<JSONValue::Array>(args->value)) {
            if (!item || !item->IsString()) {
                malformed(name, "'args' must be an array of strings");
            }
            cfg.args.push_back(std::get<std::string>(item->value));
        }
    }

    if (const JSONValue* env = obj.Find("env"); env != nullptr && !env->IsNull()) {
        if (!env->IsObject()) {
            malformed(name, "'env' must be an object of strings");
        }
        for (const auto& [key, value] : std::get<JSONValue::Object>(env->value)) {
            if (!value || !value->IsString()) {
                malformed(name, fmt::format("env '{}' must be a string", key));
            }
            cfg.env[key] = std::get<std::string>(value->value);
        }
    }

    if (const JSONValue* enabled = obj.Find("enabled"); enabled != nullptr && !enabled->IsNull()) {
        if (!std::holds_alternative<bool>(enabled->value)) {
            malformed(name, "'enabled' must be a boolean");
        }
        cfg.enabled = std::get<bool>(enabled->value);
    }

    const std::string transport = stringField(obj, "transport", name);
    if (!transport.empty()) {
        auto kind = parseTransportKind(transport);
        if (!kind) {
            malformed(name, fmt::format("unknown transport '{}'", transport));
        }
        cfg.transport = *kind;
    }

    if (const JSONValue* url = obj.Find("url"); url != nullptr && !url->IsNull()) {
        if (!url->IsString()) {
            malformed(name, "'url' must be a string");
        }
        cfg.url = std::get<std::string>(url->value);
    }
    return cfg;
}

JSONValue encodeServerConfig(const ServerConfig& cfg) {
    JSONValue::Object obj;
    obj["command"] = std::make_shared<JSONValue>(cfg.command);
    JSONValue::Array args;
    for (const auto& a : cfg.args) {
        args.push_back(std::make_shared<JSONValue>(a));
    }
    obj["args"] = std::make_shared<JSONValue>(std::move(args));
    JSONValue::Object env;
    for (const auto& [k, v] : cfg.env) {
        env[k] = std::make_shared<JSONValue>(v);
    }
    obj["env"] = std::make_shared<JSONValue>(std::move(env));
    obj["enabled"] = std::make_shared<JSONValue>(cfg.enabled);
    obj["transport"] = std::make_shared<JSONValue>(transportKindName(cfg.transport));
    if (cfg.url) {
        obj["url"] = std::make_shared<JSONValue>(*cfg.url);
    }
    return JSONValue{std::move(obj)};
}
} // namespace

const char* transportKindName(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Sse: return "sse";
    }
    return "stdio";
}

std::optional<TransportKind> parseTransportKind(const std::string& name) {
    if (name == "stdio") {
        return TransportKind::Stdio;
    }
    if (name == "sse") {
        return TransportKind::Sse;
    }
    return std::nullopt;
}

bool ServerConfig::operator==(const ServerConfig& other) const {
    return command == other.command && args == other.args && env == other.env && enabled == other.enabled &&
           transport == other.transport && url == other.url;
}

void ValidateServerConfig(const ServerConfig& config) {
    const bool hasUrl = config.url.has_value() && !config.url->empty();
    if (config.transport == TransportKind::Sse) {
        if (!hasUrl) {
            throw std::invalid_argument("sse transport requires a non-empty url");
        }
        if (!config.command.empty()) {
            throw std::invalid_argument("command is only valid for the stdio transport");
        }
    } else {
        if (config.command.empty()) {
            throw std::invalid_argument("stdio transport requires a non-empty command");
        }
        if (hasUrl) {
            throw std::invalid_argument("url is only valid for the sse transport");
        }
    }
}

std::string DefaultRegistryPath() {
    const std::string home = GetEnvOrDefault("HOME", ".");
    return (fs::path(home) / ".mcphost" / "mcp-servers.json").string();
}

class Registry::Impl {
public:
    std::map<std::string, ServerConfig> servers;
    std::optional<std::string> path;
};

Registry::Registry() : pImpl(std::make_unique<Impl>()) {}
Registry::~Registry() = default;
Registry::Registry(Registry&&) noexcept = default;
Registry& Registry::operator=(Registry&&) noexcept = default;

Registry Registry::Load(const std::string& path) {
    FUNC_SCOPE();
    Registry registry;
    registry.pImpl->path = path;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        LOG_DEBUG("MCP registry file {} not found, using empty registry", path);
        return registry;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error(fmt::format("failed to read MCP registry: {}", path));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    try {
        JSONValue doc = ParseJSON(buffer.str());
        if (!doc.IsObject()) {
            throw std::runtime_error("top-level value must be an object");
        }
        if (const JSONValue* servers = doc.Find("servers"); servers != nullptr && !servers->IsNull()) {
            if (!servers->IsObject()) {
                throw std::runtime_error("'servers' must be an object");
            }
            for (const auto& [name, entry] : std::get<JSONValue::Object>(servers->value)) {
                ServerConfig cfg = decodeServerConfig(name, entry ? *entry : JSONValue());
                try {
                    ValidateServerConfig(cfg);
                } catch (const std::invalid_argument& e) {
                    malformed(name, e.what());
                }
                registry.pImpl->servers.emplace(name, std::move(cfg));
            }
        }
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(fmt::format("failed to parse MCP registry {}: {}", path, e.what()));
    }
    LOG_DEBUG("Loaded {} MCP server(s) from {}", registry.pImpl->servers.size(), path);
    return registry;
}

void Registry::Save() const {
    FUNC_SCOPE();
    if (!pImpl->path) {
        throw std::runtime_error("no path set for MCP registry");
    }
    const fs::path target(*pImpl->path);

    JSONValue::Object servers;
    for (const auto& [name, cfg] : pImpl->servers) {
        servers[name] = std::make_shared<JSONValue>(encodeServerConfig(cfg));
    }
    JSONValue::Object doc;
    doc["servers"] = std::make_shared<JSONValue>(std::move(servers));
    const std::string text = SerializeJSON(JSONValue{std::move(doc)}, 2) + "\n";

    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw std::runtime_error(fmt::format("failed to create {}: {}", target.parent_path().string(), ec.message()));
        }
    }
    // Write-then-rename so readers never observe a half-written file
    const fs::path tmp = target.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error(fmt::format("failed to open {} for writing", tmp.string()));
        }
        out << text;
        out.flush();
        if (!out) {
            throw std::runtime_error(fmt::format("failed to write {}", tmp.string()));
        }
    }
    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw std::runtime_error(fmt::format("failed to replace MCP registry {}", target.string()));
    }
    LOG_INFO("Saved MCP registry {} ({} server(s))", target.string(), pImpl->servers.size());
}

void Registry::Add(const std::string& name, const ServerConfig& config) {
    FUNC_SCOPE();
    if (name.empty()) {
        throw std::invalid_argument("MCP server name must not be empty");
    }
    ValidateServerConfig(config);
    LOG_INFO("Adding MCP server '{}' ({})", name,
             config.transport == TransportKind::Sse ? config.url.value_or("") : config.command);
    pImpl->servers[name] = config;
    Save();
}

bool Registry::Remove(const std::string& name) {
    FUNC_SCOPE();
    if (pImpl->servers.erase(name) == 0) {
        return false;
    }
    LOG_INFO("Removed MCP server '{}'", name);
    Save();
    return true;
}

bool Registry::Enable(const std::string& name) {
    auto it = pImpl->servers.find(name);
    if (it == pImpl->servers.end()) {
        return false;
    }
    it->second.enabled = true;
    Save();
    return true;
}

bool Registry::Disable(const std::string& name) {
    auto it = pImpl->servers.find(name);
    if (it == pImpl->servers.end()) {
        return false;
    }
    it->second.enabled = false;
    Save();
    return true;
}

std::vector<std::string> Registry::List() const {
    std::vector<std::string> names;
    names.reserve(pImpl->servers.size());
    for (const auto& kv : pImpl->servers) {
        names.push_back(kv.first);
    }
    return names;
}

std::optional<ServerConfig> Registry::Get(const std::string& name) const {
    auto it = pImpl->servers.find(name);
    if (it == pImpl->servers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::pair<std::string, ServerConfig>> Registry::EnabledServers() const {
    std::vector<std::pair<std::string, ServerConfig>> out;
    for (const auto& [name, cfg] : pImpl->servers) {
        if (cfg.enabled) {
            out.emplace_back(name, cfg);
        }
    }
    return out;
}

const std::optional<std::string>& Registry::GetPath() const {
    return pImpl->path;
}

} // namespace mcphost
