//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: MCP host example CLI - manage the server registry, list and call tools, watch server health
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcphost/Client.h"
#include "mcphost/HealthMonitor.h"
#include "mcphost/JSONRPCTypes.h"
#include "mcphost/Registry.h"
#include "mcphost/ToolBridge.h"
#include "mcphost/errors/Errors.h"
#include "mcphost/version.h"

using namespace mcphost;

namespace {
std::atomic<bool> gInterrupted{false};

void onSignal(int) {
    gInterrupted.store(true);
}

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--registry")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.rfind("--", 0) == 0) {
            if (a.substr(0, eq) == key) {
                return a.substr(eq + 1);
            }
        }
    }
    return std::nullopt;
}

// Positional arguments after stripping --key=value options (everything after "--" is kept verbatim).
std::vector<std::string> positionalArgs(int argc, char** argv) {
    std::vector<std::string> out;
    bool verbatim = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (!verbatim && a.rfind("--", 0) == 0 && a.find('=') != std::string::npos) {
            continue;
        }
        if (a == "--" && !verbatim) {
            verbatim = true;
        }
        out.push_back(a);
    }
    return out;
}

void printUsage() {
    std::cerr
        << "mcphost-cli " << getVersionString() << "\n"
        << "usage: mcphost-cli [--registry=<path>] <command> [args]\n"
        << "  list\n"
        << "  add <name> [--sse <url>] [--env K=V]... [-- <command> [args...]]\n"
        << "  remove <name>\n"
        << "  enable <name>\n"
        << "  disable <name>\n"
        << "  tools <name>\n"
        << "  call <name> <tool> [json-arguments]\n"
        << "  watch\n";
}

std::shared_ptr<Client> connectServer(const std::string& name, const ServerConfig& cfg) {
    if (cfg.transport == TransportKind::Sse) {
        return Client::ConnectSse(name, cfg.url.value_or(""));
    }
    return Client::Connect(name, cfg.command, cfg.args, cfg.env);
}

////////////////////////////////////////////// Commands //////////////////////////////////////////////

int cmdList(const Registry& registry) {
    const auto names = registry.List();
    if (names.empty()) {
        std::cout << "(no MCP servers configured)\n";
        return 0;
    }
    for (const auto& name : names) {
        const auto cfg = registry.Get(name).value();
        std::string target = cfg.transport == TransportKind::Sse ? cfg.url.value_or("") : cfg.command;
        for (const auto& a : cfg.args) {
            target += " " + a;
        }
        std::cout << name << "\t" << (cfg.enabled ? "enabled" : "disabled") << "\t"
                  << transportKindName(cfg.transport) << "\t" << target << "\n";
    }
    return 0;
}

int cmdAdd(Registry& registry, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        printUsage();
        return 2;
    }
    const std::string& name = args[1];
    ServerConfig cfg;
    std::size_t i = 2;
    for (; i < args.size(); ++i) {
        if (args[i] == "--") {
            ++i;
            break;
        }
        if (args[i] == "--sse" && i + 1 < args.size()) {
            cfg.transport = TransportKind::Sse;
            cfg.url = args[++i];
        } else if (args[i] == "--env" && i + 1 < args.size()) {
            const std::string& kv = args[++i];
            auto eq = kv.find('=');
            if (eq == std::string::npos) {
                LOG_ERROR("--env expects K=V, got '{}'", kv);
                return 2;
            }
            cfg.env[kv.substr(0, eq)] = kv.substr(eq + 1);
        } else {
            LOG_ERROR("Unexpected argument '{}'", args[i]);
            return 2;
        }
    }
    if (i < args.size()) {
        cfg.command = args[i++];
        cfg.args.assign(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
    }
    registry.Add(name, cfg);
    std::cout << "added " << name << "\n";
    return 0;
}

int cmdToggle(Registry& registry, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        printUsage();
        return 2;
    }
    const std::string& cmd = args[0];
    const std::string& name = args[1];
    bool found = false;
    if (cmd == "remove") {
        found = registry.Remove(name);
    } else if (cmd == "enable") {
        found = registry.Enable(name);
    } else {
        found = registry.Disable(name);
    }
    if (!found) {
        std::cerr << "unknown MCP server '" << name << "'\n";
        return 1;
    }
    std::cout << cmd << "d " << name << "\n";
    return 0;
}

int cmdTools(const Registry& registry, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        printUsage();
        return 2;
    }
    auto cfg = registry.Get(args[1]);
    if (!cfg) {
        std::cerr << "unknown MCP server '" << args[1] << "'\n";
        return 1;
    }
    auto client = connectServer(args[1], *cfg);
    (void)client->ListTools();
    for (const auto& bridge : McpToolBridge::FromClient(client)) {
        std::cout << bridge->Name() << "\n    " << bridge->Description() << "\n";
    }
    client->Shutdown();
    return 0;
}

int cmdCall(const Registry& registry, const std::vector<std::string>& args) {
    if (args.size() < 3) {
        printUsage();
        return 2;
    }
    auto cfg = registry.Get(args[1]);
    if (!cfg) {
        std::cerr << "unknown MCP server '" << args[1] << "'\n";
        return 1;
    }
    JSONValue arguments{JSONValue::Object{}};
    if (args.size() > 3) {
        arguments = ParseJSON(args[3]);
    }
    auto client = connectServer(args[1], *cfg);
    (void)client->ListTools();
    for (const auto& bridge : McpToolBridge::FromClient(client)) {
        if (bridge->ToolName() == args[2]) {
            JSONValue result = bridge->Execute(arguments);
            std::cout << SerializeJSON(result, 2) << "\n";
            client->Shutdown();
            return 0;
        }
    }
    std::cerr << "server '" << args[1] << "' has no tool '" << args[2] << "'\n";
    client->Shutdown();
    return 1;
}

//==========================================================================================================
// CliServerManager
// Purpose: Minimal manager for `watch`: one client per enabled server, restarted by reconnecting.
//==========================================================================================================
class CliServerManager : public IServerManager {
public:
    explicit CliServerManager(const Registry& registry) {
        for (const auto& [name, cfg] : registry.EnabledServers()) {
            configs.emplace(name, cfg);
            try {
                auto client = connectServer(name, cfg);
                (void)client->ListTools();
                clients[name] = client;
            } catch (const McpException& e) {
                LOG_WARN("Could not start MCP server '{}': {}", name, e.what());
            }
        }
    }

    std::vector<ServerStatus> StatusAll() override {
        std::lock_guard<std::mutex> lk(mutex);
        std::vector<ServerStatus> out;
        for (const auto& [name, cfg] : configs) {
            ServerStatus s;
            s.name = name;
            s.enabled = cfg.enabled;
            auto it = clients.find(name);
            if (it == clients.end()) {
                s.state = "dead";
            } else {
                const auto& client = it->second;
                switch (client->GetState()) {
                    case ClientState::Ready: s.state = client->IsAlive() ? "running" : "dead"; break;
                    case ClientState::Connected: s.state = "connecting"; break;
                    case ClientState::Closed: s.state = "stopped"; break;
                }
                s.toolCount = client->GetTools().size();
            }
            out.push_back(s);
        }
        return out;
    }

    void RestartServer(const std::string& name) override {
        ServerConfig cfg;
        std::shared_ptr<Client> previous;
        {
            std::lock_guard<std::mutex> lk(mutex);
            cfg = configs.at(name);
            auto it = clients.find(name);
            if (it != clients.end()) {
                previous = it->second;
                clients.erase(it);
            }
        }
        if (previous) {
            previous->Shutdown();
        }
        auto client = connectServer(name, cfg);
        (void)client->ListTools();
        std::lock_guard<std::mutex> lk(mutex);
        clients[name] = client;
    }

    std::size_t ToolCount() {
        std::lock_guard<std::mutex> lk(mutex);
        std::size_t n = 0;
        for (const auto& kv : clients) {
            n += kv.second->GetTools().size();
        }
        return n;
    }

private:
    std::mutex mutex;
    std::map<std::string, ServerConfig> configs;
    std::map<std::string, std::shared_ptr<Client>> clients;
};

class StdoutEventSink : public IEventSink {
public:
    void Publish(const std::string& topic, const JSONValue& payload) override {
        std::cout << topic << " " << SerializeJSON(payload) << std::endl;
    }
};

int cmdWatch(const Registry& registry) {
    auto manager = std::make_shared<CliServerManager>(registry);
    HealthMonitor::Options opts;
    opts.pollInterval = std::chrono::milliseconds(GetEnvUintOrDefault("MCPHOST_HEALTH_INTERVAL_MS", 30000));
    HealthMonitor monitor(manager, std::make_shared<StdoutEventSink>(),
                          [manager]() { LOG_INFO("Tool set re-synced ({} tools)", manager->ToolCount()); },
                          opts);
    monitor.Poll(HealthMonitor::Clock::now());
    monitor.Start();
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    while (!gInterrupted.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    monitor.Stop();
    return 0;
}
} // namespace

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::configureFromEnv();

    const auto args = positionalArgs(argc, argv);
    if (args.empty()) {
        printUsage();
        return 2;
    }
    const std::string registryPath = getArgValue(argc, argv, "--registry").value_or(DefaultRegistryPath());
    if (auto logFile = getArgValue(argc, argv, "--log-file"); logFile.has_value()) {
        Logger::setLogFile(*logFile);
    }

    try {
        Registry registry = Registry::Load(registryPath);
        const std::string& cmd = args[0];
        if (cmd == "list") {
            return cmdList(registry);
        }
        if (cmd == "add") {
            return cmdAdd(registry, args);
        }
        if (cmd == "remove" || cmd == "enable" || cmd == "disable") {
            return cmdToggle(registry, args);
        }
        if (cmd == "tools") {
            return cmdTools(registry, args);
        }
        if (cmd == "call") {
            return cmdCall(registry, args);
        }
        if (cmd == "watch") {
            return cmdWatch(registry);
        }
        LOG_ERROR("Unknown command: {}", cmd);
        printUsage();
        return 2;
    } catch (const McpException& e) {
        LOG_ERROR("{} ({})", e.what(), errors::errorKindName(e.kind()));
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("{}", e.what());
        return 1;
    }
}
