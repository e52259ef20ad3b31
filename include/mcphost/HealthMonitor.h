//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HealthMonitor.h
// Purpose: Polls MCP server health, publishes status changes and restarts crashed servers with backoff
//==========================================================================================================

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "mcphost/JSONRPCTypes.h"

namespace mcphost {

//==========================================================================================================
// ServerStatus
// Fields:
//   name: Server name.
//   state: Open set; the monitor acts on "running" and "dead".
//   enabled: Disabled servers are never restarted.
//   toolCount: Number of tools the server currently exposes.
//==========================================================================================================
struct ServerStatus {
    std::string name;
    std::string state;
    bool enabled{true};
    std::size_t toolCount{0};
};

// [{name, state, enabled, tool_count}, ...]
JSONValue EncodeStatusList(const std::vector<ServerStatus>& statuses);

//==========================================================================================================
// IServerManager
// Purpose: The owner of running servers, as seen by the monitor.
//==========================================================================================================
class IServerManager {
public:
    virtual ~IServerManager() = default;
    virtual std::vector<ServerStatus> StatusAll() = 0;

    // Throws on failure.
    virtual void RestartServer(const std::string& name) = 0;
};

//==========================================================================================================
// IEventSink
// Purpose: Broadcast bus accepting topic + JSON payload.
//==========================================================================================================
class IEventSink {
public:
    virtual ~IEventSink() = default;
    virtual void Publish(const std::string& topic, const JSONValue& payload) = 0;
};

// Invoked after a successful restart so the tool set can be re-synced.
using ToolSyncHook = std::function<void()>;

constexpr const char* StatusTopic = "mcp.status";

class HealthMonitor {
public:
    using Clock = std::chrono::steady_clock;

    struct Options {
        std::chrono::milliseconds pollInterval{std::chrono::seconds(30)};
        uint32_t maxAttempts{5};
        std::chrono::milliseconds baseBackoff{std::chrono::seconds(5)};
        std::chrono::milliseconds maxBackoff{std::chrono::seconds(300)};
    };

    HealthMonitor(std::shared_ptr<IServerManager> manager,
                  std::shared_ptr<IEventSink> sink,
                  ToolSyncHook toolSync,
                  Options options);
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    //==========================================================================================================
    // Poll
    // Purpose: One monitoring tick at the given instant:
    //   - running -> dead on an enabled server opens a restart budget; while the server stays dead and
    //     enabled the budget is re-evaluated every tick, attempting a restart once the backoff has elapsed.
    //   - After maxAttempts attempts a single give-up warning is logged.
    //   - Reaching "running" discards the budget; servers no longer listed are forgotten.
    //   - Any state change publishes the full status list on "mcp.status".
    //   Errors (including manager failures) are logged and never escape.
    //==========================================================================================================
    void Poll(Clock::time_point now);

    // Runs Poll every pollInterval on a background thread until Stop().
    void Start();
    void Stop();
    bool IsRunning() const;

    // min(baseBackoff * 2^count, maxBackoff)
    std::chrono::milliseconds BackoffFor(uint32_t count) const;

    // Restart attempts recorded for a server, when it has a budget open.
    std::optional<uint32_t> RestartCount(const std::string& name) const;

private:
    struct RestartState {
        uint32_t count{0};
        Clock::time_point lastAttempt;
    };

    void tick(Clock::time_point now);
    void evaluateRestart(const std::string& name, RestartState& rs, Clock::time_point now);
    void run();

    std::shared_ptr<IServerManager> manager;
    std::shared_ptr<IEventSink> sink;
    ToolSyncHook toolSync;
    Options options;

    // Owned by the polling context
    std::unordered_map<std::string, std::string> prevStates;
    std::unordered_map<std::string, RestartState> restartStates;

    mutable std::mutex loopMutex;
    std::condition_variable loopCv;
    bool stopRequested{false};
    std::thread loopThread;
};

} // namespace mcphost
