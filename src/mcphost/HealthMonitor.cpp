//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HealthMonitor.cpp
// Purpose: MCP health polling loop with bounded exponential-backoff restarts
//==========================================================================================================

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

#include "logging/Logger.h"
#include "mcphost/HealthMonitor.h"

namespace mcphost {

namespace {
constexpr const char* StateRunning = "running";
constexpr const char* StateDead = "dead";
} // namespace

JSONValue EncodeStatusList(const std::vector<ServerStatus>& statuses) {
    JSONValue::Array items;
    for (const auto& s : statuses) {
        JSONValue::Object obj;
        obj["name"] = std::make_shared<JSONValue>(s.name);
        obj["state"] = std::make_shared<JSONValue>(s.state);
        obj["enabled"] = std::make_shared<JSONValue>(s.enabled);
        obj["tool_count"] = std::make_shared<JSONValue>(static_cast<int64_t>(s.toolCount));
        items.push_back(std::make_shared<JSONValue>(std::move(obj)));
    }
    return JSONValue{std::move(items)};
}

HealthMonitor::HealthMonitor(std::shared_ptr<IServerManager> m,
                             std::shared_ptr<IEventSink> s,
                             ToolSyncHook hook,
                             Options opts)
    : manager(std::move(m)), sink(std::move(s)), toolSync(std::move(hook)), options(opts) {
    if (!manager) {
        throw std::invalid_argument("HealthMonitor requires a server manager");
    }
}

HealthMonitor::~HealthMonitor() {
    Stop();
}

std::chrono::milliseconds HealthMonitor::BackoffFor(uint32_t count) const {
    if (count >= 31) {
        return options.maxBackoff;
    }
    const auto scaled = options.baseBackoff * (int64_t{1} << count);
    return std::min<std::chrono::milliseconds>(scaled, options.maxBackoff);
}

std::optional<uint32_t> HealthMonitor::RestartCount(const std::string& name) const {
    auto it = restartStates.find(name);
    if (it == restartStates.end()) {
        return std::nullopt;
    }
    return it->second.count;
}

void HealthMonitor::Poll(Clock::time_point now) {
    try {
        tick(now);
    } catch (const std::exception& e) {
        LOG_ERROR("MCP health check failed: {}", e.what());
    } catch (...) {
        LOG_ERROR("MCP health check failed: unknown exception");
    }
}

void HealthMonitor::tick(Clock::time_point now) {
    const auto statuses = manager->StatusAll();

    bool changed = false;
    std::unordered_set<std::string> present;
    for (const auto& s : statuses) {
        present.insert(s.name);
        auto prevIt = prevStates.find(s.name);
        const bool stateChanged = prevIt == prevStates.end() || prevIt->second != s.state;
        const bool wasRunning = prevIt != prevStates.end() && prevIt->second == StateRunning;

        if (stateChanged) {
            changed = true;
            LOG_DEBUG("MCP server '{}' state {} -> {}", s.name,
                      prevIt == prevStates.end() ? std::string("(new)") : prevIt->second, s.state);
        }

        if (s.state == StateRunning) {
            restartStates.erase(s.name);
        } else if (s.state == StateDead && s.enabled) {
            auto rsIt = restartStates.find(s.name);
            if (rsIt == restartStates.end() && stateChanged && wasRunning) {
                // First crash observation: allow an immediate attempt
                rsIt = restartStates.emplace(s.name, RestartState{0, now - options.maxBackoff}).first;
            }
            if (rsIt != restartStates.end()) {
                evaluateRestart(s.name, rsIt->second, now);
            }
        }
        prevStates[s.name] = s.state;
    }

    // Forget servers the manager no longer reports
    for (auto it = prevStates.begin(); it != prevStates.end();) {
        it = present.count(it->first) ? std::next(it) : prevStates.erase(it);
    }
    for (auto it = restartStates.begin(); it != restartStates.end();) {
        it = present.count(it->first) ? std::next(it) : restartStates.erase(it);
    }

    if (changed && sink) {
        sink->Publish(StatusTopic, EncodeStatusList(statuses));
    }
}

void HealthMonitor::evaluateRestart(const std::string& name, RestartState& rs, Clock::time_point now) {
    if (rs.count < options.maxAttempts) {
        const auto backoff = BackoffFor(rs.count);
        if (now - rs.lastAttempt < backoff) {
            return;
        }
        rs.count += 1;
        rs.lastAttempt = now;
        LOG_INFO("Auto-restarting dead MCP server '{}' (attempt {}/{})", name, rs.count, options.maxAttempts);
        try {
            manager->RestartServer(name);
        } catch (const std::exception& e) {
            LOG_WARN("MCP auto-restart of '{}' failed: {}", name, e.what());
            return;
        } catch (...) {
            LOG_WARN("MCP auto-restart of '{}' failed: unknown exception", name);
            return;
        }
        LOG_INFO("MCP server '{}' auto-restarted", name);
        if (toolSync) {
            try {
                toolSync();
            } catch (const std::exception& e) {
                LOG_WARN("MCP tool sync after restarting '{}' failed: {}", name, e.what());
            } catch (...) {
                LOG_WARN("MCP tool sync after restarting '{}' failed: unknown exception", name);
            }
        }
    } else if (rs.count == options.maxAttempts) {
        LOG_WARN("MCP server '{}' exceeded {} restart attempts, giving up", name, options.maxAttempts);
        rs.count += 1;
    }
}

void HealthMonitor::Start() {
    std::lock_guard<std::mutex> lk(loopMutex);
    if (loopThread.joinable()) {
        return;
    }
    stopRequested = false;
    LOG_INFO("MCP health monitor started (interval {}ms)", options.pollInterval.count());
    loopThread = std::thread([this]() { run(); });
}

void HealthMonitor::Stop() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lk(loopMutex);
        if (!loopThread.joinable()) {
            return;
        }
        stopRequested = true;
        worker = std::move(loopThread);
    }
    loopCv.notify_all();
    if (worker.get_id() == std::this_thread::get_id()) {
        // Stop() from a hook running on the loop thread; run() exits once the hook returns
        worker.detach();
    } else {
        worker.join();
    }
    LOG_INFO("MCP health monitor stopped");
}

bool HealthMonitor::IsRunning() const {
    std::lock_guard<std::mutex> lk(loopMutex);
    return loopThread.joinable() && !stopRequested;
}

void HealthMonitor::run() {
    std::unique_lock<std::mutex> lk(loopMutex);
    while (!stopRequested) {
        if (loopCv.wait_for(lk, options.pollInterval, [this]() { return stopRequested; })) {
            break;
        }
        lk.unlock();
        Poll(Clock::now());
        lk.lock();
    }
}

} // namespace mcphost
