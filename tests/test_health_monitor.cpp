//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_health_monitor.cpp
// Purpose: HealthMonitor restart budget, backoff, pruning and status publishing with an injected clock
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "logging/Logger.h"
#include "mcphost/HealthMonitor.h"

using namespace mcphost;
using namespace std::chrono_literals;
using Clock = HealthMonitor::Clock;

namespace {
class FakeManager : public IServerManager {
public:
    std::vector<ServerStatus> StatusAll() override {
        std::lock_guard<std::mutex> lk(mutex);
        ++statusCalls;
        if (failStatus) {
            throw std::runtime_error("manager unavailable");
        }
        if (failStatusNonStd) {
            throw 42;
        }
        return statuses;
    }

    void RestartServer(const std::string& name) override {
        std::lock_guard<std::mutex> lk(mutex);
        restarts.push_back(name);
        restartTimes.push_back(currentTime);
        if (failRestart) {
            throw std::runtime_error("spawn failed");
        }
        if (failRestartNonStd) {
            throw std::string("spawn failed");
        }
    }

    void set(const std::string& name, const std::string& state, bool enabled = true) {
        std::lock_guard<std::mutex> lk(mutex);
        for (auto& s : statuses) {
            if (s.name == name) {
                s.state = state;
                s.enabled = enabled;
                return;
            }
        }
        statuses.push_back(ServerStatus{name, state, enabled, 0});
    }

    void drop(const std::string& name) {
        std::lock_guard<std::mutex> lk(mutex);
        for (auto it = statuses.begin(); it != statuses.end(); ++it) {
            if (it->name == name) {
                statuses.erase(it);
                return;
            }
        }
    }

    std::mutex mutex;
    std::vector<ServerStatus> statuses;
    std::vector<std::string> restarts;
    std::vector<Clock::time_point> restartTimes;
    Clock::time_point currentTime;
    bool failStatus{false};
    bool failRestart{false};
    bool failStatusNonStd{false};
    bool failRestartNonStd{false};
    int statusCalls{0};
};

class RecordingSink : public IEventSink {
public:
    void Publish(const std::string& topic, const JSONValue& payload) override {
        topics.push_back(topic);
        payloads.push_back(payload);
    }
    std::vector<std::string> topics;
    std::vector<JSONValue> payloads;
};

class LogCounter {
public:
    LogCounter(std::string level, std::string needle) : level_(std::move(level)), needle_(std::move(needle)) {
        Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);
        Logger::setSink([this](const char* lvl, const std::string& msg) {
            if (level_ == lvl && msg.find(needle_) != std::string::npos) {
                count_.fetch_add(1);
            }
        });
    }
    ~LogCounter() { Logger::setSink(nullptr); }
    int count() const { return count_.load(); }

private:
    std::string level_;
    std::string needle_;
    std::atomic<int> count_{0};
};

struct HealthMonitorTest : public ::testing::Test {
    void SetUp() override {
        manager = std::make_shared<FakeManager>();
        sink = std::make_shared<RecordingSink>();
        monitor = std::make_unique<HealthMonitor>(manager, sink, [this]() { ++toolSyncs; }, HealthMonitor::Options{});
        t0 = Clock::now();
    }

    void pollAt(Clock::time_point t) {
        manager->currentTime = t;
        monitor->Poll(t);
    }

    std::vector<std::chrono::seconds> restartOffsets(Clock::time_point base) const {
        std::vector<std::chrono::seconds> out;
        for (auto t : manager->restartTimes) {
            out.push_back(std::chrono::duration_cast<std::chrono::seconds>(t - base));
        }
        return out;
    }

    std::shared_ptr<FakeManager> manager;
    std::shared_ptr<RecordingSink> sink;
    std::unique_ptr<HealthMonitor> monitor;
    int toolSyncs{0};
    Clock::time_point t0;
};
} // namespace

TEST_F(HealthMonitorTest, BackoffDoublesAndCaps) {
    EXPECT_EQ(monitor->BackoffFor(0), 5s);
    EXPECT_EQ(monitor->BackoffFor(1), 10s);
    EXPECT_EQ(monitor->BackoffFor(2), 20s);
    EXPECT_EQ(monitor->BackoffFor(3), 40s);
    EXPECT_EQ(monitor->BackoffFor(4), 80s);
    EXPECT_EQ(monitor->BackoffFor(6), 300s);
    EXPECT_EQ(monitor->BackoffFor(10), 300s);
    EXPECT_EQ(monitor->BackoffFor(64), 300s);
}

TEST_F(HealthMonitorTest, DeadServerIsRestartedWithGrowingBackoffThenAbandoned) {
    LogCounter giveUp("WARN", "giving up");
    manager->set("fs", "running");
    pollAt(t0);

    // The server stays dead; every restart "succeeds" but it crashes again right away
    manager->set("fs", "dead");
    const auto crash = t0 + 1s;
    for (int s = 0; s <= 600; ++s) {
        pollAt(crash + std::chrono::seconds(s));
    }

    ASSERT_EQ(manager->restarts.size(), 5u);
    EXPECT_EQ(restartOffsets(crash), (std::vector<std::chrono::seconds>{0s, 10s, 30s, 70s, 150s}));
    EXPECT_EQ(toolSyncs, 5);
    EXPECT_EQ(giveUp.count(), 1);
    ASSERT_TRUE(monitor->RestartCount("fs").has_value());
    EXPECT_EQ(*monitor->RestartCount("fs"), 6u);
}

TEST_F(HealthMonitorTest, RunningAgainResetsBudget) {
    manager->set("fs", "running");
    pollAt(t0);
    manager->set("fs", "dead");
    pollAt(t0 + 1s);
    pollAt(t0 + 11s);
    ASSERT_EQ(manager->restarts.size(), 2u);
    EXPECT_EQ(*monitor->RestartCount("fs"), 2u);

    manager->set("fs", "running");
    pollAt(t0 + 12s);
    EXPECT_FALSE(monitor->RestartCount("fs").has_value());

    // A fresh crash restarts immediately again
    manager->set("fs", "dead");
    pollAt(t0 + 13s);
    EXPECT_EQ(manager->restarts.size(), 3u);
    EXPECT_EQ(*monitor->RestartCount("fs"), 1u);
}

TEST_F(HealthMonitorTest, FailedRestartStillConsumesAttempt) {
    manager->failRestart = true;
    manager->set("fs", "running");
    pollAt(t0);
    manager->set("fs", "dead");
    pollAt(t0 + 1s);
    pollAt(t0 + 5s);   // within the 10s backoff
    pollAt(t0 + 11s);
    EXPECT_EQ(manager->restarts.size(), 2u);
    EXPECT_EQ(*monitor->RestartCount("fs"), 2u);
    EXPECT_EQ(toolSyncs, 0);
}

TEST_F(HealthMonitorTest, DisabledOrNeverRunningServersAreNotRestarted) {
    manager->set("off", "running", true);
    manager->set("fresh", "dead");
    pollAt(t0);
    manager->set("off", "dead", false);
    pollAt(t0 + 1s);
    pollAt(t0 + 100s);
    EXPECT_TRUE(manager->restarts.empty());
    EXPECT_FALSE(monitor->RestartCount("off").has_value());
    EXPECT_FALSE(monitor->RestartCount("fresh").has_value());
}

TEST_F(HealthMonitorTest, PublishesFullListOnlyWhenSomethingChanged) {
    manager->set("fs", "running");
    manager->set("git", "connecting");
    pollAt(t0);
    pollAt(t0 + 30s);
    ASSERT_EQ(sink->topics.size(), 1u);
    EXPECT_EQ(sink->topics[0], "mcp.status");

    manager->set("git", "running");
    pollAt(t0 + 60s);
    ASSERT_EQ(sink->payloads.size(), 2u);
    const auto& payload = sink->payloads[1];
    ASSERT_TRUE(payload.IsArray());
    const auto& items = std::get<JSONValue::Array>(payload.value);
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(*items[1]->Find("name"), JSONValue{"git"});
    EXPECT_EQ(*items[1]->Find("state"), JSONValue{"running"});
    EXPECT_EQ(*items[1]->Find("enabled"), JSONValue{true});
    EXPECT_EQ(*items[1]->Find("tool_count"), JSONValue{static_cast<int64_t>(0)});
}

TEST_F(HealthMonitorTest, RemovedServersAreForgotten) {
    manager->set("fs", "running");
    pollAt(t0);
    manager->set("fs", "dead");
    manager->failRestart = true;
    pollAt(t0 + 1s);
    ASSERT_TRUE(monitor->RestartCount("fs").has_value());

    manager->drop("fs");
    pollAt(t0 + 2s);
    EXPECT_FALSE(monitor->RestartCount("fs").has_value());

    // Re-added as dead: no running -> dead transition was observed
    manager->set("fs", "dead");
    pollAt(t0 + 3s);
    EXPECT_EQ(manager->restarts.size(), 1u);
}

TEST_F(HealthMonitorTest, ManagerFailureIsLoggedAndSwallowed) {
    LogCounter errors("ERROR", "manager unavailable");
    manager->failStatus = true;
    EXPECT_NO_THROW(pollAt(t0));
    EXPECT_EQ(errors.count(), 1);

    manager->failStatus = false;
    manager->set("fs", "running");
    pollAt(t0 + 30s);
    EXPECT_EQ(sink->topics.size(), 1u);
}

TEST_F(HealthMonitorTest, NonStandardExceptionsAreLoggedAndSwallowed) {
    LogCounter errors("ERROR", "unknown exception");
    manager->failStatusNonStd = true;
    EXPECT_NO_THROW(pollAt(t0));
    EXPECT_EQ(errors.count(), 1);

    manager->failStatusNonStd = false;
    manager->failRestartNonStd = true;
    manager->set("fs", "running");
    pollAt(t0 + 1s);
    manager->set("fs", "dead");
    EXPECT_NO_THROW(pollAt(t0 + 2s));
    EXPECT_EQ(manager->restarts.size(), 1u);
    EXPECT_EQ(*monitor->RestartCount("fs"), 1u);
    EXPECT_EQ(toolSyncs, 0);

    monitor = std::make_unique<HealthMonitor>(
        manager, sink, []() { throw 7; }, HealthMonitor::Options{});
    manager->failRestartNonStd = false;
    manager->set("fs", "running");
    pollAt(t0 + 3s);
    manager->set("fs", "dead");
    EXPECT_NO_THROW(pollAt(t0 + 4s));
    EXPECT_EQ(manager->restarts.size(), 2u);
}

TEST_F(HealthMonitorTest, ToolSyncFailureDoesNotStopMonitoring) {
    monitor = std::make_unique<HealthMonitor>(
        manager, sink, []() { throw std::runtime_error("sync failed"); }, HealthMonitor::Options{});
    manager->set("fs", "running");
    pollAt(t0);
    manager->set("fs", "dead");
    EXPECT_NO_THROW(pollAt(t0 + 1s));
    EXPECT_EQ(manager->restarts.size(), 1u);
}

TEST(HealthMonitor, StartPollsUntilStopped) {
    auto manager = std::make_shared<FakeManager>();
    manager->set("fs", "running");
    HealthMonitor::Options opts;
    opts.pollInterval = 20ms;
    HealthMonitor monitor(manager, nullptr, nullptr, opts);

    monitor.Start();
    EXPECT_TRUE(monitor.IsRunning());
    const auto deadline = Clock::now() + 2s;
    while (Clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lk(manager->mutex);
            if (manager->statusCalls >= 3) {
                break;
            }
        }
        std::this_thread::sleep_for(5ms);
    }
    {
        std::lock_guard<std::mutex> lk(manager->mutex);
        EXPECT_GE(manager->statusCalls, 3);
    }

    const auto stopStart = Clock::now();
    monitor.Stop();
    EXPECT_LT(Clock::now() - stopStart, 1s);
    EXPECT_FALSE(monitor.IsRunning());
    monitor.Stop();
}

TEST(HealthMonitor, StopIsPromptWithLongInterval) {
    auto manager = std::make_shared<FakeManager>();
    HealthMonitor monitor(manager, nullptr, nullptr, HealthMonitor::Options{});
    monitor.Start();
    const auto start = Clock::now();
    monitor.Stop();
    EXPECT_LT(Clock::now() - start, 1s);
    EXPECT_EQ(manager->statusCalls, 0);
}

TEST(HealthMonitor, StopFromLoopThreadDoesNotTerminate) {
    auto manager = std::make_shared<FakeManager>();
    manager->set("fs", "running");
    HealthMonitor::Options opts;
    opts.pollInterval = 10ms;
    std::atomic<bool> stoppedFromHook{false};
    HealthMonitor* self = nullptr;
    HealthMonitor monitor(manager, nullptr, [&]() {
        self->Stop();
        stoppedFromHook.store(true);
    }, opts);
    self = &monitor;

    // The first tick sees fs running, the second sees it dead and restarts it, running the hook
    monitor.Start();
    std::this_thread::sleep_for(50ms);
    manager->set("fs", "dead");
    const auto deadline = Clock::now() + 2s;
    while (!stoppedFromHook.load() && Clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_TRUE(stoppedFromHook.load());
    EXPECT_FALSE(monitor.IsRunning());
    // Let the detached loop observe the stop request before the monitor goes away
    std::this_thread::sleep_for(50ms);
}

TEST(HealthMonitor, RequiresManager) {
    EXPECT_THROW(HealthMonitor(nullptr, nullptr, nullptr, HealthMonitor::Options{}), std::invalid_argument);
}
