//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PendingRequests.cpp
// Purpose: Correlation table implementation shared by the stdio and SSE transports
//==========================================================================================================

#include <stdexcept>
#include <vector>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcphost/PendingRequests.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

std::future<JSONRPCResponse> PendingRequests::Register(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex);
    if (closed) {
        throw McpException(ErrorKind::TransportClosed, closedReason);
    }
    std::promise<JSONRPCResponse> promise;
    auto fut = promise.get_future();
    auto [it, inserted] = slots.emplace(key, std::move(promise));
    (void)it;
    if (!inserted) {
        throw std::logic_error("duplicate pending request id " + key);
    }
    return fut;
}

bool PendingRequests::Resolve(JSONRPCResponse&& response) {
    const std::string key = IdToKey(response.id);
    std::promise<JSONRPCResponse> deliver;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = slots.find(key);
        if (it == slots.end()) {
            LOG_WARN("unmatched response id {} (no request is waiting for it)", key);
            return false;
        }
        deliver = std::move(it->second);
        slots.erase(it);
    }
    deliver.set_value(std::move(response));
    return true;
}

bool PendingRequests::Remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex);
    return slots.erase(key) > 0;
}

bool PendingRequests::Fail(const std::string& key, std::exception_ptr error) {
    std::promise<JSONRPCResponse> deliver;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = slots.find(key);
        if (it == slots.end()) {
            return false;
        }
        deliver = std::move(it->second);
        slots.erase(it);
    }
    deliver.set_exception(error);
    return true;
}

void PendingRequests::FailAll(const std::string& reason) {
    std::vector<std::promise<JSONRPCResponse>> drained;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!closed) {
            closed = true;
            closedReason = reason;
        }
        drained.reserve(slots.size());
        for (auto& kv : slots) {
            drained.push_back(std::move(kv.second));
        }
        slots.clear();
    }
    for (auto& p : drained) {
        p.set_exception(std::make_exception_ptr(McpException(ErrorKind::TransportClosed, reason)));
    }
}

JSONRPCResponse PendingRequests::Await(const std::string& key, std::future<JSONRPCResponse>& fut,
                                       const std::string& method, std::chrono::milliseconds timeout) {
    const auto start = std::chrono::steady_clock::now();
    if (fut.wait_for(timeout) != std::future_status::ready) {
        if (Remove(key)) {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            throw McpException(ErrorKind::Timeout,
                               fmt::format("MCP request '{}' timed out after {}ms", method, elapsed.count()));
        }
        // Resolved between the timed wait and the removal; the value is already set.
    }
    JSONRPCResponse response = fut.get();
    if (response.IsError()) {
        auto err = errors::mcpErrorFromResponse(response);
        if (!err) {
            throw McpException(ErrorKind::DecodeError,
                               fmt::format("MCP error on '{}': malformed error object", method));
        }
        const std::string message = fmt::format("MCP error on '{}': code={} message={}", method, err->code, err->message);
        throw McpException(message, std::move(*err));
    }
    return response;
}

std::size_t PendingRequests::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return slots.size();
}

bool PendingRequests::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex);
    return closed;
}

} // namespace mcphost
