//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PendingRequests.h
// Purpose: Per-transport correlation table mapping request ids to single-fulfillment response slots
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

#include "mcphost/JSONRPCTypes.h"

namespace mcphost {

//==========================================================================================================
// PendingRequests
// Purpose: Thread-safe table of outstanding requests. Each key is inserted once and removed exactly once,
//          by Resolve (reader delivers), Remove (caller timed out), Fail, or FailAll (transport torn down).
//          The lock is held only for insert/remove; promises are fulfilled outside it.
//==========================================================================================================
class PendingRequests {
public:
    //==========================================================================================================
    // Register
    // Purpose: Creates the slot for key and returns its future.
    // Throws:
    //   McpException(TransportClosed) after FailAll; std::logic_error when the key is already pending.
    //==========================================================================================================
    std::future<JSONRPCResponse> Register(const std::string& key);

    //==========================================================================================================
    // Resolve
    // Purpose: Delivers a response to the slot matching IdToKey(response.id).
    // Returns:
    //   false (and logs an "unmatched response id" warning) when nobody is waiting on that id.
    //==========================================================================================================
    bool Resolve(JSONRPCResponse&& response);

    // Removes a slot without fulfilling it; returns false when it was already gone.
    bool Remove(const std::string& key);

    // Fails a single slot with the given exception; returns false when it was already gone.
    bool Fail(const std::string& key, std::exception_ptr error);

    // Fails every slot with TransportClosed and rejects later registrations.
    void FailAll(const std::string& reason);

    //==========================================================================================================
    // Await
    // Purpose: Waits for the slot registered under key. On timeout the entry is removed before the Timeout
    //          error is raised, so a late response is reported as unmatched.
    // Args:
    //   key: Correlation key used at Register time.
    //   fut: Future returned by Register.
    //   method: Method name for error messages.
    //   timeout: Maximum wait.
    // Returns:
    //   The successful response.
    // Throws:
    //   McpException with Timeout, ProtocolError (error response), TransportClosed or TransportError.
    //==========================================================================================================
    JSONRPCResponse Await(const std::string& key, std::future<JSONRPCResponse>& fut,
                          const std::string& method, std::chrono::milliseconds timeout);

    std::size_t Size() const;
    bool IsClosed() const;

private:
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::promise<JSONRPCResponse>> slots;
    bool closed{false};
    std::string closedReason;
};

} // namespace mcphost
