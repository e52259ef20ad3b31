//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.h
// Purpose: Classification and dispatch of inbound JSON-RPC messages read from a server connection
//========================================================================================================

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <memory>

#include "mcphost/Transport.h"
#include "mcphost/JSONRPCTypes.h"

namespace mcphost {

using RequestHandler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)>;

struct RouterHandlers {
    RequestHandler requestHandler;
    ITransport::NotificationHandler notificationHandler;
};

using ResponseResolver = std::function<void(JSONRPCResponse&&)>;

class IJsonRpcMessageRouter {
public:
    virtual ~IJsonRpcMessageRouter() = default;

    enum class MessageKind {
        Request,
        Response,
        Notification,
        Unknown
    };

    // Classify a JSON-RPC message without invoking handlers.
    virtual MessageKind classify(const std::string& json) = 0;

    // Routes a JSON-RPC message. If a response should be sent (for requests), returns
    // the serialized response payload; for responses/notifications, returns std::nullopt.
    // Anything that is not a JSON-RPC message is logged at debug level and dropped.
    virtual std::optional<std::string> route(
        const std::string& json,
        RouterHandlers& handlers,
        const ResponseResolver& resolve) = 0;
};

// Factory: returns the default router implementation
std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter();

//========================================================================================================
// AnswerServerRequest
// Purpose: Default handler for requests initiated by the server: "ping" gets an empty result, anything
//          else gets MethodNotFound (the host advertises no client capabilities).
//========================================================================================================
std::unique_ptr<JSONRPCResponse> AnswerServerRequest(const JSONRPCRequest& request);

} // namespace mcphost
