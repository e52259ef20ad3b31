//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.cpp
// Purpose: Default implementation for JSON-RPC message routing
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "mcphost/JsonRpcMessageRouter.h"
#include "mcphost/JSONRPCTypes.h"
#include "mcphost/Protocol.h"

namespace mcphost {

namespace {
class JsonRpcMessageRouter : public IJsonRpcMessageRouter {
public:
    MessageKind classify(const std::string& json) override {
        JSONValue doc;
        try {
            doc = ParseJSON(json);
        } catch (const std::exception&) {
            return MessageKind::Unknown;
        }
        return classifyValue(doc);
    }

    std::optional<std::string> route(
        const std::string& json,
        RouterHandlers& handlers,
        const ResponseResolver& resolve) override {
        JSONValue doc;
        try {
            doc = ParseJSON(json);
        } catch (const std::exception& e) {
            LOG_DEBUG("Router: ignoring non-JSON line ({}): {}", e.what(), json);
            return std::nullopt;
        }

        switch (classifyValue(doc)) {
            case MessageKind::Response: {
                JSONRPCResponse response;
                if (response.Deserialize(json)) {
                    resolve(std::move(response));
                    return std::nullopt;
                }
                break;
            }
            case MessageKind::Request: {
                JSONRPCRequest request;
                if (!request.Deserialize(json)) {
                    break;
                }
                if (!handlers.requestHandler) {
                    LOG_DEBUG("Router: no request handler for server request '{}'", request.method);
                    return std::nullopt;
                }
                try {
                    auto resp = handlers.requestHandler(request);
                    if (!resp) {
                        resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, "Null response from handler");
                    } else {
                        resp->id = request.id;
                    }
                    return resp->Serialize();
                } catch (const std::exception& e) {
                    LOG_ERROR("Request handler exception: {}", e.what());
                    return CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, e.what())->Serialize();
                }
            }
            case MessageKind::Notification: {
                JSONRPCNotification notification;
                if (notification.Deserialize(json)) {
                    if (handlers.notificationHandler) {
                        handlers.notificationHandler(notification);
                    }
                    return std::nullopt;
                }
                break;
            }
            case MessageKind::Unknown:
                break;
        }

        LOG_DEBUG("Router: unrecognized JSON-RPC message: {}", json);
        return std::nullopt;
    }

private:
    static MessageKind classifyValue(const JSONValue& doc) {
        if (!doc.IsObject()) {
            return MessageKind::Unknown;
        }
        if (doc.Find("method")) {
            return doc.Find("id") ? MessageKind::Request : MessageKind::Notification;
        }
        const auto& obj = std::get<JSONValue::Object>(doc.value);
        if (obj.count("result") || obj.count("error")) {
            return MessageKind::Response;
        }
        return MessageKind::Unknown;
    }
};
} // namespace

std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter() {
    return std::make_unique<JsonRpcMessageRouter>();
}

std::unique_ptr<JSONRPCResponse> AnswerServerRequest(const JSONRPCRequest& request) {
    if (request.method == Methods::Ping) {
        return std::make_unique<JSONRPCResponse>(request.id, JSONValue{JSONValue::Object{}});
    }
    LOG_DEBUG("Declining server request '{}'", request.method);
    return CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                               "Method not found: " + request.method);
}

} // namespace mcphost
