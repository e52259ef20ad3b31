//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, JSON-RPC error mapping helpers and the exception type raised by mcphost
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "mcphost/JSONRPCTypes.h"

namespace mcphost {
namespace errors {

// Categorization of the standard JSON-RPC error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    ServerDefined,
    Unknown
};

// Typed error representation of a JSON-RPC error object.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code.
//
// Returns:
//   ErrorCategory for the code; -32000..-32099 are reserved for server-defined errors.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        default: break;
    }
    if (code <= -32000 && code >= -32099) {
        return ErrorCategory::ServerDefined;
    }
    return ErrorCategory::Unknown;
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* code = errVal.Find("code");
    const JSONValue* msg = errVal.Find("message");
    if (!code || !msg) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(code->value) || !msg->IsString()) {
        return std::nullopt;
    }
    McpError e;
    e.code = static_cast<int>(std::get<int64_t>(code->value));
    e.message = std::get<std::string>(msg->value);
    if (const JSONValue* data = errVal.Find("data")) {
        e.data = *data;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

//==========================================================================================================
// ErrorKind
// Purpose: Failure classes surfaced by transports, clients, the tool bridge and the health monitor.
//==========================================================================================================
enum class ErrorKind {
    SpawnFailure,
    HandshakeFailure,
    ProtocolError,
    Timeout,
    DecodeError,
    NotReady,
    RestartExhausted,
    TransportClosed,
    TransportError
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SpawnFailure: return "SpawnFailure";
        case ErrorKind::HandshakeFailure: return "HandshakeFailure";
        case ErrorKind::ProtocolError: return "ProtocolError";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::DecodeError: return "DecodeError";
        case ErrorKind::NotReady: return "NotReady";
        case ErrorKind::RestartExhausted: return "RestartExhausted";
        case ErrorKind::TransportClosed: return "TransportClosed";
        case ErrorKind::TransportError: return "TransportError";
    }
    return "Unknown";
}

//==========================================================================================================
// McpException
// Purpose: Exception carrying an ErrorKind and, for ProtocolError, the server's JSON-RPC error.
// Ctors:
//   McpException(kind, message): Generic failure.
//   McpException(message, error): ProtocolError with the decoded error object.
//==========================================================================================================
class McpException : public std::runtime_error {
public:
    McpException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}
    McpException(const std::string& message, McpError error)
        : std::runtime_error(message), kind_(ErrorKind::ProtocolError), error_(std::move(error)) {}

    ErrorKind kind() const noexcept { return kind_; }
    const std::optional<McpError>& error() const noexcept { return error_; }

private:
    ErrorKind kind_;
    std::optional<McpError> error_;
};

} // namespace errors

using errors::ErrorKind;
using errors::McpException;

} // namespace mcphost
