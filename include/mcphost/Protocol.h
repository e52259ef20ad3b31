//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures, method names and JSON codecs used by the client
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>
#include <variant>

namespace mcphost {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// MCP Protocol version negotiated during initialize
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* Ping = "ping";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
}

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information (clientInfo / serverInfo); version may be empty for servers
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = false;
};

struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
    JSONValue raw;  // capabilities object as sent by the server
};

struct InitializeResult {
    std::string protocolVersion;
    ServerCapabilities capabilities;
    Implementation serverInfo;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Tool definition as listed by tools/list
struct McpToolDef {
    std::string name;
    std::optional<std::string> description;
    JSONValue inputSchema;  // JSON Schema for tool parameters, passed through untouched
};

struct TextContent {
    std::string text;
};

struct ImageContent {
    std::string data;
    std::string mimeType;
};

struct ResourceContent {
    JSONValue resource;
};

using ToolContent = std::variant<TextContent, ImageContent, ResourceContent>;

struct ToolsCallResult {
    std::vector<ToolContent> content;
    bool isError = false;
};

///////////////////////////////////////// Codecs ///////////////////////////////////////////
// Decoders throw McpException(ErrorKind::DecodeError) when a required field is missing or mistyped.

//==========================================================================================================
// EncodeInitializeParams
// Purpose: Builds { protocolVersion, capabilities: {}, clientInfo: { name, version } }.
//==========================================================================================================
JSONValue EncodeInitializeParams(const Implementation& clientInfo);

//==========================================================================================================
// DecodeInitializeResult
// Purpose: Parses the initialize result (protocolVersion, capabilities.tools.listChanged, serverInfo).
//==========================================================================================================
InitializeResult DecodeInitializeResult(const JSONValue& result);

//==========================================================================================================
// DecodeToolsListResult
// Purpose: Parses { tools: [ { name, description?, inputSchema } ] }.
//==========================================================================================================
std::vector<McpToolDef> DecodeToolsListResult(const JSONValue& result);

JSONValue EncodeToolDef(const McpToolDef& tool);

//==========================================================================================================
// EncodeCallToolParams
// Purpose: Builds { name, arguments } for tools/call.
//==========================================================================================================
JSONValue EncodeCallToolParams(const std::string& name, const JSONValue& arguments);

//==========================================================================================================
// DecodeToolsCallResult
// Purpose: Parses { content: [ text | image | resource ], isError }. Unrecognized content types are skipped.
//==========================================================================================================
ToolsCallResult DecodeToolsCallResult(const JSONValue& result);

} // namespace mcphost
