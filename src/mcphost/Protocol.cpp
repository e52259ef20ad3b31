//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: JSON codecs for the MCP payloads used by the client (initialize, tools/list, tools/call)
//==========================================================================================================

#include "mcphost/Protocol.h"
#include "mcphost/errors/Errors.h"
#include "logging/Logger.h"

namespace mcphost {

namespace {
[[noreturn]] void decodeFail(const std::string& what) {
    throw McpException(ErrorKind::DecodeError, "Malformed MCP payload: " + what);
}

const std::string& requireString(const JSONValue& obj, const char* key, const char* ctx) {
    const JSONValue* v = obj.Find(key);
    if (!v || !v->IsString()) {
        decodeFail(std::string(ctx) + "." + key + " must be a string");
    }
    return std::get<std::string>(v->value);
}

std::optional<std::string> optionalString(const JSONValue& obj, const char* key) {
    const JSONValue* v = obj.Find(key);
    if (!v || !v->IsString()) {
        return std::nullopt;
    }
    return std::get<std::string>(v->value);
}

JSONValue::Object object(const JSONValue& v, const char* ctx) {
    if (!v.IsObject()) {
        decodeFail(std::string(ctx) + " must be an object");
    }
    return std::get<JSONValue::Object>(v.value);
}
} // namespace

JSONValue EncodeInitializeParams(const Implementation& clientInfo) {
    JSONValue::Object info;
    info["name"] = std::make_shared<JSONValue>(clientInfo.name);
    info["version"] = std::make_shared<JSONValue>(clientInfo.version);

    JSONValue::Object params;
    params["protocolVersion"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);
    params["capabilities"] = std::make_shared<JSONValue>(JSONValue::Object{});
    params["clientInfo"] = std::make_shared<JSONValue>(std::move(info));
    return JSONValue{std::move(params)};
}

InitializeResult DecodeInitializeResult(const JSONValue& result) {
    (void)object(result, "initialize result");
    InitializeResult out;
    out.protocolVersion = requireString(result, "protocolVersion", "initialize result");

    if (const JSONValue* caps = result.Find("capabilities")) {
        if (!caps->IsObject()) {
            decodeFail("initialize result.capabilities must be an object");
        }
        out.capabilities.raw = *caps;
        if (const JSONValue* tools = caps->Find("tools")) {
            ToolsCapability tc;
            if (const JSONValue* lc = tools->Find("listChanged")) {
                if (std::holds_alternative<bool>(lc->value)) {
                    tc.listChanged = std::get<bool>(lc->value);
                }
            }
            out.capabilities.tools = tc;
        }
    } else {
        out.capabilities.raw = JSONValue{JSONValue::Object{}};
    }

    const JSONValue* info = result.Find("serverInfo");
    if (!info || !info->IsObject()) {
        decodeFail("initialize result.serverInfo must be an object");
    }
    out.serverInfo.name = requireString(*info, "name", "serverInfo");
    out.serverInfo.version = optionalString(*info, "version").value_or("");
    return out;
}

std::vector<McpToolDef> DecodeToolsListResult(const JSONValue& result) {
    (void)object(result, "tools/list result");
    const JSONValue* tools = result.Find("tools");
    if (!tools || !tools->IsArray()) {
        decodeFail("tools/list result.tools must be an array");
    }
    std::vector<McpToolDef> out;
    for (const auto& item : std::get<JSONValue::Array>(tools->value)) {
        if (!item || !item->IsObject()) {
            decodeFail("tools/list entry must be an object");
        }
        McpToolDef def;
        def.name = requireString(*item, "name", "tool");
        def.description = optionalString(*item, "description");
        if (const JSONValue* schema = item->Find("inputSchema")) {
            def.inputSchema = *schema;
        }
        out.push_back(std::move(def));
    }
    return out;
}

JSONValue EncodeToolDef(const McpToolDef& tool) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(tool.name);
    if (tool.description.has_value()) {
        obj["description"] = std::make_shared<JSONValue>(tool.description.value());
    }
    obj["inputSchema"] = std::make_shared<JSONValue>(tool.inputSchema);
    return JSONValue{std::move(obj)};
}

JSONValue EncodeCallToolParams(const std::string& name, const JSONValue& arguments) {
    JSONValue::Object params;
    params["name"] = std::make_shared<JSONValue>(name);
    params["arguments"] = std::make_shared<JSONValue>(arguments);
    return JSONValue{std::move(params)};
}

ToolsCallResult DecodeToolsCallResult(const JSONValue& result) {
    (void)object(result, "tools/call result");
    ToolsCallResult out;
    if (const JSONValue* isErr = result.Find("isError")) {
        if (std::holds_alternative<bool>(isErr->value)) {
            out.isError = std::get<bool>(isErr->value);
        } else if (!isErr->IsNull()) {
            decodeFail("tools/call result.isError must be a boolean");
        }
    }
    const JSONValue* content = result.Find("content");
    if (!content) {
        return out;
    }
    if (!content->IsArray()) {
        decodeFail("tools/call result.content must be an array");
    }
    for (const auto& item : std::get<JSONValue::Array>(content->value)) {
        if (!item || !item->IsObject()) {
            decodeFail("content block must be an object");
        }
        const std::string& type = requireString(*item, "type", "content block");
        if (type == "text") {
            out.content.emplace_back(TextContent{requireString(*item, "text", "text content")});
        } else if (type == "image") {
            out.content.emplace_back(ImageContent{requireString(*item, "data", "image content"),
                                                  requireString(*item, "mimeType", "image content")});
        } else if (type == "resource") {
            const JSONValue* res = item->Find("resource");
            if (!res) {
                decodeFail("resource content.resource is required");
            }
            out.content.emplace_back(ResourceContent{*res});
        } else {
            LOG_DEBUG("Skipping unsupported content block type '{}'", type);
        }
    }
    return out;
}

} // namespace mcphost
