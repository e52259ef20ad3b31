//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolBridge.cpp
// Purpose: MCP tool bridge - naming, argument filtering and result flattening
//==========================================================================================================

#include <stdexcept>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcphost/ToolBridge.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

namespace {
std::vector<std::string> textBlocks(const ToolsCallResult& result) {
    std::vector<std::string> texts;
    for (const auto& block : result.content) {
        if (const auto* text = std::get_if<TextContent>(&block)) {
            texts.push_back(text->text);
        }
    }
    return texts;
}

std::string joinLines(const std::vector<std::string>& parts) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out.push_back('\n');
        }
        out += parts[i];
    }
    return out;
}

JSONValue withoutMetadataKeys(const JSONValue& params) {
    if (!params.IsObject()) {
        return params;
    }
    JSONValue::Object filtered;
    for (const auto& [key, value] : std::get<JSONValue::Object>(params.value)) {
        if (!key.empty() && key[0] == '_') {
            continue;
        }
        filtered[key] = value;
    }
    return JSONValue{std::move(filtered)};
}
} // namespace

std::string BridgedName(const std::string& serverName, const std::string& toolName) {
    return fmt::format("{}{}{}{}{}", BridgedNamePrefix, BridgedNameSeparator, serverName, BridgedNameSeparator,
                       toolName);
}

std::vector<std::string> SplitBridgedName(const std::string& name, std::size_t limit) {
    std::vector<std::string> parts;
    const std::string sep = BridgedNameSeparator;
    std::size_t start = 0;
    while (limit == 0 || parts.size() + 1 < limit) {
        auto pos = name.find(sep, start);
        if (pos == std::string::npos) {
            break;
        }
        parts.push_back(name.substr(start, pos - start));
        start = pos + sep.size();
    }
    parts.push_back(name.substr(start));
    return parts;
}

McpToolBridge::McpToolBridge(std::shared_ptr<IClient> c, const McpToolDef& tool)
    : client(std::move(c)), toolName(tool.name), inputSchema(tool.inputSchema) {
    if (!client) {
        throw std::invalid_argument("McpToolBridge requires a client");
    }
    serverName = client->GetServerName();
    bridgedName = BridgedName(serverName, toolName);
    description = tool.description.value_or(fmt::format("MCP tool: {}", toolName));
}

std::vector<std::shared_ptr<McpToolBridge>> McpToolBridge::FromClient(const std::shared_ptr<IClient>& client) {
    std::vector<std::shared_ptr<McpToolBridge>> bridges;
    for (const auto& tool : client->GetTools()) {
        bridges.push_back(std::make_shared<McpToolBridge>(client, tool));
    }
    LOG_DEBUG("Bridged {} MCP tools from '{}'", bridges.size(), client->GetServerName());
    return bridges;
}

const std::string& McpToolBridge::Name() const {
    return bridgedName;
}

const std::string& McpToolBridge::Description() const {
    return description;
}

JSONValue McpToolBridge::ParametersSchema() const {
    return inputSchema;
}

const std::string& McpToolBridge::ServerName() const {
    return serverName;
}

const std::string& McpToolBridge::ToolName() const {
    return toolName;
}

JSONValue McpToolBridge::Execute(const JSONValue& params) {
    FUNC_SCOPE();
    const auto result = client->CallTool(toolName, withoutMetadataKeys(params));
    const auto texts = textBlocks(result);

    if (result.isError) {
        throw McpException(ErrorKind::ProtocolError, fmt::format("MCP tool error: {}", joinLines(texts)));
    }

    if (texts.size() == 1) {
        try {
            return ParseJSON(texts.front());
        } catch (const std::runtime_error&) {
            return JSONValue{texts.front()};
        }
    }
    JSONValue::Array items;
    for (const auto& text : texts) {
        items.push_back(std::make_shared<JSONValue>(text));
    }
    JSONValue::Object wrapped;
    wrapped["content"] = std::make_shared<JSONValue>(std::move(items));
    return JSONValue{std::move(wrapped)};
}

} // namespace mcphost
