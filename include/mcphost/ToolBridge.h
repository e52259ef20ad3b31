//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolBridge.h
// Purpose: Exposes remote MCP tools as locally callable agent tools
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "mcphost/Client.h"
#include "mcphost/JSONRPCTypes.h"
#include "mcphost/Protocol.h"

namespace mcphost {

//==========================================================================================================
// IAgentTool
// Purpose: The callable-tool surface an agent runtime registers and invokes.
//==========================================================================================================
class IAgentTool {
public:
    virtual ~IAgentTool() = default;

    virtual const std::string& Name() const = 0;
    virtual const std::string& Description() const = 0;
    virtual JSONValue ParametersSchema() const = 0;

    //==========================================================================================================
    // Execute
    // Args:
    //   params: JSON arguments chosen by the agent.
    // Returns:
    //   The tool output as a single JSON value.
    // Throws:
    //   McpException on failure; its message is agent-visible.
    //==========================================================================================================
    virtual JSONValue Execute(const JSONValue& params) = 0;
};

constexpr const char* BridgedNamePrefix = "mcp";
constexpr const char* BridgedNameSeparator = "__";

//==========================================================================================================
// BridgedName
// Purpose: Builds "mcp__<serverName>__<toolName>".
//==========================================================================================================
std::string BridgedName(const std::string& serverName, const std::string& toolName);

//==========================================================================================================
// SplitBridgedName
// Purpose: Splits on "__" producing at most `limit` parts; the last part keeps any further separators.
// Example:
//   SplitBridgedName("mcp__my-server__read_file") -> {"mcp", "my-server", "read_file"}
//==========================================================================================================
std::vector<std::string> SplitBridgedName(const std::string& name, std::size_t limit = 3);

class McpToolBridge : public IAgentTool {
public:
    McpToolBridge(std::shared_ptr<IClient> client, const McpToolDef& tool);

    // One bridge per tool in the client's cached list.
    static std::vector<std::shared_ptr<McpToolBridge>> FromClient(const std::shared_ptr<IClient>& client);

    const std::string& Name() const override;
    const std::string& Description() const override;
    JSONValue ParametersSchema() const override;

    //==========================================================================================================
    // Execute
    // Purpose: Drops top-level keys starting with '_' (runtime-injected metadata), calls tools/call and
    //          flattens the text content:
    //            one text block   -> its JSON value when it parses, else a JSON string
    //            otherwise        -> {"content": [text, ...]}
    //          Image and resource blocks are not part of the flattened output.
    // Throws:
    //   McpException(ProtocolError, "MCP tool error: <texts>") when the server sets isError, or whatever
    //   the client raised.
    //==========================================================================================================
    JSONValue Execute(const JSONValue& params) override;

    const std::string& ServerName() const;
    const std::string& ToolName() const;

private:
    std::shared_ptr<IClient> client;
    std::string serverName;
    std::string toolName;
    std::string bridgedName;
    std::string description;
    JSONValue inputSchema;
};

} // namespace mcphost
