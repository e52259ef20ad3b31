//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_jsonrpc_types.cpp
// Purpose: Tests for JSON values, JSON-RPC envelopes, error mapping and MCP payload codecs
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "mcphost/JSONRPCTypes.h"
#include "mcphost/Protocol.h"
#include "mcphost/errors/Errors.h"

using namespace mcphost;

////////////////////////////////////////// JSON values //////////////////////////////////////////

TEST(Json, ParseAndSerializeSortsKeys) {
    JSONValue v = ParseJSON(R"({"b":[1,2.5,"x"],"a":{"z":null,"y":true}})");
    EXPECT_EQ(SerializeJSON(v), R"({"a":{"y":true,"z":null},"b":[1,2.5,"x"]})");
}

TEST(Json, PrettyPrint) {
    JSONValue v = ParseJSON(R"({"k":[1]})");
    EXPECT_EQ(SerializeJSON(v, 2), "{\n  \"k\": [\n    1\n  ]\n}");
}

TEST(Json, IntegralDoubleKeepsFraction) {
    JSONValue v{2.0};
    EXPECT_EQ(SerializeJSON(v), "2.0");
}

TEST(Json, UnicodeEscapesAndSurrogatePairs) {
    JSONValue v = ParseJSON(R"("caf\u00e9 \ud83d\ude00")");
    ASSERT_TRUE(v.IsString());
    EXPECT_EQ(std::get<std::string>(v.value), "caf\xC3\xA9 \xF0\x9F\x98\x80");
}

TEST(Json, RejectsMalformed) {
    EXPECT_THROW(ParseJSON("{"), std::runtime_error);
    EXPECT_THROW(ParseJSON("[1,]"), std::runtime_error);
    EXPECT_THROW(ParseJSON("01"), std::runtime_error);
    EXPECT_THROW(ParseJSON("{\"a\":1} trailing"), std::runtime_error);
    EXPECT_THROW(ParseJSON("not json"), std::runtime_error);
}

TEST(Json, DeepEqualityIgnoresMemberOrder) {
    EXPECT_EQ(ParseJSON(R"({"a":1,"b":[true,null]})"), ParseJSON(R"({"b":[true,null],"a":1})"));
    EXPECT_NE(ParseJSON(R"({"a":1})"), ParseJSON(R"({"a":2})"));
}

////////////////////////////////////////// Envelopes //////////////////////////////////////////

TEST(JsonRpc, RequestRoundTripKeepsIdType) {
    JSONRPCRequest req(int64_t{42}, "tools/list");
    JSONRPCRequest parsed;
    ASSERT_TRUE(parsed.Deserialize(req.Serialize()));
    ASSERT_TRUE(std::holds_alternative<int64_t>(parsed.id));
    EXPECT_EQ(std::get<int64_t>(parsed.id), 42);
    EXPECT_EQ(parsed.method, "tools/list");
    EXPECT_FALSE(parsed.params.has_value());
}

TEST(JsonRpc, IdToKey) {
    EXPECT_EQ(IdToKey(JSONRPCId{int64_t{7}}), "7");
    EXPECT_EQ(IdToKey(JSONRPCId{std::string("abc")}), "\"abc\"");
    EXPECT_NE(IdToKey(JSONRPCId{std::string("7")}), IdToKey(JSONRPCId{int64_t{7}}));
    EXPECT_EQ(IdToKey(JSONRPCId{nullptr}), "null");
}

TEST(JsonRpc, ResponseRequiresExactlyOneOfResultOrError) {
    JSONRPCResponse r;
    EXPECT_TRUE(r.Deserialize(R"({"jsonrpc":"2.0","id":1,"result":{}})"));
    EXPECT_FALSE(r.IsError());
    EXPECT_TRUE(r.Deserialize(R"({"jsonrpc":"2.0","id":"s","error":{"code":-32601,"message":"nope"}})"));
    EXPECT_TRUE(r.IsError());

    JSONRPCResponse bad;
    EXPECT_FALSE(bad.Deserialize(R"({"jsonrpc":"2.0","id":1})"));
    EXPECT_FALSE(bad.Deserialize(R"({"jsonrpc":"2.0","id":1,"result":1,"error":{"code":1,"message":"x"}})"));
    EXPECT_FALSE(bad.Deserialize(R"({"jsonrpc":"2.0","id":1,"method":"x","result":1})"));
    EXPECT_FALSE(bad.Deserialize(R"({"jsonrpc":"1.0","id":1,"result":1})"));
    EXPECT_FALSE(bad.Deserialize("garbage"));
}

TEST(JsonRpc, NotificationRejectsId) {
    JSONRPCNotification n;
    EXPECT_TRUE(n.Deserialize(R"({"jsonrpc":"2.0","method":"notifications/tools/list_changed"})"));
    EXPECT_EQ(n.method, Methods::ToolListChanged);
    EXPECT_FALSE(n.Deserialize(R"({"jsonrpc":"2.0","id":3,"method":"x"})"));
}

////////////////////////////////////////// Errors //////////////////////////////////////////

TEST(Errors, CategoryMapping) {
    using errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errors::errorCategoryFromCode(-32001), ErrorCategory::ServerDefined);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, McpErrorFromResponse) {
    JSONRPCResponse r;
    ASSERT_TRUE(r.Deserialize(R"({"jsonrpc":"2.0","id":1,"error":{"code":-32602,"message":"bad","data":{"f":1}}})"));
    auto err = errors::mcpErrorFromResponse(r);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, -32602);
    EXPECT_EQ(err->message, "bad");
    ASSERT_TRUE(err->data.has_value());
    EXPECT_EQ(err->category, errors::ErrorCategory::JsonRpcInvalidParams);
}

TEST(Errors, ProtocolErrorCarriesMcpError) {
    errors::McpError e;
    e.code = -32000;
    e.message = "boom";
    McpException ex("MCP error on 'tools/call': code=-32000 message=boom", e);
    EXPECT_EQ(ex.kind(), ErrorKind::ProtocolError);
    ASSERT_TRUE(ex.error().has_value());
    EXPECT_EQ(ex.error()->code, -32000);
    EXPECT_STREQ(errors::errorKindName(ErrorKind::HandshakeFailure), "HandshakeFailure");
}

////////////////////////////////////////// MCP payloads //////////////////////////////////////////

TEST(Protocol, InitializeParamsShape) {
    JSONValue p = EncodeInitializeParams(Implementation{"mcphost", "1.2.3"});
    EXPECT_EQ(SerializeJSON(p),
              R"({"capabilities":{},"clientInfo":{"name":"mcphost","version":"1.2.3"},"protocolVersion":"2024-11-05"})");
}

TEST(Protocol, DecodeInitializeResult) {
    auto r = DecodeInitializeResult(ParseJSON(
        R"({"protocolVersion":"2024-11-05","capabilities":{"tools":{"listChanged":true}},"serverInfo":{"name":"fs"}})"));
    EXPECT_EQ(r.protocolVersion, "2024-11-05");
    ASSERT_TRUE(r.capabilities.tools.has_value());
    EXPECT_TRUE(r.capabilities.tools->listChanged);
    EXPECT_EQ(r.serverInfo.name, "fs");
    EXPECT_EQ(r.serverInfo.version, "");
}

TEST(Protocol, DecodeInitializeResultMalformed) {
    try {
        (void)DecodeInitializeResult(ParseJSON(R"({"protocolVersion":5,"serverInfo":{"name":"x"}})"));
        FAIL() << "expected DecodeError";
    } catch (const McpException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DecodeError);
    }
    EXPECT_THROW((void)DecodeInitializeResult(ParseJSON(R"({"protocolVersion":"v"})")), McpException);
}

TEST(Protocol, DecodeToolsList) {
    auto tools = DecodeToolsListResult(ParseJSON(
        R"({"tools":[{"name":"read_file","description":"Read","inputSchema":{"type":"object"}},{"name":"bare"}]})"));
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "read_file");
    EXPECT_EQ(tools[0].description.value_or(""), "Read");
    EXPECT_EQ(tools[0].inputSchema, ParseJSON(R"({"type":"object"})"));
    EXPECT_FALSE(tools[1].description.has_value());
    EXPECT_TRUE(tools[1].inputSchema.IsNull());
    EXPECT_THROW((void)DecodeToolsListResult(ParseJSON(R"({"tools":{}})")), McpException);
}

TEST(Protocol, DecodeToolsCallResultContentKinds) {
    auto r = DecodeToolsCallResult(ParseJSON(R"({"content":[
        {"type":"text","text":"hello"},
        {"type":"image","data":"AAAA","mimeType":"image/png"},
        {"type":"resource","resource":{"uri":"file:///x"}},
        {"type":"audio","data":"zz"}
    ],"isError":false})"));
    ASSERT_EQ(r.content.size(), 3u);
    EXPECT_EQ(std::get<TextContent>(r.content[0]).text, "hello");
    EXPECT_EQ(std::get<ImageContent>(r.content[1]).mimeType, "image/png");
    EXPECT_EQ(std::get<ResourceContent>(r.content[2]).resource, ParseJSON(R"({"uri":"file:///x"})"));
    EXPECT_FALSE(r.isError);
}

TEST(Protocol, CallToolParamsShape) {
    JSONValue p = EncodeCallToolParams("echo", ParseJSON(R"({"msg":"hi"})"));
    EXPECT_EQ(SerializeJSON(p), R"({"arguments":{"msg":"hi"},"name":"echo"})");
}
