//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_message_router.cpp
// Purpose: Tests for JsonRpcMessageRouter
//==========================================================================================================

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "mcphost/JsonRpcMessageRouter.h"
#include "mcphost/JSONRPCTypes.h"

using namespace mcphost;

TEST(Router, ClassifyBasic) {
    auto router = MakeDefaultJsonRpcMessageRouter();

    JSONRPCRequest req; req.id = std::string("id-1"); req.method = std::string("ping");
    EXPECT_EQ(router->classify(req.Serialize()), IJsonRpcMessageRouter::MessageKind::Request);

    JSONRPCResponse resp; resp.id = std::string("id-1"); resp.result = JSONValue(static_cast<int64_t>(123));
    EXPECT_EQ(router->classify(resp.Serialize()), IJsonRpcMessageRouter::MessageKind::Response);

    JSONRPCNotification note{"notify", std::nullopt};
    EXPECT_EQ(router->classify(note.Serialize()), IJsonRpcMessageRouter::MessageKind::Notification);
}

TEST(Router, ClassifyInvalidJsonIsUnknown) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    EXPECT_EQ(router->classify("{"), IJsonRpcMessageRouter::MessageKind::Unknown);
    EXPECT_EQ(router->classify("[1,2]"), IJsonRpcMessageRouter::MessageKind::Unknown);
}

TEST(Router, ClassifyIdOnlyIsUnknown) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    EXPECT_EQ(router->classify("{\"jsonrpc\":\"2.0\",\"id\":\"x\"}"), IJsonRpcMessageRouter::MessageKind::Unknown);
}

TEST(Router, NoiseIsDroppedWithoutCallbacks) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    RouterHandlers handlers{};
    bool called = false;
    handlers.notificationHandler = [&](const JSONRPCNotification&) { called = true; };
    auto resolve = [&](JSONRPCResponse&&) { called = true; };
    for (const char* line : {"server starting up...", "{", "{\"jsonrpc\":\"2.0\",\"id\":1}", "42"}) {
        EXPECT_FALSE(router->route(line, handlers, resolve).has_value());
    }
    EXPECT_FALSE(called);
}

TEST(Router, ResponseGoesToResolver) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    RouterHandlers handlers{};
    std::vector<std::string> keys;
    auto resolve = [&](JSONRPCResponse&& r) { keys.push_back(IdToKey(r.id)); };
    EXPECT_FALSE(router->route(R"({"jsonrpc":"2.0","id":5,"result":{"ok":true}})", handlers, resolve).has_value());
    EXPECT_FALSE(router->route(R"({"jsonrpc":"2.0","id":"a","error":{"code":-1,"message":"m"}})", handlers, resolve).has_value());
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "5");
    EXPECT_EQ(keys[1], "a");
}

TEST(Router, NotificationGoesToHandler) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    RouterHandlers handlers{};
    std::string method;
    handlers.notificationHandler = [&](const JSONRPCNotification& n) { method = n.method; };
    auto resolve = [](JSONRPCResponse&&) {};
    EXPECT_FALSE(router->route(R"({"jsonrpc":"2.0","method":"notifications/tools/list_changed"})", handlers, resolve).has_value());
    EXPECT_EQ(method, "notifications/tools/list_changed");
}

TEST(Router, RouteRequestHandlerThrowsReturnsErrorResponse) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    JSONRPCRequest req; req.id = std::string("t-1"); req.method = std::string("boom");
    RouterHandlers handlers{};
    handlers.requestHandler = [](const JSONRPCRequest&) -> std::unique_ptr<JSONRPCResponse> {
        throw std::runtime_error("handler threw");
    };
    auto resolve = [](JSONRPCResponse&&) {};
    auto out = router->route(req.Serialize(), handlers, resolve);
    ASSERT_TRUE(out.has_value());
    JSONRPCResponse parsed;
    ASSERT_TRUE(parsed.Deserialize(out.value()));
    EXPECT_TRUE(parsed.IsError());
    EXPECT_EQ(IdToKey(parsed.id), "\"t-1\"");
}

TEST(Router, ServerPingIsAnswered) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    RouterHandlers handlers{};
    handlers.requestHandler = AnswerServerRequest;
    auto resolve = [](JSONRPCResponse&&) {};
    auto out = router->route(R"({"jsonrpc":"2.0","id":99,"method":"ping"})", handlers, resolve);
    ASSERT_TRUE(out.has_value());
    JSONRPCResponse parsed;
    ASSERT_TRUE(parsed.Deserialize(out.value()));
    EXPECT_FALSE(parsed.IsError());
    EXPECT_EQ(IdToKey(parsed.id), "99");
    EXPECT_EQ(parsed.result.value(), JSONValue{JSONValue::Object{}});
}

TEST(Router, UnknownServerRequestGetsMethodNotFound) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    RouterHandlers handlers{};
    handlers.requestHandler = AnswerServerRequest;
    auto resolve = [](JSONRPCResponse&&) {};
    auto out = router->route(R"({"jsonrpc":"2.0","id":"q","method":"sampling/createMessage","params":{}})", handlers, resolve);
    ASSERT_TRUE(out.has_value());
    JSONRPCResponse parsed;
    ASSERT_TRUE(parsed.Deserialize(out.value()));
    ASSERT_TRUE(parsed.IsError());
    const JSONValue* code = parsed.error->Find("code");
    ASSERT_NE(code, nullptr);
    EXPECT_EQ(std::get<int64_t>(code->value), JSONRPCErrorCodes::MethodNotFound);
}
