//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_registry.cpp
// Purpose: Registry persistence, defaults, validation and mutation semantics
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <unistd.h>

#include "mcphost/JSONRPCTypes.h"
#include "mcphost/Registry.h"

using namespace mcphost;
namespace fs = std::filesystem;

namespace {
class RegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir = fs::temp_directory_path() / ("mcphost-registry-" + std::to_string(::getpid()) + "-" + std::to_string(stamp));
        fs::create_directories(dir);
        path = (dir / "mcp-servers.json").string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void writeFile(const std::string& text) const {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << text;
    }

    std::string readFile() const {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream buf;
        buf << in.rdbuf();
        return buf.str();
    }

    fs::path dir;
    std::string path;
};

ServerConfig stdioConfig() {
    ServerConfig cfg;
    cfg.command = "npx";
    cfg.args = {"-y", "@modelcontextprotocol/server-filesystem", "/tmp"};
    cfg.env = {{"API_KEY", "secret"}, {"DEBUG", "1"}};
    return cfg;
}

ServerConfig sseConfig() {
    ServerConfig cfg;
    cfg.transport = TransportKind::Sse;
    cfg.url = "https://mcp.example.com/mcp";
    return cfg;
}
} // namespace

TEST_F(RegistryTest, MissingFileIsEmptyRegistryBoundToPath) {
    auto reg = Registry::Load(path);
    EXPECT_TRUE(reg.List().empty());
    ASSERT_TRUE(reg.GetPath().has_value());
    EXPECT_EQ(*reg.GetPath(), path);
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(RegistryTest, AddThenReloadPreservesEveryField) {
    {
        auto reg = Registry::Load(path);
        reg.Add("fs", stdioConfig());
        reg.Add("remote", sseConfig());
    }
    auto reloaded = Registry::Load(path);
    ASSERT_TRUE(reloaded.Get("fs").has_value());
    EXPECT_EQ(*reloaded.Get("fs"), stdioConfig());
    EXPECT_EQ(reloaded.Get("fs")->env.at("API_KEY"), "secret");
    ASSERT_TRUE(reloaded.Get("remote").has_value());
    EXPECT_EQ(*reloaded.Get("remote"), sseConfig());
    EXPECT_FALSE(reloaded.Get("missing").has_value());
}

TEST_F(RegistryTest, SavedFileIsPrettySortedJson) {
    auto reg = Registry::Load(path);
    reg.Add("zeta", stdioConfig());
    reg.Add("alpha", stdioConfig());
    const std::string text = readFile();
    ASSERT_FALSE(text.empty());
    EXPECT_EQ(text.back(), '\n');
    EXPECT_NE(text.find("\n  \"servers\": {"), std::string::npos);
    EXPECT_LT(text.find("\"alpha\""), text.find("\"zeta\""));

    auto doc = ParseJSON(text);
    const JSONValue* servers = doc.Find("servers");
    ASSERT_NE(servers, nullptr);
    const JSONValue* alpha = servers->Find("alpha");
    ASSERT_NE(alpha, nullptr);
    EXPECT_EQ(*alpha->Find("transport"), JSONValue{"stdio"});
    EXPECT_EQ(*alpha->Find("enabled"), JSONValue{true});
    EXPECT_EQ(alpha->Find("url"), nullptr);
}

TEST_F(RegistryTest, AbsentFieldsTakeDefaults) {
    writeFile(R"({"servers":{"fs":{"command":"mcp-fs"}}})");
    auto reg = Registry::Load(path);
    auto cfg = reg.Get("fs");
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->command, "mcp-fs");
    EXPECT_TRUE(cfg->args.empty());
    EXPECT_TRUE(cfg->env.empty());
    EXPECT_TRUE(cfg->enabled);
    EXPECT_EQ(cfg->transport, TransportKind::Stdio);
    EXPECT_FALSE(cfg->url.has_value());
}

TEST_F(RegistryTest, EmptyDocumentHasNoServers) {
    writeFile("{}");
    EXPECT_TRUE(Registry::Load(path).List().empty());
}

TEST_F(RegistryTest, MalformedFilesAreRejected) {
    const char* bad[] = {
        "{not json",
        "[]",
        R"({"servers":[]})",
        R"({"servers":{"fs":{"command":"x","args":"not-an-array"}}})",
        R"({"servers":{"fs":{"command":"x","env":{"K":1}}}})",
        R"({"servers":{"fs":{"command":"x","enabled":"yes"}}})",
        R"({"servers":{"fs":{"command":"x","transport":"carrier-pigeon"}}})",
        R"({"servers":{"remote":{"transport":"sse"}}})",
        R"({"servers":{"fs":{"args":["a"]}}})",
        R"({"servers":{"fs":{"command":"x","url":"http://h/mcp"}}})",
        R"({"servers":{"remote":{"command":"x","transport":"sse","url":"http://h/mcp"}}})",
    };
    for (const char* text : bad) {
        writeFile(text);
        try {
            (void)Registry::Load(path);
            FAIL() << "accepted " << text;
        } catch (const std::runtime_error& e) {
            EXPECT_NE(std::string(e.what()).find("failed to parse MCP registry"), std::string::npos) << text;
        }
    }
}

TEST_F(RegistryTest, AddValidatesConfig) {
    auto reg = Registry::Load(path);
    EXPECT_THROW(reg.Add("", stdioConfig()), std::invalid_argument);
    EXPECT_THROW(reg.Add("fs", ServerConfig{}), std::invalid_argument);

    ServerConfig sseWithoutUrl;
    sseWithoutUrl.transport = TransportKind::Sse;
    EXPECT_THROW(reg.Add("remote", sseWithoutUrl), std::invalid_argument);

    ServerConfig sseWithCommand = sseConfig();
    sseWithCommand.command = "npx";
    EXPECT_THROW(reg.Add("remote", sseWithCommand), std::invalid_argument);

    ServerConfig stdioWithUrl = stdioConfig();
    stdioWithUrl.url = "http://localhost/mcp";
    EXPECT_THROW(reg.Add("fs", stdioWithUrl), std::invalid_argument);

    EXPECT_TRUE(reg.List().empty());
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(RegistryTest, AddReplacesExistingEntry) {
    auto reg = Registry::Load(path);
    reg.Add("fs", stdioConfig());
    ServerConfig replacement;
    replacement.command = "other";
    reg.Add("fs", replacement);
    EXPECT_EQ(reg.List().size(), 1u);
    EXPECT_EQ(Registry::Load(path).Get("fs")->command, "other");
}

TEST_F(RegistryTest, RemoveOnlySavesWhenSomethingWasRemoved) {
    auto reg = Registry::Load(path);
    EXPECT_FALSE(reg.Remove("ghost"));
    EXPECT_FALSE(fs::exists(path));

    reg.Add("fs", stdioConfig());
    reg.Add("git", stdioConfig());
    EXPECT_TRUE(reg.Remove("fs"));
    EXPECT_FALSE(reg.Remove("fs"));
    auto reloaded = Registry::Load(path);
    ASSERT_EQ(reloaded.List().size(), 1u);
    EXPECT_EQ(reloaded.List()[0], "git");
}

TEST_F(RegistryTest, EnableDisableFlipFlagAndPersist) {
    auto reg = Registry::Load(path);
    EXPECT_FALSE(reg.Disable("ghost"));
    EXPECT_FALSE(reg.Enable("ghost"));

    reg.Add("fs", stdioConfig());
    reg.Add("git", stdioConfig());
    EXPECT_TRUE(reg.Disable("fs"));
    EXPECT_FALSE(Registry::Load(path).Get("fs")->enabled);

    auto enabled = reg.EnabledServers();
    ASSERT_EQ(enabled.size(), 1u);
    EXPECT_EQ(enabled[0].first, "git");

    EXPECT_TRUE(reg.Enable("fs"));
    EXPECT_TRUE(Registry::Load(path).Get("fs")->enabled);
    EXPECT_EQ(reg.EnabledServers().size(), 2u);
}

TEST_F(RegistryTest, ListIsSorted) {
    auto reg = Registry::Load(path);
    reg.Add("charlie", stdioConfig());
    reg.Add("alpha", stdioConfig());
    reg.Add("bravo", sseConfig());
    EXPECT_EQ(reg.List(), (std::vector<std::string>{"alpha", "bravo", "charlie"}));
}

TEST_F(RegistryTest, SaveCreatesParentDirectories) {
    const std::string nested = (dir / "a" / "b" / "servers.json").string();
    auto reg = Registry::Load(nested);
    reg.Add("fs", stdioConfig());
    EXPECT_TRUE(fs::exists(nested));
    EXPECT_FALSE(fs::exists(nested + ".tmp"));
    EXPECT_EQ(Registry::Load(nested).List().size(), 1u);
}

TEST(Registry, SaveWithoutPathThrows) {
    Registry reg;
    EXPECT_FALSE(reg.GetPath().has_value());
    EXPECT_THROW(reg.Save(), std::runtime_error);
}

TEST(Registry, TransportKindNames) {
    EXPECT_STREQ(transportKindName(TransportKind::Stdio), "stdio");
    EXPECT_STREQ(transportKindName(TransportKind::Sse), "sse");
    EXPECT_EQ(parseTransportKind("sse"), TransportKind::Sse);
    EXPECT_FALSE(parseTransportKind("websocket").has_value());
}

TEST(Registry, DefaultPathLivesUnderHome) {
    const std::string p = DefaultRegistryPath();
    EXPECT_NE(p.find(".mcphost"), std::string::npos);
    EXPECT_NE(p.find("mcp-servers.json"), std::string::npos);
}
