//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_request_router.cpp
// Purpose: GoogleTests for method resolution, protocol handlers and legacy file/workspace methods
//==========================================================================================================

#include <gtest/gtest.h>
#include <algorithm>
#include "idebridge/RequestRouter.h"
#include "idebridge/tools/GeneralTools.h"
#include "idebridge/tools/IdeTools.h"
#include "TestHost.h"

using namespace idebridge;

namespace {

Envelope request(const std::string& method, std::optional<JSONValue> params = std::nullopt, int64_t id = 1) {
    Envelope env;
    env.kind = EnvelopeKind::Request;
    env.id = JSONRPCId{id};
    env.method = method;
    env.params = std::move(params);
    return env;
}

Envelope notification(const std::string& method) {
    Envelope env;
    env.kind = EnvelopeKind::Notification;
    env.method = method;
    return env;
}

// Integration handler that consumes one method and counts what it saw.
class RecordingIntegration : public IIntegrationHandler {
public:
    bool Handle(const Envelope& envelope, const Reply& reply) override {
        ++seen;
        if (envelope.method != "custom/hook") {
            return false;
        }
        reply.Result(JSONValue("hooked"));
        return true;
    }
    int seen{0};
};

class RequestRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        files = std::make_shared<test::MemoryFiles>();
        files->files["src/main.cpp"] = "int main() {}";
        files->files["docs/guide.md"] = "# Guide";
        workspace = std::make_shared<test::MemoryWorkspace>(files);
        host = test::MakeHost(files, workspace);
        tools::RegisterGeneralTools(wsTools, host);
        tools::RegisterGeneralTools(httpTools, host);
        tools::RegisterIdeTools(wsTools, host);
        wsTools.Seal();
        httpTools.Seal();
        router = std::make_unique<RequestRouter>(wsTools, httpTools, host, Implementation("idebridge-test", "9.9.9"));
    }

    JSONValue dispatch(const Envelope& env, TransportSource source = TransportSource::WebSocket) {
        auto ch = std::make_shared<test::CaptureChannel>();
        router->Dispatch(env, source, Reply(env.id.value_or(JSONRPCId{nullptr}), ch));
        EXPECT_TRUE(ch->WaitFor(1));
        return ch->Last();
    }

    std::shared_ptr<test::MemoryFiles> files;
    std::shared_ptr<test::MemoryWorkspace> workspace;
    HostServices host;
    ToolRegistry wsTools;
    ToolRegistry httpTools;
    std::unique_ptr<RequestRouter> router;
};

std::size_t toolCount(const JSONValue& response) {
    const JSONValue* tools = FindMember(*FindMember(response, "result"), "tools");
    return std::get<JSONValue::Array>(tools->value).size();
}

} // namespace

TEST_F(RequestRouterTest, InitializeAdvertisesStaticCapabilities) {
    JSONValue params = MakeObject({{"clientInfo", MakeObject({{"name", JSONValue("agent")}, {"version", JSONValue("1")}})}});
    JSONValue v = dispatch(request("initialize", params));
    const JSONValue* result = FindMember(v, "result");
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(GetStringMember(*result, "protocolVersion").value(), "2024-11-05");
    const JSONValue* caps = FindMember(*result, "capabilities");
    ASSERT_NE(caps, nullptr);
    for (const char* key : {"roots", "tools", "resources", "prompts"}) {
        const JSONValue* c = FindMember(*caps, key);
        ASSERT_NE(c, nullptr) << key;
        EXPECT_EQ(GetBoolMember(*c, "listChanged").value(), false) << key;
    }
    EXPECT_EQ(GetBoolMember(*FindMember(*caps, "resources"), "subscribe").value(), false);
    const JSONValue* info = FindMember(*result, "serverInfo");
    EXPECT_EQ(GetStringMember(*info, "name").value(), "idebridge-test");
    EXPECT_EQ(GetStringMember(*info, "version").value(), "9.9.9");
}

TEST_F(RequestRouterTest, PingAndEmptyCatalogs) {
    EXPECT_EQ(GetStringMember(dispatch(request("ping")), "result").value(), "pong");
    JSONValue prompts = dispatch(request("prompts/list"));
    EXPECT_TRUE(std::get<JSONValue::Array>(FindMember(*FindMember(prompts, "result"), "prompts")->value).empty());
    JSONValue resources = dispatch(request("resources/list"));
    EXPECT_TRUE(std::get<JSONValue::Array>(FindMember(*FindMember(resources, "result"), "resources")->value).empty());
}

TEST_F(RequestRouterTest, ToolListDependsOnTransport) {
    EXPECT_EQ(toolCount(dispatch(request("tools/list"), TransportSource::WebSocket)), 10u);
    EXPECT_EQ(toolCount(dispatch(request("tools/list"), TransportSource::Http)), 6u);
}

TEST_F(RequestRouterTest, IdeToolsNotReachableOverHttp) {
    JSONValue params = MakeObject({{"name", JSONValue("close_tab")}});
    EXPECT_EQ(test::ContentText(dispatch(request("tools/call", params), TransportSource::WebSocket)),
              "Tab closed successfully");
    EXPECT_EQ(test::ContentText(dispatch(request("tools/call", params), TransportSource::Http)),
              "Tool 'close_tab' is not registered");
}

TEST_F(RequestRouterTest, ToolsCallWithoutParamsIsInvalidParams) {
    EXPECT_EQ(test::ErrorCode(dispatch(request("tools/call"))), JSONRPCErrorCodes::InvalidParams);
}

TEST_F(RequestRouterTest, UnknownRequestIsMethodNotFound) {
    JSONValue v = dispatch(request("nope/nothing", std::nullopt, 77));
    EXPECT_EQ(GetIntMember(v, "id").value(), 77);
    EXPECT_EQ(test::ErrorCode(v), JSONRPCErrorCodes::MethodNotFound);
}

TEST_F(RequestRouterTest, NotificationsAreNeverAnswered) {
    Reply none;
    EXPECT_NO_THROW(router->Dispatch(notification("nope/nothing"), TransportSource::WebSocket, none));
    EXPECT_NO_THROW(router->Dispatch(notification("ping"), TransportSource::Http, none));
    EXPECT_FALSE(none.Sent());
}

TEST_F(RequestRouterTest, LegacyReadAndWrite) {
    JSONValue read = dispatch(request("readFile", MakeObject({{"path", JSONValue("/src/main.cpp")}})));
    EXPECT_EQ(GetStringMember(read, "result").value(), "int main() {}");

    JSONValue write = dispatch(request("writeFile", MakeObject({{"path", JSONValue("out.txt")},
                                                                {"content", JSONValue("data")}})));
    EXPECT_EQ(GetBoolMember(write, "result").value(), true);
    EXPECT_EQ(files->Get("out.txt"), "data");
}

TEST_F(RequestRouterTest, LegacyReadErrors) {
    EXPECT_EQ(test::ErrorMessage(dispatch(request("readFile", MakeObject({})))), "invalid path parameter");
    EXPECT_EQ(test::ErrorCode(dispatch(request("readFile", MakeObject({})))), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(test::ErrorMessage(dispatch(request("readFile", MakeObject({{"path", JSONValue("~/secret")}})))),
              "invalid file path");
    const std::string missing = test::ErrorMessage(dispatch(request("readFile", MakeObject({{"path", JSONValue("gone.txt")}}))));
    EXPECT_EQ(missing.rfind("failed to read file: ", 0), 0u);
    EXPECT_EQ(test::ErrorMessage(dispatch(request("writeFile", MakeObject({{"path", JSONValue("x")}})))),
              "invalid parameters");
}

TEST_F(RequestRouterTest, CustomNormalizerIsHonored) {
    host.normalizePath = [](const std::string& p) -> std::optional<std::string> { return "src/" + p; };
    RequestRouter custom(wsTools, httpTools, host, Implementation("x", "1"));
    auto ch = std::make_shared<test::CaptureChannel>();
    custom.Dispatch(request("readFile", MakeObject({{"path", JSONValue("main.cpp")}})), TransportSource::Http,
                    Reply(JSONRPCId{int64_t{1}}, ch));
    EXPECT_EQ(GetStringMember(ch->Last(), "result").value(), "int main() {}");
}

TEST_F(RequestRouterTest, WorkspaceIntrospection) {
    JSONValue open = dispatch(request("getOpenFiles"));
    EXPECT_TRUE(std::get<JSONValue::Array>(FindMember(open, "result")->value).empty());
    EXPECT_TRUE(FindMember(dispatch(request("getCurrentFile")), "result")->IsNull());

    workspace->active = "src/main.cpp";
    JSONValue open2 = dispatch(request("getOpenFiles"));
    ASSERT_EQ(std::get<JSONValue::Array>(FindMember(open2, "result")->value).size(), 1u);
    EXPECT_EQ(GetStringMember(dispatch(request("getCurrentFile")), "result").value(), "src/main.cpp");

    JSONValue info = dispatch(request("getWorkspaceInfo"));
    const JSONValue* r = FindMember(info, "result");
    EXPECT_EQ(GetStringMember(*r, "name").value(), "demo");
    EXPECT_EQ(GetStringMember(*r, "path").value(), "/work/demo");
    EXPECT_EQ(GetIntMember(*r, "fileCount").value(), 2);
    EXPECT_EQ(GetStringMember(*r, "type").value(), "workspace");
}

TEST_F(RequestRouterTest, ListFilesWithPattern) {
    JSONValue all = dispatch(request("listFiles"));
    EXPECT_EQ(std::get<JSONValue::Array>(FindMember(all, "result")->value).size(), 2u);
    JSONValue md = dispatch(request("listFiles", MakeObject({{"pattern", JSONValue("\\.md$")}})));
    const auto& arr = std::get<JSONValue::Array>(FindMember(md, "result")->value);
    ASSERT_EQ(arr.size(), 1u);
    EXPECT_EQ(std::get<std::string>(arr[0]->value), "docs/guide.md");
    EXPECT_EQ(test::ErrorCode(dispatch(request("listFiles", MakeObject({{"pattern", JSONValue("(")}})))),
              JSONRPCErrorCodes::InternalError);
}

TEST_F(RequestRouterTest, MissingWorkspaceProvider) {
    RequestRouter bare(wsTools, httpTools, HostServices{}, Implementation("x", "1"));
    auto ch = std::make_shared<test::CaptureChannel>();
    bare.Dispatch(request("getWorkspaceInfo"), TransportSource::WebSocket, Reply(JSONRPCId{int64_t{1}}, ch));
    EXPECT_EQ(test::ErrorCode(ch->Last()), JSONRPCErrorCodes::InternalError);
    EXPECT_NE(test::ErrorMessage(ch->Last()).find("no workspace provider configured"), std::string::npos);
}

TEST_F(RequestRouterTest, IntegrationHandlerRunsFirst) {
    auto hook = std::make_shared<RecordingIntegration>();
    router->SetIntegrationHandler(hook);
    EXPECT_EQ(GetStringMember(dispatch(request("custom/hook")), "result").value(), "hooked");
    EXPECT_EQ(GetStringMember(dispatch(request("ping")), "result").value(), "pong");
    EXPECT_EQ(hook->seen, 2);
}

TEST_F(RequestRouterTest, MethodTableCoversEveryMethod) {
    auto names = router->MethodNames();
    EXPECT_EQ(names.size(), 12u);
    for (const char* m : {"initialize", "ping", "prompts/list", "resources/list", "tools/list", "tools/call",
                          "readFile", "writeFile", "getOpenFiles", "listFiles", "getCurrentFile", "getWorkspaceInfo"}) {
        EXPECT_NE(std::find(names.begin(), names.end(), m), names.end()) << m;
    }
}
