//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_tool_registry.cpp
// Purpose: GoogleTests for tool registration, listing and tools/call handling
//==========================================================================================================

#include <gtest/gtest.h>
#include <stdexcept>
#include "idebridge/ToolRegistry.h"
#include "idebridge/Protocol.h"
#include "TestHost.h"

using namespace idebridge;

namespace {

ToolDefinition makeDef(const std::string& name, ToolCategory cat) {
    ToolDefinition d;
    d.name = name;
    d.description = name + " tool";
    d.category = cat;
    d.inputSchema = MakeObjectSchema({});
    return d;
}

ToolImplementation echoImpl(const std::string& name) {
    return ToolImplementation{name, [](const JSONValue& args, Reply reply) {
        reply.Result(MakeTextContent(GetStringMember(args, "text").value_or("<none>")));
    }};
}

JSONValue callTool(const ToolRegistry& reg, const JSONValue& params) {
    auto ch = std::make_shared<test::CaptureChannel>();
    reg.HandleToolCall(params, Reply(JSONRPCId{int64_t{1}}, ch));
    return ch->Last();
}

} // namespace

TEST(ToolRegistry, RejectsMismatchedNames) {
    ToolRegistry reg;
    EXPECT_THROW(reg.Register(makeDef("a", ToolCategory::General), echoImpl("b")), errors::RegistrationError);
    EXPECT_EQ(reg.Size(), 0u);
}

TEST(ToolRegistry, RejectsEmptyHandlerAndName) {
    ToolRegistry reg;
    EXPECT_THROW(reg.Register(makeDef("a", ToolCategory::General), ToolImplementation{"a", nullptr}),
                 errors::RegistrationError);
    EXPECT_THROW(reg.Register(makeDef("", ToolCategory::General), echoImpl("")), errors::RegistrationError);
}

TEST(ToolRegistry, SealedRegistryRejectsRegistration) {
    ToolRegistry reg;
    reg.Register(makeDef("a", ToolCategory::General), echoImpl("a"));
    reg.Seal();
    EXPECT_TRUE(reg.IsSealed());
    EXPECT_THROW(reg.Register(makeDef("b", ToolCategory::General), echoImpl("b")), errors::RegistrationError);
    EXPECT_EQ(reg.Size(), 1u);
}

TEST(ToolRegistry, ListsInRegistrationOrderAndFiltersByCategory) {
    ToolRegistry reg;
    reg.Register(makeDef("zeta", ToolCategory::File), echoImpl("zeta"));
    reg.Register(makeDef("alpha", ToolCategory::IdeSpecific), echoImpl("alpha"));
    reg.Register(makeDef("mid", ToolCategory::File), echoImpl("mid"));

    auto names = reg.GetRegisteredToolNames();
    ASSERT_EQ(names.size(), 3u);
    EXPECT_EQ(names[0], "zeta");
    EXPECT_EQ(names[1], "alpha");
    EXPECT_EQ(names[2], "mid");

    auto files = reg.GetToolDefinitions(ToolCategory::File);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].name, "zeta");
    EXPECT_EQ(files[1].name, "mid");
    EXPECT_TRUE(reg.GetToolDefinitions(ToolCategory::Workspace).empty());
}

TEST(ToolRegistry, ReRegisterReplacesInPlace) {
    ToolRegistry reg;
    reg.Register(makeDef("a", ToolCategory::General), echoImpl("a"));
    reg.Register(makeDef("b", ToolCategory::General), echoImpl("b"));
    auto replacement = makeDef("a", ToolCategory::Workspace);
    replacement.description = "replaced";
    reg.Register(replacement, echoImpl("a"));
    ASSERT_EQ(reg.Size(), 2u);
    auto defs = reg.GetToolDefinitions();
    EXPECT_EQ(defs[0].name, "a");
    EXPECT_EQ(defs[0].description, "replaced");
}

TEST(ToolRegistry, ListResultStripsCategory) {
    ToolRegistry reg;
    reg.Register(makeDef("a", ToolCategory::IdeSpecific), echoImpl("a"));
    JSONValue result = reg.ListToolsResult();
    const JSONValue* tools = FindMember(result, "tools");
    ASSERT_NE(tools, nullptr);
    const auto& arr = std::get<JSONValue::Array>(tools->value);
    ASSERT_EQ(arr.size(), 1u);
    EXPECT_EQ(GetStringMember(*arr[0], "name").value(), "a");
    EXPECT_TRUE(GetStringMember(*arr[0], "description").has_value());
    ASSERT_NE(FindMember(*arr[0], "inputSchema"), nullptr);
    EXPECT_EQ(FindMember(*arr[0], "category"), nullptr);
    EXPECT_EQ(GetStringMember(*FindMember(*arr[0], "inputSchema"), "type").value(), "object");
}

TEST(ToolRegistry, CallPassesArguments) {
    ToolRegistry reg;
    reg.Register(makeDef("echo", ToolCategory::General), echoImpl("echo"));
    JSONValue v = callTool(reg, MakeObject({{"name", JSONValue("echo")},
                                            {"arguments", MakeObject({{"text", JSONValue("hi")}})}}));
    EXPECT_EQ(test::ContentText(v), "hi");
}

TEST(ToolRegistry, MissingArgumentsBecomeEmptyObject) {
    ToolRegistry reg;
    reg.Register(makeDef("echo", ToolCategory::General), echoImpl("echo"));
    JSONValue v = callTool(reg, MakeObject({{"name", JSONValue("echo")}}));
    EXPECT_EQ(test::ContentText(v), "<none>");
}

TEST(ToolRegistry, MissingNameIsInvalidParams) {
    ToolRegistry reg;
    EXPECT_EQ(test::ErrorCode(callTool(reg, MakeObject({}))), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(test::ErrorCode(callTool(reg, MakeObject({{"name", JSONValue(int64_t{3})}}))),
              JSONRPCErrorCodes::InvalidParams);
}

TEST(ToolRegistry, UnknownToolIsSuccessShaped) {
    ToolRegistry reg;
    JSONValue v = callTool(reg, MakeObject({{"name", JSONValue("ghost")}}));
    EXPECT_EQ(test::ErrorCode(v), 0);
    EXPECT_EQ(test::ContentText(v), "Tool 'ghost' is not registered");
}

TEST(ToolRegistry, HandlerExceptionBecomesInternalError) {
    ToolRegistry reg;
    reg.Register(makeDef("boom", ToolCategory::General),
                 ToolImplementation{"boom", [](const JSONValue&, Reply) { throw std::runtime_error("kaput"); }});
    JSONValue v = callTool(reg, MakeObject({{"name", JSONValue("boom")}}));
    EXPECT_EQ(test::ErrorCode(v), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(test::ErrorMessage(v), "failed to call tool boom: kaput");
}

TEST(ToolCategoryNames, RoundTrip) {
    for (auto c : {ToolCategory::General, ToolCategory::IdeSpecific, ToolCategory::File, ToolCategory::Workspace}) {
        EXPECT_EQ(toolCategoryFromString(toString(c)).value(), c);
    }
    EXPECT_FALSE(toolCategoryFromString("bogus").has_value());
    EXPECT_STREQ(toString(ToolCategory::IdeSpecific), "ide-specific");
}
