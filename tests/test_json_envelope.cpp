//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json_envelope.cpp
// Purpose: GoogleTests for JSON parsing and envelope classification
//==========================================================================================================

#include <gtest/gtest.h>
#include <stdexcept>
#include "idebridge/JSONRPCTypes.h"
#include "idebridge/Protocol.h"

using namespace idebridge;

TEST(JSONParse, NestedDocument) {
    JSONValue v = ParseJSON(R"({"a":[1,2.5,"x",null,true],"b":{"c":"d\n\u00e9"}})");
    ASSERT_TRUE(v.IsObject());
    const JSONValue* a = FindMember(v, "a");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->IsArray());
    const auto& arr = std::get<JSONValue::Array>(a->value);
    ASSERT_EQ(arr.size(), 5u);
    EXPECT_EQ(std::get<int64_t>(arr[0]->value), 1);
    EXPECT_DOUBLE_EQ(std::get<double>(arr[1]->value), 2.5);
    EXPECT_TRUE(arr[3]->IsNull());
    const JSONValue* b = FindMember(v, "b");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(GetStringMember(*b, "c").value(), "d\n\xC3\xA9");
}

TEST(JSONParse, RejectsMalformedAndTrailingGarbage) {
    EXPECT_THROW(ParseJSON("{"), std::runtime_error);
    EXPECT_THROW(ParseJSON("{\"a\":1} x"), std::runtime_error);
    EXPECT_THROW(ParseJSON(""), std::runtime_error);
    EXPECT_NO_THROW(ParseJSON("  [] \n"));
    EXPECT_THROW(ParseJSON("[1,]"), std::runtime_error);
    EXPECT_THROW(ParseJSON("\"\\q\""), std::runtime_error);
}

TEST(JSONParse, SurrogatePairsAndDeepNesting) {
    EXPECT_EQ(std::get<std::string>(ParseJSON(R"("\ud83d\ude00")").value), "\xF0\x9F\x98\x80");
    EXPECT_THROW(ParseJSON(std::string(300, '[') + std::string(300, ']')), std::runtime_error);
    EXPECT_NO_THROW(ParseJSON(std::string(100, '[') + std::string(100, ']')));
}

TEST(JSONParse, HugeIntegersDegradeToDouble) {
    JSONValue v = ParseJSON("123456789012345678901234567890");
    EXPECT_TRUE(std::holds_alternative<double>(v.value));
    EXPECT_EQ(std::get<int64_t>(ParseJSON("-42").value), -42);
}

TEST(JSONSerialize, EscapesStrings) {
    JSONValue v = MakeObject({{"s", JSONValue("quote\" back\\ nl\n")}});
    const std::string out = SerializeJSON(v);
    EXPECT_EQ(out, R"({"s":"quote\" back\\ nl\n"})");
    EXPECT_EQ(GetStringMember(ParseJSON(out), "s").value(), "quote\" back\\ nl\n");
}

TEST(Envelope, ClassifiesRequest) {
    auto env = DecodeEnvelope(ParseJSON(R"({"jsonrpc":"2.0","id":7,"method":"ping"})"));
    ASSERT_TRUE(env.has_value());
    EXPECT_EQ(env->kind, EnvelopeKind::Request);
    ASSERT_TRUE(env->id.has_value());
    EXPECT_EQ(std::get<int64_t>(*env->id), 7);
    EXPECT_EQ(env->method, "ping");
    EXPECT_FALSE(env->params.has_value());
}

TEST(Envelope, StringAndNullIdsAreRequests) {
    auto s = DecodeEnvelope(ParseJSON(R"({"jsonrpc":"2.0","id":"abc","method":"tools/list","params":{}})"));
    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(s->IsRequest());
    EXPECT_EQ(std::get<std::string>(*s->id), "abc");
    EXPECT_TRUE(s->params.has_value());

    auto n = DecodeEnvelope(ParseJSON(R"({"jsonrpc":"2.0","id":null,"method":"ping"})"));
    ASSERT_TRUE(n.has_value());
    EXPECT_TRUE(n->IsRequest());
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(*n->id));
}

TEST(Envelope, ClassifiesNotification) {
    auto env = DecodeEnvelope(ParseJSON(R"({"jsonrpc":"2.0","method":"notifications/initialized"})"));
    ASSERT_TRUE(env.has_value());
    EXPECT_EQ(env->kind, EnvelopeKind::Notification);
    EXPECT_FALSE(env->id.has_value());
}

TEST(Envelope, ClassifiesResponse) {
    auto ok = DecodeEnvelope(ParseJSON(R"({"jsonrpc":"2.0","id":1,"result":{}})"));
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok->kind, EnvelopeKind::Response);
    auto err = DecodeEnvelope(ParseJSON(R"({"jsonrpc":"2.0","id":1,"error":{"code":-1,"message":"x"}})"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, EnvelopeKind::Response);
}

TEST(Envelope, InvalidKeepsEchoableId) {
    auto env = DecodeEnvelope(ParseJSON(R"({"jsonrpc":"2.0","id":9})"));
    ASSERT_TRUE(env.has_value());
    EXPECT_EQ(env->kind, EnvelopeKind::Invalid);
    ASSERT_TRUE(env->id.has_value());
    EXPECT_EQ(std::get<int64_t>(*env->id), 9);

    auto noId = DecodeEnvelope(ParseJSON(R"({"hello":"world"})"));
    ASSERT_TRUE(noId.has_value());
    EXPECT_EQ(noId->kind, EnvelopeKind::Invalid);
    EXPECT_FALSE(noId->id.has_value());
}

TEST(Envelope, NonStringMethodOrBadIdIsInvalid) {
    auto badMethod = DecodeEnvelope(ParseJSON(R"({"jsonrpc":"2.0","id":1,"method":5})"));
    ASSERT_TRUE(badMethod.has_value());
    EXPECT_EQ(badMethod->kind, EnvelopeKind::Invalid);

    auto badId = DecodeEnvelope(ParseJSON(R"({"jsonrpc":"2.0","id":{"x":1},"method":"ping"})"));
    ASSERT_TRUE(badId.has_value());
    EXPECT_EQ(badId->kind, EnvelopeKind::Invalid);
}

TEST(Envelope, NonObjectIsNotAnEnvelope) {
    EXPECT_FALSE(DecodeEnvelope(ParseJSON("[1,2]")).has_value());
    EXPECT_FALSE(DecodeEnvelope(ParseJSON("\"text\"")).has_value());
}

TEST(Notification, SelectionChangedShape) {
    SelectionChangedParams p;
    p.text = "abc";
    p.filePath = "src/main.cpp";
    p.selection.start = Position{1, 2};
    p.selection.end = Position{1, 5};
    p.selection.isEmpty = false;
    JSONValue v = ParseJSON(MakeSelectionChangedNotification(p).Serialize());
    EXPECT_EQ(GetStringMember(v, "method").value(), "selection_changed");
    EXPECT_FALSE(FindMember(v, "id"));
    const JSONValue* params = FindMember(v, "params");
    ASSERT_NE(params, nullptr);
    EXPECT_EQ(GetStringMember(*params, "filePath").value(), "src/main.cpp");
    ASSERT_NE(FindMember(*params, "fileUrl"), nullptr);
    EXPECT_TRUE(FindMember(*params, "fileUrl")->IsNull());
    const JSONValue* sel = FindMember(*params, "selection");
    ASSERT_NE(sel, nullptr);
    EXPECT_EQ(GetBoolMember(*sel, "isEmpty").value(), false);
    EXPECT_EQ(GetIntMember(*FindMember(*sel, "end"), "character").value(), 5);
}
