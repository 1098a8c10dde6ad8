//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_reply.cpp
// Purpose: GoogleTests for the reply handle: exactly-once delivery and response encoding
//==========================================================================================================

#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "idebridge/Reply.h"
#include "TestHost.h"

using namespace idebridge;

TEST(Reply, EncodesResultWithId) {
    auto ch = std::make_shared<test::CaptureChannel>();
    Reply r(JSONRPCId{int64_t{42}}, ch);
    EXPECT_TRUE(r.ExpectsResponse());
    EXPECT_TRUE(r.Result(JSONValue("pong")));
    ASSERT_EQ(ch->Count(), 1u);
    JSONValue v = ch->Last();
    EXPECT_EQ(GetStringMember(v, "jsonrpc").value(), "2.0");
    EXPECT_EQ(GetIntMember(v, "id").value(), 42);
    EXPECT_EQ(GetStringMember(v, "result").value(), "pong");
    EXPECT_FALSE(FindMember(v, "error"));
}

TEST(Reply, EncodesErrorObject) {
    auto ch = std::make_shared<test::CaptureChannel>();
    Reply r(JSONRPCId{std::string("a")}, ch);
    r.Error(JSONRPCErrorCodes::MethodNotFound, "method not implemented");
    JSONValue v = ch->Last();
    EXPECT_EQ(GetStringMember(v, "id").value(), "a");
    EXPECT_EQ(test::ErrorCode(v), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(test::ErrorMessage(v), "method not implemented");
}

TEST(Reply, FirstSendWinsAcrossCopies) {
    auto ch = std::make_shared<test::CaptureChannel>();
    Reply r(JSONRPCId{int64_t{1}}, ch);
    Reply copy = r;
    EXPECT_TRUE(copy.Result(JSONValue(true)));
    EXPECT_FALSE(r.Error(JSONRPCErrorCodes::InternalError, "late"));
    EXPECT_TRUE(r.Sent());
    EXPECT_EQ(ch->Count(), 1u);
    EXPECT_EQ(test::ErrorCode(ch->Last()), 0);
}

TEST(Reply, ConcurrentSendsDeliverOnce) {
    auto ch = std::make_shared<test::CaptureChannel>();
    Reply r(JSONRPCId{int64_t{5}}, ch);
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([r, i]() { r.Result(JSONValue(static_cast<int64_t>(i))); });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(ch->Count(), 1u);
}

TEST(Reply, DefaultReplyIsNoOp) {
    Reply r;
    EXPECT_FALSE(r.ExpectsResponse());
    EXPECT_FALSE(r.Result(JSONValue(nullptr)));
    EXPECT_FALSE(r.Sent());
}

TEST(Reply, FunctionChannelForwardsPayload) {
    std::string seen;
    auto ch = std::make_shared<FunctionReplyChannel>([&seen](std::string p) { seen = std::move(p); });
    Reply r(JSONRPCId{nullptr}, ch);
    r.Result(MakeObject({}));
    JSONValue v = ParseJSON(seen);
    ASSERT_NE(FindMember(v, "id"), nullptr);
    EXPECT_TRUE(FindMember(v, "id")->IsNull());
}
