//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_endpoint_config.cpp
// Purpose: Validate URI-style endpoint parsing and the transport acceptor factories
//==========================================================================================================

#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include "idebridge/Transport.h"
#include "idebridge/StreamableHTTPServer.hpp"
#include "idebridge/WebSocketServer.hpp"

using namespace idebridge;

TEST(EndpointConfig, DefaultsWhenEmpty) {
    auto ep = ParseEndpointConfig("", "http", "127.0.0.1", 22360);
    EXPECT_EQ(ep.scheme, "http");
    EXPECT_EQ(ep.address, "127.0.0.1");
    EXPECT_EQ(ep.port, 22360);
    EXPECT_TRUE(ep.query.empty());
}

TEST(EndpointConfig, FullUriWithQueryAndPath) {
    auto ep = ParseEndpointConfig("  HTTP://localhost:8080/mcp?heartbeat_ms=500&flag  ", "http", "127.0.0.1", 22360);
    EXPECT_EQ(ep.scheme, "http");
    EXPECT_EQ(ep.address, "localhost");
    EXPECT_EQ(ep.port, 8080);
    EXPECT_EQ(ep.query.at("heartbeat_ms"), "500");
    EXPECT_EQ(ep.query.at("flag"), "");
}

TEST(EndpointConfig, BracketedAddresses) {
    auto v6 = ParseEndpointConfig("ws://[::1]:0", "ws", "127.0.0.1", 1);
    EXPECT_EQ(v6.address, "::1");
    EXPECT_EQ(v6.port, 0);
    auto v4 = ParseEndpointConfig("ws://[127.0.0.1]", "ws", "0.0.0.0", 7);
    EXPECT_EQ(v4.address, "127.0.0.1");
    EXPECT_EQ(v4.port, 7);
    EXPECT_THROW(ParseEndpointConfig("ws://[::1:80", "ws", "127.0.0.1", 0), std::invalid_argument);
}

TEST(EndpointConfig, RejectsBadPorts) {
    EXPECT_THROW(ParseEndpointConfig("http://127.0.0.1:http", "http", "127.0.0.1", 0), std::invalid_argument);
    EXPECT_THROW(ParseEndpointConfig("http://127.0.0.1:65536", "http", "127.0.0.1", 0), std::invalid_argument);
    EXPECT_THROW(ParseEndpointConfig("http://127.0.0.1:-1", "http", "127.0.0.1", 0), std::invalid_argument);
    EXPECT_EQ(ParseEndpointConfig("127.0.0.1:65535", "http", "127.0.0.1", 0).port, 65535);
}

TEST(AcceptorFactory, RejectsForeignSchemes) {
    boost::asio::io_context ioc;
    WebSocketServerFactory ws;
    StreamableHTTPServerFactory http;
    EXPECT_THROW(ws.CreateTransportAcceptor(ioc, "http://127.0.0.1:0"), std::invalid_argument);
    EXPECT_THROW(http.CreateTransportAcceptor(ioc, "https://127.0.0.1:0"), std::invalid_argument);
}

TEST(AcceptorFactory, HeartbeatQueryMustBePositiveNumber) {
    boost::asio::io_context ioc;
    StreamableHTTPServerFactory http;
    EXPECT_THROW(http.CreateTransportAcceptor(ioc, "http://127.0.0.1:0?heartbeat_ms=abc"), std::invalid_argument);
    EXPECT_THROW(http.CreateTransportAcceptor(ioc, "http://127.0.0.1:0?heartbeat_ms=10ms"), std::invalid_argument);
    EXPECT_NE(http.CreateTransportAcceptor(ioc, "http://127.0.0.1:0?heartbeat_ms=0"), nullptr);
    EXPECT_NE(http.CreateTransportAcceptor(ioc, "http://127.0.0.1:0?heartbeat_ms=-5"), nullptr);
}

TEST(AcceptorFactory, CreatedAcceptorsStartAndStop) {
    boost::asio::io_context ioc;
    auto work = boost::asio::make_work_guard(ioc);
    std::thread io([&ioc]() { ioc.run(); });

    WebSocketServerFactory wsFactory;
    StreamableHTTPServerFactory httpFactory;
    auto ws = wsFactory.CreateTransportAcceptor(ioc, "ws://127.0.0.1:0");
    auto http = httpFactory.CreateTransportAcceptor(ioc, "http://127.0.0.1:0?heartbeat_ms=1000");
    ASSERT_NE(ws, nullptr);
    ASSERT_NE(http, nullptr);

    EXPECT_NO_THROW(ws->Start().get());
    EXPECT_NO_THROW(http->Start().get());
    EXPECT_NE(ws->Port(), 0);
    EXPECT_NE(http->Port(), 0);
    EXPECT_NE(ws->Port(), http->Port());
    EXPECT_EQ(ws->ClientCount(), 0u);
    EXPECT_EQ(http->Broadcast(JSONRPCNotification("noop")).get(), 0u);

    EXPECT_NO_THROW(ws->Stop().get());
    EXPECT_NO_THROW(http->Stop().get());

    work.reset();
    ioc.stop();
    io.join();
}
