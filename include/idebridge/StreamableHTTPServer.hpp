//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StreamableHTTPServer.hpp
// Purpose: Session-oriented streaming HTTP transport (SSE event stream + POST submission) on Boost.Beast
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>

#include "idebridge/Transport.h"

namespace idebridge {

  //==========================================================================================================
  // StreamableHTTPServer
  // Purpose: ITransportAcceptor over HTTP/1.1.
  // Surface:
  //   GET  /sse, /sse/, /mcp          open an event stream (session); first event is "endpoint"
  //   POST /messages, /messages/, /mcp  submit one envelope or an array (?session_id=<id>)
  //   OPTIONS *                        200 with CORS headers
  // Notes:
  //   - Replies to requests are delivered on the session stream as "message" events; the POST itself
  //     is answered with an empty 202.
  //   - Session ids of closed streams are retired: POSTs against them receive 410 instead of 404.
  //==========================================================================================================
  class StreamableHTTPServer : public ITransportAcceptor {
  public:
    //==========================================================================================================
    // Options
    // Fields:
    //   address: Bind address (default: 127.0.0.1, loopback only)
    //   port: Listen port (default: 22360; 0 picks a free port)
    //   heartbeatInterval: Period of "ping" events on every open stream (default: 30s; non-positive
    //                      values fall back to the default)
    //   maxBodyBytes: Upper bound for POST bodies; larger requests are answered with 413
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        uint16_t port{22360};
        std::chrono::milliseconds heartbeatInterval{std::chrono::seconds(30)};
        std::size_t maxBodyBytes{8 * 1024 * 1024};
    };

    StreamableHTTPServer(boost::asio::io_context& ioc, const Options& opts);
    ~StreamableHTTPServer();

    StreamableHTTPServer(const StreamableHTTPServer&) = delete;
    StreamableHTTPServer& operator=(const StreamableHTTPServer&) = delete;

    //==========================================================================================================
    // Binds the listener on the calling thread and spawns the accept loop on the io_context.
    // Returns:
    //   Ready future, or a future holding errors::BindError (PortInUse, PermissionDenied, Other).
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Closes the listener and tears down every session (heartbeat cancelled, id retired).
    //==========================================================================================================
    std::future<void> Stop() override;

    uint16_t Port() const override;

    void SetMessageHandler(MessageHandler handler) override;
    void SetConnectionHandler(ConnectionHandler handler) override;
    void SetDisconnectionHandler(ConnectionHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    // Emits a "message" event with a fresh event id on every OPEN session.
    std::future<std::size_t> Broadcast(const JSONRPCNotification& notification) override;

    std::size_t ClientCount() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
  };

  //==========================================================================================================
  // StreamableHTTPServerFactory
  // Purpose: Creates acceptors from "http://<address>:<port>[?heartbeat_ms=<n>]"
  //          (e.g. http://127.0.0.1:22360). Scheme defaults to http; https is not supported.
  //==========================================================================================================
  class StreamableHTTPServerFactory : public ITransportAcceptorFactory {
  public:
    std::unique_ptr<ITransportAcceptor> CreateTransportAcceptor(boost::asio::io_context& ioc,
                                                                const std::string& config) override;
  };

} // namespace idebridge
