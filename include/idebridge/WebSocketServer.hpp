//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WebSocketServer.hpp
// Purpose: Coroutine-based persistent-socket JSON-RPC transport using Boost.Beast WebSocket
//==========================================================================================================

#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>

#include "idebridge/Transport.h"

namespace idebridge {

  // WebSocketServer implements ITransportAcceptor: one text frame carries one JSON-RPC envelope.
  class WebSocketServer : public ITransportAcceptor {
  public:
    //==========================================================================================================
    // Options
    // Purpose: Bind configuration.
    // Fields:
    //   address: Bind address (default: 127.0.0.1, loopback only)
    //   port: Listen port (default: 0, OS-assigned; read back with Port())
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        uint16_t port{0};
    };

    WebSocketServer(boost::asio::io_context& ioc, const Options& opts);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    //==========================================================================================================
    // Binds the listener on the calling thread and spawns the accept loop on the io_context.
    // Returns:
    //   Ready future, or a future holding errors::BindError.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Closes the listener and every connection on the I/O thread.
    // Returns:
    //   Future that completes once the connection set is empty.
    //==========================================================================================================
    std::future<void> Stop() override;

    uint16_t Port() const override;

    void SetMessageHandler(MessageHandler handler) override;
    void SetConnectionHandler(ConnectionHandler handler) override;
    void SetDisconnectionHandler(ConnectionHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    //==========================================================================================================
    // Serializes the notification once and queues it on every open connection.
    // Returns:
    //   Future resolving to the number of connections it was queued for.
    //==========================================================================================================
    std::future<std::size_t> Broadcast(const JSONRPCNotification& notification) override;

    std::size_t ClientCount() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
  };

  //==========================================================================================================
  // WebSocketServerFactory
  // Purpose: Creates WebSocket acceptors from "ws://<address>:<port>" (e.g. ws://127.0.0.1:0).
  //          Scheme, address and port may be omitted; unknown query parameters are ignored.
  //==========================================================================================================
  class WebSocketServerFactory : public ITransportAcceptorFactory {
  public:
    std::unique_ptr<ITransportAcceptor> CreateTransportAcceptor(boost::asio::io_context& ioc,
                                                                const std::string& config) override;
  };

} // namespace idebridge
