//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Server-side transport acceptor interfaces shared by the WebSocket and SSE transports
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <unordered_map>

#include <boost/asio/io_context.hpp>

#include "idebridge/JSONRPCTypes.h"
#include "idebridge/Reply.h"

namespace idebridge {

//==========================================================================================================
// TransportSource
// Purpose: Identifies the transport an envelope arrived on; selects the tool registry.
//==========================================================================================================
enum class TransportSource {
    WebSocket,
    Http
};

inline const char* toString(TransportSource source) {
    switch (source) {
        case TransportSource::WebSocket: return "websocket";
        case TransportSource::Http: return "http";
    }
    return "unknown";
}

//==========================================================================================================
// ITransportAcceptor
// Purpose: Multi-client listener which owns its connection/session set and forwards every decoded
//          envelope to the registered message handler together with a Reply bound to the origin.
// Notes:
//   - All I/O runs on the io_context passed at construction; the acceptor never owns a thread.
//   - Start() binds synchronously. A bind failure is reported as errors::BindError on the future.
//   - Stop(), Broadcast() and reply delivery may be called from any thread.
//==========================================================================================================
class ITransportAcceptor {
public:
    // Requests carry a live Reply; notifications carry a default-constructed (no-op) Reply.
    using MessageHandler = std::function<void(const Envelope& envelope, Reply reply)>;
    using ConnectionHandler = std::function<void(const std::string& clientId)>;
    using ErrorHandler = std::function<void(const std::string& error)>;

    virtual ~ITransportAcceptor() = default;

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Binds the listener and spawns the accept loop.
    // Returns:
    //   Ready future on success; a future holding errors::BindError when the port cannot be bound.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the listener and every open connection/session. Disconnection handlers fire for each.
    // Returns:
    //   Future that completes once teardown ran on the I/O thread.
    //==========================================================================================================
    virtual std::future<void> Stop() = 0;

    // Bound port; 0 before a successful Start().
    virtual uint16_t Port() const = 0;

    /////////////////////////////////////////// Handlers ///////////////////////////////////////////
    virtual void SetMessageHandler(MessageHandler handler) = 0;
    virtual void SetConnectionHandler(ConnectionHandler handler) = 0;
    virtual void SetDisconnectionHandler(ConnectionHandler handler) = 0;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;

    /////////////////////////////////////////// Fan-out ///////////////////////////////////////////
    //==========================================================================================================
    // Sends one notification to every open client. Best effort, no buffering for absent clients.
    // Returns:
    //   Future resolving to the number of recipients the notification was queued for.
    //==========================================================================================================
    virtual std::future<std::size_t> Broadcast(const JSONRPCNotification& notification) = 0;

    // Open connections/sessions; safe to read from any thread.
    virtual std::size_t ClientCount() const = 0;
};

//==========================================================================================================
// ITransportAcceptorFactory
// Purpose: Creates acceptors from URI-style configuration strings bound to a shared io_context.
//==========================================================================================================
class ITransportAcceptorFactory {
public:
    virtual ~ITransportAcceptorFactory() = default;

    virtual std::unique_ptr<ITransportAcceptor> CreateTransportAcceptor(boost::asio::io_context& ioc,
                                                                        const std::string& config) = 0;
};

//==========================================================================================================
// EndpointConfig
// Purpose: Parsed form of a factory configuration string "<scheme>://<address>:<port>?k=v&k2=v2".
// Notes:
//   - Scheme, address and port may each be omitted; the supplied defaults are used instead.
//   - IPv6 literals use the bracketed form "[::1]:8080". A path component is ignored.
//==========================================================================================================
struct EndpointConfig {
    std::string scheme;
    std::string address;
    uint16_t port{0};
    std::unordered_map<std::string, std::string> query;
};

//==========================================================================================================
// ParseEndpointConfig
// Throws:
//   std::invalid_argument when the port is non-numeric or outside [0, 65535].
//==========================================================================================================
EndpointConfig ParseEndpointConfig(const std::string& config,
                                   const std::string& defaultScheme,
                                   const std::string& defaultAddress,
                                   uint16_t defaultPort);

} // namespace idebridge
