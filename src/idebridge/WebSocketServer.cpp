//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/idebridge/WebSocketServer.cpp
// Purpose: Persistent-socket JSON-RPC transport using Boost.Beast WebSocket over a shared io_context
//==========================================================================================================

#include <atomic>
#include <deque>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "logging/Logger.h"
#include "idebridge/WebSocketServer.hpp"
#include "idebridge/errors/Errors.h"

namespace idebridge {
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

namespace {

// Expected ways for a peer to go away; logged at DEBUG rather than reported as errors.
bool isDisconnect(const boost::system::error_code& ec) {
    return ec == websocket::error::closed || ec == net::error::eof || ec == net::error::operation_aborted ||
           ec == net::error::connection_reset || ec == net::error::broken_pipe || ec == beast::error::timeout;
}

//==========================================================================================================
// Connection
// Purpose: One accepted WebSocket client. Touched only on the I/O thread.
// Notes:
//   - outbox serializes writes: at most one async_write is in flight per connection.
//   - open turns false on close; later Enqueue calls drop the frame.
//==========================================================================================================
struct Connection : std::enable_shared_from_this<Connection> {
    std::string id;
    websocket::stream<beast::tcp_stream> ws;
    std::deque<std::string> outbox;
    bool writing{false};
    bool open{false};

    Connection(std::string clientId, tcp::socket socket)
        : id(std::move(clientId)), ws(std::move(socket)) {}

    void Enqueue(std::string frame) {
        if (!open) {
            LOG_DEBUG("WebSocketServer: dropping frame for closed connection {}", id);
            return;
        }
        outbox.push_back(std::move(frame));
        if (!writing) {
            writing = true;
            net::co_spawn(ws.get_executor(), drain(shared_from_this()), net::detached);
        }
    }

    void Abort() {
        open = false;
        beast::error_code ec;
        beast::get_lowest_layer(ws).socket().shutdown(tcp::socket::shutdown_both, ec);
        beast::get_lowest_layer(ws).socket().close(ec);
    }

    static net::awaitable<void> drain(std::shared_ptr<Connection> self) {
        try {
            while (self->open && !self->outbox.empty()) {
                co_await self->ws.async_write(net::buffer(self->outbox.front()), net::use_awaitable);
                self->outbox.pop_front();
            }
        } catch (const boost::system::system_error& e) {
            LOG_DEBUG("WebSocketServer: write to {} failed: {}", self->id, e.what());
            self->Abort();
        }
        self->writing = false;
        co_return;
    }
};

//==========================================================================================================
// WsReplyChannel
// Purpose: Routes a reply back to the originating connection. Holds only a weak reference so a
//          reply completing after disconnect is swallowed.
//==========================================================================================================
class WsReplyChannel : public IReplyChannel {
public:
    explicit WsReplyChannel(std::weak_ptr<Connection> conn) : conn_(std::move(conn)) {}

    void Deliver(std::string payload) override {
        auto conn = conn_.lock();
        if (!conn) {
            LOG_DEBUG("WebSocketServer: reply dropped, connection gone");
            return;
        }
        net::post(conn->ws.get_executor(), [conn, payload = std::move(payload)]() mutable {
            conn->Enqueue(std::move(payload));
        });
    }

private:
    std::weak_ptr<Connection> conn_;
};

} // namespace

class WebSocketServer::Impl {
public:
    net::io_context& ioc;
    WebSocketServer::Options opts;
    std::atomic<bool> running{false};
    std::atomic<uint16_t> boundPort{0};
    std::atomic<std::size_t> clientCount{0};

    std::unique_ptr<tcp::acceptor> acceptor;
    std::unordered_map<std::string, std::shared_ptr<Connection>> connections;
    uint64_t nextConnectionId{0};

    ITransportAcceptor::MessageHandler messageHandler;
    ITransportAcceptor::ConnectionHandler connectHandler;
    ITransportAcceptor::ConnectionHandler disconnectHandler;
    ITransportAcceptor::ErrorHandler errorHandler;

    Impl(net::io_context& ctx, const WebSocketServer::Options& o) : ioc(ctx), opts(o) {}

    void setError(const std::string& msg) {
        if (errorHandler) {
            errorHandler(msg);
        } else {
            LOG_ERROR("{}", msg);
        }
    }

    void bind() {
        boost::system::error_code ec;
        auto fail = [this](const boost::system::error_code& err) {
            throw errors::BindError(errors::classifyBindError(err, opts.port));
        };
        auto address = net::ip::make_address(opts.address, ec);
        if (ec) { fail(ec); }
        tcp::endpoint ep{address, opts.port};

        auto acc = std::make_unique<tcp::acceptor>(ioc);
        acc->open(ep.protocol(), ec);
        if (ec) { fail(ec); }
        acc->set_option(tcp::acceptor::reuse_address(true), ec);
        acc->bind(ep, ec);
        if (ec) { fail(ec); }
        acc->listen(net::socket_base::max_listen_connections, ec);
        if (ec) { fail(ec); }

        boundPort.store(acc->local_endpoint().port());
        acceptor = std::move(acc);
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                net::co_spawn(ioc, session(std::move(socket)), net::detached);
            }
        } catch (const boost::system::system_error& e) {
            if (!running.load()) {
                LOG_DEBUG("WebSocketServer accept suppressed during shutdown: {}", e.what());
            } else {
                setError(std::string("WebSocketServer accept error: ") + e.what());
            }
        }
        co_return;
    }

    net::awaitable<void> session(tcp::socket socket) {
        auto conn = std::make_shared<Connection>("ws-" + std::to_string(++nextConnectionId), std::move(socket));
        try {
            conn->ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
            conn->ws.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
                res.set(http::field::server, "idebridge");
            }));
            co_await conn->ws.async_accept(net::use_awaitable);
            if (!running.load()) {
                conn->Abort();
                co_return;
            }
            conn->ws.text(true);
            conn->open = true;
            connections.emplace(conn->id, conn);
            clientCount.fetch_add(1);
            LOG_INFO("WebSocketServer: client {} connected ({} open)", conn->id, clientCount.load());
            if (connectHandler) { connectHandler(conn->id); }

            beast::flat_buffer buffer;
            for (;;) {
                co_await conn->ws.async_read(buffer, net::use_awaitable);
                std::string frame = beast::buffers_to_string(buffer.data());
                buffer.consume(buffer.size());
                handleFrame(conn, frame);
            }
        } catch (const boost::system::system_error& e) {
            if (!running.load() || isDisconnect(e.code())) {
                LOG_DEBUG("WebSocketServer: connection {} ended: {}", conn->id, e.what());
            } else {
                setError(std::string("WebSocketServer connection error: ") + e.what());
            }
        } catch (const std::exception& e) {
            setError(std::string("WebSocketServer connection error: ") + e.what());
        }
        removeConnection(conn);
        co_return;
    }

    void removeConnection(const std::shared_ptr<Connection>& conn) {
        conn->Abort();
        if (connections.erase(conn->id) == 0) {
            return;
        }
        clientCount.fetch_sub(1);
        LOG_INFO("WebSocketServer: client {} disconnected ({} open)", conn->id, clientCount.load());
        if (disconnectHandler) { disconnectHandler(conn->id); }
    }

    void handleFrame(const std::shared_ptr<Connection>& conn, const std::string& text) {
        JSONValue doc;
        try {
            doc = ParseJSON(text);
        } catch (const std::exception& e) {
            LOG_DEBUG("WebSocketServer: invalid JSON from {} dropped: {}", conn->id, e.what());
            return;
        }
        auto env = DecodeEnvelope(doc);
        if (!env) {
            LOG_DEBUG("WebSocketServer: non-object frame from {} dropped", conn->id);
            return;
        }
        switch (env->kind) {
            case EnvelopeKind::Request:
                dispatch(*env, Reply(*env->id, std::make_shared<WsReplyChannel>(conn)));
                break;
            case EnvelopeKind::Notification:
                dispatch(*env, Reply{});
                break;
            case EnvelopeKind::Response:
                LOG_DEBUG("WebSocketServer: unsolicited response from {} ignored", conn->id);
                break;
            case EnvelopeKind::Invalid:
                if (env->id) {
                    Reply(*env->id, std::make_shared<WsReplyChannel>(conn))
                        .Error(JSONRPCErrorCodes::InvalidRequest, "Invalid Request");
                } else {
                    LOG_DEBUG("WebSocketServer: malformed envelope from {} dropped", conn->id);
                }
                break;
        }
    }

    void dispatch(const Envelope& env, Reply reply) {
        if (!messageHandler) {
            reply.Error(JSONRPCErrorCodes::InternalError, "No message handler registered");
            return;
        }
        try {
            messageHandler(env, reply);
        } catch (const std::exception& e) {
            LOG_ERROR("WebSocketServer: handler for {} threw: {}", env.method, e.what());
            reply.Error(JSONRPCErrorCodes::InternalError, e.what());
        }
    }

    // I/O thread only.
    void shutdown() {
        if (acceptor) {
            boost::system::error_code ec;
            acceptor->close(ec);
        }
        std::vector<std::shared_ptr<Connection>> open;
        open.reserve(connections.size());
        for (auto& [id, conn] : connections) {
            open.push_back(conn);
        }
        for (auto& conn : open) {
            removeConnection(conn);
        }
    }
};

WebSocketServer::WebSocketServer(net::io_context& ioc, const Options& opts)
    : pImpl(std::make_unique<Impl>(ioc, opts)) {}

WebSocketServer::~WebSocketServer() = default;

std::future<void> WebSocketServer::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    auto fut = ready.get_future();
    if (pImpl->running.load()) {
        ready.set_value();
        return fut;
    }
    try {
        pImpl->bind();
    } catch (const errors::BindError& e) {
        LOG_ERROR("WebSocketServer: {}", e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running.store(true);
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    LOG_INFO("WebSocketServer: listening on {}:{}", pImpl->opts.address, pImpl->boundPort.load());
    ready.set_value();
    return fut;
}

std::future<void> WebSocketServer::Stop() {
    auto done = std::make_shared<std::promise<void>>();
    auto fut = done->get_future();
    if (!pImpl->running.exchange(false)) {
        done->set_value();
        return fut;
    }
    net::dispatch(pImpl->ioc, [impl = pImpl.get(), done]() {
        impl->shutdown();
        done->set_value();
    });
    return fut;
}

uint16_t WebSocketServer::Port() const {
    return pImpl->boundPort.load();
}

void WebSocketServer::SetMessageHandler(MessageHandler handler) {
    pImpl->messageHandler = std::move(handler);
}

void WebSocketServer::SetConnectionHandler(ConnectionHandler handler) {
    pImpl->connectHandler = std::move(handler);
}

void WebSocketServer::SetDisconnectionHandler(ConnectionHandler handler) {
    pImpl->disconnectHandler = std::move(handler);
}

void WebSocketServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

std::future<std::size_t> WebSocketServer::Broadcast(const JSONRPCNotification& notification) {
    auto promise = std::make_shared<std::promise<std::size_t>>();
    auto fut = promise->get_future();
    if (!pImpl->running.load()) {
        promise->set_value(0);
        return fut;
    }
    std::string payload = notification.Serialize();
    net::dispatch(pImpl->ioc, [impl = pImpl.get(), promise, payload = std::move(payload)]() {
        std::size_t sent = 0;
        for (auto& [id, conn] : impl->connections) {
            if (conn->open) {
                conn->Enqueue(payload);
                ++sent;
            }
        }
        LOG_DEBUG("WebSocketServer: broadcast queued for {} client(s)", sent);
        promise->set_value(sent);
    });
    return fut;
}

std::size_t WebSocketServer::ClientCount() const {
    return pImpl->clientCount.load();
}

std::unique_ptr<ITransportAcceptor> WebSocketServerFactory::CreateTransportAcceptor(net::io_context& ioc,
                                                                                    const std::string& config) {
    EndpointConfig ep = ParseEndpointConfig(config, "ws", "127.0.0.1", 0);
    if (ep.scheme != "ws") {
        throw std::invalid_argument("WebSocketServerFactory: unsupported scheme: " + ep.scheme);
    }
    WebSocketServer::Options opts;
    opts.address = ep.address;
    opts.port = ep.port;
    return std::unique_ptr<ITransportAcceptor>(new WebSocketServer(ioc, opts));
}

} // namespace idebridge
