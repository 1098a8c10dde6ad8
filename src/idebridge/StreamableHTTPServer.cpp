//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/idebridge/StreamableHTTPServer.cpp
// Purpose: SSE session streams and POST submission channel using Boost.Beast over a shared io_context
//==========================================================================================================

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <deque>
#include <random>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "idebridge/StreamableHTTPServer.hpp"
#include "idebridge/errors/Errors.h"

namespace idebridge {
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

// Ids of closed sessions remembered for 410 answers.
constexpr std::size_t kMaxRetiredSessions = 4096;
constexpr std::chrono::milliseconds kDefaultHeartbeat{30000};

int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string toStdString(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

// Formats one SSE frame: "id: <n>\nevent: <name>\ndata: <payload>\n\n".
std::string formatEvent(uint64_t id, const std::string& event, const std::string& data) {
    std::string out;
    out.reserve(data.size() + event.size() + 40);
    out += "id: ";
    out += std::to_string(id);
    out += "\nevent: ";
    out += event;
    out += "\ndata: ";
    out += data;
    out += "\n\n";
    return out;
}

std::string percentDecode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size() && std::isxdigit(static_cast<unsigned char>(in[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(in.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else if (in[i] == '+') {
            out.push_back(' ');
        } else {
            out.push_back(in[i]);
        }
    }
    return out;
}

// Returns the value of a query parameter, or empty when absent.
std::string queryParam(const std::string& query, const std::string& key) {
    std::stringstream ss(query);
    std::string kv;
    while (std::getline(ss, kv, '&')) {
        auto eq = kv.find('=');
        std::string k = (eq == std::string::npos) ? kv : kv.substr(0, eq);
        if (k == key) {
            return (eq == std::string::npos) ? std::string() : percentDecode(kv.substr(eq + 1));
        }
    }
    return std::string();
}

template <class Body>
void applyCors(http::response<Body>& res) {
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type, Last-Event-ID, Mcp-Session-Id");
}

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

Response makeResponse(unsigned version, http::status status, std::string body,
                      const char* contentType = "application/json") {
    Response res{status, version};
    applyCors(res);
    res.keep_alive(false);
    if (!body.empty()) {
        res.set(http::field::content_type, contentType);
    }
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

Response makeResponse(const Request& req, http::status status, std::string body,
                      const char* contentType = "application/json") {
    return makeResponse(req.version(), status, std::move(body), contentType);
}

Response jsonError(const Request& req, http::status status, const std::string& message) {
    return makeResponse(req, status, SerializeJSON(MakeObject({{"error", JSONValue(message)}})));
}

//==========================================================================================================
// SseSession
// Purpose: One open event stream. Touched only on the I/O thread.
// Notes:
//   - INIT while headers and the endpoint event are written, OPEN afterwards, CLOSED after teardown.
//   - Emit queues a frame; a single writer coroutine drains the queue in order.
//==========================================================================================================
struct SseSession : std::enable_shared_from_this<SseSession> {
    enum class State { Init, Open, Closed };

    std::string id;
    beast::tcp_stream stream;
    net::steady_timer heartbeat;
    std::shared_ptr<std::atomic<uint64_t>> eventIds;
    std::chrono::steady_clock::time_point createdAt{std::chrono::steady_clock::now()};
    State state{State::Init};
    std::deque<std::string> outbox;
    bool writing{false};

    SseSession(std::string sessionId, beast::tcp_stream&& s, std::shared_ptr<std::atomic<uint64_t>> ids)
        : id(std::move(sessionId)),
          stream(std::move(s)),
          heartbeat(stream.get_executor()),
          eventIds(std::move(ids)) {}

    void Emit(const std::string& event, const std::string& data) {
        if (state == State::Closed) {
            return;
        }
        outbox.push_back(formatEvent(eventIds->fetch_add(1) + 1, event, data));
        if (!writing) {
            writing = true;
            net::co_spawn(stream.get_executor(), drain(shared_from_this()), net::detached);
        }
    }

    void CloseSocket() {
        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        stream.socket().close(ec);
    }

    // Failed writes close the socket; the session's read loop then observes the error and tears down.
    static net::awaitable<void> drain(std::shared_ptr<SseSession> self) {
        try {
            while (self->state != State::Closed && !self->outbox.empty()) {
                co_await net::async_write(self->stream, net::buffer(self->outbox.front()), net::use_awaitable);
                self->outbox.pop_front();
            }
        } catch (const boost::system::system_error& e) {
            LOG_DEBUG("StreamableHTTPServer: write to session {} failed: {}", self->id, e.what());
            self->CloseSocket();
        }
        self->writing = false;
        co_return;
    }
};

//==========================================================================================================
// SseReplyChannel
// Purpose: Delivers a reply as a "message" event on the session that submitted the request.
//          Delivery to a session that is no longer OPEN is a silent no-op.
//==========================================================================================================
class SseReplyChannel : public IReplyChannel {
public:
    explicit SseReplyChannel(std::weak_ptr<SseSession> session) : session_(std::move(session)) {}

    void Deliver(std::string payload) override {
        auto session = session_.lock();
        if (!session) {
            LOG_DEBUG("StreamableHTTPServer: reply dropped, session gone");
            return;
        }
        net::post(session->stream.get_executor(), [session, payload = std::move(payload)]() {
            if (session->state != SseSession::State::Open) {
                LOG_DEBUG("StreamableHTTPServer: reply dropped, session {} not open", session->id);
                return;
            }
            session->Emit("message", payload);
        });
    }

private:
    std::weak_ptr<SseSession> session_;
};

bool isStreamPath(const std::string& path) {
    return path == "/sse" || path == "/sse/" || path == "/mcp";
}

bool isSubmitPath(const std::string& path) {
    return path == "/messages" || path == "/messages/" || path == "/mcp";
}

bool isDisconnect(const boost::system::error_code& ec) {
    return ec == net::error::eof || ec == net::error::operation_aborted || ec == net::error::connection_reset ||
           ec == net::error::broken_pipe || ec == http::error::end_of_stream || ec == http::error::partial_message ||
           ec == net::error::bad_descriptor;
}

// Errors raised by the request parser itself (bad request line, bad headers, body over the limit).
bool isParseFailure(const boost::system::error_code& ec) {
    return ec.category() == http::make_error_code(http::error::bad_method).category();
}

} // namespace

class StreamableHTTPServer::Impl {
public:
    net::io_context& ioc;
    StreamableHTTPServer::Options opts;
    std::atomic<bool> running{false};
    std::atomic<uint16_t> boundPort{0};
    std::atomic<std::size_t> clientCount{0};

    std::unique_ptr<tcp::acceptor> acceptor;
    std::unordered_map<std::string, std::shared_ptr<SseSession>> sessions;
    std::unordered_set<std::string> retired;
    std::deque<std::string> retiredOrder;
    std::shared_ptr<std::atomic<uint64_t>> eventIds{std::make_shared<std::atomic<uint64_t>>(0)};
    std::mt19937 rng{std::random_device{}()};

    ITransportAcceptor::MessageHandler messageHandler;
    ITransportAcceptor::ConnectionHandler connectHandler;
    ITransportAcceptor::ConnectionHandler disconnectHandler;
    ITransportAcceptor::ErrorHandler errorHandler;

    Impl(net::io_context& ctx, const StreamableHTTPServer::Options& o) : ioc(ctx), opts(o) {
        if (opts.heartbeatInterval <= std::chrono::milliseconds::zero()) {
            LOG_WARN("StreamableHTTPServer: heartbeat interval {}ms is not positive, using {}ms",
                     opts.heartbeatInterval.count(), kDefaultHeartbeat.count());
            opts.heartbeatInterval = kDefaultHeartbeat;
        }
    }

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

    //==========================================================================================================
    // Session id: session_<epoch millis>_<9 base36 chars>, unique among live and retired sessions.
    //==========================================================================================================
    std::string mintSessionId() {
        static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
        std::uniform_int_distribution<int> pick(0, 35);
        for (;;) {
            std::string suffix;
            for (int i = 0; i < 9; ++i) {
                suffix.push_back(kAlphabet[pick(rng)]);
            }
            std::string id = "session_" + std::to_string(nowMillis()) + "_" + suffix;
            if (sessions.count(id) == 0 && retired.count(id) == 0) {
                return id;
            }
        }
    }

    void retire(const std::string& id) {
        if (!retired.insert(id).second) {
            return;
        }
        retiredOrder.push_back(id);
        if (retiredOrder.size() > kMaxRetiredSessions) {
            retired.erase(retiredOrder.front());
            retiredOrder.pop_front();
        }
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                net::co_spawn(ioc, session(std::move(socket)), net::detached);
            }
        } catch (const boost::system::system_error& e) {
            if (!running.load()) {
                LOG_DEBUG("StreamableHTTPServer accept suppressed during shutdown: {}", e.what());
            } else {
                setError(std::string("StreamableHTTPServer accept error: ") + e.what());
            }
        }
        co_return;
    }

    net::awaitable<void> session(tcp::socket socket) {
        try {
            beast::tcp_stream stream(std::move(socket));
            beast::flat_buffer buffer;
            http::request_parser<http::string_body> parser;
            parser.body_limit(opts.maxBodyBytes);
            boost::system::error_code readEc;
            co_await http::async_read(stream, buffer, parser, net::redirect_error(net::use_awaitable, readEc));
            if (readEc) {
                if (isDisconnect(readEc) || !isParseFailure(readEc)) {
                    throw boost::system::system_error(readEc);
                }
                const unsigned version = parser.is_header_done() ? parser.get().version() : 11;
                co_await rejectUnreadable(stream, version, readEc);
                co_return;
            }
            Request req = parser.release();

            const std::string target = toStdString(req.target());
            const auto qpos = target.find('?');
            const std::string path = target.substr(0, qpos);
            const std::string query = (qpos == std::string::npos) ? std::string() : target.substr(qpos + 1);
            LOG_DEBUG("StreamableHTTPServer: {} {}", toStdString(req.method_string()), path);

            if (req.method() == http::verb::get && isStreamPath(path)) {
                co_await runStream(std::move(stream), req, path);
                co_return;
            }

            Response res = route(req, path, query);
            co_await http::async_write(stream, res, net::use_awaitable);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const boost::system::system_error& e) {
            if (!running.load() || isDisconnect(e.code())) {
                LOG_DEBUG("StreamableHTTPServer: request connection ended: {}", e.what());
            } else {
                setError(std::string("StreamableHTTPServer session error: ") + e.what());
            }
        } catch (const std::exception& e) {
            setError(std::string("StreamableHTTPServer session error: ") + e.what());
        }
        co_return;
    }

    //==========================================================================================================
    // Answers a request the parser gave up on: 413 when the body exceeds maxBodyBytes, 400 otherwise.
    // The body is a JSON-RPC Parse error with a null id, as for an unparsable POST body.
    //==========================================================================================================
    net::awaitable<void> rejectUnreadable(beast::tcp_stream& stream, unsigned version, const boost::system::error_code& why) {
        const bool tooLarge = why == http::error::body_limit;
        LOG_DEBUG("StreamableHTTPServer: rejecting unreadable request: {}", why.message());
        auto err = CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError,
                                       tooLarge ? "Request body too large" : "Parse error");
        Response res = makeResponse(version, tooLarge ? http::status::payload_too_large : http::status::bad_request,
                                    err->Serialize());
        co_await http::async_write(stream, res, net::use_awaitable);
        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_send, ec);

        // Drain what the peer already sent so the close does not reset the connection before the reply is read.
        stream.expires_after(std::chrono::seconds(1));
        std::array<char, 1024> scratch{};
        while (!ec) {
            co_await stream.async_read_some(net::buffer(scratch), net::redirect_error(net::use_awaitable, ec));
        }
    }

    Response route(const Request& req, const std::string& path, const std::string& query) {
        if (req.method() == http::verb::options) {
            return makeResponse(req, http::status::ok, std::string());
        }
        if (req.method() == http::verb::post && isSubmitPath(path)) {
            return handlePost(req, query);
        }
        if (path == "/mcp") {
            return jsonError(req, http::status::method_not_allowed, "Method not allowed");
        }
        return jsonError(req, http::status::not_found, "Not found");
    }

    //==========================================================================================================
    // Event stream lifetime: headers, endpoint event, OPEN, heartbeat, then wait for the peer to go away.
    //==========================================================================================================
    net::awaitable<void> runStream(beast::tcp_stream stream, const Request& req, const std::string& path) {
        auto s = std::make_shared<SseSession>(mintSessionId(), std::move(stream), eventIds);
        sessions.emplace(s->id, s);
        try {
            http::response<http::empty_body> res{http::status::ok, req.version()};
            res.set(http::field::content_type, "text/event-stream");
            res.set(http::field::cache_control, "no-cache");
            res.set(http::field::connection, "keep-alive");
            applyCors(res);
            http::response_serializer<http::empty_body> sr{res};
            co_await http::async_write_header(s->stream, sr, net::use_awaitable);

            if (s->state == SseSession::State::Closed) {
                co_return;
            }
            const std::string endpoint = (path == "/mcp" ? "/mcp" : "/messages") + std::string("?session_id=") + s->id;
            s->Emit("endpoint", endpoint);
            s->state = SseSession::State::Open;
            clientCount.fetch_add(1);
            LOG_INFO("StreamableHTTPServer: session {} opened ({} open)", s->id, clientCount.load());
            if (connectHandler) { connectHandler(s->id); }
            net::co_spawn(ioc, heartbeatLoop(s), net::detached);

            std::array<char, 512> scratch{};
            for (;;) {
                co_await s->stream.socket().async_read_some(net::buffer(scratch), net::use_awaitable);
            }
        } catch (const boost::system::system_error& e) {
            if (!running.load() || isDisconnect(e.code())) {
                LOG_DEBUG("StreamableHTTPServer: session {} stream ended: {}", s->id, e.what());
            } else {
                setError(std::string("StreamableHTTPServer stream error: ") + e.what());
            }
        } catch (const std::exception& e) {
            setError(std::string("StreamableHTTPServer stream error: ") + e.what());
        }
        teardown(s);
        co_return;
    }

    net::awaitable<void> heartbeatLoop(std::shared_ptr<SseSession> s) {
        for (;;) {
            s->heartbeat.expires_after(opts.heartbeatInterval);
            boost::system::error_code ec;
            co_await s->heartbeat.async_wait(net::redirect_error(net::use_awaitable, ec));
            if (ec || s->state != SseSession::State::Open) {
                co_return;
            }
            s->Emit("ping", SerializeJSON(MakeObject({{"timestamp", JSONValue(nowMillis())}})));
        }
    }

    // Idempotent; I/O thread only.
    void teardown(const std::shared_ptr<SseSession>& s) {
        if (s->state == SseSession::State::Closed) {
            return;
        }
        const bool wasOpen = s->state == SseSession::State::Open;
        s->state = SseSession::State::Closed;
        s->heartbeat.cancel();
        sessions.erase(s->id);
        retire(s->id);
        s->CloseSocket();
        if (wasOpen) {
            clientCount.fetch_sub(1);
            LOG_INFO("StreamableHTTPServer: session {} closed ({} open)", s->id, clientCount.load());
            if (disconnectHandler) { disconnectHandler(s->id); }
        }
    }

    //==========================================================================================================
    // POST submission. Body is one envelope or an array of envelopes.
    // Status:
    //   400 missing session id or unparsable body; 404 unknown session; 410 retired session, or a
    //   request submitted while the session is not OPEN; otherwise 202 with an empty body.
    //==========================================================================================================
    Response handlePost(const Request& req, const std::string& query) {
        std::string sessionId = queryParam(query, "session_id");
        if (sessionId.empty()) {
            sessionId = toStdString(req["Mcp-Session-Id"]);
        }
        if (sessionId.empty()) {
            return jsonError(req, http::status::bad_request, "Missing session_id");
        }
        auto it = sessions.find(sessionId);
        if (it == sessions.end()) {
            if (retired.count(sessionId) != 0) {
                return jsonError(req, http::status::gone, "Session closed");
            }
            return jsonError(req, http::status::not_found, "Session not found");
        }
        std::shared_ptr<SseSession> s = it->second;

        JSONValue body;
        try {
            body = ParseJSON(req.body());
        } catch (const std::exception& e) {
            LOG_DEBUG("StreamableHTTPServer: unparsable POST body for {}: {}", sessionId, e.what());
            auto err = CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error");
            return makeResponse(req, http::status::bad_request, err->Serialize());
        }

        std::vector<Envelope> envelopes;
        auto collect = [&envelopes](const JSONValue& item) {
            auto env = DecodeEnvelope(item);
            if (!env) {
                LOG_DEBUG("StreamableHTTPServer: non-object batch element dropped");
                return;
            }
            envelopes.push_back(std::move(*env));
        };
        if (body.IsArray()) {
            for (const auto& item : std::get<JSONValue::Array>(body.value)) {
                if (item) { collect(*item); }
            }
        } else {
            collect(body);
        }

        const bool needsStream = std::any_of(envelopes.begin(), envelopes.end(), [](const Envelope& e) {
            return e.IsRequest() || (e.kind == EnvelopeKind::Invalid && e.id.has_value());
        });
        if (needsStream && s->state != SseSession::State::Open) {
            return jsonError(req, http::status::gone, "Session not open");
        }

        for (const auto& env : envelopes) {
            switch (env.kind) {
                case EnvelopeKind::Request:
                    dispatch(env, Reply(*env.id, std::make_shared<SseReplyChannel>(s)));
                    break;
                case EnvelopeKind::Notification:
                    dispatch(env, Reply{});
                    break;
                case EnvelopeKind::Response:
                    LOG_DEBUG("StreamableHTTPServer: unsolicited response on {} ignored", sessionId);
                    break;
                case EnvelopeKind::Invalid:
                    if (env.id) {
                        Reply(*env.id, std::make_shared<SseReplyChannel>(s))
                            .Error(JSONRPCErrorCodes::InvalidRequest, "Invalid Request");
                    } else {
                        LOG_DEBUG("StreamableHTTPServer: malformed envelope on {} dropped", sessionId);
                    }
                    break;
            }
        }
        return makeResponse(req, http::status::accepted, std::string());
    }

    void dispatch(const Envelope& env, Reply reply) {
        if (!messageHandler) {
            reply.Error(JSONRPCErrorCodes::InternalError, "No message handler registered");
            return;
        }
        try {
            messageHandler(env, reply);
        } catch (const std::exception& e) {
            LOG_ERROR("StreamableHTTPServer: handler for {} threw: {}", env.method, e.what());
            reply.Error(JSONRPCErrorCodes::InternalError, e.what());
        }
    }

    // I/O thread only.
    void shutdown() {
        if (acceptor) {
            boost::system::error_code ec;
            acceptor->close(ec);
        }
        std::vector<std::shared_ptr<SseSession>> open;
        open.reserve(sessions.size());
        for (auto& [id, s] : sessions) {
            open.push_back(s);
        }
        for (auto& s : open) {
            teardown(s);
        }
    }
};

StreamableHTTPServer::StreamableHTTPServer(net::io_context& ioc, const Options& opts)
    : pImpl(std::make_unique<Impl>(ioc, opts)) {}

StreamableHTTPServer::~StreamableHTTPServer() = default;

std::future<void> StreamableHTTPServer::Start() {
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
        LOG_ERROR("StreamableHTTPServer: {}", e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running.store(true);
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    LOG_INFO("StreamableHTTPServer: listening on http://{}:{}", pImpl->opts.address, pImpl->boundPort.load());
    ready.set_value();
    return fut;
}

std::future<void> StreamableHTTPServer::Stop() {
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

uint16_t StreamableHTTPServer::Port() const {
    return pImpl->boundPort.load();
}

void StreamableHTTPServer::SetMessageHandler(MessageHandler handler) {
    pImpl->messageHandler = std::move(handler);
}

void StreamableHTTPServer::SetConnectionHandler(ConnectionHandler handler) {
    pImpl->connectHandler = std::move(handler);
}

void StreamableHTTPServer::SetDisconnectionHandler(ConnectionHandler handler) {
    pImpl->disconnectHandler = std::move(handler);
}

void StreamableHTTPServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

std::future<std::size_t> StreamableHTTPServer::Broadcast(const JSONRPCNotification& notification) {
    auto promise = std::make_shared<std::promise<std::size_t>>();
    auto fut = promise->get_future();
    if (!pImpl->running.load()) {
        promise->set_value(0);
        return fut;
    }
    std::string payload = notification.Serialize();
    net::dispatch(pImpl->ioc, [impl = pImpl.get(), promise, payload = std::move(payload)]() {
        std::size_t sent = 0;
        for (auto& [id, s] : impl->sessions) {
            if (s->state == SseSession::State::Open) {
                s->Emit("message", payload);
                ++sent;
            }
        }
        LOG_DEBUG("StreamableHTTPServer: broadcast queued for {} session(s)", sent);
        promise->set_value(sent);
    });
    return fut;
}

std::size_t StreamableHTTPServer::ClientCount() const {
    return pImpl->clientCount.load();
}

std::unique_ptr<ITransportAcceptor> StreamableHTTPServerFactory::CreateTransportAcceptor(net::io_context& ioc,
                                                                                        const std::string& config) {
    EndpointConfig ep = ParseEndpointConfig(config, "http", "127.0.0.1", 22360);
    if (ep.scheme != "http") {
        throw std::invalid_argument("StreamableHTTPServerFactory: unsupported scheme: " + ep.scheme);
    }
    StreamableHTTPServer::Options opts;
    opts.address = ep.address;
    opts.port = ep.port;
    auto hb = ep.query.find("heartbeat_ms");
    if (hb != ep.query.end() && !hb->second.empty()) {
        long long ms = 0;
        try {
            std::size_t used = 0;
            ms = std::stoll(hb->second, &used);
            if (used != hb->second.size()) {
                throw std::invalid_argument(hb->second);
            }
        } catch (const std::logic_error&) {
            throw std::invalid_argument("StreamableHTTPServerFactory: invalid heartbeat_ms: " + hb->second);
        }
        if (ms > 0) {
            opts.heartbeatInterval = std::chrono::milliseconds(ms);
        } else {
            LOG_WARN("StreamableHTTPServerFactory: ignoring heartbeat_ms={} (must be positive)", ms);
        }
    }
    return std::unique_ptr<ITransportAcceptor>(new StreamableHTTPServer(ioc, opts));
}

} // namespace idebridge
