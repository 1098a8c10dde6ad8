//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DualServer.cpp
// Purpose: Orchestrator lifecycle: registration, partial-success startup, discovery and fan-out
//==========================================================================================================

#include <sstream>
#include <stdexcept>

#include "idebridge/DualServer.h"
#include "idebridge/StreamableHTTPServer.hpp"
#include "idebridge/WebSocketServer.hpp"
#include "idebridge/tools/GeneralTools.h"
#include "idebridge/tools/IdeTools.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace idebridge {
namespace net = boost::asio;

namespace {

constexpr auto kTransportStopTimeout = std::chrono::seconds(2);

void overlayPort(const char* name, uint16_t& target) {
    auto v = GetEnvInt(name);
    if (!v) {
        return;
    }
    if (*v < 0 || *v > 65535) {
        LOG_WARN("DualServer: ignoring {}={} (out of range)", name, *v);
        return;
    }
    target = static_cast<uint16_t>(*v);
}

std::string joinNames(const std::vector<std::string>& names) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << names[i];
    }
    return oss.str();
}

} // namespace

DualServer::Options DualServer::Options::FromEnvironment(Options base) {
    overlayPort("IDEBRIDGE_HTTP_PORT", base.httpPort);
    overlayPort("IDEBRIDGE_WS_PORT", base.webSocketPort);
    base.enableWebSocket = GetEnvFlag("IDEBRIDGE_ENABLE_WS", base.enableWebSocket);
    base.enableHttp = GetEnvFlag("IDEBRIDGE_ENABLE_HTTP", base.enableHttp);
    base.ideName = GetEnvOrDefault("IDEBRIDGE_IDE_NAME", base.ideName);
    if (auto hb = GetEnvInt("IDEBRIDGE_HEARTBEAT_MS")) {
        if (*hb > 0) {
            base.heartbeatInterval = std::chrono::milliseconds(*hb);
        } else {
            LOG_WARN("DualServer: ignoring IDEBRIDGE_HEARTBEAT_MS={} (must be positive)", *hb);
        }
    }
    return base;
}

DualServer::DualServer(Options opts, HostServices host)
    : opts_(std::move(opts)),
      host_(std::move(host)),
      discovery_(opts_.ideName, opts_.configDirOverride) {
    FUNC_SCOPE();
    tools::RegisterGeneralTools(wsTools_, host_);
    tools::RegisterGeneralTools(httpTools_, host_);
    tools::RegisterIdeTools(wsTools_, host_);
    wsTools_.Seal();
    httpTools_.Seal();

    const std::string wsNames = joinNames(wsTools_.GetRegisteredToolNames());
    const std::string httpNames = joinNames(httpTools_.GetRegisteredToolNames());
    LOG_DEBUG("DualServer: WebSocket tools: {}", wsNames);
    LOG_DEBUG("DualServer: HTTP tools: {}", httpNames);

    integration_ = std::make_shared<IdeIntegrationHandler>(ioc_, opts_.onInitialContext, opts_.initialContextDelay);
    router_ = std::make_unique<RequestRouter>(wsTools_, httpTools_, host_,
                                              Implementation(opts_.serverName, SERVER_VERSION), integration_);

    if (opts_.enableWebSocket) {
        WebSocketServer::Options wo;
        wo.address = opts_.bindAddress;
        wo.port = opts_.webSocketPort;
        wsServer_ = std::make_unique<WebSocketServer>(ioc_, wo);
        wireTransport(*wsServer_, TransportSource::WebSocket);
    }
    if (opts_.enableHttp) {
        StreamableHTTPServer::Options ho;
        ho.address = opts_.bindAddress;
        ho.port = opts_.httpPort;
        ho.heartbeatInterval = opts_.heartbeatInterval;
        httpServer_ = std::make_unique<StreamableHTTPServer>(ioc_, ho);
        wireTransport(*httpServer_, TransportSource::Http);
    }
}

DualServer::~DualServer() {
    Stop();
}

void DualServer::wireTransport(ITransportAcceptor& transport, TransportSource source) {
    transport.SetMessageHandler([this, source](const Envelope& envelope, Reply reply) {
        router_->Dispatch(envelope, source, std::move(reply));
    });
    transport.SetConnectionHandler([this, source](const std::string& clientId) {
        LOG_INFO("DualServer: {} client connected: {}", toString(source), clientId);
        if (opts_.onClientConnected) {
            opts_.onClientConnected(source, clientId);
        }
    });
    transport.SetDisconnectionHandler([this, source](const std::string& clientId) {
        LOG_INFO("DualServer: {} client disconnected: {}", toString(source), clientId);
        if (opts_.onClientDisconnected) {
            opts_.onClientDisconnected(source, clientId);
        }
    });
    transport.SetErrorHandler([source](const std::string& error) {
        LOG_ERROR("DualServer: {} transport error: {}", toString(source), error);
    });
}

DualServer::StartResult DualServer::Start() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(lifecycleMtx_);
    StartResult result;
    if (stopped_.load()) {
        throw std::logic_error("DualServer cannot be restarted after Stop()");
    }
    if (running_.load()) {
        if (wsListening_.load()) { result.webSocketPort = wsServer_->Port(); }
        if (httpListening_.load()) { result.httpPort = httpServer_->Port(); }
        return result;
    }

    ioc_.restart();
    work_.emplace(net::make_work_guard(ioc_));
    ioThread_ = std::thread([this]() {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            LOG_ERROR("DualServer: I/O thread terminated: {}", e.what());
        }
    });

    if (wsServer_) {
        try {
            wsServer_->Start().get();
            wsListening_.store(true);
            result.webSocketPort = wsServer_->Port();
            try {
                discovery_.Publish(*result.webSocketPort, {});
                discovery_.UpdateWorkspaceFolders(opts_.workspaceFolders);
            } catch (const std::exception& e) {
                LOG_ERROR("DualServer: failed to publish discovery record: {}", e.what());
            }
        } catch (const errors::BindError& e) {
            result.webSocketFault = e.fault();
            LOG_ERROR("DualServer: WebSocket transport unavailable ({}): {}", toString(e.fault().kind), e.what());
        }
    }

    if (httpServer_) {
        try {
            httpServer_->Start().get();
            httpListening_.store(true);
            result.httpPort = httpServer_->Port();
        } catch (const errors::BindError& e) {
            result.httpFault = e.fault();
            LOG_ERROR("DualServer: HTTP transport unavailable ({}): {}", toString(e.fault().kind), e.what());
        }
    }

    if (!result.AnyRunning()) {
        LOG_ERROR("DualServer: no transport could be started");
        work_.reset();
        ioc_.stop();
        if (ioThread_.joinable()) {
            ioThread_.join();
        }
        return result;
    }

    running_.store(true);
    const std::string ws = result.webSocketPort ? std::to_string(*result.webSocketPort) : "disabled";
    const std::string http = result.httpPort ? std::to_string(*result.httpPort) : "disabled";
    LOG_INFO("DualServer: started (ws: {}, http: {})", ws, http);
    return result;
}

void DualServer::Stop() {
    if (ioThread_.joinable() && std::this_thread::get_id() == ioThread_.get_id()) {
        LOG_ERROR("DualServer: Stop() called from the I/O thread; ignored");
        return;
    }
    std::lock_guard<std::mutex> lock(lifecycleMtx_);
    if (!running_.exchange(false)) {
        return;
    }
    stopped_.store(true);
    LOG_INFO("DualServer: stopping");

    std::vector<std::future<void>> pending;
    if (wsServer_ && wsListening_.exchange(false)) {
        pending.push_back(wsServer_->Stop());
    }
    if (httpServer_ && httpListening_.exchange(false)) {
        pending.push_back(httpServer_->Stop());
    }
    for (auto& f : pending) {
        if (f.wait_for(kTransportStopTimeout) != std::future_status::ready) {
            LOG_WARN("DualServer: transport did not stop within {} s", kTransportStopTimeout.count());
        }
    }

    discovery_.Remove();

    work_.reset();
    ioc_.stop();
    if (ioThread_.joinable()) {
        ioThread_.join();
    }
    LOG_INFO("DualServer: stopped");
}

std::future<std::size_t> DualServer::Broadcast(const JSONRPCNotification& notification) {
    std::vector<std::future<std::size_t>> parts;
    if (running_.load()) {
        if (wsServer_ && wsListening_.load()) {
            parts.push_back(wsServer_->Broadcast(notification));
        }
        if (httpServer_ && httpListening_.load()) {
            parts.push_back(httpServer_->Broadcast(notification));
        }
    }
    return std::async(std::launch::deferred, [parts = std::move(parts)]() mutable {
        std::size_t total = 0;
        for (auto& p : parts) {
            total += p.get();
        }
        return total;
    });
}

std::size_t DualServer::WebSocketClientCount() const {
    return wsServer_ ? wsServer_->ClientCount() : 0;
}

std::size_t DualServer::HttpClientCount() const {
    return httpServer_ ? httpServer_->ClientCount() : 0;
}

void DualServer::UpdateWorkspaceFolders(const std::vector<std::string>& folders) {
    discovery_.UpdateWorkspaceFolders(folders);
}

DualServer::ServerInfo DualServer::GetServerInfo() const {
    ServerInfo info;
    if (wsListening_.load()) {
        info.webSocketPort = wsServer_->Port();
    }
    if (httpListening_.load()) {
        info.httpPort = httpServer_->Port();
    }
    info.webSocketClients = WebSocketClientCount();
    info.httpClients = HttpClientCount();
    return info;
}

const ToolRegistry& DualServer::Tools(TransportSource source) const {
    return source == TransportSource::WebSocket ? wsTools_ : httpTools_;
}

std::vector<Tool> DualServer::GetToolsByCategory(ToolCategory category, TransportSource source) const {
    return Tools(source).GetToolDefinitions(category);
}

void DualServer::ValidateToolRegistration() const {
    for (TransportSource source : {TransportSource::WebSocket, TransportSource::Http}) {
        const ToolRegistry& reg = Tools(source);
        const std::size_t general = reg.GetToolDefinitions(ToolCategory::General).size() +
                                    reg.GetToolDefinitions(ToolCategory::File).size() +
                                    reg.GetToolDefinitions(ToolCategory::Workspace).size();
        const std::size_t ide = reg.GetToolDefinitions(ToolCategory::IdeSpecific).size();
        LOG_INFO("DualServer: {} tools: total={}, general={}, ide-specific={}", toString(source), reg.Size(), general, ide);
    }
}

} // namespace idebridge
