//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DualServer.h
// Purpose: Orchestrator owning the I/O thread, both transports, both tool registries and discovery
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "idebridge/DiscoveryPublisher.h"
#include "idebridge/HostServices.h"
#include "idebridge/IdeIntegrationHandler.h"
#include "idebridge/Protocol.h"
#include "idebridge/RequestRouter.h"
#include "idebridge/ToolRegistry.h"
#include "idebridge/Transport.h"
#include "idebridge/errors/Errors.h"

namespace idebridge {

//==========================================================================================================
// DualServer
// Purpose: Runs the WebSocket transport (editor agents, advertised through a discovery record) and the
//          streaming HTTP transport (generic MCP clients) side by side on one io_context.
// Notes:
//   - Each half starts independently; a bind failure on one never aborts the other.
//   - The discovery record is written only after the WebSocket listener is bound.
//   - Public methods are safe to call from the host thread while the I/O thread runs.
//==========================================================================================================
class DualServer {
public:
    using ClientEventCallback = std::function<void(TransportSource source, const std::string& clientId)>;

    //==========================================================================================================
    // Options
    // Fields:
    //   ideName: Written to the discovery record
    //   serverName: serverInfo.name reported by initialize
    //   enableWebSocket / enableHttp: Start the corresponding transport
    //   webSocketPort: 0 lets the OS pick (the usual case; clients find it through discovery)
    //   httpPort: Fixed port for generic MCP clients (default 22360)
    //   workspaceFolders: Written to the discovery record after publish
    //   heartbeatInterval: SSE ping period
    //   initialContextDelay: Delay between notifications/initialized and onInitialContext
    //   configDirOverride: Discovery directory override (tests)
    //==========================================================================================================
    struct Options {
        Options();

        std::string ideName{"idebridge"};
        std::string serverName{"idebridge"};
        std::string bindAddress{"127.0.0.1"};
        bool enableWebSocket{true};
        bool enableHttp{true};
        uint16_t webSocketPort{0};
        uint16_t httpPort{22360};
        std::vector<std::string> workspaceFolders;
        std::chrono::milliseconds heartbeatInterval{std::chrono::seconds(30)};
        std::chrono::milliseconds initialContextDelay{std::chrono::milliseconds(200)};
        std::optional<std::filesystem::path> configDirOverride;

        std::function<void()> onInitialContext;
        ClientEventCallback onClientConnected;
        ClientEventCallback onClientDisconnected;

        //==========================================================================================================
        // Overlays IDEBRIDGE_HTTP_PORT, IDEBRIDGE_WS_PORT, IDEBRIDGE_ENABLE_WS, IDEBRIDGE_ENABLE_HTTP,
        // IDEBRIDGE_IDE_NAME and IDEBRIDGE_HEARTBEAT_MS onto base. Out-of-range values are logged and ignored.
        //==========================================================================================================
        static Options FromEnvironment(Options base = Options{});
    };

    // Outcome of Start(); a port is present for each transport that is listening.
    struct StartResult {
        std::optional<uint16_t> webSocketPort;
        std::optional<uint16_t> httpPort;
        std::optional<errors::TransportFault> webSocketFault;
        std::optional<errors::TransportFault> httpFault;

        bool AnyRunning() const { return webSocketPort.has_value() || httpPort.has_value(); }
    };

    // Snapshot for status displays.
    struct ServerInfo {
        std::optional<uint16_t> webSocketPort;
        std::optional<uint16_t> httpPort;
        std::size_t webSocketClients{0};
        std::size_t httpClients{0};
    };

    //==========================================================================================================
    // Registers built-in tools (general into both registries, ide-specific into the WebSocket registry
    // only) and seals both registries.
    // Throws:
    //   errors::RegistrationError when a tool definition has no implementation.
    //==========================================================================================================
    DualServer(Options opts, HostServices host);
    ~DualServer();

    DualServer(const DualServer&) = delete;
    DualServer& operator=(const DualServer&) = delete;

    //==========================================================================================================
    // Starts the I/O thread and every enabled transport. Calling Start() on a running server returns the
    // current ports.
    // Throws:
    //   std::logic_error when called after Stop(); a stopped server is not restartable.
    //==========================================================================================================
    StartResult Start();

    //==========================================================================================================
    // Stops both transports, removes the discovery record and joins the I/O thread. Idempotent.
    // Must not be called from the I/O thread (handlers, connection callbacks).
    //==========================================================================================================
    void Stop();

    bool IsRunning() const { return running_.load(); }

    //==========================================================================================================
    // Sends the notification to every WebSocket connection and every open SSE session.
    // Returns:
    //   Future resolving to the total number of recipients (0 when stopped).
    //==========================================================================================================
    std::future<std::size_t> Broadcast(const JSONRPCNotification& notification);

    std::size_t ClientCount() const { return WebSocketClientCount() + HttpClientCount(); }
    std::size_t WebSocketClientCount() const;
    std::size_t HttpClientCount() const;

    // Rewrites workspaceFolders in the published discovery record.
    void UpdateWorkspaceFolders(const std::vector<std::string>& folders);

    ServerInfo GetServerInfo() const;

    std::vector<Tool> GetToolsByCategory(ToolCategory category,
                                         TransportSource source = TransportSource::WebSocket) const;

    // Logs per-registry totals by category.
    void ValidateToolRegistration() const;

    const ToolRegistry& Tools(TransportSource source) const;
    const DiscoveryPublisher& Discovery() const { return discovery_; }

private:
    void wireTransport(ITransportAcceptor& transport, TransportSource source);

    Options opts_;
    HostServices host_;

    // Declared before the transports so it outlives them.
    boost::asio::io_context ioc_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::thread ioThread_;

    ToolRegistry wsTools_;
    ToolRegistry httpTools_;
    std::shared_ptr<IdeIntegrationHandler> integration_;
    std::unique_ptr<RequestRouter> router_;
    DiscoveryPublisher discovery_;

    // Created at construction for each enabled transport and kept until destruction.
    std::unique_ptr<ITransportAcceptor> wsServer_;
    std::unique_ptr<ITransportAcceptor> httpServer_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<bool> wsListening_{false};
    std::atomic<bool> httpListening_{false};
    std::mutex lifecycleMtx_;
};

inline DualServer::Options::Options() = default;

} // namespace idebridge
