//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestRouter.h
// Purpose: Resolves one decoded envelope to a protocol handler, legacy method or tool call
//==========================================================================================================

#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "idebridge/HostServices.h"
#include "idebridge/IdeIntegrationHandler.h"
#include "idebridge/JSONRPCTypes.h"
#include "idebridge/Protocol.h"
#include "idebridge/Reply.h"
#include "idebridge/ToolRegistry.h"
#include "idebridge/Transport.h"

namespace idebridge {

//==========================================================================================================
// RequestRouter
// Purpose: Transport-independent dispatcher.
// Resolution order:
//   1. integration handler (if set); stops when it consumes the envelope
//   2. protocol methods: initialize, ping, prompts/list, resources/list, tools/list
//   3. tools/call against the registry selected by the transport source
//   4. legacy methods backed by HostServices: readFile, writeFile, getOpenFiles, listFiles,
//      getCurrentFile, getWorkspaceInfo
//   5. Method not found (-32601)
// Notes:
//   - Notifications are never answered; unknown notifications are logged.
//   - Dispatch never throws. Handler exceptions become Internal error.
//   - Registries are borrowed and must outlive the router.
//==========================================================================================================
class RequestRouter {
public:
    RequestRouter(const ToolRegistry& webSocketTools,
                  const ToolRegistry& httpTools,
                  HostServices host,
                  Implementation serverInfo,
                  std::shared_ptr<IIntegrationHandler> integration = nullptr);

    void Dispatch(const Envelope& envelope, TransportSource source, Reply reply) const;

    void SetIntegrationHandler(std::shared_ptr<IIntegrationHandler> integration) {
        integration_ = std::move(integration);
    }

    // Registry serving the given transport.
    const ToolRegistry& Registry(TransportSource source) const;

    // Every method name resolved in steps 2-4, in table order.
    std::vector<std::string> MethodNames() const;

    const Implementation& ServerInfo() const { return serverInfo_; }

private:
    enum class Method : std::size_t {
        Initialize,
        Ping,
        ListPrompts,
        ListResources,
        ListTools,
        CallTool,
        ReadFile,
        WriteFile,
        GetOpenFiles,
        ListFiles,
        GetCurrentFile,
        GetWorkspaceInfo,
        Count
    };
    static constexpr std::size_t kMethodCount = static_cast<std::size_t>(Method::Count);

    using Handler = void (RequestRouter::*)(const Envelope&, TransportSource, const Reply&) const;

    struct MethodEntry {
        Method method;
        const char* name;
        Handler handler;
    };

    static const std::array<MethodEntry, kMethodCount>& methodTable();
    void buildTable();

    void handleInitialize(const Envelope& env, TransportSource source, const Reply& reply) const;
    void handlePing(const Envelope& env, TransportSource source, const Reply& reply) const;
    void handleListPrompts(const Envelope& env, TransportSource source, const Reply& reply) const;
    void handleListResources(const Envelope& env, TransportSource source, const Reply& reply) const;
    void handleListTools(const Envelope& env, TransportSource source, const Reply& reply) const;
    void handleCallTool(const Envelope& env, TransportSource source, const Reply& reply) const;
    void handleReadFile(const Envelope& env, TransportSource source, const Reply& reply) const;
    void handleWriteFile(const Envelope& env, TransportSource source, const Reply& reply) const;
    void handleGetOpenFiles(const Envelope& env, TransportSource source, const Reply& reply) const;
    void handleListFiles(const Envelope& env, TransportSource source, const Reply& reply) const;
    void handleGetCurrentFile(const Envelope& env, TransportSource source, const Reply& reply) const;
    void handleGetWorkspaceInfo(const Envelope& env, TransportSource source, const Reply& reply) const;

    const ToolRegistry& wsTools_;
    const ToolRegistry& httpTools_;
    HostServices host_;
    Implementation serverInfo_;
    std::shared_ptr<IIntegrationHandler> integration_;

    std::unordered_map<std::string, Method> byName_;
    std::array<Handler, kMethodCount> handlers_{};
};

} // namespace idebridge
