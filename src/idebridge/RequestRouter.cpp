//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestRouter.cpp
// Purpose: Method table, protocol handlers and legacy file/workspace methods
//==========================================================================================================

#include <regex>
#include <stdexcept>

#include "idebridge/RequestRouter.h"
#include "idebridge/async/FutureAwaitable.h"
#include "idebridge/async/Task.h"
#include "logging/Logger.h"

namespace idebridge {

namespace {

JSONValue paramsOrEmpty(const Envelope& env) {
    return env.params ? *env.params : JSONValue(JSONValue::Object{});
}

std::optional<std::string> normalize(const HostServices& host, const std::string& path) {
    return host.normalizePath ? host.normalizePath(path) : DefaultNormalizePath(path);
}

async::DetachedTask readFile(HostServices host, std::string path, Reply reply) {
    try {
        std::string content = co_await async::awaitFuture(host.files->Read(path));
        reply.Result(JSONValue(std::move(content)));
    } catch (const std::exception& e) {
        reply.Error(JSONRPCErrorCodes::InternalError, std::string("failed to read file: ") + e.what());
    }
}

async::DetachedTask writeFile(HostServices host, std::string path, std::string content, Reply reply) {
    try {
        co_await async::awaitFuture(host.files->Write(path, content));
        reply.Result(JSONValue(true));
    } catch (const std::exception& e) {
        reply.Error(JSONRPCErrorCodes::InternalError, std::string("failed to write file: ") + e.what());
    }
}

} // namespace

RequestRouter::RequestRouter(const ToolRegistry& webSocketTools,
                             const ToolRegistry& httpTools,
                             HostServices host,
                             Implementation serverInfo,
                             std::shared_ptr<IIntegrationHandler> integration)
    : wsTools_(webSocketTools),
      httpTools_(httpTools),
      host_(std::move(host)),
      serverInfo_(std::move(serverInfo)),
      integration_(std::move(integration)) {
    buildTable();
}

const std::array<RequestRouter::MethodEntry, RequestRouter::kMethodCount>& RequestRouter::methodTable() {
    static const std::array<MethodEntry, kMethodCount> table{{
        {Method::Initialize, Methods::Initialize, &RequestRouter::handleInitialize},
        {Method::Ping, Methods::Ping, &RequestRouter::handlePing},
        {Method::ListPrompts, Methods::ListPrompts, &RequestRouter::handleListPrompts},
        {Method::ListResources, Methods::ListResources, &RequestRouter::handleListResources},
        {Method::ListTools, Methods::ListTools, &RequestRouter::handleListTools},
        {Method::CallTool, Methods::CallTool, &RequestRouter::handleCallTool},
        {Method::ReadFile, Methods::ReadFile, &RequestRouter::handleReadFile},
        {Method::WriteFile, Methods::WriteFile, &RequestRouter::handleWriteFile},
        {Method::GetOpenFiles, Methods::GetOpenFiles, &RequestRouter::handleGetOpenFiles},
        {Method::ListFiles, Methods::ListFiles, &RequestRouter::handleListFiles},
        {Method::GetCurrentFile, Methods::GetCurrentFile, &RequestRouter::handleGetCurrentFile},
        {Method::GetWorkspaceInfo, Methods::GetWorkspaceInfo, &RequestRouter::handleGetWorkspaceInfo}
    }};
    return table;
}

//==========================================================================================================
// Every Method value must map to exactly one name and one handler; a gap is a programming error.
//==========================================================================================================
void RequestRouter::buildTable() {
    std::array<bool, kMethodCount> seen{};
    for (const auto& entry : methodTable()) {
        const auto idx = static_cast<std::size_t>(entry.method);
        const std::string name = entry.name != nullptr ? entry.name : "";
        if (idx >= kMethodCount || seen[idx]) {
            throw std::logic_error("RequestRouter: duplicate method table entry for \"" + name + "\"");
        }
        if (name.empty() || entry.handler == nullptr) {
            throw std::logic_error("RequestRouter: incomplete method table entry " + std::to_string(idx));
        }
        if (!byName_.emplace(name, entry.method).second) {
            throw std::logic_error("RequestRouter: method name \"" + name + "\" registered twice");
        }
        seen[idx] = true;
        handlers_[idx] = entry.handler;
    }
    for (std::size_t i = 0; i < kMethodCount; ++i) {
        if (!seen[i]) {
            throw std::logic_error("RequestRouter: method " + std::to_string(i) + " has no handler");
        }
    }
}

std::vector<std::string> RequestRouter::MethodNames() const {
    std::vector<std::string> names;
    names.reserve(kMethodCount);
    for (const auto& entry : methodTable()) {
        names.emplace_back(entry.name);
    }
    return names;
}

const ToolRegistry& RequestRouter::Registry(TransportSource source) const {
    return source == TransportSource::WebSocket ? wsTools_ : httpTools_;
}

void RequestRouter::Dispatch(const Envelope& envelope, TransportSource source, Reply reply) const {
    try {
        if (integration_ && integration_->Handle(envelope, reply)) {
            return;
        }
        auto it = byName_.find(envelope.method);
        if (it == byName_.end()) {
            if (reply.ExpectsResponse()) {
                LOG_WARN("RequestRouter: unknown method {} from {}", envelope.method, toString(source));
                reply.Error(JSONRPCErrorCodes::MethodNotFound, "method not implemented");
            } else {
                LOG_INFO("RequestRouter: unhandled notification {} from {}", envelope.method, toString(source));
            }
            return;
        }
        LOG_DEBUG("RequestRouter: {} via {}", envelope.method, toString(source));
        const Handler handler = handlers_[static_cast<std::size_t>(it->second)];
        (this->*handler)(envelope, source, reply);
    } catch (const std::exception& e) {
        LOG_ERROR("RequestRouter: {} failed: {}", envelope.method, e.what());
        reply.Error(JSONRPCErrorCodes::InternalError, e.what());
    }
}

/////////////////////////////////////////// Protocol methods ///////////////////////////////////////////

void RequestRouter::handleInitialize(const Envelope& env, TransportSource source, const Reply& reply) const {
    if (env.params) {
        if (const JSONValue* client = FindMember(*env.params, "clientInfo")) {
            const std::string name = GetStringMember(*client, "name").value_or("unknown");
            const std::string version = GetStringMember(*client, "version").value_or("");
            LOG_INFO("RequestRouter: initialize from {} {} via {}", name, version, toString(source));
        }
    }
    reply.Result(BuildInitializeResult(serverInfo_));
}

void RequestRouter::handlePing(const Envelope&, TransportSource, const Reply& reply) const {
    reply.Result(JSONValue(PING_RESULT));
}

void RequestRouter::handleListPrompts(const Envelope&, TransportSource, const Reply& reply) const {
    reply.Result(MakeObject({{"prompts", MakeArray({})}}));
}

void RequestRouter::handleListResources(const Envelope&, TransportSource, const Reply& reply) const {
    reply.Result(MakeObject({{"resources", MakeArray({})}}));
}

void RequestRouter::handleListTools(const Envelope&, TransportSource source, const Reply& reply) const {
    reply.Result(Registry(source).ListToolsResult());
}

void RequestRouter::handleCallTool(const Envelope& env, TransportSource source, const Reply& reply) const {
    Registry(source).HandleToolCall(paramsOrEmpty(env), reply);
}

/////////////////////////////////////////// Legacy methods ///////////////////////////////////////////

void RequestRouter::handleReadFile(const Envelope& env, TransportSource, const Reply& reply) const {
    auto path = GetStringMember(paramsOrEmpty(env), "path");
    if (!path || path->empty()) {
        reply.Error(JSONRPCErrorCodes::InvalidParams, "invalid path parameter");
        return;
    }
    auto normalized = normalize(host_, *path);
    if (!normalized || normalized->empty()) {
        reply.Error(JSONRPCErrorCodes::InternalError, "invalid file path");
        return;
    }
    if (!host_.files) {
        reply.Error(JSONRPCErrorCodes::InternalError, "no file provider configured");
        return;
    }
    readFile(host_, *normalized, reply);
}

void RequestRouter::handleWriteFile(const Envelope& env, TransportSource, const Reply& reply) const {
    const JSONValue params = paramsOrEmpty(env);
    auto path = GetStringMember(params, "path");
    auto content = GetStringMember(params, "content");
    if (!path || path->empty() || !content) {
        reply.Error(JSONRPCErrorCodes::InvalidParams, "invalid parameters");
        return;
    }
    auto normalized = normalize(host_, *path);
    if (!normalized || normalized->empty()) {
        reply.Error(JSONRPCErrorCodes::InternalError, "invalid file path");
        return;
    }
    if (!host_.files) {
        reply.Error(JSONRPCErrorCodes::InternalError, "no file provider configured");
        return;
    }
    writeFile(host_, *normalized, *content, reply);
}

void RequestRouter::handleGetOpenFiles(const Envelope&, TransportSource, const Reply& reply) const {
    if (!host_.workspace) {
        reply.Error(JSONRPCErrorCodes::InternalError, "failed to get open files: no workspace provider configured");
        return;
    }
    std::vector<JSONValue> open;
    if (auto active = host_.workspace->ActiveFile()) {
        open.emplace_back(*active);
    }
    reply.Result(MakeArray(open));
}

void RequestRouter::handleListFiles(const Envelope& env, TransportSource, const Reply& reply) const {
    if (!host_.workspace) {
        reply.Error(JSONRPCErrorCodes::InternalError, "failed to list files: no workspace provider configured");
        return;
    }
    auto pattern = GetStringMember(paramsOrEmpty(env), "pattern");
    std::optional<std::regex> filter;
    if (pattern && !pattern->empty()) {
        try {
            filter.emplace(*pattern, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            reply.Error(JSONRPCErrorCodes::InternalError, std::string("failed to list files: ") + e.what());
            return;
        }
    }
    std::vector<JSONValue> files;
    for (const auto& f : host_.workspace->ListFiles()) {
        if (!filter || std::regex_search(f, *filter)) {
            files.emplace_back(f);
        }
    }
    reply.Result(MakeArray(files));
}

void RequestRouter::handleGetCurrentFile(const Envelope&, TransportSource, const Reply& reply) const {
    if (!host_.workspace) {
        reply.Error(JSONRPCErrorCodes::InternalError, "failed to get current file: no workspace provider configured");
        return;
    }
    auto active = host_.workspace->ActiveFile();
    reply.Result(active ? JSONValue(*active) : JSONValue(nullptr));
}

void RequestRouter::handleGetWorkspaceInfo(const Envelope&, TransportSource, const Reply& reply) const {
    if (!host_.workspace) {
        reply.Error(JSONRPCErrorCodes::InternalError, "failed to get workspace info: no workspace provider configured");
        return;
    }
    WorkspaceInfo info;
    info.name = host_.workspace->Name();
    info.path = host_.workspace->BasePath();
    if (info.path.empty()) {
        info.path = "unknown";
    }
    info.fileCount = static_cast<int64_t>(host_.workspace->ListFiles().size());
    info.type = host_.workspace->Kind();
    reply.Result(ToJSON(info));
}

} // namespace idebridge
