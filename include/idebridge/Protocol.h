//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Protocol constants, method names and host context payloads
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>

namespace idebridge {
//==========================================================================================================
// Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Negotiated protocol version returned by initialize (no per-client negotiation takes place)
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// Literal returned by ping
constexpr const char* PING_RESULT = "pong";

// Library version reported in serverInfo
constexpr const char* SERVER_VERSION = "1.0.0";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information (serverInfo)
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
// All advertised capabilities are static; listChanged is never signalled.
struct ServerCapabilities {
    bool rootsListChanged = false;
    bool toolsListChanged = false;
    bool resourcesSubscribe = false;
    bool resourcesListChanged = false;
    bool promptsListChanged = false;
};

//==========================================================================================================
// BuildInitializeResult
// Purpose: Shape of the initialize result:
//   { protocolVersion, capabilities:{roots,tools,resources,prompts}, serverInfo:{name,version} }
//==========================================================================================================
inline JSONValue BuildInitializeResult(const Implementation& serverInfo,
                                       const ServerCapabilities& caps = ServerCapabilities{}) {
    JSONValue capabilities = MakeObject({
        {"roots", MakeObject({{"listChanged", JSONValue(caps.rootsListChanged)}})},
        {"tools", MakeObject({{"listChanged", JSONValue(caps.toolsListChanged)}})},
        {"resources", MakeObject({{"subscribe", JSONValue(caps.resourcesSubscribe)},
                                  {"listChanged", JSONValue(caps.resourcesListChanged)}})},
        {"prompts", MakeObject({{"listChanged", JSONValue(caps.promptsListChanged)}})}
    });
    return MakeObject({
        {"protocolVersion", JSONValue(PROTOCOL_VERSION)},
        {"capabilities", capabilities},
        {"serverInfo", MakeObject({{"name", JSONValue(serverInfo.name)},
                                   {"version", JSONValue(serverInfo.version)}})}
    });
}

///////////////////////////////////////// Host context ///////////////////////////////////////////
struct Position {
    int64_t line = 0;
    int64_t character = 0;
};

struct SelectionRange {
    Position start;
    Position end;
    bool isEmpty = true;
};

// Payload of the selection_changed notification pushed to every client.
struct SelectionChangedParams {
    std::string text;
    std::optional<std::string> filePath;
    std::optional<std::string> fileUrl;
    SelectionRange selection;
};

inline JSONValue ToJSON(const Position& p) {
    return MakeObject({{"line", JSONValue(p.line)}, {"character", JSONValue(p.character)}});
}

inline JSONValue ToJSON(const SelectionChangedParams& p) {
    return MakeObject({
        {"text", JSONValue(p.text)},
        {"filePath", p.filePath ? JSONValue(*p.filePath) : JSONValue(nullptr)},
        {"fileUrl", p.fileUrl ? JSONValue(*p.fileUrl) : JSONValue(nullptr)},
        {"selection", MakeObject({{"start", ToJSON(p.selection.start)},
                                  {"end", ToJSON(p.selection.end)},
                                  {"isEmpty", JSONValue(p.selection.isEmpty)}})}
    });
}

// Workspace summary returned by getWorkspaceInfo.
struct WorkspaceInfo {
    std::string name;
    std::string path;
    int64_t fileCount = 0;
    std::string type;
};

inline JSONValue ToJSON(const WorkspaceInfo& w) {
    return MakeObject({
        {"name", JSONValue(w.name)},
        {"path", JSONValue(w.path)},
        {"fileCount", JSONValue(w.fileCount)},
        {"type", JSONValue(w.type)}
    });
}

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Protocol
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ListPrompts = "prompts/list";

    // Legacy direct file/workspace access
    constexpr const char* ReadFile = "readFile";
    constexpr const char* WriteFile = "writeFile";
    constexpr const char* GetOpenFiles = "getOpenFiles";
    constexpr const char* ListFiles = "listFiles";
    constexpr const char* GetCurrentFile = "getCurrentFile";
    constexpr const char* GetWorkspaceInfo = "getWorkspaceInfo";

    // Integration notifications
    constexpr const char* IdeConnected = "ide_connected";
    constexpr const char* Initialized = "notifications/initialized";

    // Server to client
    constexpr const char* SelectionChanged = "selection_changed";
}

// Builds the selection_changed notification broadcast by the host.
inline JSONRPCNotification MakeSelectionChangedNotification(const SelectionChangedParams& params) {
    return JSONRPCNotification(Methods::SelectionChanged, ToJSON(params));
}

// Content helper: { content: [ { type: "text", text } ] }
inline JSONValue MakeTextContent(const std::string& text) {
    return MakeObject({
        {"content", MakeArray({MakeObject({{"type", JSONValue("text")}, {"text", JSONValue(text)}})})}
    });
}

} // namespace idebridge
