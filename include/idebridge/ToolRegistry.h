//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Name-keyed catalog of tool definitions paired with their handlers
//==========================================================================================================

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "idebridge/JSONRPCTypes.h"
#include "idebridge/Reply.h"

namespace idebridge {

//==========================================================================================================
// ToolCategory
// Purpose: Internal grouping tag; never exposed to clients.
//==========================================================================================================
enum class ToolCategory {
    General,
    IdeSpecific,
    File,
    Workspace
};

const char* toString(ToolCategory category);
std::optional<ToolCategory> toolCategoryFromString(const std::string& s);

//==========================================================================================================
// Tool
// Purpose: Client-facing tool shape { name, description, inputSchema }.
//==========================================================================================================
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;

    JSONValue ToJSON() const;
};

//==========================================================================================================
// ToolDefinition
// Purpose: Tool plus its internal category.
//==========================================================================================================
struct ToolDefinition {
    std::string name;
    std::string description;
    ToolCategory category{ToolCategory::General};
    JSONValue inputSchema;

    // Returns the client-facing shape (category stripped).
    Tool ToTool() const { return Tool{name, description, inputSchema}; }
};

// Tool handlers receive the call arguments (an object, empty when omitted) and the reply handle.
// Synchronous exceptions are converted to Internal error by the registry; asynchronous handlers
// must catch their own and reply with an error.
using ToolHandler = std::function<void(const JSONValue& arguments, Reply reply)>;

struct ToolImplementation {
    std::string name;
    ToolHandler handler;
};

// Builds { type:"object", properties:{...}, required?:[...] }.
JSONValue MakeObjectSchema(const JSONValue::Object& properties,
                           const std::vector<std::string>& required = {});

//==========================================================================================================
// ToolRegistry
// Purpose: Holds (definition, implementation) pairs in registration order.
// Notes:
//   - Populated at startup, then sealed; afterwards it is read-only and safe to share across threads.
//   - Re-registering an existing name replaces the entry in place.
//==========================================================================================================
class ToolRegistry {
public:
    ToolRegistry() = default;

    //==========================================================================================================
    // Registers a tool.
    // Throws:
    //   errors::RegistrationError when names differ, the name is empty, the handler is empty,
    //   or the registry is sealed.
    //==========================================================================================================
    void Register(ToolDefinition definition, ToolImplementation implementation);

    // Freezes the registry; later Register calls throw.
    void Seal() { sealed_ = true; }
    bool IsSealed() const { return sealed_; }

    //==========================================================================================================
    // Lists tool definitions in registration order, optionally filtered by category.
    //==========================================================================================================
    std::vector<Tool> GetToolDefinitions(std::optional<ToolCategory> category = std::nullopt) const;

    // tools/list result: { tools: [...] }
    JSONValue ListToolsResult() const;

    //==========================================================================================================
    // Handles tools/call params { name, arguments? }.
    // Behavior:
    //   - Missing or non-string name: Invalid params.
    //   - Unknown name: successful result whose text content says the tool is not registered.
    //   - Handler exception: Internal error "failed to call tool <name>: <what>".
    //==========================================================================================================
    void HandleToolCall(const JSONValue& params, Reply reply) const;

    std::vector<std::string> GetRegisteredToolNames() const;
    bool HasImplementation(const std::string& name) const;
    std::size_t Size() const { return entries_.size(); }

private:
    struct Entry {
        ToolDefinition definition;
        ToolImplementation implementation;
    };

    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
    bool sealed_{false};
};

} // namespace idebridge
