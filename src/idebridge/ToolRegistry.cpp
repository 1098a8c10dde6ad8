//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: Tool registration, listing and tools/call dispatch
//==========================================================================================================

#include "idebridge/ToolRegistry.h"
#include "idebridge/Protocol.h"
#include "idebridge/errors/Errors.h"
#include "logging/Logger.h"

namespace idebridge {

const char* toString(ToolCategory category) {
    switch (category) {
        case ToolCategory::General: return "general";
        case ToolCategory::IdeSpecific: return "ide-specific";
        case ToolCategory::File: return "file";
        case ToolCategory::Workspace: return "workspace";
    }
    return "general";
}

std::optional<ToolCategory> toolCategoryFromString(const std::string& s) {
    if (s == "general") return ToolCategory::General;
    if (s == "ide-specific") return ToolCategory::IdeSpecific;
    if (s == "file") return ToolCategory::File;
    if (s == "workspace") return ToolCategory::Workspace;
    return std::nullopt;
}

JSONValue Tool::ToJSON() const {
    return MakeObject({
        {"name", JSONValue(name)},
        {"description", JSONValue(description)},
        {"inputSchema", inputSchema.IsObject() ? inputSchema : MakeObjectSchema({})}
    });
}

JSONValue MakeObjectSchema(const JSONValue::Object& properties, const std::vector<std::string>& required) {
    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>("object");
    schema["properties"] = std::make_shared<JSONValue>(properties);
    if (!required.empty()) {
        JSONValue::Array req;
        for (const auto& r : required) {
            req.push_back(std::make_shared<JSONValue>(r));
        }
        schema["required"] = std::make_shared<JSONValue>(std::move(req));
    }
    return JSONValue(std::move(schema));
}

void ToolRegistry::Register(ToolDefinition definition, ToolImplementation implementation) {
    FUNC_SCOPE();
    if (sealed_) {
        throw errors::RegistrationError("Tool registry is sealed; cannot register \"" + definition.name + "\"");
    }
    if (definition.name.empty()) {
        throw errors::RegistrationError("Tool definition name must not be empty");
    }
    if (definition.name != implementation.name) {
        throw errors::RegistrationError("Tool definition name \"" + definition.name +
                                        "\" doesn't match implementation name \"" + implementation.name + "\"");
    }
    if (!implementation.handler) {
        throw errors::RegistrationError("Tool \"" + definition.name + "\" has no handler");
    }

    auto it = index_.find(definition.name);
    if (it != index_.end()) {
        LOG_DEBUG("ToolRegistry: replacing tool {}", definition.name);
        entries_[it->second] = Entry{std::move(definition), std::move(implementation)};
        return;
    }
    index_.emplace(definition.name, entries_.size());
    entries_.push_back(Entry{std::move(definition), std::move(implementation)});
}

std::vector<Tool> ToolRegistry::GetToolDefinitions(std::optional<ToolCategory> category) const {
    std::vector<Tool> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) {
        if (!category.has_value() || e.definition.category == *category) {
            out.push_back(e.definition.ToTool());
        }
    }
    return out;
}

JSONValue ToolRegistry::ListToolsResult() const {
    JSONValue::Array tools;
    for (const auto& t : GetToolDefinitions()) {
        tools.push_back(std::make_shared<JSONValue>(t.ToJSON()));
    }
    JSONValue::Object result;
    result["tools"] = std::make_shared<JSONValue>(std::move(tools));
    return JSONValue(std::move(result));
}

void ToolRegistry::HandleToolCall(const JSONValue& params, Reply reply) const {
    auto name = GetStringMember(params, "name");
    if (!name.has_value()) {
        reply.Error(JSONRPCErrorCodes::InvalidParams, "tools/call requires a string \"name\"");
        return;
    }

    auto it = index_.find(*name);
    if (it == index_.end()) {
        LOG_WARN("ToolRegistry: unknown tool called: {}", *name);
        reply.Result(MakeTextContent("Tool '" + *name + "' is not registered"));
        return;
    }

    JSONValue arguments = MakeObject({});
    if (const JSONValue* a = FindMember(params, "arguments")) {
        if (!a->IsNull()) {
            arguments = *a;
        }
    }

    const Entry& entry = entries_[it->second];
    LOG_DEBUG("ToolRegistry: calling tool {}", *name);
    try {
        entry.implementation.handler(arguments, reply);
    } catch (const std::exception& e) {
        LOG_ERROR("ToolRegistry: tool {} threw: {}", *name, e.what());
        reply.Error(JSONRPCErrorCodes::InternalError, "failed to call tool " + *name + ": " + e.what());
    }
}

std::vector<std::string> ToolRegistry::GetRegisteredToolNames() const {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& e : entries_) {
        names.push_back(e.definition.name);
    }
    return names;
}

bool ToolRegistry::HasImplementation(const std::string& name) const {
    return index_.count(name) > 0;
}

} // namespace idebridge
