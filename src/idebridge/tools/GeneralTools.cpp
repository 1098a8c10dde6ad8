//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GeneralTools.cpp
// Purpose: get_current_file, get_workspace_files, view, str_replace, create and insert
//==========================================================================================================

#include <algorithm>
#include <regex>
#include <sstream>
#include <unordered_map>

#include "idebridge/tools/GeneralTools.h"
#include "idebridge/Protocol.h"
#include "idebridge/errors/Errors.h"
#include "idebridge/async/Task.h"
#include "idebridge/async/FutureAwaitable.h"
#include "logging/Logger.h"

namespace idebridge {
namespace tools {

namespace {

JSONValue prop(const char* type, const char* description) {
    return MakeObject({{"type", JSONValue(type)}, {"description", JSONValue(description)}});
}

ToolDefinition def(const char* name, const char* description, ToolCategory category, JSONValue schema) {
    ToolDefinition d;
    d.name = name;
    d.description = description;
    d.category = category;
    d.inputSchema = std::move(schema);
    return d;
}

// Splits on '\n'; always yields at least one (possibly empty) line.
std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (true) {
        auto nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::string joinLines(const std::vector<std::string>& lines) {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out.push_back('\n');
        out += lines[i];
    }
    return out;
}

std::size_t countOccurrences(const std::string& haystack, const std::string& needle) {
    std::size_t n = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + needle.size())) {
        ++n;
    }
    return n;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

// Resolves "path" from the arguments; replies and returns nullopt on failure.
std::optional<std::string> resolvePath(const HostServices& host, const JSONValue& args, const Reply& reply) {
    auto path = GetStringMember(args, "path");
    if (!path.has_value() || path->empty()) {
        reply.Error(JSONRPCErrorCodes::InvalidParams, "invalid path parameter");
        return std::nullopt;
    }
    auto normalized = host.normalizePath ? host.normalizePath(*path) : DefaultNormalizePath(*path);
    if (!normalized.has_value() || normalized->empty()) {
        reply.Error(JSONRPCErrorCodes::InternalError, "invalid file path");
        return std::nullopt;
    }
    return normalized;
}

bool requireFiles(const HostServices& host, const Reply& reply) {
    if (!host.files) {
        reply.Error(JSONRPCErrorCodes::InternalError, "no file provider configured");
        return false;
    }
    return true;
}

std::string numbered(const std::vector<std::string>& lines, std::size_t start, std::size_t end) {
    std::ostringstream oss;
    for (std::size_t i = start; i < end; ++i) {
        if (i > start) oss << '\n';
        oss << (i + 1) << ": " << lines[i];
    }
    return oss.str();
}

async::DetachedTask viewFile(HostServices host, std::string path, std::optional<JSONValue> viewRange, Reply reply) {
    try {
        std::string content = co_await async::awaitFuture(host.files->Read(path));
        auto lines = splitLines(content);
        std::size_t start = 0;
        std::size_t end = lines.size();
        const auto* range = viewRange ? std::get_if<JSONValue::Array>(&viewRange->value) : nullptr;
        if (range != nullptr && range->size() == 2 && (*range)[0] && (*range)[1]) {
            const auto* first = std::get_if<int64_t>(&(*range)[0]->value);
            const auto* last = std::get_if<int64_t>(&(*range)[1]->value);
            if (first != nullptr && last != nullptr) {
                start = static_cast<std::size_t>(std::max<int64_t>(0, *first - 1));
                end = (*last == -1) ? lines.size()
                                    : static_cast<std::size_t>(std::clamp<int64_t>(*last, 0, static_cast<int64_t>(lines.size())));
                start = std::min(start, end);
            }
        }
        reply.Result(MakeTextContent(numbered(lines, start, end)));
    } catch (const std::exception& e) {
        reply.Error(JSONRPCErrorCodes::InternalError, std::string("failed to view file/directory: ") + e.what());
    }
}

async::DetachedTask replaceText(HostServices host, std::string path, std::string oldStr, std::string newStr, Reply reply) {
    try {
        std::string content = co_await async::awaitFuture(host.files->Read(path));
        const std::size_t matches = countOccurrences(content, oldStr);
        if (matches == 0) {
            reply.Error(JSONRPCErrorCodes::InternalError, "No match found for replacement text");
            co_return;
        }
        if (matches > 1) {
            reply.Error(JSONRPCErrorCodes::InternalError,
                        "Found " + std::to_string(matches) +
                        " matches for replacement text. Please provide more specific text to match exactly one location.");
            co_return;
        }
        content.replace(content.find(oldStr), oldStr.size(), newStr);
        co_await async::awaitFuture(host.files->Write(path, content));
        reply.Result(MakeTextContent("Successfully replaced text at exactly one location."));
    } catch (const std::exception& e) {
        reply.Error(JSONRPCErrorCodes::InternalError, std::string("failed to replace text: ") + e.what());
    }
}

async::DetachedTask createFile(HostServices host, std::string path, std::string displayPath, std::string text, Reply reply) {
    try {
        if (host.files->Exists(path)) {
            reply.Error(JSONRPCErrorCodes::InternalError, "File already exists. Use str_replace to modify existing files.");
            co_return;
        }
        co_await async::awaitFuture(host.files->Write(path, text));
        reply.Result(MakeTextContent("Successfully created file: " + displayPath));
    } catch (const std::exception& e) {
        reply.Error(JSONRPCErrorCodes::InternalError, std::string("failed to create file: ") + e.what());
    }
}

async::DetachedTask insertText(HostServices host, std::string path, std::string displayPath, int64_t insertLine,
                               std::string newStr, Reply reply) {
    try {
        std::string content = co_await async::awaitFuture(host.files->Read(path));
        auto lines = splitLines(content);
        if (insertLine < 0 || insertLine > static_cast<int64_t>(lines.size())) {
            reply.Error(JSONRPCErrorCodes::InternalError,
                        "Invalid insert_line " + std::to_string(insertLine) + ". Must be between 0 and " +
                        std::to_string(lines.size()));
            co_return;
        }
        auto inserted = splitLines(newStr);
        lines.insert(lines.begin() + insertLine, inserted.begin(), inserted.end());
        co_await async::awaitFuture(host.files->Write(path, joinLines(lines)));
        reply.Result(MakeTextContent("Successfully inserted text at line " + std::to_string(insertLine) + " in " + displayPath));
    } catch (const std::exception& e) {
        reply.Error(JSONRPCErrorCodes::InternalError, std::string("failed to insert text: ") + e.what());
    }
}

std::vector<ToolImplementation> generalImplementations(const HostServices& host) {
    std::vector<ToolImplementation> impls;

    impls.push_back({"get_current_file", [host](const JSONValue&, Reply reply) {
        auto active = host.workspace ? host.workspace->ActiveFile() : std::nullopt;
        reply.Result(MakeTextContent(active ? "Current file: " + *active : std::string("No file currently active")));
    }});

    impls.push_back({"get_workspace_files", [host](const JSONValue& args, Reply reply) {
        std::vector<std::string> files = host.workspace ? host.workspace->ListFiles() : std::vector<std::string>{};
        if (auto pattern = GetStringMember(args, "pattern"); pattern && !pattern->empty()) {
            const std::regex re(*pattern, std::regex::ECMAScript);
            files.erase(std::remove_if(files.begin(), files.end(),
                                       [&re](const std::string& f) { return !std::regex_search(f, re); }),
                        files.end());
        }
        reply.Result(MakeTextContent("Files in workspace:\n" + joinLines(files)));
    }});

    impls.push_back({"view", [host](const JSONValue& args, Reply reply) {
        auto path = resolvePath(host, args, reply);
        if (!path) {
            return;
        }
        const std::vector<std::string> all = host.workspace ? host.workspace->ListFiles() : std::vector<std::string>{};
        const bool trailingSlash = path->back() == '/';
        const std::string dirPath = trailingSlash ? *path : *path + "/";
        const bool isDirectory = trailingSlash ||
            std::any_of(all.begin(), all.end(), [&dirPath](const std::string& f) { return startsWith(f, dirPath); });
        if (isDirectory) {
            std::vector<std::string> entries;
            for (const auto& f : all) {
                if (startsWith(f, dirPath) && f.find('/', dirPath.size()) == std::string::npos) {
                    entries.push_back(f);
                }
            }
            reply.Result(MakeTextContent(entries.empty() ? std::string("Directory is empty or does not exist")
                                                         : "Directory contents:\n" + joinLines(entries)));
            return;
        }
        if (!requireFiles(host, reply)) {
            return;
        }
        std::optional<JSONValue> range;
        if (const JSONValue* r = FindMember(args, "view_range")) {
            range = *r;
        }
        viewFile(host, *path, std::move(range), reply);
    }});

    impls.push_back({"str_replace", [host](const JSONValue& args, Reply reply) {
        auto oldStr = GetStringMember(args, "old_str");
        auto newStr = GetStringMember(args, "new_str");
        if (!GetStringMember(args, "path") || !oldStr || !newStr || oldStr->empty()) {
            reply.Error(JSONRPCErrorCodes::InvalidParams, "invalid parameters");
            return;
        }
        auto path = resolvePath(host, args, reply);
        if (!path || !requireFiles(host, reply)) {
            return;
        }
        replaceText(host, *path, *oldStr, *newStr, reply);
    }});

    impls.push_back({"create", [host](const JSONValue& args, Reply reply) {
        auto original = GetStringMember(args, "path");
        auto text = GetStringMember(args, "file_text");
        if (!original || original->empty() || !text) {
            reply.Error(JSONRPCErrorCodes::InvalidParams, "invalid parameters");
            return;
        }
        auto path = resolvePath(host, args, reply);
        if (!path || !requireFiles(host, reply)) {
            return;
        }
        createFile(host, *path, *original, *text, reply);
    }});

    impls.push_back({"insert", [host](const JSONValue& args, Reply reply) {
        auto original = GetStringMember(args, "path");
        auto line = GetIntMember(args, "insert_line");
        auto newStr = GetStringMember(args, "new_str");
        if (!original || original->empty() || !line || !newStr) {
            reply.Error(JSONRPCErrorCodes::InvalidParams, "invalid parameters");
            return;
        }
        auto path = resolvePath(host, args, reply);
        if (!path || !requireFiles(host, reply)) {
            return;
        }
        insertText(host, *path, *original, *line, *newStr, reply);
    }});

    return impls;
}

} // namespace

std::vector<ToolDefinition> GeneralToolDefinitions() {
    std::vector<ToolDefinition> defs;
    defs.push_back(def("get_current_file", "Get the currently active file in the workspace",
                       ToolCategory::Workspace, MakeObjectSchema({})));
    defs.push_back(def("get_workspace_files", "List all files in the workspace",
                       ToolCategory::Workspace,
                       MakeObjectSchema({{"pattern", std::make_shared<JSONValue>(
                           prop("string", "Optional regular expression to filter files"))}})));

    JSONValue viewRange = MakeObject({
        {"type", JSONValue("array")},
        {"description", JSONValue("Optional array of two integers [start_line, end_line] to view specific lines "
                                  "(1-indexed, -1 for end means read to end of file)")},
        {"items", MakeObject({{"type", JSONValue("integer")}})}
    });
    defs.push_back(def("view", "View the contents of a file or list the contents of a directory in the workspace",
                       ToolCategory::File,
                       MakeObjectSchema({
                           {"path", std::make_shared<JSONValue>(prop("string",
                               "Path to the file or directory to view (relative to workspace root)"))},
                           {"view_range", std::make_shared<JSONValue>(viewRange)}})));

    defs.push_back(def("str_replace", "Replace specific text in a file with new text", ToolCategory::File,
                       MakeObjectSchema({
                           {"path", std::make_shared<JSONValue>(prop("string",
                               "Path to the file to modify (relative to workspace root)"))},
                           {"old_str", std::make_shared<JSONValue>(prop("string",
                               "The exact text to replace (must match exactly, including whitespace and indentation)"))},
                           {"new_str", std::make_shared<JSONValue>(prop("string",
                               "The new text to insert in place of the old text"))}})));

    defs.push_back(def("create", "Create a new file with specified content in the workspace", ToolCategory::File,
                       MakeObjectSchema({
                           {"path", std::make_shared<JSONValue>(prop("string",
                               "Path where the new file should be created (relative to workspace root)"))},
                           {"file_text", std::make_shared<JSONValue>(prop("string",
                               "The content to write to the new file"))}})));

    defs.push_back(def("insert", "Insert text at a specific line number in a file", ToolCategory::File,
                       MakeObjectSchema({
                           {"path", std::make_shared<JSONValue>(prop("string",
                               "Path to the file to modify (relative to workspace root)"))},
                           {"insert_line", std::make_shared<JSONValue>(prop("integer",
                               "Line number after which to insert the text (0 for beginning of file, 1-indexed)"))},
                           {"new_str", std::make_shared<JSONValue>(prop("string", "The text to insert"))}})));
    return defs;
}

void RegisterGeneralTools(ToolRegistry& registry, const HostServices& host) {
    std::unordered_map<std::string, ToolImplementation> impls;
    for (auto& impl : generalImplementations(host)) {
        impls.emplace(impl.name, std::move(impl));
    }
    for (auto& d : GeneralToolDefinitions()) {
        auto it = impls.find(d.name);
        if (it == impls.end()) {
            throw errors::RegistrationError("No implementation for tool \"" + d.name + "\"");
        }
        registry.Register(std::move(d), it->second);
    }
}

} // namespace tools
} // namespace idebridge
