//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HostServices.h
// Purpose: Narrow interfaces to the host application's files, workspace and path rules
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace idebridge {

//==========================================================================================================
// IFileProvider
// Purpose: Workspace-relative file access supplied by the host.
// Notes:
//   - Read/Write complete asynchronously; failures are reported by the returned future.
//   - Paths are already normalized by the PathNormalizer before reaching the provider.
//==========================================================================================================
class IFileProvider {
public:
    virtual ~IFileProvider() = default;

    virtual std::future<std::string> Read(const std::string& path) = 0;
    virtual std::future<void> Write(const std::string& path, const std::string& content) = 0;
    virtual bool Exists(const std::string& path) = 0;
};

//==========================================================================================================
// IWorkspaceProvider
// Purpose: Introspection of the host workspace and its active document.
//==========================================================================================================
class IWorkspaceProvider {
public:
    virtual ~IWorkspaceProvider() = default;

    // Workspace-relative path of the active document, if any.
    virtual std::optional<std::string> ActiveFile() const = 0;

    // Workspace-relative paths of every file ('/' separated).
    virtual std::vector<std::string> ListFiles() const = 0;

    virtual std::string Name() const = 0;
    virtual std::string BasePath() const = 0;

    // Reported as WorkspaceInfo.type.
    virtual std::string Kind() const { return "workspace"; }
};

// Maps a client-supplied path onto a workspace-relative one; std::nullopt rejects it.
using PathNormalizer = std::function<std::optional<std::string>(const std::string&)>;

// Strips one leading '/' and rejects traversal ("..") and home ("~") references.
inline std::optional<std::string> DefaultNormalizePath(const std::string& path) {
    std::string cleaned = (!path.empty() && path.front() == '/') ? path.substr(1) : path;
    if (cleaned.find("..") != std::string::npos || cleaned.find('~') != std::string::npos) {
        return std::nullopt;
    }
    return cleaned;
}

//==========================================================================================================
// HostServices
// Purpose: Bundle of collaborators injected into tool handlers and legacy methods.
//          Any member may be null; handlers needing it reply with Internal error.
//==========================================================================================================
struct HostServices {
    std::shared_ptr<IFileProvider> files;
    std::shared_ptr<IWorkspaceProvider> workspace;
    PathNormalizer normalizePath{DefaultNormalizePath};
};

} // namespace idebridge
