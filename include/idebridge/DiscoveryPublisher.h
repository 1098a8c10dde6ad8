//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DiscoveryPublisher.h
// Purpose: Lock-file discovery records (<config-dir>/ide/<port>.lock) for locating running servers
//==========================================================================================================

#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "idebridge/JSONRPCTypes.h"

namespace idebridge {

//==========================================================================================================
// DiscoveryRecord
// Purpose: On-disk shape { pid, workspaceFolders, ideName, transport:"ws" }.
//==========================================================================================================
struct DiscoveryRecord {
    int64_t pid{0};
    std::vector<std::string> workspaceFolders;
    std::string ideName;
    std::string transport{"ws"};

    JSONValue ToJSON() const;
    static std::optional<DiscoveryRecord> FromJSON(const JSONValue& value);
};

// One record found by ListRecords; port is taken from the file name.
struct DiscoveredServer {
    uint16_t port{0};
    std::filesystem::path path;
    DiscoveryRecord record;
};

//==========================================================================================================
// DiscoveryPublisher
// Purpose: Owns the single record advertising this process's WebSocket port.
// Notes:
//   - Publish is called only after a successful bind.
//   - Thread-safe; DualServer may update folders from the host thread while the I/O thread runs.
//==========================================================================================================
class DiscoveryPublisher {
public:
    explicit DiscoveryPublisher(std::string ideName,
                                std::optional<std::filesystem::path> configDirOverride = std::nullopt);
    ~DiscoveryPublisher();

    DiscoveryPublisher(const DiscoveryPublisher&) = delete;
    DiscoveryPublisher& operator=(const DiscoveryPublisher&) = delete;

    //==========================================================================================================
    // ResolveConfigDir
    // Purpose: Locates the client configuration directory.
    // Order:
    //   1. CLAUDE_CONFIG_DIR
    //   2. $XDG_CONFIG_HOME/claude, else ~/.config/claude (%APPDATA%\claude on Windows)
    //   3. ~/.claude (legacy)
    //   The first existing directory among 2 and 3 wins; otherwise the modern path is returned.
    //==========================================================================================================
    static std::filesystem::path ResolveConfigDir();

    // <config-dir>/ide for this publisher.
    std::filesystem::path IdeDir() const;

    //==========================================================================================================
    // Writes <ide-dir>/<port>.lock, creating directories as needed.
    // Throws:
    //   std::filesystem::filesystem_error or std::runtime_error when the record cannot be written.
    //==========================================================================================================
    void Publish(uint16_t port, const std::vector<std::string>& workspaceFolders);

    // Read-modify-write of workspaceFolders only; no-op when nothing is published or the file vanished.
    void UpdateWorkspaceFolders(const std::vector<std::string>& workspaceFolders);

    // Deletes the record; a missing file is not an error.
    void Remove();

    bool IsPublished() const;
    std::optional<std::filesystem::path> RecordPath() const;

    //==========================================================================================================
    // Client-side discovery helpers. Malformed or unreadable records are skipped.
    //==========================================================================================================
    static std::optional<DiscoveryRecord> ReadRecord(const std::filesystem::path& path);
    static std::vector<DiscoveredServer> ListRecords(const std::filesystem::path& ideDir);

private:
    static void writeRecord(const std::filesystem::path& path, const DiscoveryRecord& record);

    std::string ideName_;
    std::filesystem::path configDir_;
    std::optional<std::filesystem::path> recordPath_;
    mutable std::mutex mtx_;
};

} // namespace idebridge
