//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DiscoveryPublisher.cpp
// Purpose: Config directory resolution and lock-file publish/update/remove
//==========================================================================================================

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#ifdef _WIN32
#include <process.h>
#else
#include <unistd.h>
#endif

#include "idebridge/DiscoveryPublisher.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace fs = std::filesystem;

namespace idebridge {

namespace {

int64_t currentPid() {
#ifdef _WIN32
    return static_cast<int64_t>(::_getpid());
#else
    return static_cast<int64_t>(::getpid());
#endif
}

fs::path homeDir() {
#ifdef _WIN32
    return fs::path(GetEnvOrDefault("USERPROFILE", "."));
#else
    return fs::path(GetEnvOrDefault("HOME", "."));
#endif
}

bool isDirectory(const fs::path& p) {
    std::error_code ec;
    return fs::is_directory(p, ec);
}

std::optional<uint16_t> portFromFileName(const fs::path& p) {
    const std::string stem = p.stem().string();
    if (stem.empty() || stem.size() > 5) {
        return std::nullopt;
    }
    for (char c : stem) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
    }
    const unsigned long n = std::stoul(stem);
    if (n == 0 || n > 65535ul) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(n);
}

} // namespace

JSONValue DiscoveryRecord::ToJSON() const {
    JSONValue::Array folders;
    for (const auto& f : workspaceFolders) {
        folders.push_back(std::make_shared<JSONValue>(f));
    }
    JSONValue::Object obj;
    obj["pid"] = std::make_shared<JSONValue>(pid);
    obj["workspaceFolders"] = std::make_shared<JSONValue>(std::move(folders));
    obj["ideName"] = std::make_shared<JSONValue>(ideName);
    obj["transport"] = std::make_shared<JSONValue>(transport);
    return JSONValue(std::move(obj));
}

std::optional<DiscoveryRecord> DiscoveryRecord::FromJSON(const JSONValue& value) {
    auto pid = GetIntMember(value, "pid");
    auto ideName = GetStringMember(value, "ideName");
    auto transport = GetStringMember(value, "transport");
    const JSONValue* folders = FindMember(value, "workspaceFolders");
    if (!pid || !ideName || !transport || folders == nullptr || !folders->IsArray()) {
        return std::nullopt;
    }
    DiscoveryRecord r;
    r.pid = *pid;
    r.ideName = *ideName;
    r.transport = *transport;
    for (const auto& f : std::get<JSONValue::Array>(folders->value)) {
        if (f && f->IsString()) {
            r.workspaceFolders.push_back(std::get<std::string>(f->value));
        }
    }
    return r;
}

DiscoveryPublisher::DiscoveryPublisher(std::string ideName, std::optional<fs::path> configDirOverride)
    : ideName_(std::move(ideName)),
      configDir_(configDirOverride ? *configDirOverride : ResolveConfigDir()) {}

DiscoveryPublisher::~DiscoveryPublisher() = default;

fs::path DiscoveryPublisher::ResolveConfigDir() {
    const std::string overrideDir = GetEnvOrDefault("CLAUDE_CONFIG_DIR", "");
    if (!overrideDir.empty()) {
        return fs::path(overrideDir);
    }

    const fs::path home = homeDir();
#ifdef _WIN32
    const std::string appData = GetEnvOrDefault("APPDATA", (home / "AppData" / "Roaming").string());
    const fs::path modern = fs::path(appData) / "claude";
#else
    const std::string xdg = GetEnvOrDefault("XDG_CONFIG_HOME", (home / ".config").string());
    const fs::path modern = fs::path(xdg) / "claude";
#endif
    const fs::path legacy = home / ".claude";

    if (isDirectory(modern)) {
        return modern;
    }
    if (isDirectory(legacy)) {
        return legacy;
    }
    return modern;
}

fs::path DiscoveryPublisher::IdeDir() const {
    return configDir_ / "ide";
}

void DiscoveryPublisher::writeRecord(const fs::path& path, const DiscoveryRecord& record) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open discovery record for writing: " + path.string());
    }
    out << SerializeJSON(record.ToJSON());
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write discovery record: " + path.string());
    }
}

void DiscoveryPublisher::Publish(uint16_t port, const std::vector<std::string>& workspaceFolders) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(mtx_);
    const fs::path dir = IdeDir();
    fs::create_directories(dir);

    DiscoveryRecord record;
    record.pid = currentPid();
    record.workspaceFolders = workspaceFolders;
    record.ideName = ideName_;

    const fs::path path = dir / (std::to_string(port) + ".lock");
    writeRecord(path, record);
    recordPath_ = path;
    const std::string shown = path.string();
    LOG_INFO("Discovery: published {}", shown);
}

void DiscoveryPublisher::UpdateWorkspaceFolders(const std::vector<std::string>& workspaceFolders) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!recordPath_) {
        return;
    }
    auto record = ReadRecord(*recordPath_);
    if (!record) {
        const std::string shown = recordPath_->string();
        LOG_WARN("Discovery: record {} missing or unreadable; workspace update skipped", shown);
        return;
    }
    record->workspaceFolders = workspaceFolders;
    try {
        writeRecord(*recordPath_, *record);
    } catch (const std::exception& e) {
        LOG_ERROR("Discovery: failed to update workspace folders: {}", e.what());
    }
}

void DiscoveryPublisher::Remove() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!recordPath_) {
        return;
    }
    std::error_code ec;
    fs::remove(*recordPath_, ec);
    if (ec) {
        const std::string shown = recordPath_->string();
        const std::string reason = ec.message();
        LOG_WARN("Discovery: failed to remove {}: {}", shown, reason);
    }
    recordPath_.reset();
}

bool DiscoveryPublisher::IsPublished() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return recordPath_.has_value();
}

std::optional<fs::path> DiscoveryPublisher::RecordPath() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return recordPath_;
}

std::optional<DiscoveryRecord> DiscoveryPublisher::ReadRecord(const fs::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    try {
        return DiscoveryRecord::FromJSON(ParseJSON(ss.str()));
    } catch (const std::exception& e) {
        const std::string shown = path.string();
        LOG_DEBUG("Discovery: skipping malformed record {}: {}", shown, e.what());
        return std::nullopt;
    }
}

std::vector<DiscoveredServer> DiscoveryPublisher::ListRecords(const fs::path& ideDir) {
    std::vector<DiscoveredServer> out;
    std::error_code ec;
    fs::directory_iterator it(ideDir, ec);
    if (ec) {
        return out;
    }
    // A failing increment ends the scan with what was collected so far.
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const fs::path p = it->path();
        std::error_code typeEc;
        if (p.extension() != ".lock" || !it->is_regular_file(typeEc)) {
            continue;
        }
        auto port = portFromFileName(p);
        if (!port) {
            continue;
        }
        auto record = ReadRecord(p);
        if (!record) {
            continue;
        }
        out.push_back(DiscoveredServer{*port, p, std::move(*record)});
    }
    if (ec) {
        LOG_DEBUG("Discovery: scan of {} stopped early: {}", ideDir.string(), ec.message());
    }
    std::sort(out.begin(), out.end(),
              [](const DiscoveredServer& a, const DiscoveredServer& b) { return a.port < b.port; });
    return out;
}

} // namespace idebridge
