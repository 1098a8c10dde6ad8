//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Serves a directory on disk to agent clients over WebSocket and streaming HTTP
//==========================================================================================================

#include "logging/Logger.h"
#include "env/EnvVars.h"
#include "idebridge/DualServer.h"
#include "idebridge/Protocol.h"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <algorithm>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <sstream>
#include <stdexcept>

using namespace idebridge;
namespace fs = std::filesystem;

//==========================================================================================================
// Parses simple --key=value command-line options.
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == nullptr) {
            continue;
        }
        std::string a = argv[i];
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

//==========================================================================================================
// DirectoryFiles
// Purpose: IFileProvider over a root directory. Reads and writes run on std::async workers.
//==========================================================================================================
class DirectoryFiles : public IFileProvider {
public:
    explicit DirectoryFiles(fs::path root) : root_(std::move(root)) {}

    std::future<std::string> Read(const std::string& path) override {
        return std::async(std::launch::async, [p = root_ / path, path]() {
            std::ifstream in(p, std::ios::binary);
            if (!in) {
                throw std::runtime_error("ENOENT: no such file: " + path);
            }
            std::ostringstream oss;
            oss << in.rdbuf();
            return oss.str();
        });
    }

    std::future<void> Write(const std::string& path, const std::string& content) override {
        return std::async(std::launch::async, [p = root_ / path, path, content]() {
            if (p.has_parent_path()) {
                fs::create_directories(p.parent_path());
            }
            std::ofstream out(p, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw std::runtime_error("EACCES: cannot open for writing: " + path);
            }
            out << content;
            if (!out) {
                throw std::runtime_error("EIO: write failed: " + path);
            }
        });
    }

    bool Exists(const std::string& path) override {
        std::error_code ec;
        return fs::exists(root_ / path, ec);
    }

private:
    fs::path root_;
};

// Lists regular files below root; dot-directories are skipped.
class DirectoryWorkspace : public IWorkspaceProvider {
public:
    DirectoryWorkspace(fs::path root, std::optional<std::string> active)
        : root_(std::move(root)), active_(std::move(active)) {}

    std::optional<std::string> ActiveFile() const override { return active_; }

    std::vector<std::string> ListFiles() const override {
        std::vector<std::string> out;
        std::error_code ec;
        fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            LOG_WARN("directory_host: cannot list {}: {}", root_.string(), ec.message());
            return out;
        }
        for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) {
                break;
            }
            const std::string name = it->path().filename().string();
            if (it->is_directory() && !name.empty() && name.front() == '.') {
                it.disable_recursion_pending();
                continue;
            }
            if (it->is_regular_file()) {
                out.push_back(fs::relative(it->path(), root_).generic_string());
            }
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    std::string Name() const override { return root_.filename().string(); }
    std::string BasePath() const override { return root_.string(); }

private:
    fs::path root_;
    std::optional<std::string> active_;
};

static SelectionChangedParams describeActive(const fs::path& root, const std::optional<std::string>& active) {
    SelectionChangedParams p;
    if (active) {
        const fs::path full = root / *active;
        p.filePath = full.string();
        p.fileUrl = "file://" + full.generic_string();
    }
    return p;
}

int main(int argc, char** argv) {
    Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);
    Logger::configureFromEnvironment();

    std::error_code ec;
    const fs::path root = fs::weakly_canonical(getArgValue(argc, argv, "--root").value_or("."), ec);
    if (ec || !fs::is_directory(root)) {
        std::cerr << "directory_host: --root must name an existing directory" << std::endl;
        return 2;
    }
    const std::optional<std::string> active = getArgValue(argc, argv, "--active");

    DualServer::Options base;
    base.ideName = getArgValue(argc, argv, "--ide-name").value_or("directory_host");
    base.workspaceFolders = {root.string()};
    if (auto v = getArgValue(argc, argv, "--http-port")) {
        try {
            base.httpPort = static_cast<uint16_t>(std::stoi(*v));
        } catch (const std::exception& e) {
            LOG_WARN("directory_host: ignoring --http-port={}: {}", *v, e.what());
        }
    }
    std::chrono::milliseconds selectionPeriod{0};
    if (auto v = getArgValue(argc, argv, "--selection-ms")) {
        try {
            selectionPeriod = std::chrono::milliseconds(std::stoll(*v));
        } catch (const std::exception& e) {
            LOG_WARN("directory_host: ignoring --selection-ms={}: {}", *v, e.what());
        }
    }

    HostServices host;
    host.files = std::make_shared<DirectoryFiles>(root);
    host.workspace = std::make_shared<DirectoryWorkspace>(root, active);

    // Set after construction; the initial-context callback only fires once the server runs.
    DualServer* serverRef = nullptr;
    base.onInitialContext = [&serverRef, &root, &active]() {
        if (serverRef != nullptr) {
            (void)serverRef->Broadcast(MakeSelectionChangedNotification(describeActive(root, active)));
        }
    };
    base.onClientConnected = [](TransportSource source, const std::string& id) {
        LOG_INFO("directory_host: {} client {} connected", toString(source), id);
    };

    DualServer server(DualServer::Options::FromEnvironment(base), host);
    serverRef = &server;
    server.ValidateToolRegistration();

    auto started = server.Start();
    if (!started.AnyRunning()) {
        if (started.webSocketFault) { LOG_ERROR("directory_host: {}", started.webSocketFault->message); }
        if (started.httpFault) { LOG_ERROR("directory_host: {}", started.httpFault->message); }
        return 1;
    }
    if (started.webSocketPort) {
        LOG_INFO("directory_host: WebSocket on ws://127.0.0.1:{} (record {})", *started.webSocketPort,
                 server.Discovery().RecordPath().value_or(fs::path()).string());
    }
    if (started.httpPort) {
        LOG_INFO("directory_host: SSE stream on http://127.0.0.1:{}/sse", *started.httpPort);
    }

    boost::asio::io_context mainIoc;
    boost::asio::signal_set signals(mainIoc, SIGINT, SIGTERM);
    boost::asio::steady_timer selectionTimer(mainIoc);
    signals.async_wait([&](const boost::system::error_code& err, int sig) {
        if (!err) {
            LOG_INFO("directory_host: signal {} received, shutting down", sig);
        }
        selectionTimer.cancel();
    });

    std::function<void()> scheduleSelection = [&]() {
        selectionTimer.expires_after(selectionPeriod);
        selectionTimer.async_wait([&](const boost::system::error_code& err) {
            if (err) {
                return;
            }
            const std::size_t n = server.Broadcast(MakeSelectionChangedNotification(describeActive(root, active))).get();
            LOG_DEBUG("directory_host: selection_changed sent to {} client(s)", n);
            scheduleSelection();
        });
    };
    if (selectionPeriod.count() > 0) {
        scheduleSelection();
    }

    mainIoc.run();
    server.Stop();
    return 0;
}
