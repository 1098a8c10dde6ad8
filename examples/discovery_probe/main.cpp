//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Lists the discovery records an agent client would find, and optionally pings each server
//==========================================================================================================

#include "logging/Logger.h"
#include "idebridge/DiscoveryPublisher.h"
#include "idebridge/JSONRPCTypes.h"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <iostream>
#include <string>

using namespace idebridge;
namespace net = boost::asio;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

// Sends one ping request and returns the raw reply.
static std::string pingServer(uint16_t port) {
    net::io_context ioc;
    websocket::stream<tcp::socket> ws(ioc);
    ws.next_layer().connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
    ws.handshake("127.0.0.1:" + std::to_string(port), "/");
    ws.text(true);
    JSONRPCRequest req(JSONRPCId{int64_t{1}}, "ping");
    ws.write(net::buffer(req.Serialize()));
    boost::beast::flat_buffer buffer;
    ws.read(buffer);
    std::string reply = boost::beast::buffers_to_string(buffer.data());
    boost::system::error_code ec;
    ws.close(websocket::close_code::normal, ec);
    return reply;
}

int main(int argc, char** argv) {
    Logger::configureFromEnvironment();
    bool ping = false;
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--ping") {
            ping = true;
        }
    }

    const auto ideDir = DiscoveryPublisher::ResolveConfigDir() / "ide";
    const auto servers = DiscoveryPublisher::ListRecords(ideDir);
    std::cout << "discovery directory: " << ideDir.string() << std::endl;
    if (servers.empty()) {
        std::cout << "no servers found" << std::endl;
        return 1;
    }
    for (const auto& s : servers) {
        std::cout << "port=" << s.port << " pid=" << s.record.pid << " ide=" << s.record.ideName
                  << " transport=" << s.record.transport << " folders=" << s.record.workspaceFolders.size() << std::endl;
        if (!ping) {
            continue;
        }
        try {
            std::cout << "  ping: " << pingServer(s.port) << std::endl;
        } catch (const boost::system::system_error& e) {
            LOG_WARN("discovery_probe: port {} unreachable: {}", s.port, e.what());
        }
    }
    return 0;
}
