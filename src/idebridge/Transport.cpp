//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.cpp
// Purpose: URI-style acceptor configuration parsing shared by the transport factories
//==========================================================================================================

#include "idebridge/Transport.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string_view>

namespace idebridge {

namespace {

std::string_view stripSpace(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

// Splits s at the first occurrence of sep; the separator itself is dropped.
std::pair<std::string_view, std::string_view> cut(std::string_view s, std::string_view sep) {
    const auto at = s.find(sep);
    if (at == std::string_view::npos) {
        return {s, std::string_view()};
    }
    return {s.substr(0, at), s.substr(at + sep.size())};
}

uint16_t portNumber(std::string_view text) {
    const bool digits = !text.empty() && text.size() <= 5 &&
        std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
    if (!digits) {
        throw std::invalid_argument("invalid port (non-numeric): " + std::string(text));
    }
    unsigned long n = 0;
    for (char ch : text) {
        n = n * 10 + static_cast<unsigned long>(ch - '0');
    }
    if (n > 65535ul) {
        throw std::invalid_argument("invalid port (out of range): " + std::string(text));
    }
    return static_cast<uint16_t>(n);
}

// "host", "host:port", "[v6]" or "[v6]:port" into the config, leaving defaults for absent parts.
void applyAuthority(std::string_view authority, EndpointConfig& out) {
    std::string_view host = authority;
    std::string_view port;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string_view::npos) {
            throw std::invalid_argument("unterminated IPv6 address: " + std::string(authority));
        }
        host = authority.substr(1, close - 1);
        const std::string_view rest = authority.substr(close + 1);
        if (!rest.empty() && rest.front() == ':') {
            port = rest.substr(1);
        }
    } else if (const auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    }
    host = stripSpace(host);
    port = stripSpace(port);
    if (!host.empty()) {
        out.address = std::string(host);
    }
    if (!port.empty()) {
        out.port = portNumber(port);
    }
}

} // namespace

EndpointConfig ParseEndpointConfig(const std::string& config,
                                   const std::string& defaultScheme,
                                   const std::string& defaultAddress,
                                   uint16_t defaultPort) {
    EndpointConfig out{defaultScheme, defaultAddress, defaultPort, {}};

    std::string_view rest = stripSpace(config);
    if (rest.find("://") != std::string_view::npos) {
        auto [scheme, tail] = cut(rest, "://");
        out.scheme.clear();
        for (char c : scheme) {
            out.scheme += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        rest = tail;
    }

    auto [location, query] = cut(rest, "?");
    const std::string_view authority = stripSpace(cut(location, "/").first);
    if (!authority.empty()) {
        applyAuthority(authority, out);
    }

    while (!query.empty()) {
        auto [pair, more] = cut(query, "&");
        query = more;
        if (pair.empty()) {
            continue;
        }
        auto [key, value] = cut(pair, "=");
        out.query[std::string(key)] = std::string(value);
    }
    return out;
}

} // namespace idebridge
