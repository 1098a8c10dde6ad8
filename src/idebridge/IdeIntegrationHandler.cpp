//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: IdeIntegrationHandler.cpp
// Purpose: ide_connected / notifications/initialized handling and the delayed initial-context push
//==========================================================================================================

#include <memory>

#include <boost/asio/steady_timer.hpp>

#include "idebridge/IdeIntegrationHandler.h"
#include "idebridge/Protocol.h"
#include "logging/Logger.h"

namespace idebridge {

IdeIntegrationHandler::IdeIntegrationHandler(boost::asio::io_context& ioc,
                                             InitialContextCallback onInitialContext,
                                             std::chrono::milliseconds delay)
    : ioc_(ioc), onInitialContext_(std::move(onInitialContext)), delay_(delay) {}

bool IdeIntegrationHandler::IsIntegrationMethod(const std::string& method) {
    return method == Methods::IdeConnected || method == Methods::Initialized;
}

bool IdeIntegrationHandler::Handle(const Envelope& envelope, const Reply& reply) {
    if (envelope.method == Methods::IdeConnected) {
        std::string pid = "unknown";
        if (envelope.params) {
            if (auto n = GetIntMember(*envelope.params, "pid")) {
                pid = std::to_string(*n);
            }
        }
        LOG_INFO("IdeIntegration: client connected with pid {}", pid);
    } else if (envelope.method == Methods::Initialized) {
        LOG_DEBUG("IdeIntegration: client initialized; initial context in {} ms", delay_.count());
        scheduleInitialContext();
    } else {
        return false;
    }
    if (reply.ExpectsResponse()) {
        reply.Result(JSONValue(nullptr));
    }
    return true;
}

void IdeIntegrationHandler::scheduleInitialContext() {
    if (!onInitialContext_) {
        return;
    }
    auto timer = std::make_shared<boost::asio::steady_timer>(ioc_, delay_);
    timer->async_wait([timer, cb = onInitialContext_](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        try {
            LOG_DEBUG("IdeIntegration: sending initial context");
            cb();
        } catch (const std::exception& e) {
            LOG_ERROR("IdeIntegration: initial context callback failed: {}", e.what());
        }
    });
}

} // namespace idebridge
