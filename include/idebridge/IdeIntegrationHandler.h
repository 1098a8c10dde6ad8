//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: IdeIntegrationHandler.h
// Purpose: Pluggable pre-dispatch hook for editor-integration messages
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <string>

#include <boost/asio/io_context.hpp>

#include "idebridge/JSONRPCTypes.h"
#include "idebridge/Reply.h"

namespace idebridge {

//==========================================================================================================
// IIntegrationHandler
// Purpose: Consulted by RequestRouter before any protocol method.
// Returns:
//   true when the envelope was consumed; the router then stops. A consumed request must be answered
//   through the supplied Reply.
//==========================================================================================================
class IIntegrationHandler {
public:
    virtual ~IIntegrationHandler() = default;
    virtual bool Handle(const Envelope& envelope, const Reply& reply) = 0;
};

//==========================================================================================================
// IdeIntegrationHandler
// Purpose: Default integration handler.
//   ide_connected              logs the client pid.
//   notifications/initialized  schedules the host's initial-context callback after a short delay.
// Notes:
//   - Both are notifications in practice. When a client sends either with an id it still receives
//     exactly one (null) result.
//   - The delay runs on the io_context; the callback executes on the I/O thread.
//==========================================================================================================
class IdeIntegrationHandler : public IIntegrationHandler {
public:
    using InitialContextCallback = std::function<void()>;

    IdeIntegrationHandler(boost::asio::io_context& ioc,
                          InitialContextCallback onInitialContext,
                          std::chrono::milliseconds delay = std::chrono::milliseconds(200));

    bool Handle(const Envelope& envelope, const Reply& reply) override;

    static bool IsIntegrationMethod(const std::string& method);

private:
    void scheduleInitialContext();

    boost::asio::io_context& ioc_;
    InitialContextCallback onInitialContext_;
    std::chrono::milliseconds delay_;
};

} // namespace idebridge
