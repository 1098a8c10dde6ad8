//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Reply.cpp
// Purpose: Reply encoding and exactly-once delivery
//==========================================================================================================

#include "idebridge/Reply.h"
#include "logging/Logger.h"

namespace idebridge {

Reply::Reply(JSONRPCId id, std::shared_ptr<IReplyChannel> channel)
    : id_(std::move(id)), channel_(std::move(channel)), sent_(std::make_shared<std::atomic<bool>>(false)) {}

std::string Reply::Encode(const JSONRPCId& id, const ReplyPayload& payload) {
    if (const auto* err = std::get_if<errors::RpcError>(&payload)) {
        return errors::makeErrorResponse(id, *err)->Serialize();
    }
    return JSONRPCResponse::Success(id, std::get<JSONValue>(payload)).Serialize();
}

bool Reply::Send(ReplyPayload payload) const {
    if (!channel_) {
        return false;
    }
    if (sent_->exchange(true)) {
        LOG_WARN("Reply: duplicate response for id {} dropped", IdToString(id_));
        return false;
    }
    channel_->Deliver(Encode(id_, payload));
    return true;
}

} // namespace idebridge
