//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Reply.h
// Purpose: Transport-independent reply handle injected into request handlers
//==========================================================================================================

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <variant>

#include "idebridge/JSONRPCTypes.h"
#include "idebridge/errors/Errors.h"

namespace idebridge {

// A reply carries either a result value or a typed error.
using ReplyPayload = std::variant<JSONValue, errors::RpcError>;

//==========================================================================================================
// IReplyChannel
// Purpose: Per-transport sink for one serialized JSON-RPC response.
// Notes:
//   - WebSocket channels write a text frame to the originating connection.
//   - SSE channels emit a "message" event on the originating session.
//   - Deliver may be called from any thread; a closed connection/session swallows the payload.
//==========================================================================================================
class IReplyChannel {
public:
    virtual ~IReplyChannel() = default;
    virtual void Deliver(std::string payload) = 0;
};

//==========================================================================================================
// FunctionReplyChannel
// Purpose: Adapts a callable into a reply channel (in-process callers and tests).
//==========================================================================================================
class FunctionReplyChannel : public IReplyChannel {
public:
    explicit FunctionReplyChannel(std::function<void(std::string)> fn) : fn_(std::move(fn)) {}
    void Deliver(std::string payload) override {
        if (fn_) {
            fn_(std::move(payload));
        }
    }

private:
    std::function<void(std::string)> fn_;
};

//==========================================================================================================
// Reply
// Purpose: Copyable handle bound to one request id and one reply channel.
// Notes:
//   - Copies share a once-flag: the first Send wins, later ones are logged and dropped, so every
//     request yields exactly one response.
//   - A default-constructed Reply (used for notifications) has no channel; Send is a no-op.
//==========================================================================================================
class Reply {
public:
    Reply() = default;
    Reply(JSONRPCId id, std::shared_ptr<IReplyChannel> channel);

    //==========================================================================================================
    // Sends the response. Returns true when this call produced the response.
    //==========================================================================================================
    bool Send(ReplyPayload payload) const;

    bool Result(JSONValue result) const { return Send(ReplyPayload{std::move(result)}); }
    bool Error(int code, std::string message) const {
        return Send(ReplyPayload{errors::makeRpcError(code, std::move(message))});
    }
    bool Error(errors::RpcError err) const { return Send(ReplyPayload{std::move(err)}); }

    // True when the peer is waiting for a response (request, not notification).
    bool ExpectsResponse() const { return channel_ != nullptr; }
    bool Sent() const { return sent_ && sent_->load(); }
    const JSONRPCId& Id() const { return id_; }

    // Serializes a payload as a complete JSON-RPC response for the given id.
    static std::string Encode(const JSONRPCId& id, const ReplyPayload& payload);

private:
    JSONRPCId id_{nullptr};
    std::shared_ptr<IReplyChannel> channel_;
    std::shared_ptr<std::atomic<bool>> sent_;
};

} // namespace idebridge
