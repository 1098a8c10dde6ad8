//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.h
// Purpose: Fire-and-forget coroutine type for handlers that report through a Reply
//==========================================================================================================

#pragma once

#include <coroutine>
#include <exception>

#include "logging/Logger.h"

namespace idebridge {
namespace async {

// DetachedTask - eagerly started coroutine that owns its own frame.
// Usage: DetachedTask run(args, Reply reply) { auto s = co_await ...; reply.Result(...); }
// The outcome is delivered through the Reply captured by the coroutine, so there is no future.
// Bodies are expected to catch their own exceptions; anything escaping is logged here.

class DetachedTask {
public:
    struct promise_type {
        DetachedTask get_return_object() noexcept { return DetachedTask{}; }
        std::suspend_never initial_suspend() noexcept { return {}; }
        std::suspend_never final_suspend() noexcept { return {}; }
        void return_void() noexcept {}
        void unhandled_exception() noexcept {
            try {
                std::rethrow_exception(std::current_exception());
            } catch (const std::exception& e) {
                LOG_ERROR("DetachedTask: unhandled exception: {}", e.what());
            }
        }
    };

private:
    DetachedTask() = default;
};

} // namespace async
} // namespace idebridge
