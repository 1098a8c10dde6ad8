//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FutureAwaitable.h
// Purpose: co_await support for std::future values produced by host collaborators
//==========================================================================================================

#pragma once

#include <future>
#include <coroutine>
#include <chrono>
#include <thread>
#include <utility>

namespace idebridge {
namespace async {

// Awaiter for std::future<T> (T may be void).
// A ready future completes inline; otherwise a waiter thread blocks on it and resumes the
// coroutine on that thread. Exceptions stored in the future are rethrown from await_resume.

template <typename T>
class FutureAwaitable {
public:
    explicit FutureAwaitable(std::future<T>&& f) : fut(std::move(f)) {}

    bool await_ready() const noexcept {
        using namespace std::chrono_literals;
        return !fut.valid() || fut.wait_for(0s) == std::future_status::ready;
    }

    void await_suspend(std::coroutine_handle<> h) {
        std::thread([this, h]() {
            fut.wait();
            h.resume();
        }).detach();
    }

    T await_resume() {
        if constexpr (std::is_void_v<T>) {
            fut.get();
        } else {
            return fut.get();
        }
    }

private:
    std::future<T> fut;
};

template <typename T>
inline FutureAwaitable<T> awaitFuture(std::future<T>&& fut) {
    return FutureAwaitable<T>(std::move(fut));
}

} // namespace async
} // namespace idebridge
