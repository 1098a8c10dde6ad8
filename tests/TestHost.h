//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TestHost.h
// Purpose: In-memory host collaborators and reply capture shared by the GoogleTests
//==========================================================================================================

#pragma once

#include <condition_variable>
#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "idebridge/HostServices.h"
#include "idebridge/JSONRPCTypes.h"
#include "idebridge/Reply.h"

namespace idebridge {
namespace test {

// Files live in a map; futures are always ready so tool coroutines complete inline.
class MemoryFiles : public IFileProvider {
public:
    std::future<std::string> Read(const std::string& path) override {
        std::promise<std::string> p;
        std::lock_guard<std::mutex> lock(mtx);
        auto it = files.find(path);
        if (it == files.end()) {
            p.set_exception(std::make_exception_ptr(std::runtime_error("ENOENT: " + path)));
        } else {
            p.set_value(it->second);
        }
        return p.get_future();
    }

    std::future<void> Write(const std::string& path, const std::string& content) override {
        std::promise<void> p;
        std::lock_guard<std::mutex> lock(mtx);
        if (readOnly) {
            p.set_exception(std::make_exception_ptr(std::runtime_error("EACCES: " + path)));
        } else {
            files[path] = content;
            p.set_value();
        }
        return p.get_future();
    }

    bool Exists(const std::string& path) override {
        std::lock_guard<std::mutex> lock(mtx);
        return files.count(path) > 0;
    }

    std::string Get(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx);
        return files.at(path);
    }

    std::map<std::string, std::string> files;
    bool readOnly{false};
    std::mutex mtx;
};

class MemoryWorkspace : public IWorkspaceProvider {
public:
    explicit MemoryWorkspace(std::shared_ptr<MemoryFiles> f) : files(std::move(f)) {}

    std::optional<std::string> ActiveFile() const override { return active; }

    std::vector<std::string> ListFiles() const override {
        std::vector<std::string> out;
        std::lock_guard<std::mutex> lock(files->mtx);
        for (const auto& kv : files->files) {
            out.push_back(kv.first);
        }
        return out;
    }

    std::string Name() const override { return name; }
    std::string BasePath() const override { return basePath; }

    std::shared_ptr<MemoryFiles> files;
    std::optional<std::string> active;
    std::string name{"demo"};
    std::string basePath{"/work/demo"};
};

inline HostServices MakeHost(std::shared_ptr<MemoryFiles> files, std::shared_ptr<MemoryWorkspace> ws) {
    HostServices host;
    host.files = std::move(files);
    host.workspace = std::move(ws);
    return host;
}

// Collects serialized responses delivered through a Reply.
class CaptureChannel : public IReplyChannel {
public:
    void Deliver(std::string payload) override {
        std::lock_guard<std::mutex> lock(mtx);
        payloads.push_back(std::move(payload));
        cv.notify_all();
    }

    bool WaitFor(std::size_t n, std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        std::unique_lock<std::mutex> lock(mtx);
        return cv.wait_for(lock, timeout, [&] { return payloads.size() >= n; });
    }

    std::size_t Count() {
        std::lock_guard<std::mutex> lock(mtx);
        return payloads.size();
    }

    JSONValue Last() {
        std::lock_guard<std::mutex> lock(mtx);
        if (payloads.empty()) {
            throw std::runtime_error("no reply captured");
        }
        return ParseJSON(payloads.back());
    }

    std::vector<std::string> payloads;
    std::mutex mtx;
    std::condition_variable cv;
};

// Text of result.content[0].text.
inline std::string ContentText(const JSONValue& response) {
    const JSONValue* result = FindMember(response, "result");
    const JSONValue* content = result ? FindMember(*result, "content") : nullptr;
    if (content == nullptr || !content->IsArray()) {
        return {};
    }
    const auto& arr = std::get<JSONValue::Array>(content->value);
    if (arr.empty() || !arr[0]) {
        return {};
    }
    return GetStringMember(*arr[0], "text").value_or("");
}

inline int64_t ErrorCode(const JSONValue& response) {
    const JSONValue* err = FindMember(response, "error");
    return err ? GetIntMember(*err, "code").value_or(0) : 0;
}

inline std::string ErrorMessage(const JSONValue& response) {
    const JSONValue* err = FindMember(response, "error");
    return err ? GetStringMember(*err, "message").value_or("") : std::string();
}

} // namespace test
} // namespace idebridge
