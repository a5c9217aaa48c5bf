/*
  lock.h

  This file is part of plugdock

  MIT License

  Copyright (c) 2026 The plugdock authors

  Permission is hereby granted, free of charge, to any person obtaining a copy
  of this software and associated documentation files (the "Software"), to deal
  in the Software without restriction, including without limitation the rights
  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
  copies of the Software, and to permit persons to whom the Software is
  furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all
  copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/

#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "registry/platform.h"
#include "utils/plugdock_filesystem.h"

namespace plugdock {

using plugdock_filesystem::Result;

// Upper bound for pids on Linux (PID_MAX_LIMIT); anything above is not a real owner.
constexpr long long kMaxPlausiblePid = 4194304;

// Advisory per-plugin locks: <plugin_root>/<name>.lock holding the owner's pid.
// acquire_lock is a try-lock; it never waits for another holder.
class LockManager {
   public:
    using Unlock = std::function<void()>;

    explicit LockManager(std::filesystem::path plugin_root,
                         std::shared_ptr<ProcessChecker> checker = default_process_checker());

    // Returns a closure that removes the lock. Calling it more than once is harmless.
    Result<Unlock> acquire_lock(const std::string& name);

    // Empty, whitespace, non-numeric, implausibly large or dead pids are stale.
    // A missing file is not stale.
    bool is_lock_stale(const std::filesystem::path& lock_path) const;

    std::filesystem::path lock_path(const std::string& name) const;

    const std::filesystem::path& plugin_root() const {
        return plugin_root_;
    }

   private:
    std::filesystem::path plugin_root_;
    std::shared_ptr<ProcessChecker> checker_;
};

// Runs an unlock closure when it goes out of scope.
class LockGuard {
   public:
    LockGuard() = default;
    explicit LockGuard(LockManager::Unlock unlock) : unlock_(std::move(unlock)) {
    }
    LockGuard(LockGuard&& other) noexcept : unlock_(std::move(other.unlock_)) {
        other.unlock_ = nullptr;
    }
    LockGuard& operator=(LockGuard&& other) noexcept {
        if (this != &other) {
            release();
            unlock_ = std::move(other.unlock_);
            other.unlock_ = nullptr;
        }
        return *this;
    }
    LockGuard(const LockGuard&) = delete;
    LockGuard& operator=(const LockGuard&) = delete;

    ~LockGuard() {
        release();
    }

    void release() {
        if (unlock_) {
            auto unlock = std::move(unlock_);
            unlock_ = nullptr;
            unlock();
        }
    }

   private:
    LockManager::Unlock unlock_;
};

}  // namespace plugdock
