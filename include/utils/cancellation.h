/*
  cancellation.h

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

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace plugdock {

// Shared cancellation flag with an optional deadline. Copies observe the same
// flag. An external flag (set from a signal handler) can be attached so that
// SIGINT reaches long running downloads and extraction.
class CancellationToken {
   public:
    using clock = std::chrono::steady_clock;

    CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {
    }

    static CancellationToken with_timeout(std::chrono::milliseconds timeout) {
        CancellationToken token;
        token.deadline_ = clock::now() + timeout;
        return token;
    }

    void cancel() const {
        cancelled_->store(true);
    }

    void attach_external_flag(const volatile std::atomic<bool>* flag) {
        external_ = flag;
    }

    bool is_cancelled() const {
        if (cancelled_->load()) {
            return true;
        }
        if (external_ != nullptr && external_->load()) {
            return true;
        }
        return deadline_.has_value() && clock::now() >= *deadline_;
    }

   private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
    const volatile std::atomic<bool>* external_ = nullptr;
    std::optional<clock::time_point> deadline_;
};

}  // namespace plugdock
