/*
  plugdock_filesystem.h

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

#include <limits.h>
#include <unistd.h>

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <fcntl.h>

#include "error_out.h"

// the plugdock file system
namespace plugdock_filesystem {
namespace fs = std::filesystem;

// Error type for Result
struct Error {
    ErrorType type;
    std::string message;
    explicit Error(const std::string& msg) : type(ErrorType::RUNTIME_ERROR), message(msg) {}
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}
};

// Result template for safe error handling
template<typename T>
class Result {
public:
    explicit Result(T value) : value_(std::move(value)), has_value_(true) {}
    explicit Result(const Error& error)
        : error_(error.message), error_type_(error.type), has_value_(false) {}

    // Factory methods
    static Result<T> ok(T value) {
        return Result<T>(std::move(value));
    }
    static Result<T> error(const std::string& message) {
        return Result<T>(Error(message));
    }
    static Result<T> error(ErrorType type, const std::string& message) {
        return Result<T>(Error(type, message));
    }

    bool is_ok() const { return has_value_; }
    bool is_error() const { return !has_value_; }

    const T& value() const {
        if (!has_value_) throw std::runtime_error("Attempted to access value of error Result");
        return value_;
    }

    T& value() {
        if (!has_value_) throw std::runtime_error("Attempted to access value of error Result");
        return value_;
    }

    const std::string& error() const {
        if (has_value_) throw std::runtime_error("Attempted to access error of ok Result");
        return error_;
    }

    ErrorType error_type() const { return error_type_; }

private:
    T value_{};
    std::string error_;
    ErrorType error_type_{ErrorType::RUNTIME_ERROR};
    bool has_value_;
};

// Specialization for void
template<>
class Result<void> {
public:
    Result() : has_value_(true) {}
    explicit Result(const Error& error)
        : error_(error.message), error_type_(error.type), has_value_(false) {}

    // Factory methods
    static Result<void> ok() { return Result<void>(); }
    static Result<void> error(const std::string& message) {
        return Result<void>(Error(message));
    }
    static Result<void> error(ErrorType type, const std::string& message) {
        return Result<void>(Error(type, message));
    }

    bool is_ok() const { return has_value_; }
    bool is_error() const { return !has_value_; }

    const std::string& error() const {
        if (has_value_) throw std::runtime_error("Attempted to access error of ok Result");
        return error_;
    }

    ErrorType error_type() const { return error_type_; }

private:
    std::string error_;
    ErrorType error_type_{ErrorType::RUNTIME_ERROR};
    bool has_value_;
};

// Re-raise an error Result as another Result type, keeping its kind and
// prefixing the message with context.
template<typename T, typename U>
Result<T> propagate(const Result<U>& failed, const std::string& context = "") {
    if (context.empty()) {
        return Result<T>::error(failed.error_type(), failed.error());
    }
    return Result<T>::error(failed.error_type(), context + ": " + failed.error());
}

// Safe file operations class
class FileOperations {
public:
    static Result<int> safe_open(const std::string& path, int flags, mode_t mode = 0644);
    static void safe_close(int fd);

    // Temporary file utilities
    static Result<std::string> create_temp_file(const std::string& prefix = "plugdock_temp");
    static void cleanup_temp_file(const std::string& path);

    // create a uniquely named directory below parent (mkdtemp)
    static Result<std::string> create_temp_directory(const fs::path& parent,
                                                     const std::string& prefix);

    // High-level utilities
    static Result<void> write_file_content(const std::string& path, const std::string& content,
                                           mode_t mode = 0644);
    static Result<std::string> read_file_content(const std::string& path);
    static Result<void> write_all(int fd, const char* data, size_t size);
};

// Removes a directory tree when it goes out of scope unless released.
class ScopedDirectory {
public:
    ScopedDirectory() = default;
    explicit ScopedDirectory(fs::path path) : path_(std::move(path)) {}
    ScopedDirectory(const ScopedDirectory&) = delete;
    ScopedDirectory& operator=(const ScopedDirectory&) = delete;
    ~ScopedDirectory();

    const fs::path& path() const { return path_; }
    void release() { path_.clear(); }

private:
    fs::path path_;
};

// Recursive on-disk size of regular files below path.
Result<std::uint64_t> directory_size(const fs::path& path);

fs::path user_home_path();
fs::path user_cache_path();

}  // namespace plugdock_filesystem
