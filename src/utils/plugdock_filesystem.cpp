/*
  plugdock_filesystem.cpp

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

#include "utils/plugdock_filesystem.h"

#include <errno.h>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <system_error>
#include <vector>

#include "utils/debug.h"

namespace plugdock_filesystem {

Result<int> FileOperations::safe_open(const std::string& path, int flags, mode_t mode) {
    int fd = ::open(path.c_str(), flags, mode);
    if (fd == -1) {
        return Result<int>::error(ErrorType::FILE_ERROR, "Failed to open file '" + path +
                                                             "': " + std::string(strerror(errno)));
    }
    return Result<int>::ok(fd);
}

void FileOperations::safe_close(int fd) {
    if (fd >= 0) {
        ::close(fd);
    }
}

Result<std::string> FileOperations::create_temp_file(const std::string& prefix) {
    std::string pattern = (fs::temp_directory_path() / (prefix + "_XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    int fd = ::mkstemp(buffer.data());
    if (fd == -1) {
        return Result<std::string>::error(ErrorType::FILE_ERROR,
                                          "Failed to create temporary file: " +
                                              std::string(strerror(errno)));
    }
    safe_close(fd);
    return Result<std::string>::ok(std::string(buffer.data()));
}

void FileOperations::cleanup_temp_file(const std::string& path) {
    std::remove(path.c_str());
}

Result<std::string> FileOperations::create_temp_directory(const fs::path& parent,
                                                          const std::string& prefix) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        return Result<std::string>::error(ErrorType::FILE_ERROR, "Failed to create directory '" +
                                                                     parent.string() +
                                                                     "': " + ec.message());
    }

    std::string pattern = (parent / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (::mkdtemp(buffer.data()) == nullptr) {
        return Result<std::string>::error(ErrorType::FILE_ERROR,
                                          "Failed to create temporary directory in '" +
                                              parent.string() + "': " + strerror(errno));
    }
    return Result<std::string>::ok(std::string(buffer.data()));
}

Result<void> FileOperations::write_all(int fd, const char* data, size_t size) {
    size_t written_total = 0;
    while (written_total < size) {
        ssize_t written = ::write(fd, data + written_total, size - written_total);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Result<void>::error(ErrorType::FILE_ERROR,
                                       "Failed to write to file descriptor: " +
                                           std::string(strerror(errno)));
        }
        written_total += static_cast<size_t>(written);
    }
    return Result<void>::ok();
}

Result<void> FileOperations::write_file_content(const std::string& path, const std::string& content,
                                                mode_t mode) {
    auto open_result = safe_open(path, O_WRONLY | O_CREAT | O_TRUNC, mode);
    if (open_result.is_error()) {
        return Result<void>::error(open_result.error_type(), open_result.error());
    }

    int fd = open_result.value();
    auto write_result = write_all(fd, content.data(), content.size());
    if (write_result.is_ok() && ::fchmod(fd, mode) != 0) {
        write_result = Result<void>::error(ErrorType::FILE_ERROR, "Failed to set permissions on '" +
                                                                      path + "': " + strerror(errno));
    }
    safe_close(fd);

    if (write_result.is_error()) {
        return Result<void>::error(write_result.error_type(),
                                   "Failed to write complete content to file '" + path +
                                       "': " + write_result.error());
    }

    return Result<void>::ok();
}

Result<std::string> FileOperations::read_file_content(const std::string& path) {
    auto open_result = safe_open(path, O_RDONLY);
    if (open_result.is_error()) {
        return Result<std::string>::error(open_result.error_type(), open_result.error());
    }

    int fd = open_result.value();
    std::string content;
    char buffer[4096];
    ssize_t bytes_read;

    while ((bytes_read = read(fd, buffer, sizeof(buffer))) > 0) {
        content.append(buffer, bytes_read);
    }

    safe_close(fd);

    if (bytes_read < 0) {
        return Result<std::string>::error(ErrorType::FILE_ERROR, "Failed to read from file '" +
                                                                     path + "': " +
                                                                     std::string(strerror(errno)));
    }

    return Result<std::string>::ok(content);
}

ScopedDirectory::~ScopedDirectory() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        plugdock_debug_msg("failed to remove %s: %s", path_.c_str(), ec.message().c_str());
    }
}

Result<std::uint64_t> directory_size(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<std::uint64_t>::error(ErrorType::FILE_ERROR,
                                            "Path does not exist: " + path.string());
    }

    std::uint64_t total = 0;
    fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Result<std::uint64_t>::error(ErrorType::FILE_ERROR, "Failed to walk '" +
                                                                       path.string() +
                                                                       "': " + ec.message());
    }

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return Result<std::uint64_t>::error(ErrorType::FILE_ERROR, "Failed to walk '" +
                                                                           path.string() +
                                                                           "': " + ec.message());
        }
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec)) {
            auto size = it->file_size(entry_ec);
            if (!entry_ec) {
                total += size;
            }
        }
    }
    return Result<std::uint64_t>::ok(total);
}

fs::path user_home_path() {
    const char* home = std::getenv("HOME");
    if (!home || home[0] == '\0') {
        plugdock_debug_msg("HOME not set, falling back to /tmp");
        return fs::path("/tmp");
    }
    return fs::path(home);
}

fs::path user_cache_path() {
    const char* xdg_cache = std::getenv("XDG_CACHE_HOME");
    if (xdg_cache != nullptr && xdg_cache[0] != '\0') {
        return fs::path(xdg_cache) / "plugdock";
    }
    return user_home_path() / ".cache" / "plugdock";
}

}  // namespace plugdock_filesystem
