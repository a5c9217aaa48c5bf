/*
  lock.cpp

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

#include "registry/lock.h"

#include <fcntl.h>
#include <unistd.h>

#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <vector>

#include "utils/debug.h"

namespace plugdock {

namespace {

using plugdock_filesystem::FileOperations;

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

bool valid_lock_name(const std::string& name) {
    return !name.empty() && name != "." && name != ".." &&
           name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

Result<std::string> write_pending_lock(const std::string& lock_path, const std::string& owner) {
    std::string pattern = lock_path + ".XXXXXX";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    int fd = ::mkstemp(buffer.data());
    if (fd < 0) {
        return Result<std::string>::error(ErrorType::FILE_ERROR, "failed to create lock file '" +
                                                                     lock_path +
                                                                     "': " + strerror(errno));
    }
    // mkstemp creates the file 0600
    std::string pending(buffer.data());
    auto written = FileOperations::write_all(fd, owner.data(), owner.size());
    FileOperations::safe_close(fd);
    if (written.is_error()) {
        ::unlink(pending.c_str());
        return Result<std::string>::error(ErrorType::FILE_ERROR, "failed to write lock file '" +
                                                                     lock_path +
                                                                     "': " + written.error());
    }
    return Result<std::string>::ok(pending);
}

}  // namespace

LockManager::LockManager(std::filesystem::path plugin_root,
                         std::shared_ptr<ProcessChecker> checker)
    : plugin_root_(std::move(plugin_root)), checker_(std::move(checker)) {
    if (!checker_) {
        checker_ = default_process_checker();
    }
}

std::filesystem::path LockManager::lock_path(const std::string& name) const {
    return plugin_root_ / (name + ".lock");
}

bool LockManager::is_lock_stale(const std::filesystem::path& path) const {
    auto content = FileOperations::read_file_content(path.string());
    if (content.is_error()) {
        // a lock released between the failed create and this read is simply gone
        return false;
    }

    std::string text = trim(content.value());
    if (text.empty()) {
        return true;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return true;
        }
    }

    errno = 0;
    char* end = nullptr;
    long long pid = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE || end == nullptr || *end != '\0') {
        return true;
    }
    if (pid <= 0 || pid > kMaxPlausiblePid) {
        return true;
    }
    return !checker_->is_running(pid);
}

Result<LockManager::Unlock> LockManager::acquire_lock(const std::string& name) {
    if (!valid_lock_name(name)) {
        return Result<Unlock>::error(ErrorType::INVALID_ARGUMENT,
                                     "invalid plugin name for lock: '" + name + "'");
    }

    std::error_code ec;
    std::filesystem::create_directories(plugin_root_, ec);
    if (ec) {
        return Result<Unlock>::error(ErrorType::FILE_ERROR, "failed to create plugin directory '" +
                                                                plugin_root_.string() +
                                                                "': " + ec.message());
    }

    std::string path = lock_path(name).string();
    std::string owner = std::to_string(static_cast<long long>(::getpid()));

    for (int attempt = 0; attempt < 2; ++attempt) {
        // the lock only ever appears with its pid already written
        auto pending = write_pending_lock(path, owner);
        if (pending.is_error()) {
            return Result<Unlock>::error(pending.error_type(), pending.error());
        }
        int linked = ::link(pending.value().c_str(), path.c_str());
        int link_errno = errno;
        ::unlink(pending.value().c_str());

        if (linked == 0) {
            plugdock_debug_msg("acquired lock %s", path.c_str());
            auto released = std::make_shared<std::atomic<bool>>(false);
            Unlock unlock = [path, owner, released]() {
                if (released->exchange(true)) {
                    return;
                }
                // leave a lock alone if someone else reclaimed it meanwhile
                auto current = FileOperations::read_file_content(path);
                if (current.is_ok() && trim(current.value()) != owner) {
                    plugdock_debug_msg("lock %s now owned by %s, not removing", path.c_str(),
                                       current.value().c_str());
                    return;
                }
                if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
                    plugdock_debug_msg("failed to remove lock %s: %s", path.c_str(),
                                       strerror(errno));
                }
            };
            return Result<Unlock>::ok(unlock);
        }
        errno = link_errno;

        if (errno != EEXIST) {
            return Result<Unlock>::error(ErrorType::FILE_ERROR, "failed to create lock file '" +
                                                                    path + "': " + strerror(errno));
        }

        if (attempt == 0 && is_lock_stale(path)) {
            plugdock_debug_msg("reclaiming stale lock %s", path.c_str());
            if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
                return Result<Unlock>::error(ErrorType::FILE_ERROR,
                                             "failed to remove stale lock '" + path +
                                                 "': " + strerror(errno));
            }
            continue;
        }
        break;
    }

    return Result<Unlock>::error(ErrorType::LOCK_HELD,
                                 "failed to acquire lock for plugin '" + name +
                                     "': another operation is in progress (" + path + ")");
}

}  // namespace plugdock
