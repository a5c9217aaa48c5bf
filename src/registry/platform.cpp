/*
  platform.cpp

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

#include "registry/platform.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#else
#include <signal.h>
#include <sys/types.h>
#include <sys/utsname.h>
#endif

namespace plugdock {

namespace {

std::string normalize_arch(std::string arch) {
    std::transform(arch.begin(), arch.end(), arch.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (arch == "x86_64" || arch == "amd64") {
        return "amd64";
    }
    if (arch == "arm64" || arch == "aarch64") {
        return "arm64";
    }
    return arch;
}

}  // namespace

Platform Platform::current() {
    Platform platform;
#ifdef _WIN32
    platform.os = "windows";
    const char* arch = std::getenv("PROCESSOR_ARCHITECTURE");
    platform.arch = normalize_arch(arch != nullptr ? arch : "amd64");
#else
    struct utsname system_info {};
    if (uname(&system_info) == 0) {
        std::string sysname = system_info.sysname;
        std::transform(sysname.begin(), sysname.end(), sysname.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        platform.os = sysname;
        platform.arch = normalize_arch(system_info.machine);
    } else {
#ifdef __APPLE__
        platform.os = "darwin";
#else
        platform.os = "linux";
#endif
        platform.arch = "amd64";
    }
#endif
    return platform;
}

std::vector<std::string> Platform::arch_aliases() const {
    if (arch == "amd64") {
        return {"amd64", "x86_64"};
    }
    if (arch == "arm64") {
        return {"arm64", "aarch64"};
    }
    return {arch};
}

#ifndef _WIN32
bool PosixProcessChecker::is_running(long long pid) const {
    if (pid <= 0) {
        return false;
    }
    if (::kill(static_cast<pid_t>(pid), 0) == 0) {
        return true;
    }
    return errno == EPERM;
}
#else
bool WindowsProcessChecker::is_running(long long pid) const {
    if (pid <= 0) {
        return false;
    }
    HANDLE process =
        OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, static_cast<DWORD>(pid));
    if (process == nullptr) {
        return GetLastError() == ERROR_ACCESS_DENIED;
    }
    DWORD exit_code = 0;
    bool running = GetExitCodeProcess(process, &exit_code) && exit_code == STILL_ACTIVE;
    CloseHandle(process);
    return running;
}
#endif

bool PermissionBitsExecutabilityChecker::is_executable(const std::filesystem::path& path) const {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::is_regular_file(status)) {
        return false;
    }
    using std::filesystem::perms;
    return (status.permissions() & (perms::owner_exec | perms::group_exec | perms::others_exec)) !=
           perms::none;
}

bool ExtensionExecutabilityChecker::is_executable(const std::filesystem::path& path) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
    std::string extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension == ".exe";
}

std::shared_ptr<ProcessChecker> default_process_checker() {
#ifdef _WIN32
    return std::make_shared<WindowsProcessChecker>();
#else
    return std::make_shared<PosixProcessChecker>();
#endif
}

std::shared_ptr<ExecutabilityChecker> default_executability_checker() {
#ifdef _WIN32
    return std::make_shared<ExtensionExecutabilityChecker>();
#else
    return std::make_shared<PermissionBitsExecutabilityChecker>();
#endif
}

}  // namespace plugdock
