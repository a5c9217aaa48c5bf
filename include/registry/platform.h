/*
  platform.h

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
#include <memory>
#include <string>
#include <vector>

namespace plugdock {

// Release-asset naming convention for an OS/architecture pair,
// e.g. linux/amd64 or darwin/arm64.
struct Platform {
    std::string os;
    std::string arch;

    static Platform current();

    std::string str() const {
        return os + "/" + arch;
    }

    // spellings of arch that may appear in an asset name
    std::vector<std::string> arch_aliases() const;
};

class ProcessChecker {
   public:
    virtual ~ProcessChecker() = default;
    virtual bool is_running(long long pid) const = 0;
};

class ExecutabilityChecker {
   public:
    virtual ~ExecutabilityChecker() = default;
    virtual bool is_executable(const std::filesystem::path& path) const = 0;
};

#ifndef _WIN32
// kill(pid, 0): success or EPERM means the process exists
class PosixProcessChecker : public ProcessChecker {
   public:
    bool is_running(long long pid) const override;
};
#else
class WindowsProcessChecker : public ProcessChecker {
   public:
    bool is_running(long long pid) const override;
};
#endif

// any of the owner, group or other execute bits on a regular file
class PermissionBitsExecutabilityChecker : public ExecutabilityChecker {
   public:
    bool is_executable(const std::filesystem::path& path) const override;
};

// a regular file with an .exe extension
class ExtensionExecutabilityChecker : public ExecutabilityChecker {
   public:
    bool is_executable(const std::filesystem::path& path) const override;
};

std::shared_ptr<ProcessChecker> default_process_checker();
std::shared_ptr<ExecutabilityChecker> default_executability_checker();

}  // namespace plugdock
