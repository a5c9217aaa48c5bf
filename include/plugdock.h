/*
  plugdock.h

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

#include <string>

const bool PRE_RELEASE = false;
constexpr const char* c_version_base = "1.4.0";

inline std::string get_version() {
    static std::string cached_version =
        std::string(c_version_base) + (PRE_RELEASE ? " (pre-release)" : "");
    return cached_version;
}

#ifndef PLUGDOCK_GIT_HASH
#define PLUGDOCK_GIT_HASH "unknown"
#endif

inline std::string user_agent() {
    return std::string("plugdock/") + c_version_base;
}

namespace config {
extern std::string home_dir;
extern std::string plugin_dir;
extern std::string catalog_path;
extern std::string release_api;
extern std::string github_token;
extern int http_timeout_seconds;
extern bool legacy_plugin_names;
extern bool show_version;
extern bool show_help;

// Reads PLUGDOCK_* variables and GITHUB_TOKEN. Command line flags are applied
// afterwards and override whatever this sets.
void load_from_environment();

bool env_flag_enabled(const char* name);
}  // namespace config
