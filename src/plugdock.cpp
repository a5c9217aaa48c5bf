/*
  plugdock.cpp

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

#include "plugdock.h"

#include <cstdlib>
#include <string>

#include "utils/debug.h"
#include "utils/plugdock_filesystem.h"

namespace config {
std::string home_dir;
std::string plugin_dir;
std::string catalog_path;
std::string release_api = "https://api.github.com";
std::string github_token;
int http_timeout_seconds = 30;
bool legacy_plugin_names = false;
bool show_version = false;
bool show_help = false;

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return fallback;
    }
    return value;
}

}  // namespace

bool env_flag_enabled(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return false;
    }
    std::string text(value);
    return text == "1" || text == "true" || text == "TRUE" || text == "yes";
}

void load_from_environment() {
    auto default_home = plugdock_filesystem::user_home_path() / ".plugdock";
    home_dir = env_or("PLUGDOCK_HOME", default_home.string());

    plugin_dir =
        env_or("PLUGDOCK_PLUGIN_DIR", (std::filesystem::path(home_dir) / "plugins").string());
    catalog_path =
        env_or("PLUGDOCK_CATALOG", (std::filesystem::path(home_dir) / "catalog.json").string());
    release_api = env_or("PLUGDOCK_RELEASE_API", "https://api.github.com");
    while (!release_api.empty() && release_api.back() == '/') {
        release_api.pop_back();
    }
    github_token = env_or("GITHUB_TOKEN", "");
    legacy_plugin_names = env_flag_enabled("PLUGDOCK_LEGACY_PLUGIN_NAMES");

    std::string timeout_text = env_or("PLUGDOCK_HTTP_TIMEOUT", "");
    if (!timeout_text.empty()) {
        char* end = nullptr;
        long parsed = std::strtol(timeout_text.c_str(), &end, 10);
        if (end != nullptr && *end == '\0' && parsed > 0 && parsed <= 3600) {
            http_timeout_seconds = static_cast<int>(parsed);
        } else {
            plugdock_debug_msg("ignoring invalid PLUGDOCK_HTTP_TIMEOUT '%s'",
                               timeout_text.c_str());
        }
    }

    plugdock_debug_msg("config: home=%s plugins=%s api=%s legacy=%d", home_dir.c_str(),
                       plugin_dir.c_str(), release_api.c_str(), legacy_plugin_names ? 1 : 0);
}
}  // namespace config
