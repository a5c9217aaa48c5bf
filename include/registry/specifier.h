/*
  specifier.h

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

#include "utils/plugdock_filesystem.h"

namespace plugdock {

using plugdock_filesystem::Result;

constexpr const char* kPluginRepoPrefix = "plugdock-plugin-";
constexpr const char* kLegacyPluginPrefix = "costplug-plugin-";

// What the user asked to install: a catalog name or an owner/repo pair,
// optionally pinned to a version or constraint with '@'.
struct PluginSpecifier {
    std::string name;
    std::string owner;
    std::string repo;
    std::string version;
    bool is_url = false;

    bool has_version() const {
        return !version.empty();
    }
    bool has_constraint() const;
    std::string str() const;
};

// Accepts name, name@version, owner/repo[@version] and the same behind
// github.com/ or https://github.com/. Anything else is INVALID_SPECIFIER.
Result<PluginSpecifier> parse_plugin_specifier(const std::string& text);

// repo name without the plugdock-plugin- prefix
std::string plugin_name_from_repo(const std::string& repo);

bool is_valid_plugin_name(const std::string& name);

}  // namespace plugdock
