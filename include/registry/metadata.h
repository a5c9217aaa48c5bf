/*
  metadata.h

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
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "utils/plugdock_filesystem.h"

namespace plugdock {

using plugdock_filesystem::Result;

constexpr const char* kPluginMetadataFile = "plugin.metadata.json";

using PluginMetadata = std::map<std::string, std::string>;

// Writes <dir>/plugin.metadata.json: mode 0600, two-space indent, trailing newline.
Result<void> write_plugin_metadata(const std::filesystem::path& dir,
                                   const PluginMetadata& metadata);

// METADATA_NOT_FOUND when the file is absent, METADATA_PARSE_ERROR when it is
// not a JSON object of strings.
Result<PluginMetadata> read_plugin_metadata(const std::filesystem::path& dir);

// Cloud region suffix of a binary name, e.g. "us-east-1" in
// "plugdock-plugin-aws-us-east-1".
std::optional<std::string> parse_region_from_binary_name(const std::filesystem::path& binary);

// Parses key=value pairs given on the command line.
Result<PluginMetadata> parse_metadata_pairs(const std::vector<std::string>& pairs);

}  // namespace plugdock
