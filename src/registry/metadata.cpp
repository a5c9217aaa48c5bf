/*
  metadata.cpp

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

#include "registry/metadata.h"

#include <nlohmann/json.hpp>
#include <regex>
#include <system_error>

using json = nlohmann::json;

namespace plugdock {

namespace fs = std::filesystem;
using plugdock_filesystem::FileOperations;

Result<void> write_plugin_metadata(const fs::path& dir, const PluginMetadata& metadata) {
    json document = json::object();
    for (const auto& entry : metadata) {
        document[entry.first] = entry.second;
    }

    auto path = dir / kPluginMetadataFile;
    auto written = FileOperations::write_file_content(path.string(), document.dump(2) + "\n", 0600);
    if (written.is_error()) {
        return Result<void>::error(written.error_type(),
                                   "writing metadata file: " + written.error());
    }
    return Result<void>::ok();
}

Result<PluginMetadata> read_plugin_metadata(const fs::path& dir) {
    auto path = dir / kPluginMetadataFile;
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<PluginMetadata>::error(ErrorType::METADATA_NOT_FOUND,
                                             "metadata file not found: " + path.string());
    }

    auto content = FileOperations::read_file_content(path.string());
    if (content.is_error()) {
        return Result<PluginMetadata>::error(content.error_type(),
                                             "reading metadata file: " + content.error());
    }

    PluginMetadata metadata;
    try {
        auto document = json::parse(content.value());
        if (!document.is_object()) {
            return Result<PluginMetadata>::error(ErrorType::METADATA_PARSE_ERROR,
                                                 "parsing metadata file " + path.string() +
                                                     ": expected a JSON object");
        }
        for (auto it = document.begin(); it != document.end(); ++it) {
            if (!it.value().is_string()) {
                return Result<PluginMetadata>::error(
                    ErrorType::METADATA_PARSE_ERROR,
                    "parsing metadata file " + path.string() + ": value of '" + it.key() +
                        "' is not a string");
            }
            metadata[it.key()] = it.value().get<std::string>();
        }
    } catch (const json::exception& e) {
        return Result<PluginMetadata>::error(ErrorType::METADATA_PARSE_ERROR,
                                             "parsing metadata file " + path.string() + ": " +
                                                 e.what());
    }
    return Result<PluginMetadata>::ok(metadata);
}

std::optional<std::string> parse_region_from_binary_name(const fs::path& binary) {
    static const std::regex region_pattern(R"((?:us|eu|ap|sa|ca|me|af|il|mx)-[a-z]+-\d$)");

    std::string name = binary.filename().string();
    if (name.size() > 4 && name.compare(name.size() - 4, 4, ".exe") == 0) {
        name.erase(name.size() - 4);
    }

    std::smatch match;
    if (!std::regex_search(name, match, region_pattern)) {
        return std::nullopt;
    }
    return match.str(0);
}

Result<PluginMetadata> parse_metadata_pairs(const std::vector<std::string>& pairs) {
    PluginMetadata metadata;
    for (const auto& pair : pairs) {
        size_t equals = pair.find('=');
        if (equals == std::string::npos || equals == 0) {
            return Result<PluginMetadata>::error(ErrorType::INVALID_ARGUMENT,
                                                 "invalid metadata '" + pair +
                                                     "', expected key=value");
        }
        metadata[pair.substr(0, equals)] = pair.substr(equals + 1);
    }
    return Result<PluginMetadata>::ok(metadata);
}

}  // namespace plugdock
