/*
  catalog.cpp

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

#include "registry/catalog.h"

#include <nlohmann/json.hpp>
#include <system_error>

#include "registry/specifier.h"
#include "utils/debug.h"

using json = nlohmann::json;

namespace plugdock {

namespace {

std::string string_value(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

}  // namespace

std::string CatalogEntry::owner() const {
    size_t slash = repository.find('/');
    return slash == std::string::npos ? "" : repository.substr(0, slash);
}

std::string CatalogEntry::repo() const {
    size_t slash = repository.find('/');
    return slash == std::string::npos ? repository : repository.substr(slash + 1);
}

Result<PluginCatalog> PluginCatalog::load(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        plugdock_debug_msg("no catalog at %s", path.c_str());
        return Result<PluginCatalog>::ok(PluginCatalog());
    }

    auto content = plugdock_filesystem::FileOperations::read_file_content(path);
    if (content.is_error()) {
        return plugdock_filesystem::propagate<PluginCatalog>(content, "reading catalog");
    }
    auto catalog = parse(content.value());
    if (catalog.is_error()) {
        return plugdock_filesystem::propagate<PluginCatalog>(catalog, path);
    }
    return catalog;
}

Result<PluginCatalog> PluginCatalog::parse(const std::string& content) {
    PluginCatalog catalog;
    try {
        auto document = json::parse(content);
        if (!document.is_object()) {
            return Result<PluginCatalog>::error(ErrorType::METADATA_PARSE_ERROR,
                                                "catalog must be a JSON object");
        }
        auto plugins = document.find("plugins");
        const json& table = (plugins != document.end() && plugins->is_object()) ? *plugins
                                                                                : document;

        for (auto it = table.begin(); it != table.end(); ++it) {
            const json& value = it.value();
            if (!value.is_object()) {
                return Result<PluginCatalog>::error(
                    ErrorType::METADATA_PARSE_ERROR,
                    "catalog entry '" + it.key() + "' must be a JSON object");
            }

            CatalogEntry entry;
            entry.name = it.key();
            entry.repository = string_value(value, "repository");
            entry.description = string_value(value, "description");
            std::string level = string_value(value, "security_level");
            if (!level.empty()) {
                entry.security_level = level;
            }

            auto hints = value.find("asset_hints");
            if (hints != value.end() && hints->is_object()) {
                entry.asset_hints.asset_prefix = string_value(*hints, "asset_prefix");
                entry.asset_hints.region = string_value(*hints, "default_region");
                entry.asset_hints.version_prefix = string_value(*hints, "version_prefix");
            }

            if (!is_valid_plugin_name(entry.name)) {
                return Result<PluginCatalog>::error(ErrorType::METADATA_PARSE_ERROR,
                                                    "invalid plugin name '" + entry.name +
                                                        "' in catalog");
            }
            if (entry.owner().empty() || entry.repo().empty() ||
                entry.repo().find('/') != std::string::npos) {
                return Result<PluginCatalog>::error(
                    ErrorType::METADATA_PARSE_ERROR,
                    "catalog entry '" + entry.name + "' needs repository in owner/repo form");
            }
            catalog.add(entry);
        }
    } catch (const json::exception& e) {
        return Result<PluginCatalog>::error(ErrorType::METADATA_PARSE_ERROR,
                                            std::string("invalid catalog JSON: ") + e.what());
    }
    return Result<PluginCatalog>::ok(catalog);
}

const CatalogEntry* PluginCatalog::find(const std::string& name) const {
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : &it->second;
}

Result<CatalogEntry> PluginCatalog::get(const std::string& name) const {
    const CatalogEntry* entry = find(name);
    if (entry == nullptr) {
        return Result<CatalogEntry>::error(ErrorType::PLUGIN_NOT_FOUND,
                                           "plugin '" + name + "' not found in catalog");
    }
    return Result<CatalogEntry>::ok(*entry);
}

void PluginCatalog::add(const CatalogEntry& entry) {
    entries_[entry.name] = entry;
}

std::vector<CatalogEntry> PluginCatalog::entries() const {
    std::vector<CatalogEntry> list;
    list.reserve(entries_.size());
    for (const auto& item : entries_) {
        list.push_back(item.second);
    }
    return list;
}

}  // namespace plugdock
