/*
  registry.cpp

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

#include "registry/registry.h"

#include <algorithm>
#include <system_error>

#include "registry/specifier.h"
#include "registry/version.h"
#include "utils/debug.h"

namespace plugdock {

namespace fs = std::filesystem;

namespace {

#ifdef _WIN32
constexpr const char* kExecutableSuffix = ".exe";
#else
constexpr const char* kExecutableSuffix = "";
#endif

// sorted names of the entries in dir that satisfy keep; hidden entries are
// never returned (staging trees live there)
std::vector<std::string> sorted_entries(const fs::path& dir,
                                        const std::function<bool(const fs::directory_entry&)>& keep) {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        plugdock_debug_msg("cannot read %s: %s", dir.string().c_str(), ec.message().c_str());
        return names;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        std::string name = it->path().filename().string();
        if (name.empty() || name[0] == '.') {
            continue;
        }
        if (keep(*it)) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool is_directory_entry(const fs::directory_entry& entry) {
    std::error_code ec;
    return entry.is_directory(ec);
}

}  // namespace

std::vector<BinaryMatcher> default_binary_matchers(bool legacy_names) {
    std::vector<BinaryMatcher> matchers;
    matchers.push_back({"exact", [](const std::string& name, const PluginMetadata&) {
                            return std::optional<std::string>(name);
                        }});
    matchers.push_back({"prefixed-region",
                        [](const std::string& name,
                           const PluginMetadata& metadata) -> std::optional<std::string> {
                            auto region = metadata.find("region");
                            if (region == metadata.end() || region->second.empty()) {
                                return std::nullopt;
                            }
                            return std::string(kPluginRepoPrefix) + name + "-" + region->second;
                        }});
    matchers.push_back({"prefixed", [](const std::string& name, const PluginMetadata&) {
                            return std::optional<std::string>(kPluginRepoPrefix + name);
                        }});
    if (legacy_names) {
        matchers.push_back({"legacy", [](const std::string& name, const PluginMetadata&) {
                                return std::optional<std::string>(kLegacyPluginPrefix + name);
                            }});
    }
    return matchers;
}

PluginRegistry::PluginRegistry(std::vector<fs::path> roots, bool legacy_names,
                               std::shared_ptr<ExecutabilityChecker> checker)
    : roots_(std::move(roots)),
      checker_(std::move(checker)),
      matchers_(default_binary_matchers(legacy_names)) {
    if (!checker_) {
        checker_ = default_executability_checker();
    }
}

bool PluginRegistry::is_candidate(const fs::path& path) const {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }
    return checker_->is_executable(path);
}

std::optional<fs::path> PluginRegistry::find_plugin_binary(const fs::path& dir,
                                                           const std::string& name,
                                                           const PluginMetadata& metadata) const {
    for (const auto& matcher : matchers_) {
        auto file_name = matcher.candidate(name, metadata);
        if (!file_name || file_name->empty()) {
            continue;
        }
        fs::path candidate = dir / (*file_name + kExecutableSuffix);
        if (is_candidate(candidate)) {
            plugdock_debug_msg("binary for %s found by %s matcher: %s", name.c_str(),
                               matcher.label.c_str(), candidate.string().c_str());
            return candidate;
        }
    }

    auto files = sorted_entries(dir, [](const fs::directory_entry& entry) {
        return !is_directory_entry(entry);
    });
    for (const auto& file : files) {
        if (file == kPluginMetadataFile) {
            continue;
        }
        fs::path candidate = dir / file;
        if (is_candidate(candidate)) {
            plugdock_debug_msg("binary for %s found by fallback: %s", name.c_str(),
                               candidate.string().c_str());
            return candidate;
        }
    }
    return std::nullopt;
}

Result<std::vector<InstalledPlugin>> PluginRegistry::list_plugins() const {
    PerformanceTracker tracker("list_plugins");
    std::vector<InstalledPlugin> plugins;

    for (const auto& root : roots_) {
        std::error_code ec;
        if (!fs::exists(root, ec)) {
            continue;
        }
        if (!fs::is_directory(root, ec)) {
            return Result<std::vector<InstalledPlugin>>::error(
                ErrorType::FILE_ERROR, "plugin root is not a directory: " + root.string());
        }

        for (const auto& name : sorted_entries(root, is_directory_entry)) {
            fs::path plugin_dir = root / name;
            for (const auto& version : sorted_entries(plugin_dir, is_directory_entry)) {
                fs::path version_dir = plugin_dir / version;

                PluginMetadata metadata;
                bool has_metadata_file = false;
                auto read = read_plugin_metadata(version_dir);
                if (read.is_ok()) {
                    metadata = read.value();
                    has_metadata_file = true;
                } else if (read.error_type() != ErrorType::METADATA_NOT_FOUND) {
                    plugdock_debug_msg("ignoring metadata in %s: %s", version_dir.string().c_str(),
                                       read.error().c_str());
                }

                auto binary = find_plugin_binary(version_dir, name, metadata);
                if (!binary) {
                    plugdock_debug_msg("no binary in %s, skipping", version_dir.string().c_str());
                    continue;
                }

                if (!has_metadata_file) {
                    auto region = parse_region_from_binary_name(*binary);
                    if (region) {
                        metadata["region"] = *region;
                    }
                }

                InstalledPlugin plugin;
                plugin.name = name;
                plugin.version = version;
                plugin.path = *binary;
                plugin.metadata = metadata;
                plugins.push_back(plugin);
            }
        }
    }
    return Result<std::vector<InstalledPlugin>>::ok(plugins);
}

Result<PluginScan> PluginRegistry::list_latest_plugins() const {
    auto all = list_plugins();
    if (all.is_error()) {
        return plugdock_filesystem::propagate<PluginScan>(all);
    }

    PluginScan scan;
    std::map<std::string, std::pair<InstalledPlugin, Version>> latest;

    for (const auto& plugin : all.value()) {
        auto version = parse_version(plugin.version);
        if (version.is_error()) {
            scan.warnings.push_back("Plugin " + plugin.name + " version " + plugin.version +
                                    " has invalid semver format: " + version.error());
            continue;
        }

        auto existing = latest.find(plugin.name);
        if (existing == latest.end()) {
            latest.emplace(plugin.name, std::make_pair(plugin, version.value()));
            continue;
        }
        if (compare(version.value(), existing->second.second) > 0) {
            existing->second = std::make_pair(plugin, version.value());
        }
    }

    for (const auto& entry : latest) {
        scan.plugins.push_back(entry.second.first);
    }
    return Result<PluginScan>::ok(scan);
}

Result<std::vector<AvailablePlugin>> PluginRegistry::list_available_plugins(
    const PluginCatalog& catalog) const {
    auto scan = list_latest_plugins();
    if (scan.is_error()) {
        return plugdock_filesystem::propagate<std::vector<AvailablePlugin>>(scan);
    }

    std::map<std::string, std::string> installed;
    for (const auto& plugin : scan.value().plugins) {
        installed[plugin.name] = plugin.version;
    }

    std::vector<AvailablePlugin> available;
    for (const auto& entry : catalog.entries()) {
        AvailablePlugin plugin;
        plugin.entry = entry;
        auto it = installed.find(entry.name);
        if (it != installed.end()) {
            plugin.installed_version = it->second;
        }
        available.push_back(plugin);
    }
    return Result<std::vector<AvailablePlugin>>::ok(available);
}

Result<PluginLookup> PluginRegistry::get_latest_plugin(const std::string& name) const {
    auto scan = list_latest_plugins();
    if (scan.is_error()) {
        return plugdock_filesystem::propagate<PluginLookup>(scan);
    }

    PluginLookup lookup;
    lookup.warnings = scan.value().warnings;
    for (const auto& plugin : scan.value().plugins) {
        if (plugin.name == name) {
            lookup.found = true;
            lookup.plugin = plugin;
            break;
        }
    }
    return Result<PluginLookup>::ok(lookup);
}

void merge_registry_metadata(std::map<std::string, std::string>& reported,
                             const InstalledPlugin& plugin) {
    for (const auto& entry : plugin.metadata) {
        reported.emplace(entry.first, entry.second);
    }
}

}  // namespace plugdock
