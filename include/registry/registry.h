/*
  registry.h

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
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "registry/catalog.h"
#include "registry/metadata.h"
#include "registry/platform.h"
#include "utils/plugdock_filesystem.h"

namespace plugdock {

using plugdock_filesystem::Result;

struct InstalledPlugin {
    std::string name;
    std::string version;
    std::filesystem::path path;
    PluginMetadata metadata;

    std::string region() const {
        auto it = metadata.find("region");
        return it == metadata.end() ? "" : it->second;
    }
};

struct PluginScan {
    std::vector<InstalledPlugin> plugins;
    // non-fatal problems, e.g. a version directory that is not valid semver
    std::vector<std::string> warnings;
};

struct PluginLookup {
    bool found = false;
    InstalledPlugin plugin;
    std::vector<std::string> warnings;
};

// A catalog entry and, when present, the newest installed version of it.
struct AvailablePlugin {
    CatalogEntry entry;
    std::string installed_version;

    bool installed() const {
        return !installed_version.empty();
    }
};

// One way of naming a plugin binary inside a version directory. Returns the
// candidate file name to probe, or nothing when the convention does not apply.
struct BinaryMatcher {
    std::string label;
    std::function<std::optional<std::string>(const std::string& name,
                                             const PluginMetadata& metadata)>
        candidate;
};

// Read-only view over <root>/<name>/<version>/ trees.
class PluginRegistry {
   public:
    explicit PluginRegistry(std::vector<std::filesystem::path> roots,
                            bool legacy_names = false,
                            std::shared_ptr<ExecutabilityChecker> checker = nullptr);

    // Every resolvable (name, version) in every root. Roots that do not exist
    // contribute nothing; version directories without a binary are skipped.
    Result<std::vector<InstalledPlugin>> list_plugins() const;

    // Newest valid version per name, ordered by name. When two roots carry
    // the same name and version the root listed first wins.
    Result<PluginScan> list_latest_plugins() const;

    Result<PluginLookup> get_latest_plugin(const std::string& name) const;

    // Every catalog entry ordered by name, annotated with what is installed.
    // Installed plugins the catalog does not know are not listed.
    Result<std::vector<AvailablePlugin>> list_available_plugins(const PluginCatalog& catalog) const;

    // Binary for the plugin called name inside dir, trying the matchers in
    // order and then any executable file.
    std::optional<std::filesystem::path> find_plugin_binary(const std::filesystem::path& dir,
                                                            const std::string& name,
                                                            const PluginMetadata& metadata) const;

    const std::vector<BinaryMatcher>& matchers() const {
        return matchers_;
    }

   private:
    bool is_candidate(const std::filesystem::path& path) const;

    std::vector<std::filesystem::path> roots_;
    std::shared_ptr<ExecutabilityChecker> checker_;
    std::vector<BinaryMatcher> matchers_;
};

std::vector<BinaryMatcher> default_binary_matchers(bool legacy_names);

// Copies registry metadata into what the running plugin reported about
// itself. Keys the plugin already set are left alone.
void merge_registry_metadata(std::map<std::string, std::string>& reported,
                             const InstalledPlugin& plugin);

}  // namespace plugdock
