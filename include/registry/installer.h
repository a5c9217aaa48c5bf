/*
  installer.h

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

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "registry/catalog.h"
#include "registry/metadata.h"
#include "registry/platform.h"
#include "registry/release_client.h"
#include "registry/specifier.h"
#include "utils/cancellation.h"
#include "utils/plugdock_filesystem.h"

namespace plugdock {

using plugdock_filesystem::Result;

// Human readable progress, one line per step.
using InstallProgress = std::function<void(const std::string& message)>;

struct InstallOptions {
    // reinstall even when the version directory already holds a binary
    bool force = false;
    // require the exact tagged release to carry a platform asset
    bool no_fallback = false;
    // overrides the installer's plugin root when set
    std::string plugin_dir;
    PluginMetadata metadata;
    CancellationToken cancel;
    ProgressCallback download_progress;
};

struct InstallResult {
    std::string name;
    std::string version;
    std::filesystem::path path;
    std::string repository;
    bool from_url = false;
    bool was_fallback = false;
    std::string requested_version;
    std::string fallback_reason;
};

struct UpdateOptions {
    bool dry_run = false;
    // version or constraint to move to; empty means the newest stable release
    std::string version;
    std::string plugin_dir;
    CancellationToken cancel;
    ProgressCallback download_progress;
};

struct UpdateResult {
    std::string name;
    std::string old_version;
    std::string new_version;
    bool was_up_to_date = false;
    bool dry_run = false;
    std::filesystem::path path;
};

struct RemoveOptions {
    // leave each version's plugin.metadata.json in place
    bool keep_config = false;
    std::string plugin_dir;
};

struct CleanupResult {
    std::string name;
    std::string kept_version;
    std::vector<std::string> removed_versions;
    std::uint64_t bytes_freed = 0;
};

class Installer {
   public:
    Installer(std::filesystem::path plugin_root, std::shared_ptr<ReleaseClient> client,
              PluginCatalog catalog = PluginCatalog());

    Result<InstallResult> install(const std::string& specifier, const InstallOptions& options,
                                  const InstallProgress& progress = nullptr);

    Result<UpdateResult> update(const std::string& name, const UpdateOptions& options,
                                const InstallProgress& progress = nullptr);

    Result<void> remove(const std::string& name, const RemoveOptions& options,
                        const InstallProgress& progress = nullptr);

    // Deletes every version directory of name except keep_version. An empty
    // root means the installer's plugin root.
    Result<CleanupResult> remove_other_versions(const std::string& name,
                                                const std::string& keep_version,
                                                const std::string& root,
                                                const InstallProgress& progress = nullptr);

    static Result<std::uint64_t> dir_size(const std::filesystem::path& path);

    void set_platform(const Platform& platform) {
        platform_ = platform;
    }
    void set_legacy_plugin_names(bool enabled) {
        legacy_plugin_names_ = enabled;
    }
    void set_process_checker(std::shared_ptr<ProcessChecker> checker) {
        process_checker_ = std::move(checker);
    }
    void set_executability_checker(std::shared_ptr<ExecutabilityChecker> checker) {
        executability_checker_ = std::move(checker);
    }

    const std::filesystem::path& plugin_root() const {
        return plugin_root_;
    }
    const PluginCatalog& catalog() const {
        return catalog_;
    }

   private:
    // where a plugin comes from once the specifier has been looked up
    struct Source {
        std::string name;
        std::string owner;
        std::string repo;
        AssetNamingHints hints;
        bool from_url = false;
    };

    Result<Source> resolve_source(const PluginSpecifier& spec) const;
    Result<FallbackInfo> resolve_release(const Source& source, const std::string& version,
                                         bool allow_fallback);
    bool has_installed_binary(const std::filesystem::path& version_dir,
                              const std::string& name) const;
    Result<InstallResult> install_release(const Source& source, const FallbackInfo& found,
                                          const std::filesystem::path& root,
                                          const PluginMetadata& metadata, bool force,
                                          const CancellationToken& cancel,
                                          const ProgressCallback& download_progress,
                                          const InstallProgress& progress);
    std::filesystem::path root_for(const std::string& override_dir) const;

    std::filesystem::path plugin_root_;
    std::shared_ptr<ReleaseClient> client_;
    PluginCatalog catalog_;
    Platform platform_;
    bool legacy_plugin_names_ = false;
    std::shared_ptr<ProcessChecker> process_checker_;
    std::shared_ptr<ExecutabilityChecker> executability_checker_;
};

}  // namespace plugdock
