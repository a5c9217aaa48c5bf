/*
  installer.cpp

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

#include "registry/installer.h"

#include <algorithm>
#include <system_error>

#include "registry/archive.h"
#include "registry/lock.h"
#include "registry/registry.h"
#include "registry/version.h"
#include "utils/debug.h"

namespace plugdock {

namespace fs = std::filesystem;
using plugdock_filesystem::FileOperations;
using plugdock_filesystem::ScopedDirectory;

namespace {

void report(const InstallProgress& progress, const std::string& message) {
    plugdock_debug_msg("%s", message.c_str());
    if (progress) {
        progress(message);
    }
}

bool valid_version_dir_name(const std::string& version) {
    return !version.empty() && version[0] != '.' && version.find('/') == std::string::npos &&
           version.find('\\') == std::string::npos;
}

// version part of a tag, e.g. "1.2.0" for "aws-v1.2.0" with version_prefix "aws-v"
std::string tag_version(const std::string& tag, const AssetNamingHints& hints) {
    if (!hints.version_prefix.empty() &&
        tag.compare(0, hints.version_prefix.size(), hints.version_prefix) == 0 &&
        tag.size() > hints.version_prefix.size()) {
        return tag.substr(hints.version_prefix.size());
    }
    return tag;
}

// Directory a release is installed under. Always a "v"-prefixed semver when the
// tag carries one, so the registry scanner can order it.
std::string version_dir_name(const std::string& tag, const AssetNamingHints& hints) {
    std::string version = tag_version(tag, hints);
    if (!version.empty() && version[0] != 'v' && version[0] != 'V' && is_valid_version(version)) {
        return "v" + version;
    }
    return version;
}

Result<void> cancelled_error(const std::string& step) {
    return Result<void>::error(ErrorType::CANCELLED, "operation cancelled during " + step);
}

// entries directly below dir, optionally only directories
Result<std::vector<fs::path>> list_entries(const fs::path& dir, bool directories_only) {
    std::vector<fs::path> entries;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (directories_only && !it->is_directory(type_ec)) {
            continue;
        }
        entries.push_back(it->path());
    }
    if (ec) {
        return Result<std::vector<fs::path>>::error(ErrorType::FILE_ERROR,
                                                    "reading " + dir.string() + ": " + ec.message());
    }
    return Result<std::vector<fs::path>>::ok(entries);
}

}  // namespace

Installer::Installer(fs::path plugin_root, std::shared_ptr<ReleaseClient> client,
                     PluginCatalog catalog)
    : plugin_root_(std::move(plugin_root)),
      client_(std::move(client)),
      catalog_(std::move(catalog)),
      platform_(Platform::current()),
      process_checker_(default_process_checker()),
      executability_checker_(default_executability_checker()) {
}

fs::path Installer::root_for(const std::string& override_dir) const {
    return override_dir.empty() ? plugin_root_ : fs::path(override_dir);
}

Result<std::uint64_t> Installer::dir_size(const fs::path& path) {
    return plugdock_filesystem::directory_size(path);
}

Result<Installer::Source> Installer::resolve_source(const PluginSpecifier& spec) const {
    Source source;
    source.name = spec.name;
    if (spec.is_url) {
        source.owner = spec.owner;
        source.repo = spec.repo;
        source.from_url = true;
        return Result<Source>::ok(source);
    }

    auto entry = catalog_.get(spec.name);
    if (entry.is_error()) {
        return plugdock_filesystem::propagate<Source>(entry);
    }
    source.owner = entry.value().owner();
    source.repo = entry.value().repo();
    source.hints = entry.value().asset_hints;
    return Result<Source>::ok(source);
}

Result<FallbackInfo> Installer::resolve_release(const Source& source, const std::string& version,
                                                bool allow_fallback) {
    if (!version.empty() && !is_valid_version(version)) {
        auto constraint = parse_version_constraint(version);
        if (constraint.is_error()) {
            return Result<FallbackInfo>::error(ErrorType::INVALID_SPECIFIER, constraint.error());
        }
        return client_->find_release_matching(source.owner, source.repo, constraint.value(),
                                              source.name, platform_, source.hints);
    }
    return client_->find_release_with_asset(source.owner, source.repo, version, source.name,
                                            platform_, source.hints, allow_fallback);
}

bool Installer::has_installed_binary(const fs::path& version_dir, const std::string& name) const {
    std::error_code ec;
    if (!fs::is_directory(version_dir, ec)) {
        return false;
    }
    PluginRegistry registry({}, legacy_plugin_names_, executability_checker_);
    PluginMetadata metadata;
    auto read = read_plugin_metadata(version_dir);
    if (read.is_ok()) {
        metadata = read.value();
    }
    return registry.find_plugin_binary(version_dir, name, metadata).has_value();
}

Result<InstallResult> Installer::install(const std::string& specifier,
                                         const InstallOptions& options,
                                         const InstallProgress& progress) {
    auto spec = parse_plugin_specifier(specifier);
    if (spec.is_error()) {
        return plugdock_filesystem::propagate<InstallResult>(spec);
    }
    auto source = resolve_source(spec.value());
    if (source.is_error()) {
        return plugdock_filesystem::propagate<InstallResult>(source);
    }

    fs::path root = root_for(options.plugin_dir);
    LockManager locks(root, process_checker_);
    auto unlock = locks.acquire_lock(spec.value().name);
    if (unlock.is_error()) {
        return plugdock_filesystem::propagate<InstallResult>(unlock);
    }
    LockGuard guard(unlock.value());

    const std::string& version = spec.value().version;
    if (!options.force && !version.empty() && !spec.value().has_constraint()) {
        for (const auto& tag : ReleaseClient::tag_candidates(version, source.value().hints)) {
            std::string dir_name = version_dir_name(tag, source.value().hints);
            if (!valid_version_dir_name(dir_name)) {
                continue;
            }
            fs::path existing = root / spec.value().name / dir_name;
            if (has_installed_binary(existing, spec.value().name)) {
                return Result<InstallResult>::error(
                    ErrorType::ALREADY_INSTALLED, "plugin " + spec.value().name + " " + dir_name +
                                                      " is already installed at " +
                                                      existing.string());
            }
        }
    }

    report(progress, "Resolving " + spec.value().str() + " for " + platform_.str());
    auto found = resolve_release(source.value(), version, !options.no_fallback);
    if (found.is_error()) {
        return plugdock_filesystem::propagate<InstallResult>(found);
    }
    if (found.value().was_fallback) {
        report(progress, found.value().fallback_reason + ", using " +
                             found.value().release.tag_name + " instead");
    }

    return install_release(source.value(), found.value(), root, options.metadata, options.force,
                           options.cancel, options.download_progress, progress);
}

Result<InstallResult> Installer::install_release(const Source& source, const FallbackInfo& found,
                                                 const fs::path& root,
                                                 const PluginMetadata& metadata, bool force,
                                                 const CancellationToken& cancel,
                                                 const ProgressCallback& download_progress,
                                                 const InstallProgress& progress) {
    const std::string& tag = found.release.tag_name;
    std::string version = version_dir_name(tag, source.hints);
    if (!valid_version_dir_name(version)) {
        return Result<InstallResult>::error(ErrorType::INVALID_VERSION,
                                            "release tag '" + tag +
                                                "' cannot be used as a version directory");
    }

    fs::path plugin_dir = root / source.name;
    fs::path final_dir = plugin_dir / version;
    if (!force && has_installed_binary(final_dir, source.name)) {
        return Result<InstallResult>::error(ErrorType::ALREADY_INSTALLED,
                                            "plugin " + source.name + " " + version +
                                                " is already installed at " + final_dir.string());
    }

    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        return Result<InstallResult>::error(ErrorType::FILE_ERROR,
                                            "creating plugin root " + root.string() + ": " +
                                                ec.message());
    }

    auto staging_path = FileOperations::create_temp_directory(root, ".staging-" + source.name + "-");
    if (staging_path.is_error()) {
        return plugdock_filesystem::propagate<InstallResult>(staging_path, "creating staging directory");
    }
    ScopedDirectory staging{fs::path(staging_path.value())};

    if (cancel.is_cancelled()) {
        return plugdock_filesystem::propagate<InstallResult>(cancelled_error("download"));
    }

    fs::path archive_path = staging.path() / fs::path(found.asset.name).filename();
    report(progress, "Downloading " + found.asset.name);
    {
        PerformanceTracker tracker("download_asset");
        auto downloaded = client_->download_asset(found.asset.browser_download_url,
                                                  archive_path.string(), download_progress, cancel);
        if (downloaded.is_error()) {
            return plugdock_filesystem::propagate<InstallResult>(
                downloaded, source.owner + "/" + source.repo + "@" + tag);
        }
    }

    fs::path extract_dir = staging.path() / "plugin";
    report(progress, "Extracting " + found.asset.name);
    {
        PerformanceTracker tracker("extract_archive");
        auto extracted = extract_archive(archive_path, extract_dir, cancel);
        if (extracted.is_error()) {
            return plugdock_filesystem::propagate<InstallResult>(extracted);
        }
    }
    FileOperations::cleanup_temp_file(archive_path.string());

    if (cancel.is_cancelled()) {
        return plugdock_filesystem::propagate<InstallResult>(cancelled_error("extraction"));
    }

    PluginRegistry registry({}, legacy_plugin_names_, executability_checker_);
    auto binary = registry.find_plugin_binary(extract_dir, source.name, metadata);
    if (!binary) {
        return Result<InstallResult>::error(ErrorType::BINARY_NOT_FOUND,
                                            "no executable for plugin " + source.name + " in " +
                                                found.asset.name);
    }

    auto valid = validate_binary(*binary, *executability_checker_);
    if (valid.is_error()) {
        return plugdock_filesystem::propagate<InstallResult>(valid);
    }

    if (!metadata.empty()) {
        auto written = write_plugin_metadata(extract_dir, metadata);
        if (written.is_error()) {
            return plugdock_filesystem::propagate<InstallResult>(written);
        }
    }

    fs::create_directories(plugin_dir, ec);
    if (ec) {
        return Result<InstallResult>::error(ErrorType::FILE_ERROR, "creating " +
                                                                       plugin_dir.string() + ": " +
                                                                       ec.message());
    }
    if (fs::exists(final_dir, ec)) {
        fs::remove_all(final_dir, ec);
        if (ec) {
            return Result<InstallResult>::error(ErrorType::FILE_ERROR,
                                                "removing previous install " + final_dir.string() +
                                                    ": " + ec.message());
        }
    }
    fs::rename(extract_dir, final_dir, ec);
    if (ec) {
        return Result<InstallResult>::error(ErrorType::FILE_ERROR,
                                            "moving plugin into " + final_dir.string() + ": " +
                                                ec.message());
    }

    InstallResult result;
    result.name = source.name;
    result.version = version;
    result.path = final_dir / binary->filename();
    result.repository = source.owner + "/" + source.repo;
    result.from_url = source.from_url;
    result.was_fallback = found.was_fallback;
    result.requested_version = found.requested_version;
    result.fallback_reason = found.fallback_reason;

    report(progress, "Installed " + source.name + " " + version + " to " + final_dir.string());
    return Result<InstallResult>::ok(result);
}

Result<UpdateResult> Installer::update(const std::string& name, const UpdateOptions& options,
                                       const InstallProgress& progress) {
    if (!is_valid_plugin_name(name)) {
        return Result<UpdateResult>::error(ErrorType::INVALID_SPECIFIER,
                                           "invalid plugin name '" + name + "'");
    }
    if (!options.version.empty() && !is_valid_version(options.version) &&
        !looks_like_constraint(options.version)) {
        return Result<UpdateResult>::error(ErrorType::INVALID_VERSION,
                                           "'" + options.version +
                                               "' is neither a version nor a constraint");
    }

    fs::path root = root_for(options.plugin_dir);
    PluginRegistry registry({root}, legacy_plugin_names_, executability_checker_);
    auto lookup = registry.get_latest_plugin(name);
    if (lookup.is_error()) {
        return plugdock_filesystem::propagate<UpdateResult>(lookup);
    }
    for (const auto& warning : lookup.value().warnings) {
        plugdock_debug_msg("%s", warning.c_str());
    }
    if (!lookup.value().found) {
        return Result<UpdateResult>::error(ErrorType::PLUGIN_NOT_FOUND,
                                           "plugin '" + name + "' is not installed");
    }
    const InstalledPlugin& installed = lookup.value().plugin;

    PluginSpecifier spec;
    spec.name = name;
    auto source = resolve_source(spec);
    if (source.is_error()) {
        return plugdock_filesystem::propagate<UpdateResult>(source);
    }

    LockManager locks(root, process_checker_);
    auto unlock = locks.acquire_lock(name);
    if (unlock.is_error()) {
        return plugdock_filesystem::propagate<UpdateResult>(unlock);
    }
    LockGuard guard(unlock.value());

    report(progress, "Checking for updates to " + name + " " + installed.version);
    auto found = resolve_release(source.value(), options.version, true);
    if (found.is_error()) {
        return plugdock_filesystem::propagate<UpdateResult>(found);
    }

    UpdateResult result;
    result.name = name;
    result.old_version = installed.version;
    result.new_version = version_dir_name(found.value().release.tag_name, source.value().hints);
    result.dry_run = options.dry_run;
    result.path = installed.path;

    auto order = compare_versions(result.new_version, installed.version);
    if (order.is_ok()) {
        bool pinned = !options.version.empty() && is_valid_version(options.version);
        bool up_to_date = pinned ? order.value() == 0 : order.value() <= 0;
        if (up_to_date) {
            result.was_up_to_date = true;
            result.new_version = installed.version;
            report(progress, name + " " + installed.version + " is up to date");
            return Result<UpdateResult>::ok(result);
        }
    } else {
        plugdock_debug_msg("cannot compare %s with %s: %s", result.new_version.c_str(),
                           installed.version.c_str(), order.error().c_str());
    }

    if (options.dry_run) {
        report(progress, "Would update " + name + " from " + installed.version + " to " +
                             result.new_version);
        return Result<UpdateResult>::ok(result);
    }

    // carry region and other metadata over to the new version
    PluginMetadata metadata;
    auto existing = read_plugin_metadata(installed.path.parent_path());
    if (existing.is_ok()) {
        metadata = existing.value();
    } else if (existing.error_type() != ErrorType::METADATA_NOT_FOUND) {
        return plugdock_filesystem::propagate<UpdateResult>(existing);
    }

    auto installed_new = install_release(source.value(), found.value(), root, metadata, false,
                                         options.cancel, options.download_progress, progress);
    if (installed_new.is_error()) {
        return plugdock_filesystem::propagate<UpdateResult>(installed_new);
    }
    result.path = installed_new.value().path;
    return Result<UpdateResult>::ok(result);
}

Result<void> Installer::remove(const std::string& name, const RemoveOptions& options,
                               const InstallProgress& progress) {
    if (!is_valid_plugin_name(name)) {
        return Result<void>::error(ErrorType::INVALID_SPECIFIER,
                                   "invalid plugin name '" + name + "'");
    }

    fs::path root = root_for(options.plugin_dir);
    fs::path plugin_dir = root / name;
    std::error_code ec;
    if (!fs::is_directory(plugin_dir, ec)) {
        return Result<void>::error(ErrorType::PLUGIN_NOT_FOUND,
                                   "plugin '" + name + "' is not installed");
    }

    LockManager locks(root, process_checker_);
    auto unlock = locks.acquire_lock(name);
    if (unlock.is_error()) {
        return plugdock_filesystem::propagate<void>(unlock);
    }
    LockGuard guard(unlock.value());

    if (!options.keep_config) {
        fs::remove_all(plugin_dir, ec);
        if (ec) {
            return Result<void>::error(ErrorType::FILE_ERROR,
                                       "removing " + plugin_dir.string() + ": " + ec.message());
        }
        report(progress, "Removed " + name);
        return Result<void>::ok();
    }

    auto versions = list_entries(plugin_dir, true);
    if (versions.is_error()) {
        return plugdock_filesystem::propagate<void>(versions);
    }
    for (const auto& version_dir : versions.value()) {
        auto entries = list_entries(version_dir, false);
        if (entries.is_error()) {
            return plugdock_filesystem::propagate<void>(entries);
        }
        for (const auto& path : entries.value()) {
            if (path.filename() == kPluginMetadataFile) {
                continue;
            }
            fs::remove_all(path, ec);
            if (ec) {
                return Result<void>::error(ErrorType::FILE_ERROR,
                                           "removing " + path.string() + ": " + ec.message());
            }
        }
    }
    report(progress, "Removed " + name + " (configuration kept)");
    return Result<void>::ok();
}

Result<CleanupResult> Installer::remove_other_versions(const std::string& name,
                                                       const std::string& keep_version,
                                                       const std::string& root,
                                                       const InstallProgress& progress) {
    if (!is_valid_plugin_name(name)) {
        return Result<CleanupResult>::error(ErrorType::INVALID_SPECIFIER,
                                            "invalid plugin name '" + name + "'");
    }
    if (keep_version.empty()) {
        return Result<CleanupResult>::error(ErrorType::INVALID_ARGUMENT,
                                            "a version to keep is required");
    }

    fs::path root_dir = root_for(root);
    LockManager locks(root_dir, process_checker_);
    auto unlock = locks.acquire_lock(name);
    if (unlock.is_error()) {
        return plugdock_filesystem::propagate<CleanupResult>(unlock);
    }
    LockGuard guard(unlock.value());

    CleanupResult result;
    result.name = name;
    result.kept_version = keep_version;

    fs::path plugin_dir = root_dir / name;
    std::error_code ec;
    if (!fs::is_directory(plugin_dir, ec)) {
        return Result<CleanupResult>::ok(result);
    }

    auto entries = list_entries(plugin_dir, true);
    if (entries.is_error()) {
        return plugdock_filesystem::propagate<CleanupResult>(entries);
    }
    std::vector<std::string> versions;
    for (const auto& entry : entries.value()) {
        std::string version = entry.filename().string();
        if (version != keep_version) {
            versions.push_back(version);
        }
    }
    std::sort(versions.begin(), versions.end());

    for (const auto& version : versions) {
        fs::path version_dir = plugin_dir / version;
        auto size = dir_size(version_dir);
        if (size.is_error()) {
            return plugdock_filesystem::propagate<CleanupResult>(size);
        }
        fs::remove_all(version_dir, ec);
        if (ec) {
            return Result<CleanupResult>::error(ErrorType::FILE_ERROR,
                                                "removing " + version_dir.string() + ": " +
                                                    ec.message());
        }
        result.removed_versions.push_back(version);
        result.bytes_freed += size.value();
        report(progress, "Removed " + name + " " + version);
    }
    return Result<CleanupResult>::ok(result);
}

}  // namespace plugdock
