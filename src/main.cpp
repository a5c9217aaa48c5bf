/*
  main.cpp

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

#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>

#include "error_out.h"
#include "flags.h"
#include "plugdock.h"
#include "registry/catalog.h"
#include "registry/installer.h"
#include "registry/metadata.h"
#include "registry/registry.h"
#include "registry/release_client.h"
#include "registry/specifier.h"
#include "usage.h"
#include "utils/debug.h"
#include "utils/http_client.h"

using namespace plugdock;

namespace {

volatile std::atomic<bool> g_interrupted{false};

void handle_interrupt(int) {
    g_interrupted.store(true);
}

void install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = handle_interrupt;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

template <typename T>
int report_failure(const std::string& command, const plugdock_filesystem::Result<T>& result) {
    print_error(ErrorInfo(result.error_type(), command, result.error(),
                          default_suggestions(result.error_type())));
    return exit_code_for(result.error_type());
}

int usage_error(const std::string& command, const std::string& message) {
    print_error({ErrorType::INVALID_ARGUMENT, command, message,
                 {"Run 'plugdock --help' for usage"}});
    return 2;
}

void print_step(const std::string& message) {
    std::cerr << message << '\n';
}

ProgressCallback make_download_progress() {
    if (isatty(STDERR_FILENO) == 0) {
        return nullptr;
    }
    auto last_percent = std::make_shared<int>(-1);
    return [last_percent](std::uint64_t done, std::uint64_t total) {
        if (total == 0) {
            return;
        }
        int percent = static_cast<int>(done * 100 / total);
        if (percent == *last_percent) {
            return;
        }
        *last_percent = percent;
        std::fprintf(stderr, "\r  %3d%% (%llu/%llu bytes)", percent,
                     static_cast<unsigned long long>(done),
                     static_cast<unsigned long long>(total));
        if (done >= total) {
            std::fprintf(stderr, "\n");
        }
        std::fflush(stderr);
    };
}

CancellationToken make_cancel_token() {
    CancellationToken token;
    token.attach_external_flag(&g_interrupted);
    return token;
}

void warn_about_source(const PluginSpecifier& spec, const PluginCatalog& catalog) {
    if (spec.is_url) {
        print_warning("install", "installing from " + spec.owner + "/" + spec.repo +
                                     ", which is not in the plugin catalog. Only install "
                                     "plugins from sources you trust.");
        return;
    }
    const CatalogEntry* entry = catalog.find(spec.name);
    if (entry != nullptr && entry->security_level == "experimental") {
        print_warning("install", "plugin '" + spec.name +
                                     "' is marked experimental in the catalog and has not "
                                     "been reviewed.");
    }
}

int run_install(Installer& installer, const flags::ParseResult& args) {
    if (args.args.size() != 1) {
        return usage_error("install", "expected exactly one plugin specifier");
    }

    auto spec = parse_plugin_specifier(args.args[0]);
    if (spec.is_error()) {
        return report_failure("install", spec);
    }
    warn_about_source(spec.value(), installer.catalog());

    auto metadata = parse_metadata_pairs(args.metadata);
    if (metadata.is_error()) {
        return report_failure("install", metadata);
    }

    InstallOptions options;
    options.force = args.force;
    options.no_fallback = args.no_fallback;
    options.metadata = metadata.value();
    options.cancel = make_cancel_token();
    options.download_progress = make_download_progress();

    auto installed = installer.install(args.args[0], options, print_step);
    if (installed.is_error()) {
        return report_failure("install", installed);
    }

    const InstallResult& result = installed.value();
    std::cout << "Installed " << result.name << " " << result.version << " ("
              << result.repository << ")\n"
              << "  " << result.path.string() << '\n';
    if (result.was_fallback) {
        std::cout << "  requested " << result.requested_version << ": " << result.fallback_reason
                  << '\n';
    }

    if (args.clean) {
        auto cleaned =
            installer.remove_other_versions(result.name, result.version, "", print_step);
        if (cleaned.is_error()) {
            return report_failure("install", cleaned);
        }
        if (cleaned.value().removed_versions.empty()) {
            std::cout << "No other versions to remove\n";
        } else {
            std::cout << "Removed " << cleaned.value().removed_versions.size()
                      << " other version(s), freed " << cleaned.value().bytes_freed
                      << " bytes\n";
        }
    }
    return 0;
}

int run_update(Installer& installer, const flags::ParseResult& args) {
    if (args.args.size() != 1) {
        return usage_error("update", "expected exactly one plugin name");
    }

    UpdateOptions options;
    options.dry_run = args.dry_run;
    options.version = args.target_version;
    options.cancel = make_cancel_token();
    options.download_progress = make_download_progress();

    auto updated = installer.update(args.args[0], options, print_step);
    if (updated.is_error()) {
        return report_failure("update", updated);
    }

    const UpdateResult& result = updated.value();
    if (result.was_up_to_date) {
        std::cout << result.name << " " << result.old_version << " is already up to date\n";
    } else if (result.dry_run) {
        std::cout << result.name << " " << result.old_version << " -> " << result.new_version
                  << " (dry run)\n";
    } else {
        std::cout << "Updated " << result.name << " " << result.old_version << " -> "
                  << result.new_version << '\n';
    }
    return 0;
}

int run_remove(Installer& installer, const flags::ParseResult& args) {
    if (args.args.size() != 1) {
        return usage_error("remove", "expected exactly one plugin name");
    }

    RemoveOptions options;
    options.keep_config = args.keep_config;
    auto removed = installer.remove(args.args[0], options, print_step);
    if (removed.is_error()) {
        return report_failure("remove", removed);
    }
    return 0;
}

void print_plugin(const InstalledPlugin& plugin) {
    std::cout << plugin.name << "\t" << plugin.version << "\t" << plugin.path.string();
    if (!plugin.region().empty()) {
        std::cout << "\tregion=" << plugin.region();
    }
    std::cout << '\n';
}

int run_list_available(const PluginRegistry& registry) {
    auto catalog = PluginCatalog::load(config::catalog_path);
    if (catalog.is_error()) {
        return report_failure("list", catalog);
    }
    auto available = registry.list_available_plugins(catalog.value());
    if (available.is_error()) {
        return report_failure("list", available);
    }
    if (available.value().empty()) {
        std::cout << "No plugins available in " << config::catalog_path << '\n';
        return 0;
    }
    for (const auto& plugin : available.value()) {
        const CatalogEntry& entry = plugin.entry;
        std::cout << entry.name << "\t" << entry.repository << "\t" << entry.security_level << "\t"
                  << (plugin.installed() ? plugin.installed_version : "-");
        if (!entry.description.empty()) {
            std::cout << "\t" << entry.description;
        }
        std::cout << '\n';
    }
    return 0;
}

int run_list(const flags::ParseResult& args) {
    PluginRegistry registry({config::plugin_dir}, config::legacy_plugin_names);

    if (args.available) {
        return run_list_available(registry);
    }

    if (args.all_versions) {
        auto plugins = registry.list_plugins();
        if (plugins.is_error()) {
            return report_failure("list", plugins);
        }
        for (const auto& plugin : plugins.value()) {
            print_plugin(plugin);
        }
        return 0;
    }

    auto scan = registry.list_latest_plugins();
    if (scan.is_error()) {
        return report_failure("list", scan);
    }
    for (const auto& warning : scan.value().warnings) {
        print_warning("list", warning);
    }
    if (scan.value().plugins.empty()) {
        std::cout << "No plugins installed in " << config::plugin_dir << '\n';
        return 0;
    }
    for (const auto& plugin : scan.value().plugins) {
        print_plugin(plugin);
    }
    return 0;
}

int run_prune(Installer& installer, const flags::ParseResult& args) {
    if (args.args.size() != 2) {
        return usage_error("prune", "expected a plugin name and the version to keep");
    }

    auto cleaned = installer.remove_other_versions(args.args[0], args.args[1], "", print_step);
    if (cleaned.is_error()) {
        return report_failure("prune", cleaned);
    }
    std::cout << "Removed " << cleaned.value().removed_versions.size() << " version(s), freed "
              << cleaned.value().bytes_freed << " bytes\n";
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    config::load_from_environment();

    flags::ParseResult args = flags::parse_arguments(argc, argv);
    if (args.should_exit) {
        return args.exit_code;
    }
    if (config::show_version) {
        print_version();
        return 0;
    }
    if (config::show_help || args.command.empty()) {
        print_usage();
        return config::show_help ? 0 : 2;
    }

    plugdock_debug_msg("plugdock %s command=%s", get_version().c_str(), args.command.c_str());

    if (args.command == "list") {
        return run_list(args);
    }

    install_signal_handlers();

    ReleaseClientOptions client_options;
    client_options.api_base = config::release_api;
    client_options.token = config::github_token;
    client_options.user_agent = user_agent();
    client_options.timeout_seconds = config::http_timeout_seconds;
    auto client =
        std::make_shared<ReleaseClient>(std::make_shared<CurlHttpClient>(), client_options);

    auto catalog = PluginCatalog::load(config::catalog_path);
    if (catalog.is_error()) {
        return report_failure(args.command, catalog);
    }

    Installer installer(config::plugin_dir, client, catalog.value());
    installer.set_legacy_plugin_names(config::legacy_plugin_names);

    if (args.command == "install") {
        return run_install(installer, args);
    }
    if (args.command == "update") {
        return run_update(installer, args);
    }
    if (args.command == "remove") {
        return run_remove(installer, args);
    }
    if (args.command == "prune") {
        return run_prune(installer, args);
    }
    return usage_error(args.command, "unknown command");
}
