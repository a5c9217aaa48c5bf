/*
  release_client.cpp

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

#include "registry/release_client.h"

#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

#include "utils/debug.h"

using json = nlohmann::json;

namespace plugdock {

namespace {

constexpr int kMaxPerPage = 100;

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

std::string url_escape(const std::string& text) {
    static const char* hex = "0123456789ABCDEF";
    std::string escaped;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped += static_cast<char>(c);
        } else {
            escaped += '%';
            escaped += hex[c >> 4];
            escaped += hex[c & 0x0F];
        }
    }
    return escaped;
}

std::string string_field(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

bool bool_field(const json& object, const char* key) {
    auto it = object.find(key);
    return it != object.end() && it->is_boolean() && it->get<bool>();
}

Result<Release> parse_release(const json& object) {
    if (!object.is_object()) {
        return Result<Release>::error(ErrorType::FETCH_FAILED, "release is not a JSON object");
    }

    Release release;
    release.tag_name = string_field(object, "tag_name");
    if (release.tag_name.empty()) {
        return Result<Release>::error(ErrorType::FETCH_FAILED, "release has no tag_name");
    }
    release.name = string_field(object, "name");
    release.draft = bool_field(object, "draft");
    release.prerelease = bool_field(object, "prerelease");
    release.published_at = string_field(object, "published_at");

    auto assets = object.find("assets");
    if (assets != object.end() && assets->is_array()) {
        for (const auto& item : *assets) {
            if (!item.is_object()) {
                continue;
            }
            ReleaseAsset asset;
            asset.name = string_field(item, "name");
            asset.browser_download_url = string_field(item, "browser_download_url");
            auto size = item.find("size");
            if (size != item.end() && size->is_number_unsigned()) {
                asset.size = size->get<std::uint64_t>();
            }
            if (!asset.name.empty()) {
                release.assets.push_back(asset);
            }
        }
    }
    return Result<Release>::ok(release);
}

std::string repo_context(const std::string& owner, const std::string& repo,
                         const std::string& version) {
    std::string context = owner + "/" + repo;
    if (!version.empty()) {
        context += "@" + version;
    }
    return context;
}

std::string strip_v(const std::string& version) {
    if (version.size() > 1 && (version[0] == 'v' || version[0] == 'V') &&
        std::isdigit(static_cast<unsigned char>(version[1]))) {
        return version.substr(1);
    }
    return version;
}

}  // namespace

ReleaseClient::ReleaseClient(std::shared_ptr<HttpClient> http, ReleaseClientOptions options)
    : http_(std::move(http)), options_(std::move(options)) {
    while (!options_.api_base.empty() && options_.api_base.back() == '/') {
        options_.api_base.pop_back();
    }
}

std::map<std::string, std::string> ReleaseClient::request_headers(const std::string& url,
                                                                  const std::string& accept) const {
    std::map<std::string, std::string> headers;
    headers["Accept"] = accept;
    headers["User-Agent"] = options_.user_agent;
    // only hand the token to the API host and github itself
    if (!options_.token.empty() &&
        (starts_with(url, options_.api_base + "/") || starts_with(url, "https://github.com/"))) {
        headers["Authorization"] = "Bearer " + options_.token;
    }
    return headers;
}

Result<std::string> ReleaseClient::fetch(const std::string& url) {
    plugdock_debug_msg("GET %s", url.c_str());
    HttpResponse response =
        http_->get(url, request_headers(url, "application/vnd.github+json"), options_.timeout_seconds);

    if (response.status_code == 0) {
        return Result<std::string>::error(ErrorType::FETCH_FAILED,
                                          "request to " + url + " failed: " +
                                              response.error_message);
    }
    if (response.status_code == 404) {
        return Result<std::string>::error(ErrorType::RELEASE_NOT_FOUND, "release not found");
    }
    if (response.status_code == 403 || response.status_code == 429) {
        return Result<std::string>::error(
            ErrorType::RATE_LIMITED,
            "API rate limit exceeded or access forbidden (HTTP " +
                std::to_string(response.status_code) + ")");
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        return Result<std::string>::error(ErrorType::FETCH_FAILED,
                                          "unexpected HTTP status " +
                                              std::to_string(response.status_code) + " from " +
                                              url);
    }
    return Result<std::string>::ok(response.body);
}

Result<Release> ReleaseClient::get_latest_release(const std::string& owner,
                                                  const std::string& repo) {
    auto body = fetch(options_.api_base + "/repos/" + owner + "/" + repo + "/releases/latest");
    if (body.is_error()) {
        return plugdock_filesystem::propagate<Release>(body, repo_context(owner, repo, "latest"));
    }
    try {
        auto release = parse_release(json::parse(body.value()));
        if (release.is_error()) {
            return plugdock_filesystem::propagate<Release>(release,
                                                           repo_context(owner, repo, "latest"));
        }
        return release;
    } catch (const json::exception& e) {
        return Result<Release>::error(ErrorType::FETCH_FAILED,
                                      repo_context(owner, repo, "latest") +
                                          ": invalid release JSON: " + e.what());
    }
}

Result<Release> ReleaseClient::get_release_by_tag(const std::string& owner,
                                                  const std::string& repo,
                                                  const std::string& tag) {
    auto body = fetch(options_.api_base + "/repos/" + owner + "/" + repo + "/releases/tags/" +
                      url_escape(tag));
    if (body.is_error()) {
        return plugdock_filesystem::propagate<Release>(body, repo_context(owner, repo, tag));
    }
    try {
        auto release = parse_release(json::parse(body.value()));
        if (release.is_error()) {
            return plugdock_filesystem::propagate<Release>(release, repo_context(owner, repo, tag));
        }
        return release;
    } catch (const json::exception& e) {
        return Result<Release>::error(ErrorType::FETCH_FAILED, repo_context(owner, repo, tag) +
                                                                   ": invalid release JSON: " +
                                                                   e.what());
    }
}

Result<std::vector<Release>> ReleaseClient::list_stable_releases(const std::string& owner,
                                                                 const std::string& repo,
                                                                 int limit) {
    using Releases = std::vector<Release>;

    auto body = fetch(options_.api_base + "/repos/" + owner + "/" + repo +
                      "/releases?per_page=" + std::to_string(kMaxPerPage));
    if (body.is_error()) {
        return plugdock_filesystem::propagate<Releases>(body, repo_context(owner, repo, ""));
    }

    Releases stable;
    try {
        auto document = json::parse(body.value());
        if (!document.is_array()) {
            return Result<Releases>::error(ErrorType::FETCH_FAILED,
                                           repo_context(owner, repo, "") +
                                               ": release list is not a JSON array");
        }
        for (const auto& item : document) {
            auto release = parse_release(item);
            if (release.is_error()) {
                plugdock_debug_msg("skipping malformed release in %s/%s: %s", owner.c_str(),
                                   repo.c_str(), release.error().c_str());
                continue;
            }
            if (!release.value().is_stable()) {
                continue;
            }
            stable.push_back(release.value());
            if (limit > 0 && static_cast<int>(stable.size()) >= limit) {
                break;
            }
        }
    } catch (const json::exception& e) {
        return Result<Releases>::error(ErrorType::FETCH_FAILED, repo_context(owner, repo, "") +
                                                                    ": invalid release JSON: " +
                                                                    e.what());
    }
    return Result<Releases>::ok(stable);
}

Result<void> ReleaseClient::download_asset(const std::string& url, const std::string& dest_path,
                                           const ProgressCallback& progress,
                                           const CancellationToken& cancel) {
    plugdock_debug_msg("downloading %s -> %s", url.c_str(), dest_path.c_str());
    HttpResponse response = http_->download(url, request_headers(url, "application/octet-stream"),
                                            dest_path, progress, cancel);
    if (response.cancelled) {
        return Result<void>::error(ErrorType::CANCELLED, "download of " + url + " cancelled");
    }
    if (response.status_code == 0) {
        return Result<void>::error(ErrorType::FETCH_FAILED,
                                   "downloading " + url + ": " + response.error_message);
    }
    if (response.status_code == 404) {
        return Result<void>::error(ErrorType::RELEASE_NOT_FOUND, "asset not found: " + url);
    }
    if (response.status_code == 403 || response.status_code == 429) {
        return Result<void>::error(ErrorType::RATE_LIMITED,
                                   "download of " + url + " forbidden or rate limited (HTTP " +
                                       std::to_string(response.status_code) + ")");
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        return Result<void>::error(ErrorType::FETCH_FAILED,
                                   "downloading " + url + ": unexpected HTTP status " +
                                       std::to_string(response.status_code));
    }
    return Result<void>::ok();
}

std::optional<ReleaseAsset> ReleaseClient::find_platform_asset(const Release& release,
                                                               const std::string& name_prefix,
                                                               const Platform& platform,
                                                               const AssetNamingHints& hints) {
    std::string prefix = lowercase(hints.asset_prefix.empty() ? name_prefix : hints.asset_prefix);
    std::string os_token = "_" + lowercase(platform.os) + "_";
    std::string region = lowercase(hints.region);

    for (const auto& asset : release.assets) {
        std::string name = lowercase(asset.name);
        if (!prefix.empty() && !contains(name, prefix)) {
            continue;
        }
        if (!contains(name, os_token)) {
            continue;
        }
        auto aliases = platform.arch_aliases();
        bool arch_match = std::any_of(aliases.begin(), aliases.end(), [&](const std::string& a) {
            return contains(name, lowercase(a));
        });
        if (!arch_match) {
            continue;
        }
        if (!ends_with(name, ".tar.gz") && !ends_with(name, ".tgz") && !ends_with(name, ".zip")) {
            continue;
        }
        if (!region.empty() && !contains(name, region)) {
            continue;
        }
        return asset;
    }
    return std::nullopt;
}

std::vector<std::string> ReleaseClient::tag_candidates(const std::string& version,
                                                       const AssetNamingHints& hints) {
    std::vector<std::string> candidates;
    auto add = [&candidates](const std::string& tag) {
        if (!tag.empty() && std::find(candidates.begin(), candidates.end(), tag) == candidates.end()) {
            candidates.push_back(tag);
        }
    };

    std::string bare = strip_v(version);
    if (!hints.version_prefix.empty() && !starts_with(version, hints.version_prefix)) {
        add(hints.version_prefix + bare);
    }
    add(version);
    if (!bare.empty() && std::isdigit(static_cast<unsigned char>(bare[0]))) {
        add("v" + bare);
    }
    return candidates;
}

Result<FallbackInfo> ReleaseClient::find_release_with_asset(const std::string& owner,
                                                            const std::string& repo,
                                                            const std::string& version,
                                                            const std::string& name_prefix,
                                                            const Platform& platform,
                                                            const AssetNamingHints& hints,
                                                            bool allow_fallback) {
    PerformanceTracker tracker("find_release_with_asset");
    std::string context = repo_context(owner, repo, version);

    if (version.empty()) {
        auto releases = list_stable_releases(owner, repo, options_.search_limit);
        if (releases.is_error()) {
            return plugdock_filesystem::propagate<FallbackInfo>(releases);
        }
        for (const auto& release : releases.value()) {
            auto asset = find_platform_asset(release, name_prefix, platform, hints);
            if (asset) {
                FallbackInfo info;
                info.release = release;
                info.asset = *asset;
                return Result<FallbackInfo>::ok(info);
            }
        }
        return Result<FallbackInfo>::error(ErrorType::NO_COMPATIBLE_ASSET,
                                           context + ": no compatible asset found for " +
                                               platform.str() + " in any stable release");
    }

    std::optional<Release> tagged;
    for (const auto& tag : tag_candidates(version, hints)) {
        auto release = get_release_by_tag(owner, repo, tag);
        if (release.is_ok()) {
            tagged = release.value();
            break;
        }
        if (release.error_type() != ErrorType::RELEASE_NOT_FOUND) {
            return plugdock_filesystem::propagate<FallbackInfo>(release);
        }
    }
    if (!tagged) {
        return Result<FallbackInfo>::error(ErrorType::RELEASE_NOT_FOUND,
                                           context + ": release not found");
    }

    auto asset = find_platform_asset(*tagged, name_prefix, platform, hints);
    if (asset) {
        FallbackInfo info;
        info.release = *tagged;
        info.asset = *asset;
        info.requested_version = version;
        return Result<FallbackInfo>::ok(info);
    }

    std::string reason =
        "release " + tagged->tag_name + " has no asset for " + platform.str();
    if (!allow_fallback) {
        return Result<FallbackInfo>::error(ErrorType::NO_COMPATIBLE_ASSET,
                                           context + ": no compatible asset found for " +
                                               platform.str());
    }

    plugdock_debug_msg("%s, searching stable releases", reason.c_str());
    auto releases = list_stable_releases(owner, repo, options_.search_limit);
    if (releases.is_error()) {
        return plugdock_filesystem::propagate<FallbackInfo>(releases);
    }
    for (const auto& release : releases.value()) {
        if (release.tag_name == tagged->tag_name) {
            continue;
        }
        auto candidate = find_platform_asset(release, name_prefix, platform, hints);
        if (candidate) {
            FallbackInfo info;
            info.release = release;
            info.asset = *candidate;
            info.was_fallback = true;
            info.requested_version = version;
            info.fallback_reason = reason;
            return Result<FallbackInfo>::ok(info);
        }
    }

    return Result<FallbackInfo>::error(ErrorType::NO_COMPATIBLE_ASSET,
                                       context + ": no compatible asset found for " +
                                           platform.str() + " in any stable release");
}

Result<FallbackInfo> ReleaseClient::find_release_matching(const std::string& owner,
                                                          const std::string& repo,
                                                          const VersionConstraint& constraint,
                                                          const std::string& name_prefix,
                                                          const Platform& platform,
                                                          const AssetNamingHints& hints) {
    std::string context = repo_context(owner, repo, constraint.text());

    auto releases = list_stable_releases(owner, repo, options_.search_limit);
    if (releases.is_error()) {
        return plugdock_filesystem::propagate<FallbackInfo>(releases);
    }

    bool any_satisfied = false;
    for (const auto& release : releases.value()) {
        std::string tag = release.tag_name;
        if (!hints.version_prefix.empty() && starts_with(tag, hints.version_prefix)) {
            tag = tag.substr(hints.version_prefix.size());
        }
        auto version = parse_version(tag);
        if (version.is_error() || !constraint.check(version.value())) {
            continue;
        }
        any_satisfied = true;
        auto asset = find_platform_asset(release, name_prefix, platform, hints);
        if (asset) {
            FallbackInfo info;
            info.release = release;
            info.asset = *asset;
            info.requested_version = constraint.text();
            return Result<FallbackInfo>::ok(info);
        }
    }

    if (any_satisfied) {
        return Result<FallbackInfo>::error(ErrorType::NO_COMPATIBLE_ASSET,
                                           context + ": no compatible asset found for " +
                                               platform.str());
    }
    return Result<FallbackInfo>::error(ErrorType::RELEASE_NOT_FOUND,
                                       context + ": no stable release satisfies the constraint");
}

}  // namespace plugdock
