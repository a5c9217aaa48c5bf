/*
  release_client.h

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
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "registry/platform.h"
#include "registry/version.h"
#include "utils/cancellation.h"
#include "utils/http_client.h"
#include "utils/plugdock_filesystem.h"

namespace plugdock {

using plugdock_filesystem::Result;

struct ReleaseAsset {
    std::string name;
    std::string browser_download_url;
    std::uint64_t size = 0;
};

struct Release {
    std::string tag_name;
    std::string name;
    bool draft = false;
    bool prerelease = false;
    std::string published_at;
    std::vector<ReleaseAsset> assets;

    bool is_stable() const {
        return !draft && !prerelease;
    }
};

// Per-plugin overrides for asset and tag naming.
struct AssetNamingHints {
    std::string asset_prefix;
    std::string region;
    // prepended to a bare version when looking up a tag, e.g. "v" or "aws-v"
    std::string version_prefix;
};

struct FallbackInfo {
    Release release;
    ReleaseAsset asset;
    bool was_fallback = false;
    std::string requested_version;
    std::string fallback_reason;
};

struct ReleaseClientOptions {
    std::string api_base = "https://api.github.com";
    std::string token;
    std::string user_agent = "plugdock";
    int timeout_seconds = 30;
    // how many releases the fallback and constraint searches look at
    int search_limit = 100;
};

class ReleaseClient {
   public:
    ReleaseClient(std::shared_ptr<HttpClient> http, ReleaseClientOptions options);

    Result<Release> get_latest_release(const std::string& owner, const std::string& repo);
    Result<Release> get_release_by_tag(const std::string& owner, const std::string& repo,
                                       const std::string& tag);

    // Non-draft, non-prerelease releases in API order (newest first), at most
    // limit entries. A limit of zero or less means no cap.
    Result<std::vector<Release>> list_stable_releases(const std::string& owner,
                                                      const std::string& repo, int limit);

    Result<void> download_asset(const std::string& url, const std::string& dest_path,
                                const ProgressCallback& progress,
                                const CancellationToken& cancel = CancellationToken());

    // Resolves the release and asset to install. With an empty version the
    // newest stable release carrying a platform asset wins. With a version the
    // tagged release is tried first; if it exists but has no platform asset the
    // stable list is searched instead, unless allow_fallback is false.
    Result<FallbackInfo> find_release_with_asset(const std::string& owner,
                                                 const std::string& repo,
                                                 const std::string& version,
                                                 const std::string& name_prefix,
                                                 const Platform& platform,
                                                 const AssetNamingHints& hints = AssetNamingHints(),
                                                 bool allow_fallback = true);

    // Newest stable release whose tag satisfies constraint and carries a platform asset.
    Result<FallbackInfo> find_release_matching(const std::string& owner, const std::string& repo,
                                               const VersionConstraint& constraint,
                                               const std::string& name_prefix,
                                               const Platform& platform,
                                               const AssetNamingHints& hints = AssetNamingHints());

    static std::optional<ReleaseAsset> find_platform_asset(const Release& release,
                                                           const std::string& name_prefix,
                                                           const Platform& platform,
                                                           const AssetNamingHints& hints);

    // candidate tag names for a requested version, most specific first
    static std::vector<std::string> tag_candidates(const std::string& version,
                                                   const AssetNamingHints& hints);

    const ReleaseClientOptions& options() const {
        return options_;
    }

   private:
    Result<std::string> fetch(const std::string& url);
    std::map<std::string, std::string> request_headers(const std::string& url,
                                                       const std::string& accept) const;

    std::shared_ptr<HttpClient> http_;
    ReleaseClientOptions options_;
};

}  // namespace plugdock
