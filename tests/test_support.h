/*
  test_support.h

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

#include <archive.h>
#include <archive_entry.h>
#include <stdlib.h>
#include <sys/stat.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <set>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include "registry/platform.h"
#include "utils/http_client.h"

namespace plugdock_test {

namespace fs = std::filesystem;
using json = nlohmann::json;

class TempDir {
   public:
    TempDir() {
        std::string pattern = (fs::temp_directory_path() / "plugdock_test_XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        char* created = mkdtemp(buffer.data());
        if (created != nullptr) {
            path_ = created;
        }
    }
    ~TempDir() {
        std::error_code ec;
        if (!path_.empty()) {
            fs::remove_all(path_, ec);
        }
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const {
        return path_;
    }

   private:
    fs::path path_;
};

inline void write_file(const fs::path& path, const std::string& content, unsigned mode = 0644) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    out.close();
    ::chmod(path.c_str(), mode);
}

inline std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

inline bool is_executable_file(const fs::path& path) {
    struct stat info {};
    return ::stat(path.c_str(), &info) == 0 && (info.st_mode & 0111) != 0;
}

struct ArchiveEntry {
    std::string name;
    std::string content;
    unsigned mode = 0644;
    bool directory = false;
};

namespace detail {

inline void write_archive(struct archive* writer, const fs::path& path,
                          const std::vector<ArchiveEntry>& entries) {
    if (archive_write_open_filename(writer, path.c_str()) != ARCHIVE_OK) {
        archive_write_free(writer);
        return;
    }
    for (const auto& item : entries) {
        struct archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, item.name.c_str());
        archive_entry_set_filetype(entry, item.directory ? AE_IFDIR : AE_IFREG);
        archive_entry_set_perm(entry, item.directory ? 0755 : item.mode);
        archive_entry_set_size(entry, item.directory ? 0 : static_cast<la_int64_t>(item.content.size()));
        if (archive_write_header(writer, entry) == ARCHIVE_OK && !item.directory) {
            archive_write_data(writer, item.content.data(), item.content.size());
        }
        archive_entry_free(entry);
    }
    archive_write_close(writer);
    archive_write_free(writer);
}

}  // namespace detail

inline void write_tar_gz(const fs::path& path, const std::vector<ArchiveEntry>& entries) {
    struct archive* writer = archive_write_new();
    archive_write_add_filter_gzip(writer);
    archive_write_set_format_pax_restricted(writer);
    detail::write_archive(writer, path, entries);
}

inline void write_zip(const fs::path& path, const std::vector<ArchiveEntry>& entries,
                      bool compress = true) {
    struct archive* writer = archive_write_new();
    archive_write_set_format_zip(writer);
    if (compress) {
        archive_write_zip_set_compression_deflate(writer);
    } else {
        archive_write_zip_set_compression_store(writer);
    }
    detail::write_archive(writer, path, entries);
}

// Serves canned responses by exact URL; anything unknown is a 404.
class FakeHttpClient : public plugdock::HttpClient {
   public:
    void add_json(const std::string& url, const json& body, int status = 200) {
        plugdock::HttpResponse response;
        response.status_code = status;
        response.success = status >= 200 && status < 300;
        response.body = body.dump();
        std::lock_guard<std::mutex> lock(mutex_);
        responses_[url] = response;
    }

    void add_status(const std::string& url, int status) {
        plugdock::HttpResponse response;
        response.status_code = status;
        response.success = status >= 200 && status < 300;
        std::lock_guard<std::mutex> lock(mutex_);
        responses_[url] = response;
    }

    void add_download(const std::string& url, const std::string& content) {
        std::lock_guard<std::mutex> lock(mutex_);
        downloads_[url] = content;
    }

    void add_download_file(const std::string& url, const fs::path& file) {
        add_download(url, read_file(file));
    }

    plugdock::HttpResponse get(const std::string& url,
                               const std::map<std::string, std::string>& headers,
                               int) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(url);
        last_headers_ = headers;
        auto it = responses_.find(url);
        if (it == responses_.end()) {
            plugdock::HttpResponse missing;
            missing.status_code = 404;
            missing.body = R"({"message":"Not Found"})";
            return missing;
        }
        return it->second;
    }

    plugdock::HttpResponse download(const std::string& url,
                                    const std::map<std::string, std::string>& headers,
                                    const std::string& dest_path,
                                    const plugdock::ProgressCallback& progress,
                                    const plugdock::CancellationToken& cancel) override {
        std::string content;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(url);
            last_headers_ = headers;
            auto it = downloads_.find(url);
            if (it == downloads_.end()) {
                plugdock::HttpResponse missing;
                missing.status_code = 404;
                return missing;
            }
            content = it->second;
        }

        plugdock::HttpResponse response;
        if (cancel.is_cancelled()) {
            response.cancelled = true;
            response.error_message = "cancelled";
            return response;
        }
        write_file(dest_path, content);
        if (progress) {
            progress(content.size(), content.size());
        }
        response.status_code = 200;
        response.success = true;
        return response;
    }

    std::vector<std::string> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::map<std::string, std::string> last_headers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_headers_;
    }

   private:
    mutable std::mutex mutex_;
    std::map<std::string, plugdock::HttpResponse> responses_;
    std::map<std::string, std::string> downloads_;
    std::vector<std::string> requests_;
    std::map<std::string, std::string> last_headers_;
};

class FakeProcessChecker : public plugdock::ProcessChecker {
   public:
    explicit FakeProcessChecker(std::set<long long> running = {}) : running_(std::move(running)) {
    }
    bool is_running(long long pid) const override {
        return running_.count(pid) != 0;
    }

   private:
    std::set<long long> running_;
};

constexpr const char* kApiBase = "https://api.test";

inline std::string asset_url(const std::string& tag, const std::string& name) {
    return "https://downloads.test/" + tag + "/" + name;
}

inline json release_json(const std::string& tag, const std::vector<std::string>& assets,
                         bool draft = false, bool prerelease = false) {
    json release = {{"tag_name", tag},
                    {"name", "Release " + tag},
                    {"draft", draft},
                    {"prerelease", prerelease},
                    {"assets", json::array()}};
    for (const auto& name : assets) {
        release["assets"].push_back(
            {{"name", name}, {"browser_download_url", asset_url(tag, name)}, {"size", 1024}});
    }
    return release;
}

inline std::string tag_url(const std::string& owner, const std::string& repo,
                           const std::string& tag) {
    return std::string(kApiBase) + "/repos/" + owner + "/" + repo + "/releases/tags/" + tag;
}

inline std::string list_url(const std::string& owner, const std::string& repo) {
    return std::string(kApiBase) + "/repos/" + owner + "/" + repo + "/releases?per_page=100";
}

inline plugdock::Platform linux_amd64() {
    return plugdock::Platform{"linux", "amd64"};
}

}  // namespace plugdock_test
