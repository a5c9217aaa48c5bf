/*
  archive.cpp

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

#include "registry/archive.h"

#include <archive.h>
#include <archive_entry.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <vector>

#include "utils/debug.h"

namespace plugdock {

namespace {

namespace fs = std::filesystem;
using plugdock_filesystem::FileOperations;

constexpr size_t kChunkSize = 64 * 1024;
constexpr size_t kReadBlockSize = 10240;

// dest_dir in the form sanitize_path compares against
fs::path normalized_root(const fs::path& dest_dir) {
    fs::path base = dest_dir.lexically_normal();
    if (!base.has_filename() && base.has_relative_path()) {
        base = base.parent_path();
    }
    return base;
}

mode_t entry_file_mode(mode_t mode) {
    return (mode & 0111) != 0 ? 0755 : 0644;
}

Result<void> cancelled(const std::string& where) {
    return Result<void>::error(ErrorType::CANCELLED, "extraction cancelled while writing " + where);
}

Result<void> too_large(const std::string& name, std::uint64_t size, std::uint64_t limit) {
    return Result<void>::error(ErrorType::ENTRY_TOO_LARGE,
                               "archive entry '" + name + "' is " + std::to_string(size) +
                                   " bytes, limit is " + std::to_string(limit));
}

// Destination file of a single archive entry. Removed again unless finished.
class EntryFile {
   public:
    ~EntryFile() {
        if (fd_ >= 0) {
            FileOperations::safe_close(fd_);
            ::unlink(path_.c_str());
        }
    }

    Result<void> open(const fs::path& path) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Result<void>::error(ErrorType::FILE_ERROR, "failed to create directory '" +
                                                                  path.parent_path().string() +
                                                                  "': " + ec.message());
        }
        auto opened = FileOperations::safe_open(path.string(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
        if (opened.is_error()) {
            return Result<void>::error(opened.error_type(), opened.error());
        }
        fd_ = opened.value();
        path_ = path.string();
        return Result<void>::ok();
    }

    Result<void> write(const void* data, size_t size) {
        return FileOperations::write_all(fd_, static_cast<const char*>(data), size);
    }

    Result<void> finish(mode_t mode) {
        int fd = fd_;
        fd_ = -1;
        if (::fchmod(fd, mode) != 0) {
            std::string message = "failed to set mode on '" + path_ + "': " + strerror(errno);
            FileOperations::safe_close(fd);
            ::unlink(path_.c_str());
            return Result<void>::error(ErrorType::FILE_ERROR, message);
        }
        if (::close(fd) != 0) {
            return Result<void>::error(ErrorType::FILE_ERROR,
                                       "failed to close '" + path_ + "': " + strerror(errno));
        }
        return Result<void>::ok();
    }

   private:
    int fd_ = -1;
    std::string path_;
};

Result<void> make_directory(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        return Result<void>::error(ErrorType::FILE_ERROR,
                                   "failed to create directory '" + path.string() +
                                       "': " + ec.message());
    }
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                              fs::perms::others_read | fs::perms::others_exec,
                    ec);
    return Result<void>::ok();
}

// Owns a libarchive read handle set up for one of the supported formats.
class ArchiveReader {
   public:
    explicit ArchiveReader(ArchiveFormat format) : handle_(archive_read_new()) {
        if (handle_ == nullptr) {
            return;
        }
        if (format == ArchiveFormat::TAR_GZ) {
            archive_read_support_filter_gzip(handle_);
            archive_read_support_format_tar(handle_);
            archive_read_support_format_gnutar(handle_);
        } else {
            archive_read_support_format_zip(handle_);
        }
    }

    ~ArchiveReader() {
        if (handle_ != nullptr) {
            archive_read_free(handle_);
        }
    }

    ArchiveReader(const ArchiveReader&) = delete;
    ArchiveReader& operator=(const ArchiveReader&) = delete;

    struct archive* get() const {
        return handle_;
    }

    std::string error_string() const {
        const char* message = handle_ != nullptr ? archive_error_string(handle_) : nullptr;
        return message != nullptr ? message : "unknown archive error";
    }

   private:
    struct archive* handle_;
};

Result<void> read_error(const ArchiveReader& reader, const fs::path& archive_path) {
    return Result<void>::error(ErrorType::UNSUPPORTED_ARCHIVE,
                               "failed to read '" + archive_path.filename().string() +
                                   "': " + reader.error_string());
}

Result<void> extract_file_entry(const ArchiveReader& reader, const std::string& name,
                                const fs::path& target, mode_t mode,
                                std::uint64_t max_entry_size, const CancellationToken& cancel) {
    EntryFile out;
    auto opened = out.open(target);
    if (opened.is_error()) {
        return opened;
    }

    // the declared size is only a hint for zip, so the running total is checked too
    std::vector<char> buffer(kChunkSize);
    std::uint64_t written_total = 0;
    while (true) {
        if (cancel.is_cancelled()) {
            return cancelled(name);
        }
        la_ssize_t chunk = archive_read_data(reader.get(), buffer.data(), buffer.size());
        if (chunk < 0) {
            return Result<void>::error(ErrorType::UNSUPPORTED_ARCHIVE,
                                       "failed to read entry '" + name +
                                           "': " + reader.error_string());
        }
        if (chunk == 0) {
            break;
        }
        written_total += static_cast<std::uint64_t>(chunk);
        if (written_total > max_entry_size) {
            return too_large(name, written_total, max_entry_size);
        }
        auto written = out.write(buffer.data(), static_cast<size_t>(chunk));
        if (written.is_error()) {
            return written;
        }
    }

    return out.finish(entry_file_mode(mode));
}

Result<void> extract_entries(ArchiveFormat format, const fs::path& archive_path,
                             const fs::path& dest_dir, std::uint64_t max_entry_size,
                             const CancellationToken& cancel) {
    ArchiveReader reader(format);
    if (reader.get() == nullptr) {
        return Result<void>::error(ErrorType::RUNTIME_ERROR, "failed to allocate archive reader");
    }
    if (archive_read_open_filename(reader.get(), archive_path.c_str(), kReadBlockSize) !=
        ARCHIVE_OK) {
        return Result<void>::error(ErrorType::FILE_ERROR,
                                   "failed to open archive '" + archive_path.string() +
                                       "': " + reader.error_string());
    }

    fs::path root = normalized_root(dest_dir);
    struct archive_entry* entry = nullptr;
    while (true) {
        if (cancel.is_cancelled()) {
            return cancelled(archive_path.filename().string());
        }

        int status = archive_read_next_header(reader.get(), &entry);
        if (status == ARCHIVE_EOF) {
            break;
        }
        if (status == ARCHIVE_WARN) {
            plugdock_debug_msg("archive warning in %s: %s", archive_path.c_str(),
                               reader.error_string().c_str());
        } else if (status != ARCHIVE_OK) {
            return read_error(reader, archive_path);
        }

        const char* raw_name = archive_entry_pathname(entry);
        if (raw_name == nullptr) {
            return Result<void>::error(ErrorType::UNSUPPORTED_ARCHIVE,
                                       "archive entry without a name in '" +
                                           archive_path.filename().string() + "'");
        }
        std::string name = raw_name;

        mode_t type = archive_entry_filetype(entry);
        if (type == AE_IFLNK || archive_entry_hardlink(entry) != nullptr) {
            return Result<void>::error(ErrorType::UNSUPPORTED_ARCHIVE,
                                       "links are not permitted in plugin archives: " + name);
        }
        bool is_directory = type == AE_IFDIR || (!name.empty() && name.back() == '/');
        if (!is_directory && type != AE_IFREG) {
            return Result<void>::error(ErrorType::UNSUPPORTED_ARCHIVE,
                                       "unsupported archive entry type for " + name);
        }

        auto target = sanitize_path(dest_dir, name);
        if (target.is_error()) {
            return Result<void>::error(target.error_type(), target.error());
        }

        if (is_directory || target.value() == root) {
            if (is_directory) {
                auto created = make_directory(target.value());
                if (created.is_error()) {
                    return created;
                }
            }
            if (archive_read_data_skip(reader.get()) != ARCHIVE_OK) {
                return read_error(reader, archive_path);
            }
            continue;
        }

        if (archive_entry_size_is_set(entry) != 0) {
            auto declared = static_cast<std::uint64_t>(archive_entry_size(entry));
            if (declared > max_entry_size) {
                return too_large(name, declared, max_entry_size);
            }
        }

        auto extracted = extract_file_entry(reader, name, target.value(),
                                            archive_entry_perm(entry), max_entry_size, cancel);
        if (extracted.is_error()) {
            return extracted;
        }
    }

    return Result<void>::ok();
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

ArchiveFormat detect_archive_format(const fs::path& archive_path) {
    std::string name = lowercase(archive_path.filename().string());
    if (ends_with(name, ".tar.gz") || ends_with(name, ".tgz")) {
        return ArchiveFormat::TAR_GZ;
    }
    if (ends_with(name, ".zip")) {
        return ArchiveFormat::ZIP;
    }
    return ArchiveFormat::UNKNOWN;
}

Result<fs::path> sanitize_path(const fs::path& dest_dir, const std::string& entry_name) {
    std::string name = entry_name;
    std::replace(name.begin(), name.end(), '\\', '/');

    // neutralise absolute names, including drive-letter forms, by making them relative
    if (name.size() >= 2 && std::isalpha(static_cast<unsigned char>(name[0])) && name[1] == ':') {
        name.erase(0, 2);
    }
    size_t first = name.find_first_not_of('/');
    name = first == std::string::npos ? std::string() : name.substr(first);

    fs::path base = normalized_root(dest_dir);
    fs::path joined = (base / fs::path(name)).lexically_normal();
    if (!joined.has_filename() && joined.has_relative_path()) {
        joined = joined.parent_path();
    }

    fs::path relative = joined.lexically_relative(base);
    if (relative.empty() || *relative.begin() == "..") {
        return Result<fs::path>::error(ErrorType::PATH_TRAVERSAL,
                                       "illegal file path in archive: " + entry_name);
    }
    return Result<fs::path>::ok(joined);
}

Result<void> extract_archive(const fs::path& archive_path, const fs::path& dest_dir,
                             const CancellationToken& cancel, std::uint64_t max_entry_size) {
    ArchiveFormat format = detect_archive_format(archive_path);
    if (format == ArchiveFormat::UNKNOWN) {
        return Result<void>::error(ErrorType::UNSUPPORTED_ARCHIVE,
                                   "unsupported archive format: " +
                                       archive_path.filename().string());
    }

    auto created = make_directory(dest_dir);
    if (created.is_error()) {
        return created;
    }

    PerformanceTracker tracker("extract_archive");
    plugdock_debug_msg("extracting %s into %s", archive_path.c_str(), dest_dir.c_str());

    return extract_entries(format, archive_path, dest_dir, max_entry_size, cancel);
}

Result<void> validate_binary(const fs::path& path, const ExecutabilityChecker& checker) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return Result<void>::error(ErrorType::INVALID_BINARY,
                                   "binary does not exist: " + path.string());
    }
    if (fs::is_directory(status)) {
        return Result<void>::error(ErrorType::INVALID_BINARY,
                                   "binary path is a directory: " + path.string());
    }
    if (!checker.is_executable(path)) {
        return Result<void>::error(ErrorType::INVALID_BINARY,
                                   "binary is not executable: " + path.string());
    }
    return Result<void>::ok();
}

Result<void> validate_binary(const fs::path& path) {
    return validate_binary(path, *default_executability_checker());
}

}  // namespace plugdock
