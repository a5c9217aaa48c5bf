/*
  archive.h

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
#include <string>

#include "registry/platform.h"
#include "utils/cancellation.h"
#include "utils/plugdock_filesystem.h"

namespace plugdock {

using plugdock_filesystem::Result;

// Largest single entry (uncompressed) that extraction will write.
constexpr std::uint64_t kMaxArchiveEntrySize = 500ULL * 1024 * 1024;

enum class ArchiveFormat : std::uint8_t { TAR_GZ, ZIP, UNKNOWN };

// Chosen by file extension: .tar.gz, .tgz or .zip (case-insensitive).
ArchiveFormat detect_archive_format(const std::filesystem::path& archive_path);

// Joins entry_name below dest_dir. Absolute entry names are treated as
// relative; any name that resolves outside dest_dir is a PATH_TRAVERSAL error.
Result<std::filesystem::path> sanitize_path(const std::filesystem::path& dest_dir,
                                            const std::string& entry_name);

// Unpacks archive_path into dest_dir. Any file entry larger than
// max_entry_size, declared or actually inflated, is ENTRY_TOO_LARGE. On error
// dest_dir may hold a partial tree and must be discarded by the caller.
Result<void> extract_archive(const std::filesystem::path& archive_path,
                             const std::filesystem::path& dest_dir,
                             const CancellationToken& cancel = CancellationToken(),
                             std::uint64_t max_entry_size = kMaxArchiveEntrySize);

Result<void> validate_binary(const std::filesystem::path& path,
                             const ExecutabilityChecker& checker);
Result<void> validate_binary(const std::filesystem::path& path);

}  // namespace plugdock
