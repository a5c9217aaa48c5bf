/*
  archive_test.cpp

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

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "registry/archive.h"
#include "test_support.h"

using namespace plugdock;
using namespace plugdock_test;

namespace {

std::vector<ArchiveEntry> plugin_files() {
    return {
        {"bin/", "", 0755, true},
        {"bin/plugdock-plugin-aws", "#!/bin/sh\necho aws\n", 0755, false},
        {"README.md", "# aws plugin\n", 0644, false},
        {"config/defaults.json", std::string(3000, 'x'), 0644, false},
    };
}

}  // namespace

TEST(SanitizePath, RejectsParentTraversal) {
    TempDir dir;
    for (const std::string entry :
         {"../../../etc/passwd", "foo/../../../etc/passwd", "..", "a/b/../../..", "..\\evil"}) {
        auto result = sanitize_path(dir.path(), entry);
        ASSERT_TRUE(result.is_error()) << entry;
        EXPECT_EQ(result.error_type(), ErrorType::PATH_TRAVERSAL) << entry;
        EXPECT_NE(result.error().find("illegal file path in archive"), std::string::npos);
    }
}

TEST(SanitizePath, TreatsAbsolutePathsAsRelative) {
    TempDir dir;
    auto result = sanitize_path(dir.path(), "/etc/passwd");
    ASSERT_TRUE(result.is_ok()) << result.error();
    EXPECT_EQ(result.value(), (dir.path() / "etc" / "passwd").lexically_normal());

    auto drive = sanitize_path(dir.path(), "C:\\Windows\\evil.exe");
    ASSERT_TRUE(drive.is_ok());
    EXPECT_EQ(drive.value(), (dir.path() / "Windows" / "evil.exe").lexically_normal());
}

TEST(SanitizePath, AllowsInnerDotDot) {
    TempDir dir;
    auto result = sanitize_path(dir.path(), "bin/../lib/plugin.so");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), (dir.path() / "lib" / "plugin.so").lexically_normal());
}

TEST(DetectArchiveFormat, UsesExtension) {
    EXPECT_EQ(detect_archive_format("plugin_v1.0.0_linux_amd64.tar.gz"), ArchiveFormat::TAR_GZ);
    EXPECT_EQ(detect_archive_format("plugin.TGZ"), ArchiveFormat::TAR_GZ);
    EXPECT_EQ(detect_archive_format("plugin_windows_amd64.zip"), ArchiveFormat::ZIP);
    EXPECT_EQ(detect_archive_format("plugin.tar.bz2"), ArchiveFormat::UNKNOWN);
    EXPECT_EQ(detect_archive_format("plugin"), ArchiveFormat::UNKNOWN);
}

TEST(ExtractArchive, UnsupportedFormatFailsImmediately) {
    TempDir dir;
    write_file(dir.path() / "plugin.rar", "not really");
    auto result = extract_archive(dir.path() / "plugin.rar", dir.path() / "out");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error_type(), ErrorType::UNSUPPORTED_ARCHIVE);
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "out"));
}

TEST(ExtractArchive, TarGzRestoresFilesAndExecutableBit) {
    TempDir dir;
    auto archive = dir.path() / "plugin.tar.gz";
    write_tar_gz(archive, plugin_files());

    auto out = dir.path() / "out";
    auto result = extract_archive(archive, out);
    ASSERT_TRUE(result.is_ok()) << result.error();

    EXPECT_EQ(read_file(out / "bin" / "plugdock-plugin-aws"), "#!/bin/sh\necho aws\n");
    EXPECT_EQ(read_file(out / "README.md"), "# aws plugin\n");
    EXPECT_EQ(read_file(out / "config" / "defaults.json"), std::string(3000, 'x'));
    EXPECT_TRUE(is_executable_file(out / "bin" / "plugdock-plugin-aws"));
    EXPECT_FALSE(is_executable_file(out / "README.md"));
}

TEST(ExtractArchive, ZipRestoresFilesAndExecutableBit) {
    TempDir dir;
    auto archive = dir.path() / "plugin.zip";
    write_zip(archive, plugin_files());

    auto out = dir.path() / "out";
    auto result = extract_archive(archive, out);
    ASSERT_TRUE(result.is_ok()) << result.error();

    EXPECT_EQ(read_file(out / "bin" / "plugdock-plugin-aws"), "#!/bin/sh\necho aws\n");
    EXPECT_TRUE(is_executable_file(out / "bin" / "plugdock-plugin-aws"));
    EXPECT_FALSE(is_executable_file(out / "README.md"));
}

TEST(ExtractArchive, TarGzAndZipProduceIdenticalTrees) {
    TempDir dir;
    write_tar_gz(dir.path() / "plugin.tar.gz", plugin_files());
    write_zip(dir.path() / "plugin.zip", plugin_files());
    write_zip(dir.path() / "stored.zip", plugin_files(), false);

    ASSERT_TRUE(extract_archive(dir.path() / "plugin.tar.gz", dir.path() / "tar").is_ok());
    ASSERT_TRUE(extract_archive(dir.path() / "plugin.zip", dir.path() / "zip").is_ok());
    ASSERT_TRUE(extract_archive(dir.path() / "stored.zip", dir.path() / "stored").is_ok());

    for (const auto& entry : plugin_files()) {
        if (entry.directory) {
            continue;
        }
        std::string from_tar = read_file(dir.path() / "tar" / entry.name);
        EXPECT_EQ(from_tar, entry.content) << entry.name;
        EXPECT_EQ(read_file(dir.path() / "zip" / entry.name), from_tar) << entry.name;
        EXPECT_EQ(read_file(dir.path() / "stored" / entry.name), from_tar) << entry.name;
    }
}

TEST(ExtractArchive, RejectsTraversalInTarGz) {
    TempDir dir;
    auto archive = dir.path() / "evil.tar.gz";
    write_tar_gz(archive, {{"ok.txt", "fine", 0644, false}, {"../escape.txt", "bad", 0644, false}});

    auto out = dir.path() / "nested" / "out";
    auto result = extract_archive(archive, out);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error_type(), ErrorType::PATH_TRAVERSAL);
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "nested" / "escape.txt"));
}

TEST(ExtractArchive, RejectsTraversalInZip) {
    TempDir dir;
    auto archive = dir.path() / "evil.zip";
    write_zip(archive, {{"../../escape.txt", "bad", 0644, false}});

    auto result = extract_archive(archive, dir.path() / "out");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error_type(), ErrorType::PATH_TRAVERSAL);
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "escape.txt"));
}

TEST(ExtractArchive, AbsoluteEntryStaysInsideDestination) {
    TempDir dir;
    auto archive = dir.path() / "absolute.tar.gz";
    write_tar_gz(archive, {{"/tmp/plugdock-absolute-entry", "inside", 0644, false}});

    auto out = dir.path() / "out";
    auto result = extract_archive(archive, out);
    ASSERT_TRUE(result.is_ok()) << result.error();
    EXPECT_EQ(read_file(out / "tmp" / "plugdock-absolute-entry"), "inside");
}

TEST(ExtractArchive, RejectsOversizedTarEntry) {
    TempDir dir;
    auto archive = dir.path() / "bomb.tar.gz";
    write_tar_gz(archive, {{"small.txt", "ok", 0644, false},
                           {"huge.bin", std::string(4096, '\0'), 0644, false}});

    auto result = extract_archive(archive, dir.path() / "out", CancellationToken(), 1024);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error_type(), ErrorType::ENTRY_TOO_LARGE);
    EXPECT_NE(result.error().find("huge.bin"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "out" / "huge.bin"));
}

TEST(ExtractArchive, RejectsOversizedZipEntry) {
    TempDir dir;
    std::vector<ArchiveEntry> entries = {{"small.txt", "ok", 0644, false},
                                         {"huge.bin", std::string(64 * 1024, '\0'), 0644, false}};
    write_zip(dir.path() / "bomb.zip", entries);
    write_zip(dir.path() / "stored.zip", entries, false);

    for (const char* name : {"bomb.zip", "stored.zip"}) {
        auto out = dir.path() / (std::string(name) + ".out");
        auto result = extract_archive(dir.path() / name, out, CancellationToken(), 1024);
        ASSERT_TRUE(result.is_error()) << name;
        EXPECT_EQ(result.error_type(), ErrorType::ENTRY_TOO_LARGE) << name;
        EXPECT_FALSE(std::filesystem::exists(out / "huge.bin")) << name;
    }
}

TEST(ExtractArchive, EntryAtLimitIsAccepted) {
    TempDir dir;
    write_tar_gz(dir.path() / "edge.tar.gz", {{"edge.bin", std::string(1024, 'e'), 0644, false}});
    write_zip(dir.path() / "edge.zip", {{"edge.bin", std::string(1024, 'e'), 0644, false}});

    EXPECT_TRUE(extract_archive(dir.path() / "edge.tar.gz", dir.path() / "tar", CancellationToken(),
                                1024)
                    .is_ok());
    EXPECT_TRUE(
        extract_archive(dir.path() / "edge.zip", dir.path() / "zip", CancellationToken(), 1024)
            .is_ok());
    EXPECT_EQ(read_file(dir.path() / "zip" / "edge.bin").size(), 1024u);
}

TEST(ExtractArchive, CorruptGzipIsAnError) {
    TempDir dir;
    write_file(dir.path() / "broken.tar.gz", std::string("\x1f\x8b garbage", 10));
    auto result = extract_archive(dir.path() / "broken.tar.gz", dir.path() / "out");
    EXPECT_TRUE(result.is_error());
}

TEST(ExtractArchive, HonoursCancellation) {
    TempDir dir;
    write_tar_gz(dir.path() / "plugin.tar.gz", plugin_files());
    write_zip(dir.path() / "plugin.zip", plugin_files());

    CancellationToken cancel;
    cancel.cancel();
    for (const char* name : {"plugin.tar.gz", "plugin.zip"}) {
        auto out = dir.path() / (std::string(name) + ".out");
        auto result = extract_archive(dir.path() / name, out, cancel);
        ASSERT_TRUE(result.is_error()) << name;
        EXPECT_EQ(result.error_type(), ErrorType::CANCELLED) << name;
        EXPECT_FALSE(std::filesystem::exists(out / "bin" / "plugdock-plugin-aws")) << name;
    }
}

TEST(ExtractArchive, RejectsSymlinkEntries) {
    TempDir dir;
    auto archive_path = dir.path() / "link.tar.gz";
    struct archive* writer = archive_write_new();
    archive_write_add_filter_gzip(writer);
    archive_write_set_format_pax_restricted(writer);
    ASSERT_EQ(archive_write_open_filename(writer, archive_path.c_str()), ARCHIVE_OK);
    struct archive_entry* entry = archive_entry_new();
    archive_entry_set_pathname(entry, "passwd");
    archive_entry_set_filetype(entry, AE_IFLNK);
    archive_entry_set_perm(entry, 0777);
    archive_entry_set_symlink(entry, "/etc/passwd");
    archive_write_header(writer, entry);
    archive_entry_free(entry);
    archive_write_close(writer);
    archive_write_free(writer);

    auto result = extract_archive(archive_path, dir.path() / "out");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error_type(), ErrorType::UNSUPPORTED_ARCHIVE);
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "out" / "passwd"));
}

TEST(ValidateBinary, AcceptsExecutableFile) {
    TempDir dir;
    write_file(dir.path() / "plugin", "#!/bin/sh\n", 0755);
    EXPECT_TRUE(validate_binary(dir.path() / "plugin", PermissionBitsExecutabilityChecker()).is_ok());
}

TEST(ValidateBinary, RejectsMissingDirectoryAndNonExecutable) {
    TempDir dir;
    PermissionBitsExecutabilityChecker checker;
    write_file(dir.path() / "data.txt", "text", 0644);

    auto missing = validate_binary(dir.path() / "nope", checker);
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error_type(), ErrorType::INVALID_BINARY);

    auto directory = validate_binary(dir.path(), checker);
    ASSERT_TRUE(directory.is_error());
    EXPECT_EQ(directory.error_type(), ErrorType::INVALID_BINARY);

    auto plain = validate_binary(dir.path() / "data.txt", checker);
    ASSERT_TRUE(plain.is_error());
    EXPECT_EQ(plain.error_type(), ErrorType::INVALID_BINARY);
}

TEST(ValidateBinary, ExtensionCheckerWantsExe) {
    TempDir dir;
    write_file(dir.path() / "plugin.exe", "MZ", 0644);
    write_file(dir.path() / "plugin", "MZ", 0755);
    ExtensionExecutabilityChecker checker;
    EXPECT_TRUE(validate_binary(dir.path() / "plugin.exe", checker).is_ok());
    EXPECT_TRUE(validate_binary(dir.path() / "plugin", checker).is_error());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
