/*
  metadata_test.cpp

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

#include "registry/metadata.h"
#include "test_support.h"

using namespace plugdock;
using namespace plugdock_test;

TEST(PluginMetadata, WriteThenReadKeepsEveryKey) {
    TempDir dir;
    PluginMetadata metadata = {{"region", "us-east-1"}, {"account", "prod"}, {"empty", ""}};

    auto written = write_plugin_metadata(dir.path(), metadata);
    ASSERT_TRUE(written.is_ok()) << written.error();

    auto path = dir.path() / kPluginMetadataFile;
    EXPECT_EQ(std::filesystem::status(path).permissions() & std::filesystem::perms::all,
              std::filesystem::perms::owner_read | std::filesystem::perms::owner_write);
    std::string content = read_file(path);
    ASSERT_FALSE(content.empty());
    EXPECT_EQ(content.back(), '\n');
    EXPECT_NE(content.find("  \"region\": \"us-east-1\""), std::string::npos);

    auto read = read_plugin_metadata(dir.path());
    ASSERT_TRUE(read.is_ok()) << read.error();
    EXPECT_EQ(read.value(), metadata);
}

TEST(PluginMetadata, MissingFileIsNotFound) {
    TempDir dir;
    auto read = read_plugin_metadata(dir.path());
    ASSERT_TRUE(read.is_error());
    EXPECT_EQ(read.error_type(), ErrorType::METADATA_NOT_FOUND);
}

TEST(PluginMetadata, MalformedFileIsParseError) {
    TempDir dir;
    for (const std::string content : {"{not json", "[\"region\"]", "{\"port\": 8080}"}) {
        write_file(dir.path() / kPluginMetadataFile, content, 0600);
        auto read = read_plugin_metadata(dir.path());
        ASSERT_TRUE(read.is_error()) << content;
        EXPECT_EQ(read.error_type(), ErrorType::METADATA_PARSE_ERROR) << content;
    }
}

TEST(RegionFromBinaryName, FindsTrailingRegion) {
    EXPECT_EQ(parse_region_from_binary_name("plugdock-plugin-aws-us-east-1").value_or(""),
              "us-east-1");
    EXPECT_EQ(parse_region_from_binary_name("/opt/p/plugdock-plugin-aws-eu-west-2").value_or(""),
              "eu-west-2");
    EXPECT_EQ(parse_region_from_binary_name("plugdock-plugin-aws-ap-southeast-1.exe").value_or(""),
              "ap-southeast-1");
}

TEST(RegionFromBinaryName, NoRegionSuffix) {
    EXPECT_FALSE(parse_region_from_binary_name("plugdock-plugin-aws").has_value());
    EXPECT_FALSE(parse_region_from_binary_name("aws").has_value());
    EXPECT_FALSE(parse_region_from_binary_name("plugdock-plugin-aws-us-east-1-debug").has_value());
}

TEST(MetadataPairs, ParsesKeyValue) {
    auto parsed = parse_metadata_pairs({"region=us-west-2", "note=a=b", "blank="});
    ASSERT_TRUE(parsed.is_ok()) << parsed.error();
    EXPECT_EQ(parsed.value().at("region"), "us-west-2");
    EXPECT_EQ(parsed.value().at("note"), "a=b");
    EXPECT_EQ(parsed.value().at("blank"), "");
}

TEST(MetadataPairs, RejectsMissingKey) {
    for (const std::string pair : {"region", "=value"}) {
        auto parsed = parse_metadata_pairs({pair});
        ASSERT_TRUE(parsed.is_error()) << pair;
        EXPECT_EQ(parsed.error_type(), ErrorType::INVALID_ARGUMENT) << pair;
    }
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
