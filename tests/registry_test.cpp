/*
  registry_test.cpp

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
#include <map>
#include <string>

#include "registry/registry.h"
#include "test_support.h"

using namespace plugdock;
using namespace plugdock_test;

namespace {

constexpr const char* kScript = "#!/bin/sh\nexit 0\n";

void add_binary(const std::filesystem::path& dir, const std::string& file) {
    write_file(dir / file, kScript, 0755);
}

class RegistryTest : public ::testing::Test {
   protected:
    std::filesystem::path root() const {
        return dir_.path() / "plugins";
    }
    std::filesystem::path version_dir(const std::string& name, const std::string& version) const {
        return root() / name / version;
    }

    TempDir dir_;
};

}  // namespace

TEST_F(RegistryTest, MissingRootIsEmpty) {
    PluginRegistry registry({root()});
    auto plugins = registry.list_plugins();
    ASSERT_TRUE(plugins.is_ok()) << plugins.error();
    EXPECT_TRUE(plugins.value().empty());
}

TEST_F(RegistryTest, RootThatIsAFileIsAnError) {
    write_file(root(), "not a directory");
    PluginRegistry registry({root()});
    auto plugins = registry.list_plugins();
    ASSERT_TRUE(plugins.is_error());
    EXPECT_EQ(plugins.error_type(), ErrorType::FILE_ERROR);
}

TEST_F(RegistryTest, ListsEveryVersionWithABinary) {
    add_binary(version_dir("aws", "v1.0.0"), "plugdock-plugin-aws");
    add_binary(version_dir("aws", "v1.1.0"), "plugdock-plugin-aws");
    write_file(version_dir("aws", "v2.0.0") / "README.md", "no binary here");
    add_binary(version_dir("azure", "v0.3.0"), "azure");
    add_binary(root() / ".staging-aws-abc123" / "plugin", "plugdock-plugin-aws");

    PluginRegistry registry({root()});
    auto plugins = registry.list_plugins();
    ASSERT_TRUE(plugins.is_ok()) << plugins.error();
    ASSERT_EQ(plugins.value().size(), 3u);
    EXPECT_EQ(plugins.value()[0].name, "aws");
    EXPECT_EQ(plugins.value()[0].version, "v1.0.0");
    EXPECT_EQ(plugins.value()[1].version, "v1.1.0");
    EXPECT_EQ(plugins.value()[2].name, "azure");
    EXPECT_EQ(plugins.value()[2].path, version_dir("azure", "v0.3.0") / "azure");
}

TEST_F(RegistryTest, LatestPicksHighestSemver) {
    add_binary(version_dir("aws", "v1.9.0"), "plugdock-plugin-aws");
    add_binary(version_dir("aws", "v1.10.0"), "plugdock-plugin-aws");
    add_binary(version_dir("aws", "v1.10.0-rc.1"), "plugdock-plugin-aws");

    PluginRegistry registry({root()});
    auto scan = registry.list_latest_plugins();
    ASSERT_TRUE(scan.is_ok()) << scan.error();
    ASSERT_EQ(scan.value().plugins.size(), 1u);
    EXPECT_EQ(scan.value().plugins[0].version, "v1.10.0");
    EXPECT_TRUE(scan.value().warnings.empty());
}

TEST_F(RegistryTest, InvalidVersionDirectoryIsAWarning) {
    add_binary(version_dir("aws", "v1.0.0"), "plugdock-plugin-aws");
    add_binary(version_dir("aws", "v1.2.0-!!invalid"), "plugdock-plugin-aws");

    PluginRegistry registry({root()});
    auto scan = registry.list_latest_plugins();
    ASSERT_TRUE(scan.is_ok()) << scan.error();
    ASSERT_EQ(scan.value().plugins.size(), 1u);
    EXPECT_EQ(scan.value().plugins[0].version, "v1.0.0");
    ASSERT_EQ(scan.value().warnings.size(), 1u);
    EXPECT_EQ(scan.value().warnings[0].rfind(
                  "Plugin aws version v1.2.0-!!invalid has invalid semver format: ", 0),
              0u);
}

TEST_F(RegistryTest, FirstRootWinsOnEqualVersions) {
    auto second = dir_.path() / "second";
    add_binary(version_dir("aws", "v1.0.0"), "plugdock-plugin-aws");
    add_binary(second / "aws" / "v1.0.0", "plugdock-plugin-aws");
    add_binary(second / "gcp" / "v0.1.0", "gcp");

    PluginRegistry registry({root(), second});
    auto scan = registry.list_latest_plugins();
    ASSERT_TRUE(scan.is_ok()) << scan.error();
    ASSERT_EQ(scan.value().plugins.size(), 2u);
    EXPECT_EQ(scan.value().plugins[0].path, version_dir("aws", "v1.0.0") / "plugdock-plugin-aws");
    EXPECT_EQ(scan.value().plugins[1].name, "gcp");
}

TEST_F(RegistryTest, GetLatestPlugin) {
    add_binary(version_dir("aws", "v1.0.0"), "plugdock-plugin-aws");
    add_binary(version_dir("aws", "v1.2.0"), "plugdock-plugin-aws");

    PluginRegistry registry({root()});
    auto found = registry.get_latest_plugin("aws");
    ASSERT_TRUE(found.is_ok()) << found.error();
    EXPECT_TRUE(found.value().found);
    EXPECT_EQ(found.value().plugin.version, "v1.2.0");

    auto missing = registry.get_latest_plugin("gcp");
    ASSERT_TRUE(missing.is_ok());
    EXPECT_FALSE(missing.value().found);
}

TEST_F(RegistryTest, MatcherOrderPrefersExactName) {
    auto dir = version_dir("aws", "v1.0.0");
    add_binary(dir, "aws");
    add_binary(dir, "plugdock-plugin-aws");
    add_binary(dir, "plugdock-plugin-aws-us-east-1");

    PluginRegistry registry({root()});
    EXPECT_EQ(registry.find_plugin_binary(dir, "aws", {}).value_or(""), dir / "aws");

    std::filesystem::remove(dir / "aws");
    PluginMetadata metadata = {{"region", "us-east-1"}};
    EXPECT_EQ(registry.find_plugin_binary(dir, "aws", metadata).value_or(""),
              dir / "plugdock-plugin-aws-us-east-1");
    EXPECT_EQ(registry.find_plugin_binary(dir, "aws", {}).value_or(""),
              dir / "plugdock-plugin-aws");
}

TEST_F(RegistryTest, LegacyNamesOnlyWhenEnabled) {
    auto dir = version_dir("aws", "v1.0.0");
    add_binary(dir, "costplug-plugin-aws");
    add_binary(dir, "aaa-helper");

    PluginRegistry modern({root()});
    EXPECT_EQ(modern.find_plugin_binary(dir, "aws", {}).value_or(""), dir / "aaa-helper");

    PluginRegistry legacy({root()}, true);
    EXPECT_EQ(legacy.find_plugin_binary(dir, "aws", {}).value_or(""),
              dir / "costplug-plugin-aws");
    EXPECT_EQ(legacy.matchers().back().label, "legacy");
}

TEST_F(RegistryTest, FallbackSkipsNonExecutablesAndMetadata) {
    auto dir = version_dir("aws", "v1.0.0");
    write_file(dir / "README.md", "docs", 0644);
    write_file(dir / kPluginMetadataFile, "{}", 0755);
    write_file(dir / "plugdock-plugin-aws", "not executable", 0644);

    PluginRegistry registry({root()});
    EXPECT_FALSE(registry.find_plugin_binary(dir, "aws", {}).has_value());

    add_binary(dir, "run");
    EXPECT_EQ(registry.find_plugin_binary(dir, "aws", {}).value_or(""), dir / "run");
}

TEST_F(RegistryTest, RegionComesFromMetadataOrBinaryName) {
    add_binary(version_dir("aws", "v1.0.0"), "plugdock-plugin-aws-eu-west-1");
    add_binary(version_dir("gcp", "v1.0.0"), "gcp");
    write_file(version_dir("gcp", "v1.0.0") / kPluginMetadataFile,
               "{\"region\": \"us-central1\"}", 0600);

    PluginRegistry registry({root()});
    auto plugins = registry.list_plugins();
    ASSERT_TRUE(plugins.is_ok()) << plugins.error();
    ASSERT_EQ(plugins.value().size(), 2u);
    EXPECT_EQ(plugins.value()[0].region(), "eu-west-1");
    EXPECT_EQ(plugins.value()[1].region(), "us-central1");
}

TEST(MergeRegistryMetadata, KeepsReportedValues) {
    InstalledPlugin plugin;
    plugin.metadata = {{"region", "us-east-1"}, {"account", "prod"}};

    std::map<std::string, std::string> reported = {{"region", "eu-west-1"}};
    merge_registry_metadata(reported, plugin);
    EXPECT_EQ(reported.at("region"), "eu-west-1");
    EXPECT_EQ(reported.at("account"), "prod");
}

TEST_F(RegistryTest, AvailablePluginsShowInstalledVersion) {
    add_binary(version_dir("aws", "v1.0.0"), "plugdock-plugin-aws");
    add_binary(version_dir("aws", "v1.3.0"), "plugdock-plugin-aws");
    add_binary(version_dir("local-only", "v0.1.0"), "local-only");

    auto catalog = PluginCatalog::parse(R"({
        "plugins": {
            "gcp": {"repository": "plugdock/plugdock-plugin-gcp", "description": "GCP billing"},
            "aws": {"repository": "plugdock/plugdock-plugin-aws", "security_level": "experimental"}
        }
    })");
    ASSERT_TRUE(catalog.is_ok()) << catalog.error();

    PluginRegistry registry({root()});
    auto available = registry.list_available_plugins(catalog.value());
    ASSERT_TRUE(available.is_ok()) << available.error();
    ASSERT_EQ(available.value().size(), 2u);

    EXPECT_EQ(available.value()[0].entry.name, "aws");
    EXPECT_TRUE(available.value()[0].installed());
    EXPECT_EQ(available.value()[0].installed_version, "v1.3.0");
    EXPECT_EQ(available.value()[0].entry.security_level, "experimental");

    EXPECT_EQ(available.value()[1].entry.name, "gcp");
    EXPECT_FALSE(available.value()[1].installed());
    EXPECT_EQ(available.value()[1].entry.description, "GCP billing");
}

TEST_F(RegistryTest, AvailablePluginsFromEmptyCatalog) {
    add_binary(version_dir("aws", "v1.0.0"), "plugdock-plugin-aws");
    PluginRegistry registry({root()});
    auto available = registry.list_available_plugins(PluginCatalog());
    ASSERT_TRUE(available.is_ok());
    EXPECT_TRUE(available.value().empty());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
