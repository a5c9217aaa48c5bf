/*
  http_client_test.cpp

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

#include <chrono>
#include <string>

#include "test_support.h"
#include "utils/http_client.h"

using namespace plugdock;
using namespace plugdock_test;

namespace {

// Stands in for curl: honours -o and -D, prints the status like -w would.
constexpr const char* kFakeCurl = R"(#!/bin/sh
out=""
hdr=""
while [ $# -gt 0 ]; do
    case "$1" in
        -o) out="$2"; shift ;;
        -D) hdr="$2"; shift ;;
    esac
    shift
done
if [ -n "$FAKE_CURL_SLEEP" ]; then sleep "$FAKE_CURL_SLEEP"; fi
printf 'HTTP/1.1 302 Found\r\nLocation: https://elsewhere\r\n\r\nHTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\n' > "$hdr"
printf 'hello' > "$out"
printf '200'
)";

}  // namespace

TEST(ParseHeaderBlock, KeepsFinalResponseOnly) {
    auto headers = CurlHttpClient::parse_header_block(
        "HTTP/1.1 302 Found\r\nLocation: https://objects.test/a\r\nX-Hop: 1\r\n\r\n"
        "HTTP/2 200\r\nContent-Type: application/octet-stream\r\nContent-Length:  42 \r\n\r\n");
    EXPECT_EQ(headers.count("location"), 0u);
    EXPECT_EQ(headers.count("x-hop"), 0u);
    EXPECT_EQ(headers["content-type"], "application/octet-stream");
    EXPECT_EQ(headers["content-length"], "42");
}

TEST(ParseHeaderBlock, IgnoresMalformedLines) {
    auto headers = CurlHttpClient::parse_header_block("garbage\n: novalue\nX-Ok: yes\n");
    EXPECT_EQ(headers.size(), 1u);
    EXPECT_EQ(headers["x-ok"], "yes");
}

TEST(CurlHttpClient, MissingExecutableIsTransportFailure) {
    CurlHttpClient client("/nonexistent/plugdock-curl");
    auto response = client.get("https://api.test/", {}, 5);
    EXPECT_EQ(response.status_code, 0);
    EXPECT_FALSE(response.success);
    EXPECT_NE(response.error_message.find("curl executable not found"), std::string::npos);
}

TEST(CurlHttpClient, GetReadsBodyAndHeaders) {
    TempDir dir;
    auto curl = dir.path() / "curl";
    write_file(curl, kFakeCurl, 0755);

    CurlHttpClient client(curl.string());
    auto response = client.get("https://api.test/repos", {{"Accept", "application/json"}}, 5);
    ASSERT_TRUE(response.success) << response.error_message;
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.body, "hello");
    EXPECT_EQ(response.headers["content-length"], "5");
}

TEST(CurlHttpClient, DownloadWritesFileAndReportsProgress) {
    TempDir dir;
    auto curl = dir.path() / "curl";
    write_file(curl, kFakeCurl, 0755);

    CurlHttpClient client(curl.string());
    std::uint64_t done = 0;
    std::uint64_t total = 0;
    auto dest = dir.path() / "asset.tar.gz";
    auto response = client.download(
        "https://downloads.test/asset.tar.gz", {}, dest.string(),
        [&](std::uint64_t d, std::uint64_t t) {
            done = d;
            total = t;
        },
        CancellationToken());
    ASSERT_TRUE(response.success) << response.error_message;
    EXPECT_EQ(read_file(dest), "hello");
    EXPECT_EQ(done, 5u);
    EXPECT_EQ(total, 5u);
}

TEST(CurlHttpClient, DownloadHonoursCancellation) {
    TempDir dir;
    auto curl = dir.path() / "curl";
    write_file(curl, kFakeCurl, 0755);
    ::setenv("FAKE_CURL_SLEEP", "10", 1);

    CurlHttpClient client(curl.string());
    auto dest = dir.path() / "slow.tar.gz";
    auto started = std::chrono::steady_clock::now();
    auto response = client.download("https://downloads.test/slow.tar.gz", {}, dest.string(),
                                     nullptr,
                                     CancellationToken::with_timeout(std::chrono::milliseconds(200)));
    ::unsetenv("FAKE_CURL_SLEEP");

    EXPECT_TRUE(response.cancelled);
    EXPECT_FALSE(response.success);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    EXPECT_FALSE(std::filesystem::exists(dest));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
