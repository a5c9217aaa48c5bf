/*
  http_client.h

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
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "utils/cancellation.h"

namespace plugdock {

struct HttpResponse {
    int status_code = 0;
    std::string body;
    // header names are lowercased; only the final response of a redirect chain is kept
    std::map<std::string, std::string> headers;
    bool success = false;
    bool cancelled = false;
    std::string error_message;
};

// bytes written so far, and the announced length (0 when the server sent none)
using ProgressCallback = std::function<void(std::uint64_t, std::uint64_t)>;

class HttpClient {
   public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url,
                             const std::map<std::string, std::string>& headers,
                             int timeout_seconds) = 0;

    // Streams the body of url into dest_path. The body is never held in memory.
    virtual HttpResponse download(const std::string& url,
                                  const std::map<std::string, std::string>& headers,
                                  const std::string& dest_path, const ProgressCallback& progress,
                                  const CancellationToken& cancel) = 0;
};

// Transport backed by the system curl executable.
class CurlHttpClient : public HttpClient {
   public:
    explicit CurlHttpClient(std::string curl_path = "curl");

    HttpResponse get(const std::string& url, const std::map<std::string, std::string>& headers,
                     int timeout_seconds) override;

    HttpResponse download(const std::string& url,
                          const std::map<std::string, std::string>& headers,
                          const std::string& dest_path, const ProgressCallback& progress,
                          const CancellationToken& cancel) override;

    static std::map<std::string, std::string> parse_header_block(const std::string& raw);

   private:
    struct CurlRun {
        int exit_code = -1;
        bool cancelled = false;
        std::string status_output;
        std::string error_output;
    };

    CurlRun run_curl(const std::vector<std::string>& args, const CancellationToken* cancel,
                     const std::function<void()>& on_tick);

    std::string curl_path_;
};

}  // namespace plugdock
