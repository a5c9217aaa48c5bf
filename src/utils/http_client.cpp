/*
  http_client.cpp

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

#include "utils/http_client.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>

#include "utils/debug.h"
#include "utils/plugdock_filesystem.h"

namespace plugdock {

namespace {

using plugdock_filesystem::FileOperations;

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::string read_or_empty(const std::string& path) {
    auto result = FileOperations::read_file_content(path);
    return result.is_ok() ? result.value() : std::string();
}

std::uint64_t file_size_or_zero(const std::string& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return 0;
    }
    return static_cast<std::uint64_t>(st.st_size);
}

void append_headers(std::vector<std::string>& args,
                    const std::map<std::string, std::string>& headers) {
    for (const auto& header : headers) {
        args.push_back("-H");
        args.push_back(header.first + ": " + header.second);
    }
}

// Temp files for one curl invocation, removed on scope exit.
struct CurlScratch {
    std::vector<std::string> paths;

    ~CurlScratch() {
        for (const auto& path : paths) {
            FileOperations::cleanup_temp_file(path);
        }
    }

    bool add(const std::string& prefix, std::string& out, std::string& error) {
        auto result = FileOperations::create_temp_file(prefix);
        if (result.is_error()) {
            error = result.error();
            return false;
        }
        out = result.value();
        paths.push_back(out);
        return true;
    }
};

void finish_response(HttpResponse& response, const std::string& status_output) {
    response.status_code = std::atoi(trim(status_output).c_str());
    response.success = response.status_code >= 200 && response.status_code < 300;
    if (!response.success && response.error_message.empty()) {
        response.error_message =
            "HTTP request failed with status code " + std::to_string(response.status_code);
    }
}

std::string describe_exit(int exit_code, const std::string& stderr_text) {
    if (exit_code == 127) {
        return "curl executable not found. Please install curl.";
    }
    std::string message = "curl exited with status " + std::to_string(exit_code);
    std::string detail = trim(stderr_text);
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return message;
}

}  // namespace

CurlHttpClient::CurlHttpClient(std::string curl_path) : curl_path_(std::move(curl_path)) {
}

std::map<std::string, std::string> CurlHttpClient::parse_header_block(const std::string& raw) {
    std::map<std::string, std::string> headers;
    std::istringstream stream(raw);
    std::string line;
    while (std::getline(stream, line)) {
        // each redirect hop starts a new status line; keep only the last block
        if (line.rfind("HTTP/", 0) == 0) {
            headers.clear();
            continue;
        }
        size_t colon_pos = line.find(':');
        if (colon_pos == std::string::npos) {
            continue;
        }
        std::string key = trim(line.substr(0, colon_pos));
        std::string value = trim(line.substr(colon_pos + 1));
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!key.empty()) {
            headers[key] = value;
        }
    }
    return headers;
}

CurlHttpClient::CurlRun CurlHttpClient::run_curl(const std::vector<std::string>& args,
                                                 const CancellationToken* cancel,
                                                 const std::function<void()>& on_tick) {
    CurlRun run;

    CurlScratch scratch;
    std::string status_file;
    std::string stderr_file;
    std::string scratch_error;
    if (!scratch.add("plugdock_curl_status", status_file, scratch_error) ||
        !scratch.add("plugdock_curl_stderr", stderr_file, scratch_error)) {
        run.error_output = scratch_error;
        return run;
    }

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(curl_path_.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    plugdock_debug_msg("running %s with %zu arguments", curl_path_.c_str(), args.size());

    pid_t pid = ::fork();
    if (pid < 0) {
        run.error_output = std::string("fork failed: ") + strerror(errno);
        return run;
    }

    if (pid == 0) {
        int out_fd = ::open(status_file.c_str(), O_WRONLY | O_TRUNC);
        int err_fd = ::open(stderr_file.c_str(), O_WRONLY | O_TRUNC);
        if (out_fd >= 0) {
            ::dup2(out_fd, STDOUT_FILENO);
            ::close(out_fd);
        }
        if (err_fd >= 0) {
            ::dup2(err_fd, STDERR_FILENO);
            ::close(err_fd);
        }
        ::execvp(argv[0], argv.data());
        _exit(127);
    }

    int status = 0;
    while (true) {
        pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            break;
        }
        if (waited < 0 && errno != EINTR) {
            run.error_output = std::string("waitpid failed: ") + strerror(errno);
            return run;
        }
        if (cancel != nullptr && cancel->is_cancelled()) {
            ::kill(pid, SIGTERM);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            }
            run.cancelled = true;
            return run;
        }
        if (on_tick) {
            on_tick();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    if (WIFEXITED(status)) {
        run.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        run.exit_code = 128 + WTERMSIG(status);
    }
    run.status_output = read_or_empty(status_file);
    run.error_output = read_or_empty(stderr_file);
    return run;
}

HttpResponse CurlHttpClient::get(const std::string& url,
                                 const std::map<std::string, std::string>& headers,
                                 int timeout_seconds) {
    HttpResponse response;

    CurlScratch scratch;
    std::string body_file;
    std::string headers_file;
    if (!scratch.add("plugdock_http_response", body_file, response.error_message) ||
        !scratch.add("plugdock_http_headers", headers_file, response.error_message)) {
        return response;
    }

    std::vector<std::string> args = {"-sS", "-L", "-w", "%{http_code}", "-m",
                                     std::to_string(timeout_seconds), "-o", body_file, "-D",
                                     headers_file};
    append_headers(args, headers);
    args.push_back(url);

    CurlRun run = run_curl(args, nullptr, nullptr);
    if (run.exit_code != 0) {
        response.error_message = run.exit_code < 0 ? run.error_output
                                                   : describe_exit(run.exit_code, run.error_output);
        return response;
    }

    response.body = read_or_empty(body_file);
    response.headers = parse_header_block(read_or_empty(headers_file));
    finish_response(response, run.status_output);
    return response;
}

HttpResponse CurlHttpClient::download(const std::string& url,
                                      const std::map<std::string, std::string>& headers,
                                      const std::string& dest_path,
                                      const ProgressCallback& progress,
                                      const CancellationToken& cancel) {
    HttpResponse response;

    CurlScratch scratch;
    std::string headers_file;
    if (!scratch.add("plugdock_download_headers", headers_file, response.error_message)) {
        return response;
    }

    std::vector<std::string> args = {"-sS", "-L", "-w", "%{http_code}", "--connect-timeout",
                                     "30", "-o", dest_path, "-D", headers_file};
    append_headers(args, headers);
    args.push_back(url);

    std::uint64_t total = 0;
    auto report = [&]() {
        if (!progress) {
            return;
        }
        if (total == 0) {
            auto partial = parse_header_block(read_or_empty(headers_file));
            auto it = partial.find("content-length");
            if (it != partial.end()) {
                total = std::strtoull(it->second.c_str(), nullptr, 10);
            }
        }
        progress(file_size_or_zero(dest_path), total);
    };

    PerformanceTracker tracker("download");
    CurlRun run = run_curl(args, &cancel, report);
    if (run.cancelled) {
        FileOperations::cleanup_temp_file(dest_path);
        response.cancelled = true;
        response.error_message = "download cancelled";
        return response;
    }
    if (run.exit_code != 0) {
        FileOperations::cleanup_temp_file(dest_path);
        response.error_message = run.exit_code < 0 ? run.error_output
                                                   : describe_exit(run.exit_code, run.error_output);
        return response;
    }

    response.headers = parse_header_block(read_or_empty(headers_file));
    finish_response(response, run.status_output);
    if (response.success) {
        report();
    } else {
        FileOperations::cleanup_temp_file(dest_path);
    }
    return response;
}

}  // namespace plugdock
