/*
  error_out.cpp

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

#include "error_out.h"

#include <iostream>
#include <string>
#include <vector>

void print_error(const ErrorInfo& error) {
    std::cerr << "plugdock: ";

    if (!error.command_used.empty()) {
        std::cerr << error.command_used << ": ";
    }

    if (error.severity == ErrorSeverity::WARNING) {
        std::cerr << "warning";
    } else {
        std::cerr << error_type_name(error.type);
    }

    if (!error.message.empty()) {
        std::cerr << ": " << error.message;
    }

    std::cerr << '\n';

    for (const auto& suggestion : error.suggestions) {
        std::cerr << "  " << suggestion << '\n';
    }
}

void print_warning(const std::string& command, const std::string& message) {
    print_error(ErrorInfo(ErrorType::RUNTIME_ERROR, ErrorSeverity::WARNING, command, message, {}));
}

ErrorInfo::ErrorInfo()
    : type(ErrorType::UNKNOWN_ERROR),
      severity(ErrorSeverity::ERROR),
      command_used(""),
      message(""),
      suggestions() {
}

ErrorInfo::ErrorInfo(ErrorType t, ErrorSeverity s, const std::string& cmd, const std::string& msg,
                     const std::vector<std::string>& sugg)
    : type(t), severity(s), command_used(cmd), message(msg), suggestions(sugg) {
}

ErrorInfo::ErrorInfo(ErrorType t, const std::string& cmd, const std::string& msg,
                     const std::vector<std::string>& sugg)
    : type(t),
      severity(get_default_severity(t)),
      command_used(cmd),
      message(msg),
      suggestions(sugg) {
}

ErrorSeverity ErrorInfo::get_default_severity(ErrorType type) {
    switch (type) {
        case ErrorType::PATH_TRAVERSAL:
        case ErrorType::ENTRY_TOO_LARGE:
        case ErrorType::INVALID_BINARY:
            return ErrorSeverity::CRITICAL;
        case ErrorType::ALREADY_INSTALLED:
        case ErrorType::METADATA_NOT_FOUND:
            return ErrorSeverity::INFO;
        case ErrorType::INVALID_SPECIFIER:
        case ErrorType::INVALID_ARGUMENT:
        case ErrorType::INVALID_VERSION:
            return ErrorSeverity::WARNING;
        default:
            return ErrorSeverity::ERROR;
    }
}

const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::INVALID_SPECIFIER:
            return "invalid plugin specifier";
        case ErrorType::LOCK_HELD:
            return "plugin is locked";
        case ErrorType::ALREADY_INSTALLED:
            return "already installed";
        case ErrorType::PLUGIN_NOT_FOUND:
            return "plugin not found";
        case ErrorType::BINARY_NOT_FOUND:
            return "binary not found";
        case ErrorType::RELEASE_NOT_FOUND:
            return "release not found";
        case ErrorType::RATE_LIMITED:
            return "rate limited or forbidden";
        case ErrorType::FETCH_FAILED:
            return "fetch failed";
        case ErrorType::NO_COMPATIBLE_ASSET:
            return "no compatible asset";
        case ErrorType::UNSUPPORTED_ARCHIVE:
            return "unsupported archive";
        case ErrorType::PATH_TRAVERSAL:
            return "path traversal rejected";
        case ErrorType::ENTRY_TOO_LARGE:
            return "archive entry too large";
        case ErrorType::INVALID_BINARY:
            return "invalid binary";
        case ErrorType::METADATA_NOT_FOUND:
            return "metadata not found";
        case ErrorType::METADATA_PARSE_ERROR:
            return "metadata parse error";
        case ErrorType::INVALID_VERSION:
            return "invalid version";
        case ErrorType::INVALID_ARGUMENT:
            return "invalid argument";
        case ErrorType::CANCELLED:
            return "cancelled";
        case ErrorType::FILE_ERROR:
            return "file error";
        case ErrorType::RUNTIME_ERROR:
            return "runtime error";
        case ErrorType::UNKNOWN_ERROR:
        default:
            return "unknown error";
    }
}

std::vector<std::string> default_suggestions(ErrorType type) {
    switch (type) {
        case ErrorType::LOCK_HELD:
            return {"Another plugdock process is modifying this plugin. Try again later."};
        case ErrorType::ALREADY_INSTALLED:
            return {"Use --force to reinstall."};
        case ErrorType::RATE_LIMITED:
            return {"Set GITHUB_TOKEN to raise the API rate limit, or wait and retry."};
        case ErrorType::NO_COMPATIBLE_ASSET:
            return {"The plugin does not publish a build for this platform."};
        case ErrorType::INVALID_SPECIFIER:
            return {"Expected name[@version] or owner/repo[@version]."};
        default:
            return {};
    }
}

int exit_code_for(ErrorType type) {
    switch (type) {
        case ErrorType::INVALID_SPECIFIER:
        case ErrorType::INVALID_ARGUMENT:
        case ErrorType::INVALID_VERSION:
            return 2;
        case ErrorType::LOCK_HELD:
            return 75;  // EX_TEMPFAIL
        case ErrorType::CANCELLED:
            return 130;
        default:
            return 1;
    }
}
