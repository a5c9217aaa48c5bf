/*
  error_out.h

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

#include <string>
#include <vector>

#include <cstdint>

enum class ErrorSeverity : std::uint8_t {
    INFO = 0,
    WARNING = 1,
    ERROR = 2,
    CRITICAL = 3
};

enum class ErrorType : std::uint8_t {
    INVALID_SPECIFIER,
    LOCK_HELD,
    ALREADY_INSTALLED,
    PLUGIN_NOT_FOUND,
    BINARY_NOT_FOUND,
    RELEASE_NOT_FOUND,
    RATE_LIMITED,
    FETCH_FAILED,
    NO_COMPATIBLE_ASSET,
    UNSUPPORTED_ARCHIVE,
    PATH_TRAVERSAL,
    ENTRY_TOO_LARGE,
    INVALID_BINARY,
    METADATA_NOT_FOUND,
    METADATA_PARSE_ERROR,
    INVALID_VERSION,
    INVALID_ARGUMENT,
    CANCELLED,
    FILE_ERROR,
    RUNTIME_ERROR,
    UNKNOWN_ERROR
};

struct ErrorInfo {
    ErrorType type;
    ErrorSeverity severity;
    std::string command_used;
    std::string message;
    std::vector<std::string> suggestions;

    ErrorInfo();

    ErrorInfo(ErrorType t, ErrorSeverity s, const std::string& cmd, const std::string& msg,
              const std::vector<std::string>& sugg);

    ErrorInfo(ErrorType t, const std::string& cmd, const std::string& msg,
              const std::vector<std::string>& sugg);

    static ErrorSeverity get_default_severity(ErrorType type);
};

const char* error_type_name(ErrorType type);

// suggestions shown to the user for the kinds of failures they can act on
std::vector<std::string> default_suggestions(ErrorType type);

void print_error(const ErrorInfo& error);

void print_warning(const std::string& command, const std::string& message);

int exit_code_for(ErrorType type);
