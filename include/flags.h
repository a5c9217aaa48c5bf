/*
  flags.h

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

namespace flags {

struct ParseResult {
    std::string command;
    std::vector<std::string> args;

    bool force = false;
    bool no_fallback = false;
    bool dry_run = false;
    bool keep_config = false;
    bool clean = false;
    bool all_versions = false;
    bool available = false;
    std::vector<std::string> metadata;
    // update target (--to)
    std::string target_version;

    int exit_code = 0;
    bool should_exit = false;
};

// Global options update config:: directly; everything else lands in the result.
ParseResult parse_arguments(int argc, char* argv[]);

}  // namespace flags
