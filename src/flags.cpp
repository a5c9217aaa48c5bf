/*
  flags.cpp

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

#include "flags.h"

#include <getopt.h>

#include "error_out.h"
#include "plugdock.h"
#include "usage.h"

namespace flags {

namespace {

constexpr int kOptNoFallback = 256;
constexpr int kOptKeepConfig = 257;
constexpr int kOptClean = 258;
constexpr int kOptLegacyNames = 259;
constexpr int kOptAvailable = 260;

}  // namespace

ParseResult parse_arguments(int argc, char* argv[]) {
    ParseResult result;

    static struct option long_options[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"plugin-dir", required_argument, nullptr, 'd'},
        {"force", no_argument, nullptr, 'f'},
        {"dry-run", no_argument, nullptr, 'n'},
        {"metadata", required_argument, nullptr, 'm'},
        {"to", required_argument, nullptr, 't'},
        {"all", no_argument, nullptr, 'a'},
        {"no-fallback", no_argument, nullptr, kOptNoFallback},
        {"keep-config", no_argument, nullptr, kOptKeepConfig},
        {"clean", no_argument, nullptr, kOptClean},
        {"legacy-names", no_argument, nullptr, kOptLegacyNames},
        {"available", no_argument, nullptr, kOptAvailable},
        {nullptr, 0, nullptr, 0}};

    const char* short_options = "hvd:fnm:t:a";

    int option_index = 0;
    int c;
    optind = 1;

    while ((c = getopt_long(argc, argv, short_options, long_options, &option_index)) != -1) {
        switch (c) {
            case 'h':
                config::show_help = true;
                break;
            case 'v':
                config::show_version = true;
                break;
            case 'd':
                config::plugin_dir = optarg;
                break;
            case 'f':
                result.force = true;
                break;
            case 'n':
                result.dry_run = true;
                break;
            case 'm':
                result.metadata.emplace_back(optarg);
                break;
            case 't':
                result.target_version = optarg;
                break;
            case 'a':
                result.all_versions = true;
                break;
            case kOptNoFallback:
                result.no_fallback = true;
                break;
            case kOptKeepConfig:
                result.keep_config = true;
                break;
            case kOptClean:
                result.clean = true;
                break;
            case kOptLegacyNames:
                config::legacy_plugin_names = true;
                break;
            case kOptAvailable:
                result.available = true;
                break;
            case '?':
                print_usage();
                result.exit_code = 2;
                result.should_exit = true;
                return result;
            default:
                print_error({ErrorType::INVALID_ARGUMENT,
                             std::string(1, static_cast<char>(c)),
                             "Unrecognized option",
                             {"Run 'plugdock --help' for usage"}});
                result.exit_code = 2;
                result.should_exit = true;
                return result;
        }
    }

    if (optind < argc) {
        result.command = argv[optind];
        for (int i = optind + 1; i < argc; i++) {
            result.args.emplace_back(argv[i]);
        }
    }

    return result;
}

}  // namespace flags
