/*
  usage.cpp

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

#include "usage.h"

#include <iostream>

#include "plugdock.h"

void print_version() {
    std::cout << "plugdock " << get_version() << " (" << PLUGDOCK_GIT_HASH << ")\n";
}

void print_usage() {
    std::cout << "Manage cost-analysis plugins installed from release archives\n"
              << "Usage: plugdock [options] <command> [args...]\n"
              << "\n"
              << "Commands:\n"
              << "  install <spec>             Install name[@version] from the catalog or\n"
              << "                             owner/repo[@version] from its releases\n"
              << "  update <name>              Move a plugin to its newest release\n"
              << "  remove <name>              Delete every version of a plugin\n"
              << "  list                       Show the newest installed version of each plugin\n"
              << "  prune <name> <version>     Delete every version except <version>\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help                 Display this help message and exit\n"
              << "  -v, --version              Print version information and exit\n"
              << "  -d, --plugin-dir=DIR       Plugin root (default $PLUGDOCK_HOME/plugins)\n"
              << "      --legacy-names         Also match costplug-plugin-<name> binaries\n"
              << "\n"
              << "Install Options:\n"
              << "  -f, --force                Reinstall over an existing version\n"
              << "  -m, --metadata=KEY=VALUE   Store metadata with the plugin (repeatable)\n"
              << "      --no-fallback          Fail when the requested release has no build\n"
              << "                             for this platform\n"
              << "      --clean                Remove other versions after installing\n"
              << "\n"
              << "Update Options:\n"
              << "  -t, --to=VERSION           Target version or constraint, e.g. ^1.2\n"
              << "  -n, --dry-run              Report the update without installing it\n"
              << "\n"
              << "Remove and List Options:\n"
              << "      --keep-config          Keep plugin.metadata.json files on remove\n"
              << "  -a, --all                  List every installed version\n"
              << "      --available            List catalog plugins and what is installed\n"
              << "\n"
              << "Environment:\n"
              << "  PLUGDOCK_HOME, PLUGDOCK_PLUGIN_DIR, PLUGDOCK_CATALOG, PLUGDOCK_RELEASE_API,\n"
              << "  PLUGDOCK_HTTP_TIMEOUT, PLUGDOCK_LEGACY_PLUGIN_NAMES, GITHUB_TOKEN,\n"
              << "  PLUGDOCK_DEBUG, PLUGDOCK_DEBUG_FILE\n"
              << "\n"
              << "Examples:\n"
              << "  plugdock install aws-public@v1.2.0 -m region=us-west-2\n"
              << "  plugdock install github.com/acme/plugdock-plugin-azure@^2.0\n"
              << "  plugdock update aws-public --dry-run\n"
              << "  plugdock prune aws-public v1.2.0\n";
}
