/*
  specifier.cpp

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

#include "registry/specifier.h"

#include <cctype>

#include "registry/version.h"

namespace plugdock {

namespace {

bool strip_prefix(std::string& text, const std::string& prefix) {
    if (text.compare(0, prefix.size(), prefix) == 0) {
        text.erase(0, prefix.size());
        return true;
    }
    return false;
}

bool valid_path_part(const std::string& part) {
    if (part.empty() || part[0] == '.') {
        return false;
    }
    for (char c : part) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '.' && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

Result<PluginSpecifier> invalid(const std::string& text, const std::string& reason) {
    return Result<PluginSpecifier>::error(ErrorType::INVALID_SPECIFIER,
                                          "invalid plugin specifier '" + text + "': " + reason);
}

}  // namespace

bool is_valid_plugin_name(const std::string& name) {
    return valid_path_part(name);
}

std::string plugin_name_from_repo(const std::string& repo) {
    std::string prefix = kPluginRepoPrefix;
    if (repo.size() > prefix.size() && repo.compare(0, prefix.size(), prefix) == 0) {
        return repo.substr(prefix.size());
    }
    return repo;
}

bool PluginSpecifier::has_constraint() const {
    return !version.empty() && !is_valid_version(version);
}

std::string PluginSpecifier::str() const {
    std::string text = is_url ? owner + "/" + repo : name;
    if (!version.empty()) {
        text += "@" + version;
    }
    return text;
}

Result<PluginSpecifier> parse_plugin_specifier(const std::string& text) {
    size_t first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return invalid(text, "empty specifier");
    }
    size_t last = text.find_last_not_of(" \t");
    std::string rest = text.substr(first, last - first + 1);

    bool had_host = false;
    if (strip_prefix(rest, "https://") || strip_prefix(rest, "http://")) {
        if (!strip_prefix(rest, "github.com/")) {
            return invalid(text, "only github.com URLs are supported");
        }
        had_host = true;
    } else if (strip_prefix(rest, "github.com/")) {
        had_host = true;
    }

    PluginSpecifier spec;
    size_t at = rest.rfind('@');
    if (at != std::string::npos) {
        spec.version = rest.substr(at + 1);
        rest.erase(at);
        if (spec.version.empty()) {
            return invalid(text, "empty version after '@'");
        }
        if (!is_valid_version(spec.version) && !looks_like_constraint(spec.version)) {
            return invalid(text, "'" + spec.version + "' is neither a version nor a constraint");
        }
    }

    while (!rest.empty() && rest.back() == '/') {
        rest.pop_back();
    }

    size_t slash = rest.find('/');
    if (slash == std::string::npos) {
        if (had_host) {
            return invalid(text, "expected owner/repo after github.com/");
        }
        if (!valid_path_part(rest)) {
            return invalid(text, "plugin names may only contain letters, digits, '.', '_' and '-'");
        }
        spec.name = rest;
        return Result<PluginSpecifier>::ok(spec);
    }

    std::string owner = rest.substr(0, slash);
    std::string repo = rest.substr(slash + 1);
    if (repo.find('/') != std::string::npos) {
        return invalid(text, "expected exactly owner/repo");
    }
    if (repo.size() > 4 && repo.compare(repo.size() - 4, 4, ".git") == 0) {
        repo.erase(repo.size() - 4);
    }
    if (owner.empty() || repo.empty()) {
        return invalid(text, "owner and repository must not be empty");
    }
    if (!valid_path_part(owner) || !valid_path_part(repo)) {
        return invalid(text, "owner and repository may only contain letters, digits, '.', '_' and '-'");
    }

    spec.owner = owner;
    spec.repo = repo;
    spec.name = plugin_name_from_repo(repo);
    spec.is_url = true;
    return Result<PluginSpecifier>::ok(spec);
}

}  // namespace plugdock
