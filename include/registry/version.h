/*
  version.h

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
#include <string>
#include <vector>

#include "utils/plugdock_filesystem.h"

namespace plugdock {

using plugdock_filesystem::Result;

// Semantic version. A leading 'v' is accepted and partial versions such as
// "1" or "1.2" are filled with zeros. Build metadata is kept but never
// takes part in comparison.
struct Version {
    std::uint64_t major = 0;
    std::uint64_t minor = 0;
    std::uint64_t patch = 0;
    std::vector<std::string> prerelease;
    std::string metadata;
    std::string original;

    bool is_prerelease() const {
        return !prerelease.empty();
    }

    std::string str() const;
};

// -1, 0 or 1. Pre-release versions sort below the matching release.
int compare(const Version& a, const Version& b);

Result<Version> parse_version(const std::string& text);

bool is_valid_version(const std::string& text);

Result<int> compare_versions(const std::string& a, const std::string& b);

// A disjunction of comparator groups: "a, b || c" is (a AND b) OR c.
// Supported operators: = != > < >= <= ~ ~> ^, wildcards x X * and
// hyphen ranges "1.2 - 1.4.5".
class VersionConstraint {
   public:
    enum class Op : std::uint8_t {
        EQUAL,
        NOT_EQUAL,
        GREATER,
        GREATER_EQUAL,
        LESS,
        LESS_EQUAL,
        TILDE,
        CARET
    };

    struct Comparator {
        Op op = Op::EQUAL;
        Version version;
        // number of explicitly given components (0 for "*", 3 for a full version)
        int precision = 3;

        bool check(const Version& candidate) const;
    };

    bool check(const Version& candidate) const;

    const std::string& text() const {
        return text_;
    }

   private:
    friend Result<VersionConstraint> parse_version_constraint(const std::string& text);

    std::string text_;
    std::vector<std::vector<Comparator>> groups_;
};

Result<VersionConstraint> parse_version_constraint(const std::string& text);

// version must be a valid version; an invalid one is an error, not a mismatch
Result<bool> satisfies_constraint(const std::string& version, const VersionConstraint& constraint);

// True when the text is a constraint expression rather than a single exact
// version (contains an operator, wildcard, range or alternative).
bool looks_like_constraint(const std::string& text);

}  // namespace plugdock
