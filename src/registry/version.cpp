/*
  version.cpp

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

#include "registry/version.h"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace plugdock {

namespace {

const std::regex& version_pattern() {
    static const std::regex pattern(
        R"(^v?(\d+)(?:\.(\d+))?(?:\.(\d+))?)"
        R"((?:-([0-9A-Za-z-]+(?:\.[0-9A-Za-z-]+)*))?)"
        R"((?:\+([0-9A-Za-z-]+(?:\.[0-9A-Za-z-]+)*))?$)");
    return pattern;
}

// like version_pattern, but each numeric component may be a wildcard
const std::regex& constraint_version_pattern() {
    static const std::regex pattern(
        R"(^v?(\d+|[xX*])(?:\.(\d+|[xX*]))?(?:\.(\d+|[xX*]))?)"
        R"((?:-([0-9A-Za-z-]+(?:\.[0-9A-Za-z-]+)*))?)"
        R"((?:\+([0-9A-Za-z-]+(?:\.[0-9A-Za-z-]+)*))?$)");
    return pattern;
}

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

bool is_numeric(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

bool is_wildcard(const std::string& text) {
    return text == "x" || text == "X" || text == "*";
}

bool parse_number(const std::string& text, std::uint64_t& out) {
    try {
        size_t consumed = 0;
        out = std::stoull(text, &consumed);
        return consumed == text.size();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream stream(text);
    while (std::getline(stream, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

// numeric identifiers must not carry leading zeros
bool valid_prerelease(const std::vector<std::string>& identifiers) {
    for (const auto& id : identifiers) {
        if (id.empty()) {
            return false;
        }
        if (is_numeric(id) && id.size() > 1 && id[0] == '0') {
            return false;
        }
    }
    return true;
}

int compare_identifier(const std::string& a, const std::string& b) {
    bool a_numeric = is_numeric(a);
    bool b_numeric = is_numeric(b);
    if (a_numeric && b_numeric) {
        if (a.size() != b.size()) {
            return a.size() < b.size() ? -1 : 1;
        }
        int cmp = a.compare(b);
        return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
    }
    if (a_numeric) {
        return -1;
    }
    if (b_numeric) {
        return 1;
    }
    int cmp = a.compare(b);
    return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}

int compare_number(std::uint64_t a, std::uint64_t b) {
    if (a == b) {
        return 0;
    }
    return a < b ? -1 : 1;
}

Version bump(const Version& base, int position) {
    Version next;
    next.major = base.major;
    if (position == 0) {
        next.major = base.major + 1;
    } else if (position == 1) {
        next.minor = base.minor + 1;
    } else {
        next.minor = base.minor;
        next.patch = base.patch + 1;
    }
    return next;
}

bool within(const Version& candidate, const Version& low, const Version& high) {
    return compare(candidate, low) >= 0 && compare(candidate, high) < 0;
}

const char* const kOperators[] = {"!=", ">=", "<=", "=<", "=>", "~>", "=", ">", "<", "~", "^"};

bool is_operator_only(const std::string& token) {
    for (const char* op : kOperators) {
        if (token == op) {
            return true;
        }
    }
    return false;
}

Result<VersionConstraint::Comparator> parse_comparator(const std::string& term) {
    using Op = VersionConstraint::Op;

    std::string op_text;
    for (const char* op : kOperators) {
        if (term.rfind(op, 0) == 0) {
            op_text = op;
            break;
        }
    }

    VersionConstraint::Comparator comparator;
    if (op_text.empty() || op_text == "=") {
        comparator.op = Op::EQUAL;
    } else if (op_text == "!=") {
        comparator.op = Op::NOT_EQUAL;
    } else if (op_text == ">") {
        comparator.op = Op::GREATER;
    } else if (op_text == ">=" || op_text == "=>") {
        comparator.op = Op::GREATER_EQUAL;
    } else if (op_text == "<") {
        comparator.op = Op::LESS;
    } else if (op_text == "<=" || op_text == "=<") {
        comparator.op = Op::LESS_EQUAL;
    } else if (op_text == "~" || op_text == "~>") {
        comparator.op = Op::TILDE;
    } else {
        comparator.op = Op::CARET;
    }

    std::string version_text = trim(term.substr(op_text.size()));
    std::smatch match;
    if (version_text.empty() ||
        !std::regex_match(version_text, match, constraint_version_pattern())) {
        return Result<VersionConstraint::Comparator>::error(
            ErrorType::INVALID_VERSION, "improper constraint: " + term);
    }

    comparator.precision = 0;
    std::uint64_t* parts[] = {&comparator.version.major, &comparator.version.minor,
                              &comparator.version.patch};
    for (int i = 0; i < 3; ++i) {
        std::string component = match[i + 1].str();
        if (component.empty() || is_wildcard(component)) {
            break;
        }
        if (!parse_number(component, *parts[i])) {
            return Result<VersionConstraint::Comparator>::error(
                ErrorType::INVALID_VERSION, "version component out of range: " + term);
        }
        comparator.precision = i + 1;
    }

    if (match[4].matched) {
        comparator.version.prerelease = split(match[4].str(), '.');
        if (!valid_prerelease(comparator.version.prerelease)) {
            return Result<VersionConstraint::Comparator>::error(
                ErrorType::INVALID_VERSION, "invalid prerelease in constraint: " + term);
        }
    }
    comparator.version.original = version_text;
    return Result<VersionConstraint::Comparator>::ok(comparator);
}

}  // namespace

std::string Version::str() const {
    std::string text =
        std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    if (!prerelease.empty()) {
        text += "-";
        for (size_t i = 0; i < prerelease.size(); ++i) {
            if (i > 0) {
                text += ".";
            }
            text += prerelease[i];
        }
    }
    if (!metadata.empty()) {
        text += "+" + metadata;
    }
    return text;
}

int compare(const Version& a, const Version& b) {
    int cmp = compare_number(a.major, b.major);
    if (cmp != 0) {
        return cmp;
    }
    cmp = compare_number(a.minor, b.minor);
    if (cmp != 0) {
        return cmp;
    }
    cmp = compare_number(a.patch, b.patch);
    if (cmp != 0) {
        return cmp;
    }

    if (a.prerelease.empty() && b.prerelease.empty()) {
        return 0;
    }
    if (a.prerelease.empty()) {
        return 1;
    }
    if (b.prerelease.empty()) {
        return -1;
    }

    size_t count = std::min(a.prerelease.size(), b.prerelease.size());
    for (size_t i = 0; i < count; ++i) {
        cmp = compare_identifier(a.prerelease[i], b.prerelease[i]);
        if (cmp != 0) {
            return cmp;
        }
    }
    return compare_number(a.prerelease.size(), b.prerelease.size());
}

Result<Version> parse_version(const std::string& text) {
    std::string input = trim(text);
    if (input.empty()) {
        return Result<Version>::error(ErrorType::INVALID_VERSION, "empty version string");
    }

    std::smatch match;
    if (!std::regex_match(input, match, version_pattern())) {
        return Result<Version>::error(ErrorType::INVALID_VERSION,
                                      "invalid semantic version: " + text);
    }

    Version version;
    version.original = text;
    std::uint64_t* parts[] = {&version.major, &version.minor, &version.patch};
    for (int i = 0; i < 3; ++i) {
        if (match[i + 1].matched && !parse_number(match[i + 1].str(), *parts[i])) {
            return Result<Version>::error(ErrorType::INVALID_VERSION,
                                          "version component out of range: " + text);
        }
    }

    if (match[4].matched) {
        version.prerelease = split(match[4].str(), '.');
        if (!valid_prerelease(version.prerelease)) {
            return Result<Version>::error(ErrorType::INVALID_VERSION,
                                          "invalid prerelease identifier: " + text);
        }
    }
    if (match[5].matched) {
        version.metadata = match[5].str();
    }
    return Result<Version>::ok(version);
}

bool is_valid_version(const std::string& text) {
    return parse_version(text).is_ok();
}

Result<int> compare_versions(const std::string& a, const std::string& b) {
    auto left = parse_version(a);
    if (left.is_error()) {
        return plugdock_filesystem::propagate<int>(left);
    }
    auto right = parse_version(b);
    if (right.is_error()) {
        return plugdock_filesystem::propagate<int>(right);
    }
    return Result<int>::ok(compare(left.value(), right.value()));
}

bool VersionConstraint::Comparator::check(const Version& candidate) const {
    const Version& low = version;
    switch (op) {
        case Op::EQUAL:
            if (precision == 3) {
                return compare(candidate, low) == 0;
            }
            return precision == 0 || within(candidate, low, bump(low, precision - 1));
        case Op::NOT_EQUAL:
            if (precision == 3) {
                return compare(candidate, low) != 0;
            }
            return precision != 0 && !within(candidate, low, bump(low, precision - 1));
        case Op::GREATER:
            if (precision == 3) {
                return compare(candidate, low) > 0;
            }
            return precision != 0 && compare(candidate, bump(low, precision - 1)) >= 0;
        case Op::GREATER_EQUAL:
            return compare(candidate, low) >= 0;
        case Op::LESS:
            return precision != 0 && compare(candidate, low) < 0;
        case Op::LESS_EQUAL:
            if (precision == 3) {
                return compare(candidate, low) <= 0;
            }
            return precision == 0 || compare(candidate, bump(low, precision - 1)) < 0;
        case Op::TILDE:
            if (precision == 0) {
                return true;
            }
            return within(candidate, low, bump(low, precision == 1 ? 0 : 1));
        case Op::CARET:
            if (precision == 0) {
                return true;
            }
            if (low.major > 0 || precision == 1) {
                return within(candidate, low, bump(low, 0));
            }
            if (low.minor > 0 || precision == 2) {
                return within(candidate, low, bump(low, 1));
            }
            return within(candidate, low, bump(low, 2));
    }
    return false;
}

bool VersionConstraint::check(const Version& candidate) const {
    for (const auto& group : groups_) {
        bool mentions_prerelease = false;
        for (const auto& comparator : group) {
            if (comparator.version.is_prerelease()) {
                mentions_prerelease = true;
                break;
            }
        }
        // pre-release versions only match groups that ask for one
        if (candidate.is_prerelease() && !mentions_prerelease) {
            continue;
        }

        bool all = true;
        for (const auto& comparator : group) {
            if (!comparator.check(candidate)) {
                all = false;
                break;
            }
        }
        if (all) {
            return true;
        }
    }
    return false;
}

Result<VersionConstraint> parse_version_constraint(const std::string& text) {
    std::string input = trim(text);
    if (input.empty()) {
        return Result<VersionConstraint>::error(ErrorType::INVALID_VERSION,
                                                "empty version constraint");
    }

    VersionConstraint constraint;
    constraint.text_ = input;

    size_t start = 0;
    while (start <= input.size()) {
        size_t bar = input.find("||", start);
        std::string group_text =
            trim(input.substr(start, bar == std::string::npos ? std::string::npos : bar - start));
        if (group_text.empty()) {
            return Result<VersionConstraint>::error(ErrorType::INVALID_VERSION,
                                                    "empty alternative in constraint: " + text);
        }

        for (char& c : group_text) {
            if (c == ',') {
                c = ' ';
            }
        }

        // operators may be separated from their version by whitespace
        std::vector<std::string> terms;
        std::istringstream tokens(group_text);
        std::string token;
        std::string pending_operator;
        while (tokens >> token) {
            if (is_operator_only(token)) {
                if (!pending_operator.empty()) {
                    return Result<VersionConstraint>::error(ErrorType::INVALID_VERSION,
                                                            "improper constraint: " + text);
                }
                pending_operator = token;
                continue;
            }
            terms.push_back(pending_operator + token);
            pending_operator.clear();
        }
        if (!pending_operator.empty()) {
            return Result<VersionConstraint>::error(ErrorType::INVALID_VERSION,
                                                    "dangling operator in constraint: " + text);
        }

        std::vector<VersionConstraint::Comparator> group;
        for (size_t i = 0; i < terms.size(); ++i) {
            if (i + 2 < terms.size() && terms[i + 1] == "-") {
                auto lower = parse_comparator(">=" + terms[i]);
                auto upper = parse_comparator("<=" + terms[i + 2]);
                if (lower.is_error() || upper.is_error()) {
                    return Result<VersionConstraint>::error(
                        ErrorType::INVALID_VERSION, "improper hyphen range in constraint: " + text);
                }
                group.push_back(lower.value());
                group.push_back(upper.value());
                i += 2;
                continue;
            }
            auto comparator = parse_comparator(terms[i]);
            if (comparator.is_error()) {
                return plugdock_filesystem::propagate<VersionConstraint>(comparator);
            }
            group.push_back(comparator.value());
        }
        constraint.groups_.push_back(group);

        if (bar == std::string::npos) {
            break;
        }
        start = bar + 2;
    }

    return Result<VersionConstraint>::ok(constraint);
}

Result<bool> satisfies_constraint(const std::string& version,
                                  const VersionConstraint& constraint) {
    auto parsed = parse_version(version);
    if (parsed.is_error()) {
        return plugdock_filesystem::propagate<bool>(parsed);
    }
    return Result<bool>::ok(constraint.check(parsed.value()));
}

bool looks_like_constraint(const std::string& text) {
    if (is_valid_version(text)) {
        return false;
    }
    return parse_version_constraint(text).is_ok();
}

}  // namespace plugdock
