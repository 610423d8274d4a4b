// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace netdash {
namespace util {

// Strict integer parse: the whole string must be a base-10 integer within
// [min, max]. Leading/trailing whitespace, signs on unsigned ranges and
// trailing garbage are rejected.
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

// Port in [1, 65535].
std::optional<uint16_t> SafeParsePort(const std::string& str);

std::string Trim(std::string_view s);
std::string ToLower(std::string_view s);

// Split on runs of ASCII whitespace; no empty tokens.
std::vector<std::string> SplitWhitespace(std::string_view s);

// Split into lines, accepting \n and \r\n.
std::vector<std::string> SplitLines(std::string_view s);

bool StartsWithAny(std::string_view s, const std::vector<std::string_view>& prefixes);

// Environment helpers.
// EnvFlag: true for "1", "true", "yes", "on" (case-insensitive).
bool EnvFlag(const char* name);
// EnvInt: positive integer override, otherwise default_value.
int EnvInt(const char* name, int default_value);

}  // namespace util
}  // namespace netdash
