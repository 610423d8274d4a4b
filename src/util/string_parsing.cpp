// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>

namespace netdash {
namespace util {

namespace {

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  if (str.empty() || IsSpace(str.front()) || IsSpace(str.back())) {
    return std::nullopt;
  }
  if (str.front() == '+') {
    return std::nullopt;
  }

  int64_t value = 0;
  const char* begin = str.data();
  const char* end = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  if (value < min || value > max) {
    return std::nullopt;
  }
  return static_cast<int>(value);
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto v = SafeParseInt(str, 1, 65535);
  if (!v) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*v);
}

std::string Trim(std::string_view s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && IsSpace(s[b]))
    ++b;
  while (e > b && IsSpace(s[e - 1]))
    --e;
  return std::string(s.substr(b, e - b));
}

std::string ToLower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::vector<std::string> SplitWhitespace(std::string_view s) {
  std::vector<std::string> out;
  size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && IsSpace(s[i]))
      ++i;
    size_t start = i;
    while (i < s.size() && !IsSpace(s[i]))
      ++i;
    if (i > start) {
      out.emplace_back(s.substr(start, i - start));
    }
  }
  return out;
}

std::vector<std::string> SplitLines(std::string_view s) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= s.size()) {
    size_t nl = s.find('\n', start);
    if (nl == std::string_view::npos) {
      if (start < s.size()) {
        out.emplace_back(s.substr(start));
      }
      break;
    }
    std::string_view line = s.substr(start, nl - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    out.emplace_back(line);
    start = nl + 1;
  }
  if (!out.empty() && !out.back().empty() && out.back().back() == '\r') {
    out.back().pop_back();
  }
  return out;
}

bool StartsWithAny(std::string_view s, const std::vector<std::string_view>& prefixes) {
  return std::any_of(prefixes.begin(), prefixes.end(), [&](std::string_view p) { return s.starts_with(p); });
}

bool EnvFlag(const char* name) {
  const char* raw = std::getenv(name);
  if (raw == nullptr) {
    return false;
  }
  const std::string v = ToLower(Trim(raw));
  return v == "1" || v == "true" || v == "yes" || v == "on";
}

int EnvInt(const char* name, int default_value) {
  const char* raw = std::getenv(name);
  if (raw == nullptr) {
    return default_value;
  }
  auto parsed = SafeParseInt(raw, 1, std::numeric_limits<int>::max());
  return parsed ? *parsed : default_value;
}

}  // namespace util
}  // namespace netdash
