// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace almond {
namespace util {

namespace {

bool HasLeadingSpaceOrEmpty(const std::string& str) {
  return str.empty() || std::isspace(static_cast<unsigned char>(str[0]));
}

} // namespace

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  auto value = SafeParseInt64(str, min, max);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = SafeParseInt64(str, 1, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max) {
  try {
    if (HasLeadingSpaceOrEmpty(str)) {
      return std::nullopt;
    }

    size_t pos = 0;
    long long value = std::stoll(str, &pos);

    // Check entire string was consumed
    if (pos != str.size()) {
      return std::nullopt;
    }

    if (value < min || value > max) {
      return std::nullopt;
    }

    return static_cast<int64_t>(value);
  } catch (const std::exception&) {
    // std::invalid_argument or std::out_of_range
    return std::nullopt;
  }
}

std::optional<double> SafeParseDouble(const std::string& str) {
  try {
    if (HasLeadingSpaceOrEmpty(str)) {
      return std::nullopt;
    }

    size_t pos = 0;
    double value = std::stod(str, &pos);

    if (pos != str.size() || !std::isfinite(value)) {
      return std::nullopt;
    }

    return value;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::optional<bool> SafeParseBool(const std::string& str) {
  std::string lower(str);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "true" || lower == "1" || lower == "yes") {
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no") {
    return false;
  }
  return std::nullopt;
}

std::optional<std::vector<std::string>> SplitCommandLine(const std::string& line) {
  std::vector<std::string> tokens;
  std::string current;
  bool in_token = false;
  char quote = '\0';

  for (char c : line) {
    if (quote != '\0') {
      if (c == quote) {
        quote = '\0';
      } else {
        current.push_back(c);
      }
      continue;
    }

    if (c == '"' || c == '\'') {
      quote = c;
      in_token = true;
    } else if (std::isspace(static_cast<unsigned char>(c))) {
      if (in_token) {
        tokens.push_back(current);
        current.clear();
        in_token = false;
      }
    } else {
      current.push_back(c);
      in_token = true;
    }
  }

  if (quote != '\0') {
    return std::nullopt;
  }
  if (in_token) {
    tokens.push_back(current);
  }
  return tokens;
}

} // namespace util
} // namespace almond
