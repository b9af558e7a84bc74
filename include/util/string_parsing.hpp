// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of command-line and shell input to numeric types
 - Consistent error handling across the CLI, the shell and teleop

 Key functions:
 - SafeParseInt / SafeParseInt64: integers with bounds checking
 - SafeParsePort: port number (1-65535)
 - SafeParseDouble: finite floating point value
 - SafeParseBool: true/false/1/0/yes/no
 - SplitCommandLine: shell-style tokenizer with quote support

 All parsers validate that the entire input is consumed and return
 std::nullopt on any error (no exceptions thrown).
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace almond {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse port number string (1-65535)
 *
 * Examples:
 *   SafeParsePort("8000") -> 8000
 *   SafeParsePort("0") -> std::nullopt (port 0 invalid)
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

/**
 * Parse int64_t string with bounds checking
 */
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

/**
 * Parse a finite double ("1.5", "-20", "3e2")
 * NaN and infinities are rejected.
 */
std::optional<double> SafeParseDouble(const std::string& str);

/**
 * Parse a boolean flag (true/false, 1/0, yes/no; case-insensitive)
 */
std::optional<bool> SafeParseBool(const std::string& str);

/**
 * Split a command line into tokens. Whitespace separates tokens; single or
 * double quotes group words ("is the cup on the table?" is one token).
 *
 * @return tokens, or std::nullopt if a quote is left unterminated
 */
std::optional<std::vector<std::string>> SplitCommandLine(const std::string& line);

} // namespace util
} // namespace almond
