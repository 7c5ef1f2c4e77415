// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Validation of untrusted text: command-line options and HTTP query strings.
 Every parser consumes the whole input (no trailing garbage), checks bounds
 and reports failure as std::nullopt instead of throwing.
*/

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "util/uint.hpp"

namespace chainquery {
namespace util {

/**
 * Parse a decimal integer in [min, max].
 *
 *   SafeParseInt("42", 0, 100)  -> 42
 *   SafeParseInt("42x", 0, 100) -> std::nullopt
 *   SafeParseInt("", 0, 100)    -> std::nullopt
 */
std::optional<int> SafeParseInt(const std::string &str, int min, int max);

/**
 * Parse a TCP port number in [1, 65535].
 */
std::optional<uint16_t> SafeParsePort(const std::string &str);

std::optional<int64_t> SafeParseInt64(const std::string &str, int64_t min,
                                      int64_t max);

// true if non-empty and every character is [0-9a-fA-F]
bool IsValidHex(std::string_view str);

/**
 * Parse a 64-character hex hash in display order (as printed by
 * uint256::GetHex()). Anything else, including a "0x" prefix, is rejected.
 */
std::optional<uint256> SafeParseHash(std::string_view str);

// Lowercase hex of raw bytes in the given order
std::string HexStr(std::span<const uint8_t> bytes);

// Split on a single character; empty fields are dropped
std::vector<std::string> SplitString(std::string_view str, char sep);

} // namespace util
} // namespace chainquery
