// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <cctype>
#include <stdexcept>

namespace chainquery {
namespace util {

namespace {

// Leading whitespace is accepted by std::stoll; reject it up front
bool HasParsableStart(const std::string &str) {
  return !str.empty() && !std::isspace(static_cast<unsigned char>(str[0]));
}

std::optional<long long> ParseWhole(const std::string &str) {
  if (!HasParsableStart(str)) {
    return std::nullopt;
  }
  try {
    size_t pos = 0;
    long long value = std::stoll(str, &pos);
    if (pos != str.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::invalid_argument &) {
    return std::nullopt;
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

} // namespace

std::optional<int> SafeParseInt(const std::string &str, int min, int max) {
  auto value = ParseWhole(str);
  if (!value || *value < min || *value > max) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<uint16_t> SafeParsePort(const std::string &str) {
  auto value = ParseWhole(str);
  if (!value || *value < 1 || *value > 65535) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<int64_t> SafeParseInt64(const std::string &str, int64_t min,
                                      int64_t max) {
  auto value = ParseWhole(str);
  if (!value || *value < min || *value > max) {
    return std::nullopt;
  }
  return static_cast<int64_t>(*value);
}

bool IsValidHex(std::string_view str) {
  if (str.empty()) {
    return false;
  }
  for (char c : str) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

std::optional<uint256> SafeParseHash(std::string_view str) {
  if (str.size() != 64 || !IsValidHex(str)) {
    return std::nullopt;
  }
  return uint256::FromHex(str);
}

std::string HexStr(std::span<const uint8_t> bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0f]);
  }
  return out;
}

std::vector<std::string> SplitString(std::string_view str, char sep) {
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos <= str.size()) {
    size_t next = str.find(sep, pos);
    if (next == std::string_view::npos) {
      next = str.size();
    }
    if (next > pos) {
      out.emplace_back(str.substr(pos, next - pos));
    }
    pos = next + 1;
  }
  return out;
}

} // namespace util
} // namespace chainquery
