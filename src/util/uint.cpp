// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/uint.hpp"

namespace {

int HexDigit(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

constexpr char kHexChars[] = "0123456789abcdef";

} // namespace

template <unsigned int BITS> std::string base_blob<BITS>::GetHex() const {
  std::string out;
  out.reserve(WIDTH * 2);
  for (int i = WIDTH - 1; i >= 0; --i) {
    out.push_back(kHexChars[m_data[i] >> 4]);
    out.push_back(kHexChars[m_data[i] & 0x0f]);
  }
  return out;
}

template <unsigned int BITS> std::string base_blob<BITS>::ToString() const {
  return GetHex();
}

template <unsigned int BITS>
bool base_blob<BITS>::SetHex(std::string_view str) {
  SetNull();

  if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
    str.remove_prefix(2);
  }
  if (str.size() > static_cast<size_t>(WIDTH) * 2) {
    return false;
  }
  for (char c : str) {
    if (HexDigit(c) < 0) {
      return false;
    }
  }

  // Least significant digit is at the end of the string and lands in m_data[0]
  size_t byte = 0;
  for (size_t i = str.size(); i > 0; byte++) {
    uint8_t value = static_cast<uint8_t>(HexDigit(str[--i]));
    if (i > 0) {
      value |= static_cast<uint8_t>(HexDigit(str[--i]) << 4);
    }
    m_data[byte] = value;
  }
  return true;
}

template class base_blob<256>;

std::optional<uint256> uint256::FromHex(std::string_view str) {
  if (str.size() != uint256::size() * 2) {
    return std::nullopt;
  }
  for (char c : str) {
    if (HexDigit(c) < 0) {
      return std::nullopt;
    }
  }
  uint256 out;
  if (!out.SetHex(str)) {
    return std::nullopt;
  }
  return out;
}

const uint256 uint256::ZERO(0);
const uint256 uint256::ONE(1);
