// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/arith_uint256.hpp"

arith_uint256 &arith_uint256::SetCompact(uint32_t nCompact, bool *pfNegative,
                                         bool *pfOverflow) {
  const int nSize = static_cast<int>(nCompact >> 24);
  uint32_t nWord = nCompact & 0x007fffff;

  const bool overflow = nWord != 0 && ((nSize > 34) ||
                                       (nWord > 0xff && nSize > 33) ||
                                       (nWord > 0xffff && nSize > 32));

  if (nSize <= 3) {
    nWord >>= 8 * (3 - nSize);
    value_ = nWord;
  } else if (overflow) {
    value_ = 0;
  } else {
    // nSize <= 34 here, so the shift stays below 256 bits
    value_ = value_type(nWord) << (8 * (nSize - 3));
  }

  if (pfNegative)
    *pfNegative = nWord != 0 && (nCompact & 0x00800000) != 0;
  if (pfOverflow)
    *pfOverflow = overflow;
  return *this;
}

unsigned int arith_uint256::bits() const {
  if (value_ == 0)
    return 0;
  return static_cast<unsigned int>(boost::multiprecision::msb(value_)) + 1;
}

uint32_t arith_uint256::GetCompact() const {
  int nSize = static_cast<int>((bits() + 7) / 8);
  uint32_t nCompact = 0;
  if (nSize <= 3) {
    nCompact = value_.convert_to<uint32_t>() << (8 * (3 - nSize));
  } else {
    value_type shifted = value_ >> (8 * (nSize - 3));
    nCompact = shifted.convert_to<uint32_t>();
  }
  // The 0x00800000 bit denotes the sign; if it is set, divide the mantissa
  // by 256 and bump the exponent
  if (nCompact & 0x00800000) {
    nCompact >>= 8;
    nSize++;
  }
  nCompact |= static_cast<uint32_t>(nSize) << 24;
  return nCompact;
}

std::string arith_uint256::GetHex() const {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(64, '0');
  value_type v = value_;
  for (int i = 63; i >= 0 && v != 0; --i) {
    out[i] = kHex[value_type(v & 0x0f).convert_to<unsigned>()];
    v >>= 4;
  }
  return out;
}
