// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <string>

/**
 * 256-bit unsigned integer for proof-of-work arithmetic (targets and chain
 * work). Wraps boost::multiprecision::uint256_t with the modular (wrapping)
 * semantics block work calculations rely on.
 */
class arith_uint256 {
public:
  using value_type = boost::multiprecision::uint256_t;

  arith_uint256() = default;
  arith_uint256(uint64_t v) : value_(v) {}
  explicit arith_uint256(const value_type &v) : value_(v) {}

  /**
   * Decode a compact ("nBits") target:
   *   exponent = nCompact >> 24, mantissa = nCompact & 0x007fffff,
   *   target = mantissa * 256^(exponent - 3).
   * Bit 0x00800000 is a sign bit; pfNegative reports it for a non-zero
   * mantissa. pfOverflow reports targets that do not fit in 256 bits.
   */
  arith_uint256 &SetCompact(uint32_t nCompact, bool *pfNegative = nullptr,
                            bool *pfOverflow = nullptr);

  // Inverse of SetCompact (normalized, sign bit never set)
  uint32_t GetCompact() const;

  // 64 lowercase hex digits, most significant first
  std::string GetHex() const;
  std::string ToString() const { return GetHex(); }

  double getdouble() const { return value_.convert_to<double>(); }

  // Number of significant bits (0 for zero)
  unsigned int bits() const;

  const value_type &value() const { return value_; }

  arith_uint256 operator~() const { return arith_uint256(value_type(~value_)); }

  arith_uint256 &operator+=(const arith_uint256 &b) {
    value_ += b.value_;
    return *this;
  }
  arith_uint256 &operator-=(const arith_uint256 &b) {
    value_ -= b.value_;
    return *this;
  }

  friend arith_uint256 operator+(arith_uint256 a, const arith_uint256 &b) {
    return a += b;
  }
  friend arith_uint256 operator-(arith_uint256 a, const arith_uint256 &b) {
    return a -= b;
  }
  friend arith_uint256 operator/(const arith_uint256 &a, const arith_uint256 &b) {
    return arith_uint256(value_type(a.value_ / b.value_));
  }
  friend arith_uint256 operator<<(const arith_uint256 &a, unsigned int shift) {
    return arith_uint256(value_type(a.value_ << shift));
  }

  friend bool operator==(const arith_uint256 &a, const arith_uint256 &b) {
    return a.value_ == b.value_;
  }
  friend bool operator!=(const arith_uint256 &a, const arith_uint256 &b) {
    return a.value_ != b.value_;
  }
  friend bool operator<(const arith_uint256 &a, const arith_uint256 &b) {
    return a.value_ < b.value_;
  }
  friend bool operator<=(const arith_uint256 &a, const arith_uint256 &b) {
    return a.value_ <= b.value_;
  }
  friend bool operator>(const arith_uint256 &a, const arith_uint256 &b) {
    return a.value_ > b.value_;
  }
  friend bool operator>=(const arith_uint256 &a, const arith_uint256 &b) {
    return a.value_ >= b.value_;
  }

private:
  value_type value_{0};
};
