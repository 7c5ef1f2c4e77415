// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

namespace ser {

// Largest length prefix accepted while decoding (matches Bitcoin's MAX_SIZE)
static constexpr uint64_t MAX_SIZE = 0x02000000;

inline uint32_t byteswap32(uint32_t x) {
  return ((x >> 24) & 0x000000FF) | ((x >> 8) & 0x0000FF00) |
         ((x << 8) & 0x00FF0000) | ((x << 24) & 0xFF000000);
}

inline uint64_t byteswap64(uint64_t x) {
  return (static_cast<uint64_t>(byteswap32(static_cast<uint32_t>(x))) << 32) |
         byteswap32(static_cast<uint32_t>(x >> 32));
}

inline uint16_t ReadLE16(const uint8_t *ptr) {
  return static_cast<uint16_t>(ptr[0] | (ptr[1] << 8));
}

inline uint32_t ReadLE32(const uint8_t *ptr) {
  uint32_t v;
  std::memcpy(&v, ptr, sizeof(v));
  if constexpr (std::endian::native == std::endian::big) {
    v = byteswap32(v);
  }
  return v;
}

inline uint64_t ReadLE64(const uint8_t *ptr) {
  uint64_t v;
  std::memcpy(&v, ptr, sizeof(v));
  if constexpr (std::endian::native == std::endian::big) {
    v = byteswap64(v);
  }
  return v;
}

inline void WriteLE32(uint8_t *ptr, uint32_t v) {
  if constexpr (std::endian::native == std::endian::big) {
    v = byteswap32(v);
  }
  std::memcpy(ptr, &v, sizeof(v));
}

inline void WriteLE64(uint8_t *ptr, uint64_t v) {
  if constexpr (std::endian::native == std::endian::big) {
    v = byteswap64(v);
  }
  std::memcpy(ptr, &v, sizeof(v));
}

// Number of bytes CompactSize uses for a value: 1, 3, 5 or 9
size_t GetCompactSizeLength(uint64_t value);

/**
 * Append-only buffer for wire serialization (all scalars little-endian)
 */
class Writer {
public:
  Writer() = default;
  explicit Writer(size_t reserve) { buffer_.reserve(reserve); }

  void write_uint8(uint8_t value) { buffer_.push_back(value); }
  void write_uint16(uint16_t value);
  void write_uint32(uint32_t value);
  void write_uint64(uint64_t value);
  void write_int32(int32_t value) { write_uint32(static_cast<uint32_t>(value)); }
  void write_int64(int64_t value) { write_uint64(static_cast<uint64_t>(value)); }

  void write_compact_size(uint64_t value);
  void write_bytes(std::span<const uint8_t> bytes);
  // CompactSize length prefix followed by the bytes
  void write_var_bytes(std::span<const uint8_t> bytes);
  void write_hash(const uint256 &hash) { write_bytes({hash.begin(), hash.size()}); }

  const std::vector<uint8_t> &data() const { return buffer_; }
  std::vector<uint8_t> release() { return std::move(buffer_); }
  size_t size() const { return buffer_.size(); }

private:
  std::vector<uint8_t> buffer_;
};

/**
 * Bounds-checked cursor over a byte range.
 *
 * A read that would run past the end sets the error flag and returns a zero
 * value; all later reads fail too. Callers check has_error() once after a
 * group of reads. error_reason() says which rule tripped first.
 */
class Reader {
public:
  explicit Reader(std::span<const uint8_t> data) : data_(data) {}

  uint8_t read_uint8();
  uint16_t read_uint16();
  uint32_t read_uint32();
  uint64_t read_uint64();
  int32_t read_int32() { return static_cast<int32_t>(read_uint32()); }
  int64_t read_int64() { return static_cast<int64_t>(read_uint64()); }

  // Canonical CompactSize no larger than MAX_SIZE
  uint64_t read_compact_size();

  uint256 read_hash();
  std::vector<uint8_t> read_bytes(size_t count);
  // Length-prefixed bytes; the length may not exceed what is left
  std::vector<uint8_t> read_var_bytes();

  // Read a CompactSize element count where each element needs at least
  // min_element_size bytes; counts that cannot fit in the rest are errors
  uint64_t read_count(size_t min_element_size);

  size_t bytes_remaining() const { return data_.size() - position_; }
  size_t position() const { return position_; }
  bool has_error() const { return error_ != nullptr; }
  const char *error_reason() const { return error_ ? error_ : ""; }

  // Record a caller-level format error (first reason wins)
  void set_error(const char *reason) {
    if (!error_)
      error_ = reason;
  }

private:
  bool check_available(size_t bytes);

  std::span<const uint8_t> data_;
  size_t position_{0};
  const char *error_{nullptr};
};

} // namespace ser
