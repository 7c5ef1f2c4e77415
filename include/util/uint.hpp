// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>

/**
 * Fixed-size opaque byte blob used for block hashes, txids and merkle roots.
 *
 * Bytes are stored in wire (internal) order. GetHex()/SetHex() use the
 * reversed "display" order that block explorers and the REST interface
 * show, so the genesis block hash prints as 000000000019d6...
 */
template <unsigned int BITS> class base_blob {
protected:
  static constexpr int WIDTH = BITS / 8;
  static_assert(BITS % 8 == 0, "base_blob only supports whole bytes");
  std::array<uint8_t, WIDTH> m_data;

public:
  constexpr base_blob() : m_data() {}

  /* constructor for constants between 1 and 255 */
  constexpr explicit base_blob(uint8_t v) : m_data{v} {}

  // Copies min(size, WIDTH) bytes; shorter input leaves the tail zeroed
  explicit base_blob(std::span<const uint8_t> bytes) : m_data() {
    std::copy_n(bytes.begin(), std::min<size_t>(bytes.size(), WIDTH),
                m_data.begin());
  }

  constexpr bool IsNull() const {
    return std::all_of(m_data.begin(), m_data.end(),
                       [](uint8_t val) { return val == 0; });
  }

  constexpr void SetNull() { std::fill(m_data.begin(), m_data.end(), 0); }

  // Lexicographic over the stored (wire order) bytes
  int Compare(const base_blob &other) const {
    return std::memcmp(m_data.data(), other.m_data.data(), WIDTH);
  }

  friend bool operator==(const base_blob &a, const base_blob &b) {
    return a.Compare(b) == 0;
  }
  friend bool operator!=(const base_blob &a, const base_blob &b) {
    return a.Compare(b) != 0;
  }
  friend bool operator<(const base_blob &a, const base_blob &b) {
    return a.Compare(b) < 0;
  }

  // Display-order hex (bytes reversed)
  std::string GetHex() const;
  std::string ToString() const;

  // Parse display-order hex. Accepts an optional "0x" prefix. Returns false
  // (and leaves the blob null) on a non-hex character or too many digits.
  bool SetHex(std::string_view str);

  constexpr const uint8_t *data() const { return m_data.data(); }
  constexpr uint8_t *data() { return m_data.data(); }

  constexpr uint8_t *begin() { return m_data.data(); }
  constexpr uint8_t *end() { return m_data.data() + WIDTH; }
  constexpr const uint8_t *begin() const { return m_data.data(); }
  constexpr const uint8_t *end() const { return m_data.data() + WIDTH; }

  static constexpr unsigned int size() { return WIDTH; }

  // Little-endian 64-bit word at word position pos (used for hashing)
  uint64_t GetUint64(int pos) const {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
      v = (v << 8) | m_data[pos * 8 + i];
    }
    return v;
  }
};

/** 256-bit opaque blob: block hashes, txids, merkle roots. */
class uint256 : public base_blob<256> {
public:
  constexpr uint256() = default;
  constexpr explicit uint256(uint8_t v) : base_blob<256>(v) {}
  explicit uint256(std::span<const uint8_t> bytes) : base_blob<256>(bytes) {}

  // Strict parse of display-order hex; nullopt unless the string is
  // exactly 64 hex digits
  static std::optional<uint256> FromHex(std::string_view str);

  static const uint256 ZERO;
  static const uint256 ONE;
};

/* uint256 from display-order hex. Lenient: invalid input yields ZERO. */
inline uint256 uint256S(std::string_view str) {
  uint256 rv;
  if (!rv.SetHex(str)) {
    rv.SetNull();
  }
  return rv;
}

// Hash functor for unordered containers keyed by uint256 (first 64-bit word)
struct Uint256Hasher {
  size_t operator()(const uint256 &hash) const noexcept {
    return static_cast<size_t>(hash.GetUint64(0));
  }
};
