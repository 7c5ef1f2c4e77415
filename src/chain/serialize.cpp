// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/serialize.hpp"
#include <algorithm>

namespace ser {

size_t GetCompactSizeLength(uint64_t value) {
  if (value < 0xfd)
    return 1;
  if (value <= 0xffff)
    return 3;
  if (value <= 0xffffffff)
    return 5;
  return 9;
}

// Writer

void Writer::write_uint16(uint16_t value) {
  buffer_.push_back(static_cast<uint8_t>(value));
  buffer_.push_back(static_cast<uint8_t>(value >> 8));
}

void Writer::write_uint32(uint32_t value) {
  uint8_t tmp[4];
  WriteLE32(tmp, value);
  buffer_.insert(buffer_.end(), tmp, tmp + sizeof(tmp));
}

void Writer::write_uint64(uint64_t value) {
  uint8_t tmp[8];
  WriteLE64(tmp, value);
  buffer_.insert(buffer_.end(), tmp, tmp + sizeof(tmp));
}

void Writer::write_compact_size(uint64_t value) {
  if (value < 0xfd) {
    write_uint8(static_cast<uint8_t>(value));
  } else if (value <= 0xffff) {
    write_uint8(0xfd);
    write_uint16(static_cast<uint16_t>(value));
  } else if (value <= 0xffffffff) {
    write_uint8(0xfe);
    write_uint32(static_cast<uint32_t>(value));
  } else {
    write_uint8(0xff);
    write_uint64(value);
  }
}

void Writer::write_bytes(std::span<const uint8_t> bytes) {
  buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

void Writer::write_var_bytes(std::span<const uint8_t> bytes) {
  write_compact_size(bytes.size());
  write_bytes(bytes);
}

// Reader

bool Reader::check_available(size_t bytes) {
  if (error_)
    return false;
  if (bytes_remaining() < bytes) {
    error_ = "truncated";
    return false;
  }
  return true;
}

uint8_t Reader::read_uint8() {
  if (!check_available(1))
    return 0;
  return data_[position_++];
}

uint16_t Reader::read_uint16() {
  if (!check_available(2))
    return 0;
  uint16_t value = ReadLE16(data_.data() + position_);
  position_ += 2;
  return value;
}

uint32_t Reader::read_uint32() {
  if (!check_available(4))
    return 0;
  uint32_t value = ReadLE32(data_.data() + position_);
  position_ += 4;
  return value;
}

uint64_t Reader::read_uint64() {
  if (!check_available(8))
    return 0;
  uint64_t value = ReadLE64(data_.data() + position_);
  position_ += 8;
  return value;
}

uint64_t Reader::read_compact_size() {
  uint8_t first = read_uint8();
  if (error_)
    return 0;

  uint64_t value = 0;
  if (first < 0xfd) {
    value = first;
  } else if (first == 0xfd) {
    value = read_uint16();
    if (!error_ && value < 0xfd)
      set_error("non-canonical compact size");
  } else if (first == 0xfe) {
    value = read_uint32();
    if (!error_ && value <= 0xffff)
      set_error("non-canonical compact size");
  } else {
    value = read_uint64();
    if (!error_ && value <= 0xffffffff)
      set_error("non-canonical compact size");
  }

  if (!error_ && value > MAX_SIZE)
    set_error("compact size exceeds limit");
  return error_ ? 0 : value;
}

uint256 Reader::read_hash() {
  uint256 out;
  if (!check_available(out.size()))
    return out;
  std::copy_n(data_.begin() + position_, out.size(), out.begin());
  position_ += out.size();
  return out;
}

std::vector<uint8_t> Reader::read_bytes(size_t count) {
  if (!check_available(count))
    return {};
  auto first = data_.begin() + position_;
  std::vector<uint8_t> out(first, first + count);
  position_ += count;
  return out;
}

std::vector<uint8_t> Reader::read_var_bytes() {
  uint64_t len = read_compact_size();
  if (error_)
    return {};
  if (len > bytes_remaining()) {
    set_error("length exceeds remaining buffer");
    return {};
  }
  return read_bytes(static_cast<size_t>(len));
}

uint64_t Reader::read_count(size_t min_element_size) {
  uint64_t count = read_compact_size();
  if (error_)
    return 0;
  if (min_element_size > 0 && count > bytes_remaining() / min_element_size) {
    set_error("element count exceeds remaining buffer");
    return 0;
  }
  return count;
}

} // namespace ser
