// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace chainquery {
namespace ingest {

/**
 * BlockFeed - source of serialized blocks.
 *
 * NextBlock() returns the next raw block, or std::nullopt once the feed is
 * exhausted (end of feed). Blobs are not validated here; malformed input is
 * the decoder's business.
 */
class BlockFeed {
public:
  virtual ~BlockFeed() = default;

  virtual std::optional<std::vector<uint8_t>> NextBlock() = 0;
};

// In-memory feed over a fixed list of blobs, returned in order
class MemoryBlockFeed : public BlockFeed {
public:
  MemoryBlockFeed() = default;
  explicit MemoryBlockFeed(std::vector<std::vector<uint8_t>> blobs)
      : blobs_(std::move(blobs)) {}

  void Add(std::vector<uint8_t> blob) { blobs_.push_back(std::move(blob)); }

  std::optional<std::vector<uint8_t>> NextBlock() override {
    if (next_ >= blobs_.size()) {
      return std::nullopt;
    }
    return blobs_[next_++];
  }

  size_t Remaining() const { return blobs_.size() - next_; }

private:
  std::vector<std::vector<uint8_t>> blobs_;
  size_t next_{0};
};

} // namespace ingest
} // namespace chainquery
