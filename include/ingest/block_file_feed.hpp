// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "ingest/block_feed.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

namespace chainquery {
namespace ingest {

// Network message-start bytes, read as little-endian uint32 from disk
namespace magic {
constexpr uint32_t MAINNET = 0xD9B4BEF9;
constexpr uint32_t TESTNET = 0x0709110B;
constexpr uint32_t REGTEST = 0xDAB5BFFA;
constexpr uint32_t SIGNET = 0x40CF030A;
} // namespace magic

// Upper bound for one record (Bitcoin's MAX_BLOCK_SERIALIZED_SIZE)
static constexpr uint32_t MAX_BLOCK_RECORD_SIZE = 4000000;

// "main", "testnet", "regtest", "signet" -> magic
std::optional<uint32_t> GetNetworkMagic(const std::string &network);

// blk00000.dat style name for a file number
std::string BlockFileName(int file_number);

/**
 * BlockFileFeed - reads Bitcoin Core block files blk00000.dat,
 * blk00001.dat, ... from a directory, in file-number order.
 *
 * Record layout: magic (4 bytes LE) | size (4 bytes LE) | block bytes.
 *
 * - A zero magic is preallocated padding: the rest of the file is skipped.
 * - A foreign magic, a size larger than MAX_BLOCK_RECORD_SIZE or one that
 *   runs past the end of the file ends that file with an error log.
 * - The feed ends at the first missing file number.
 *
 * Not thread-safe; owned by the ingestion thread.
 */
class BlockFileFeed : public BlockFeed {
public:
  BlockFileFeed(std::filesystem::path blocks_dir, uint32_t magic);

  std::optional<std::vector<uint8_t>> NextBlock() override;

  int GetCurrentFile() const { return current_file_; }
  uint64_t GetRecordsRead() const { return records_read_; }
  // Files that ended on a framing error
  uint64_t GetFramingErrors() const { return framing_errors_; }

private:
  // Open blk<current_file_>.dat; false when it does not exist
  bool OpenCurrentFile();
  void CloseAndAdvance();

  std::filesystem::path blocks_dir_;
  const uint32_t magic_;

  std::ifstream file_;
  uint64_t file_size_{0};
  int current_file_{0};
  bool finished_{false};

  uint64_t records_read_{0};
  uint64_t framing_errors_{0};
};

} // namespace ingest
} // namespace chainquery
