// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "ingest/block_file_feed.hpp"
#include "chain/serialize.hpp"
#include "util/logging.hpp"
#include <array>
#include <cstdio>
#include <system_error>

namespace chainquery {
namespace ingest {

namespace {
constexpr size_t kRecordHeaderSize = 8;
} // namespace

std::optional<uint32_t> GetNetworkMagic(const std::string &network) {
  if (network == "main" || network == "mainnet")
    return magic::MAINNET;
  if (network == "testnet" || network == "test")
    return magic::TESTNET;
  if (network == "regtest")
    return magic::REGTEST;
  if (network == "signet")
    return magic::SIGNET;
  return std::nullopt;
}

std::string BlockFileName(int file_number) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "blk%05d.dat", file_number);
  return std::string(buf);
}

BlockFileFeed::BlockFileFeed(std::filesystem::path blocks_dir, uint32_t magic)
    : blocks_dir_(std::move(blocks_dir)), magic_(magic) {}

bool BlockFileFeed::OpenCurrentFile() {
  const auto path = blocks_dir_ / BlockFileName(current_file_);

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return false;
  }
  file_size_ = std::filesystem::file_size(path, ec);
  if (ec) {
    LOG_INGEST_ERROR("Cannot stat block file {}: {}", path.string(), ec.message());
    return false;
  }

  file_.open(path, std::ios::binary);
  if (!file_.is_open()) {
    LOG_INGEST_ERROR("Cannot open block file {}", path.string());
    return false;
  }

  LOG_INGEST_INFO("Reading block file {} ({} bytes)", path.filename().string(),
                  file_size_);
  return true;
}

void BlockFileFeed::CloseAndAdvance() {
  file_.close();
  file_.clear();
  file_size_ = 0;
  ++current_file_;
}

std::optional<std::vector<uint8_t>> BlockFileFeed::NextBlock() {
  while (!finished_) {
    if (!file_.is_open()) {
      if (!OpenCurrentFile()) {
        LOG_INGEST_DEBUG("No block file {}, end of feed",
                         BlockFileName(current_file_));
        finished_ = true;
        break;
      }
    }

    const uint64_t offset = static_cast<uint64_t>(file_.tellg());
    if (offset + kRecordHeaderSize > file_size_) {
      // Clean end of file (or a stub shorter than a record header)
      CloseAndAdvance();
      continue;
    }

    std::array<uint8_t, kRecordHeaderSize> header{};
    if (!file_.read(reinterpret_cast<char *>(header.data()), header.size())) {
      LOG_INGEST_ERROR("Read error in {} at offset {}",
                       BlockFileName(current_file_), offset);
      ++framing_errors_;
      CloseAndAdvance();
      continue;
    }

    const uint32_t record_magic = ser::ReadLE32(header.data());
    const uint32_t size = ser::ReadLE32(header.data() + 4);

    if (record_magic == 0) {
      // Preallocated zero padding: nothing more in this file
      LOG_INGEST_DEBUG("Padding reached in {} at offset {}",
                       BlockFileName(current_file_), offset);
      CloseAndAdvance();
      continue;
    }

    if (record_magic != magic_) {
      LOG_INGEST_ERROR("Bad magic 0x{:08x} in {} at offset {} (expected 0x{:08x}), "
                       "skipping rest of file",
                       record_magic, BlockFileName(current_file_), offset, magic_);
      ++framing_errors_;
      CloseAndAdvance();
      continue;
    }

    const uint64_t payload_offset = offset + kRecordHeaderSize;
    if (size > MAX_BLOCK_RECORD_SIZE || payload_offset + size > file_size_) {
      LOG_INGEST_ERROR("Bad record size {} in {} at offset {} (file size {}), "
                       "skipping rest of file",
                       size, BlockFileName(current_file_), offset, file_size_);
      ++framing_errors_;
      CloseAndAdvance();
      continue;
    }

    std::vector<uint8_t> block(size);
    if (size > 0 &&
        !file_.read(reinterpret_cast<char *>(block.data()),
                  static_cast<std::streamsize>(size))) {
      LOG_INGEST_ERROR("Short read of {} bytes in {} at offset {}", size,
                       BlockFileName(current_file_), payload_offset);
      ++framing_errors_;
      CloseAndAdvance();
      continue;
    }

    ++records_read_;
    return block;
  }
  return std::nullopt;
}

} // namespace ingest
} // namespace chainquery
