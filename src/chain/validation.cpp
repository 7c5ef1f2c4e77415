// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/validation.hpp"
#include "chain/block.hpp"
#include "chain/serialize.hpp"
#include "util/sha256.hpp"
#include <string>

namespace chainquery {
namespace validation {

namespace {
// version + empty vin + empty vout + locktime
static constexpr size_t kMinTransactionSize = 4 + 1 + 1 + 4;
} // namespace

bool DecodeBlock(std::span<const uint8_t> bytes, CBlock &block,
                 ValidationState &state) {
  if (bytes.size() < CBlockHeader::HEADER_SIZE) {
    return state.Invalid(REJECT_MALFORMED,
                         "truncated header: " + std::to_string(bytes.size()) +
                             " bytes");
  }

  CBlock decoded;
  if (!decoded.Deserialize(bytes.first(CBlockHeader::HEADER_SIZE))) {
    return state.Invalid(REJECT_MALFORMED, "bad header");
  }

  ser::Reader reader(bytes.subspan(CBlockHeader::HEADER_SIZE));
  uint64_t tx_count = reader.read_count(kMinTransactionSize);
  if (reader.has_error()) {
    return state.Invalid(REJECT_MALFORMED,
                         std::string("tx count: ") + reader.error_reason());
  }
  if (tx_count == 0) {
    return state.Invalid(REJECT_MALFORMED, "block has no transactions");
  }

  decoded.vtx.reserve(tx_count);
  for (uint64_t i = 0; i < tx_count; ++i) {
    CTransactionRef tx = DeserializeTransaction(reader);
    if (!tx) {
      return state.Invalid(REJECT_MALFORMED,
                           "tx " + std::to_string(i) + ": " +
                               reader.error_reason());
    }
    decoded.vtx.push_back(std::move(tx));
  }

  if (reader.bytes_remaining() != 0) {
    return state.Invalid(REJECT_MALFORMED,
                         std::to_string(reader.bytes_remaining()) +
                             " trailing bytes after last transaction");
  }

  block = std::move(decoded);
  return true;
}

std::vector<uint8_t> EncodeBlock(const CBlock &block) {
  ser::Writer w(CBlockHeader::HEADER_SIZE + 1);
  const auto header = block.SerializeFixed();
  w.write_bytes(header);
  w.write_compact_size(block.vtx.size());
  for (const auto &tx : block.vtx) {
    tx->Serialize(w);
  }
  return w.release();
}

uint256 ComputeMerkleRoot(std::vector<uint256> hashes) {
  if (hashes.empty()) {
    return uint256();
  }
  while (hashes.size() > 1) {
    if (hashes.size() & 1) {
      hashes.push_back(hashes.back());
    }
    for (size_t i = 0; i < hashes.size() / 2; ++i) {
      hashes[i] = Hash256Pair(hashes[2 * i], hashes[2 * i + 1]);
    }
    hashes.resize(hashes.size() / 2);
  }
  return hashes[0];
}

uint256 BlockMerkleRoot(const CBlock &block) {
  std::vector<uint256> leaves;
  leaves.reserve(block.vtx.size());
  for (const auto &tx : block.vtx) {
    leaves.push_back(tx->GetHash());
  }
  return ComputeMerkleRoot(std::move(leaves));
}

bool CheckMerkleRoot(const CBlock &block, ValidationState &state) {
  uint256 computed = BlockMerkleRoot(block);
  if (computed != block.hashMerkleRoot) {
    return state.Invalid(REJECT_BAD_MERKLE,
                         "hashMerkleRoot mismatch: header " +
                             block.hashMerkleRoot.ToString() + ", computed " +
                             computed.ToString());
  }
  return true;
}

} // namespace validation
} // namespace chainquery
