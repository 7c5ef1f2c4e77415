// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/arith_uint256.hpp"
#include "chain/block.hpp"
#include "util/uint.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace chainquery {
namespace chain {

// CBlockIndex - one node of the block tree
// Owns a shared reference to the immutable decoded block; header fields are
// copied inline so header queries never touch the block body.
class CBlockIndex {
public:
  /**
   * Pointer to the block's hash (DOES NOT OWN).
   *
   * Points to the key of BlockManager::m_block_index map entry.
   * MUST be set after insertion via: pindex->phashBlock = &map_iterator->first
   *
   * Requires pointer stability - BlockManager uses std::map (node-based), so
   * rehashing can never invalidate it.
   */
  const uint256 *phashBlock{nullptr};

  // Parent in the block tree (DOES NOT OWN). nullptr for a genesis block.
  CBlockIndex *pprev{nullptr};

  /**
   * Skip list pointer for O(log n) ancestor lookup (DOES NOT OWN).
   * Set by BuildSkip() once pprev and nHeight are known.
   */
  CBlockIndex *pskip{nullptr};

  // Height of this block in its tree (genesis = 0)
  int nHeight{0};

  // Cumulative work up to and including this block
  arith_uint256 nChainWork{};

  // Arrival order, assigned by BlockManager. Breaks chain-work ties in favour
  // of the block seen first.
  int32_t nSequenceId{0};

  // Header fields (stored inline)
  int32_t nVersion{0};
  uint256 hashMerkleRoot{};
  uint32_t nTime{0};
  uint32_t nBits{0};
  uint32_t nNonce{0};

  // Decoded block body, shared with readers. Never mutated.
  std::shared_ptr<const CBlock> block;

  CBlockIndex() = default;

  explicit CBlockIndex(const CBlockHeader &header)
      : nVersion{header.nVersion}, hashMerkleRoot{header.hashMerkleRoot},
        nTime{header.nTime}, nBits{header.nBits}, nNonce{header.nNonce} {}

  [[nodiscard]] uint256 GetBlockHash() const noexcept {
    return phashBlock ? *phashBlock : uint256();
  }

  // Reconstruct the block header from the inline fields
  [[nodiscard]] CBlockHeader GetBlockHeader() const noexcept {
    CBlockHeader header;
    header.nVersion = nVersion;
    if (pprev)
      header.hashPrevBlock = pprev->GetBlockHash();
    header.hashMerkleRoot = hashMerkleRoot;
    header.nTime = nTime;
    header.nBits = nBits;
    header.nNonce = nNonce;
    return header;
  }

  // Must be called after pprev and nHeight are set
  void BuildSkip();

  // Ancestor at the given height, nullptr when out of range
  [[nodiscard]] const CBlockIndex *GetAncestor(int height) const;
  [[nodiscard]] CBlockIndex *GetAncestor(int height);

  // For debugging/testing only
  [[nodiscard]] std::string ToString() const;

  /**
   * Copy/move operations are DELETED: phashBlock points to the std::map key
   * owning this node, and pprev/pskip point into the same map. Nodes are
   * constructed in place and always handled by pointer.
   */
  CBlockIndex(const CBlockIndex &) = delete;
  CBlockIndex &operator=(const CBlockIndex &) = delete;
  CBlockIndex(CBlockIndex &&) = delete;
  CBlockIndex &operator=(CBlockIndex &&) = delete;
};

// Calculate proof-of-work for a block
// Returns work = ~target / (target + 1) + 1 (mathematically equivalent to 2^256
// / (target + 1)). Negative, overflowing or zero targets return 0 work.
[[nodiscard]] arith_uint256 GetBlockProof(uint32_t nBits);
[[nodiscard]] arith_uint256 GetBlockProof(const CBlockIndex &block);

// Find last common ancestor of two blocks (aligns heights, then walks backward
// until they meet). Returns nullptr if either input is nullptr or the blocks
// descend from different genesis blocks.
[[nodiscard]] const CBlockIndex *LastCommonAncestor(const CBlockIndex *pa,
                                                    const CBlockIndex *pb);

} // namespace chain
} // namespace chainquery
