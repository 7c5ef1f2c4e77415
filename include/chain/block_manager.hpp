// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <stddef.h>
#include "chain/block_index.hpp"
#include "util/uint.hpp"
#include <map>
#include <memory>

class CBlock;

namespace chainquery {
namespace chain {

// BlockManager - Arena owning every indexed block node, keyed by hash
//
// THREAD SAFETY: NO internal synchronization - caller MUST serialize writes
// BlockManager is a PRIVATE member of ChainstateManager
// ChainstateManager::index_mutex_ is held shared for lookups and exclusive
// for AddToBlockIndex. Nodes are never erased, so CBlockIndex pointers stay
// valid for the lifetime of the manager.
class BlockManager {
public:
  BlockManager();
  ~BlockManager();

  // Look up block by hash (returns nullptr if not found)
  CBlockIndex *LookupBlockIndex(const uint256 &hash);
  const CBlockIndex *LookupBlockIndex(const uint256 &hash) const;

  // Add a block whose parent is indexed (or a genesis block with null
  // hashPrevBlock). Creates the CBlockIndex, links the parent, sets height,
  // chain work and arrival sequence. Returns the existing node for a known
  // hash and nullptr for an orphan.
  CBlockIndex *AddToBlockIndex(std::shared_ptr<const CBlock> block);

  size_t GetBlockCount() const { return m_block_index.size(); }

private:
  // Map of all known blocks: hash -> CBlockIndex (map owns CBlockIndex objects,
  // keys are what phashBlock points to)
  std::map<uint256, CBlockIndex> m_block_index;

  // Next arrival sequence number
  int32_t m_next_sequence_id{1};
};

} // namespace chain
} // namespace chainquery
