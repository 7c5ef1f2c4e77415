// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/block_manager.hpp"
#include <cmath>
#include <type_traits>
#include <utility>
#include "util/arith_uint256.hpp"
#include "chain/block.hpp"
#include "util/logging.hpp"

namespace chainquery {
namespace chain {

BlockManager::BlockManager() = default;
BlockManager::~BlockManager() = default;

CBlockIndex *BlockManager::LookupBlockIndex(const uint256 &hash) {
  auto it = m_block_index.find(hash);
  if (it == m_block_index.end())
    return nullptr;
  return &it->second;
}

const CBlockIndex *BlockManager::LookupBlockIndex(const uint256 &hash) const {
  auto it = m_block_index.find(hash);
  if (it == m_block_index.end())
    return nullptr;
  return &it->second;
}

CBlockIndex *BlockManager::AddToBlockIndex(std::shared_ptr<const CBlock> block) {
  if (!block) {
    return nullptr;
  }
  const CBlockHeader &header = block->GetBlockHeader();
  uint256 hash = header.GetHash();

  LOG_CHAIN_TRACE("AddToBlockIndex: hash={} prev={}",
                  hash.ToString().substr(0, 16),
                  header.hashPrevBlock.ToString().substr(0, 16));

  auto it = m_block_index.find(hash);
  if (it != m_block_index.end()) {
    LOG_CHAIN_TRACE("AddToBlockIndex: Block already exists, returning existing index");
    return &it->second;
  }

  CBlockIndex *parent = nullptr;
  if (!header.hashPrevBlock.IsNull()) {
    parent = LookupBlockIndex(header.hashPrevBlock);
    // Orphans must be held by the caller until the parent arrives; indexing
    // one here would fix its height at 0 for good
    if (!parent) {
      LOG_CHAIN_ERROR("AddToBlockIndex called with orphan block {} (parent {} "
                      "not indexed)",
                      hash.ToString().substr(0, 16),
                      header.hashPrevBlock.ToString().substr(0, 16));
      return nullptr;
    }
  }

  auto [iter, inserted] = m_block_index.try_emplace(hash, header);
  if (!inserted) {
    LOG_CHAIN_ERROR("Failed to insert block {}", hash.ToString().substr(0, 16));
    return nullptr;
  }

  CBlockIndex *pindex = &iter->second;

  // phashBlock points at the map key; std::map keeps it stable
  static_assert(std::is_same<decltype(m_block_index), std::map<uint256, CBlockIndex>>::value,
                "m_block_index must be std::map for pointer stability (phashBlock = &iter->first)");
  pindex->phashBlock = &iter->first;
  pindex->pprev = parent;
  pindex->block = std::move(block);
  pindex->nSequenceId = m_next_sequence_id++;

  // nHeight and nChainWork are set ONCE here. ChainSelector orders its
  // candidate set by them, so they must never change afterwards.
  if (pindex->pprev) {
    pindex->nHeight = pindex->pprev->nHeight + 1;
    pindex->nChainWork = pindex->pprev->nChainWork + GetBlockProof(*pindex);
  } else {
    pindex->nHeight = 0;
    pindex->nChainWork = GetBlockProof(*pindex);
    LOG_CHAIN_DEBUG("AddToBlockIndex: new genesis block {}",
                    hash.ToString().substr(0, 16));
  }

  pindex->BuildSkip();

  LOG_CHAIN_TRACE("AddToBlockIndex: Created block index height={} seq={} log2_work={:.6f}",
                  pindex->nHeight, pindex->nSequenceId,
                  std::log(pindex->nChainWork.getdouble()) / std::log(2.0));

  return pindex;
}

} // namespace chain
} // namespace chainquery
