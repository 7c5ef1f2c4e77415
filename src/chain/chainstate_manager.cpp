// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/chainstate_manager.hpp"
#include <algorithm>
#include <cmath>
#include <utility>
#include "chain/block_index.hpp"
#include "chain/validation.hpp"
#include "util/logging.hpp"

namespace chainquery {
namespace validation {

bool ChainSnapshot::Contains(const chain::CBlockIndex *pindex) const {
  if (!tip || !pindex) {
    return false;
  }
  return tip->GetAncestor(pindex->nHeight) == pindex;
}

ChainstateManager::ChainstateManager(const ChainstateOptions &options)
    : max_reorg_depth_(options.max_reorg_depth > 0 ? options.max_reorg_depth : 0),
      m_snapshot(std::make_shared<const ChainSnapshot>()) {}

InsertResult ChainstateManager::AcceptBlock(const CBlock &block,
                                            ValidationState &state) {
  return AcceptBlock(std::make_shared<const CBlock>(block), state);
}

InsertResult ChainstateManager::AcceptBlock(std::shared_ptr<const CBlock> block,
                                            ValidationState &state) {
  std::lock_guard<std::mutex> writer_lock(writer_mutex_);

  InsertResult result;
  if (!block || block->vtx.empty()) {
    result.status = InsertResult::Status::MALFORMED;
    state.Invalid(REJECT_MALFORMED, "block has no transactions");
    return result;
  }

  const uint256 hash = block->GetHash();
  result.hash = hash;
  LOG_CHAIN_TRACE("AcceptBlock: hash={} prev={}", hash.ToString().substr(0, 16),
                  block->hashPrevBlock.ToString().substr(0, 16));

  // Step 1: Check for duplicate. Only this thread mutates the index, so the
  // writer may read it without index_mutex_.
  if (const chain::CBlockIndex *existing = block_manager_.LookupBlockIndex(hash)) {
    LOG_CHAIN_DEBUG("AcceptBlock: block {} already indexed at height {}",
                    hash.ToString().substr(0, 16), existing->nHeight);
    result.status = InsertResult::Status::DUPLICATE_BLOCK;
    result.height = existing->nHeight;
    state.Invalid(REJECT_DUPLICATE, "block already indexed");
    return result;
  }

  // Step 2: Parent must exist in index (null prev = new genesis)
  if (!block->hashPrevBlock.IsNull() &&
      !block_manager_.LookupBlockIndex(block->hashPrevBlock)) {
    LOG_CHAIN_DEBUG("AcceptBlock: block {} has prev block not found: {}",
                    hash.ToString().substr(0, 16),
                    block->hashPrevBlock.ToString().substr(0, 16));
    result.status = InsertResult::Status::UNKNOWN_PARENT;
    state.Invalid(REJECT_PREV_NOT_FOUND, "parent block not found");
    return result;
  }

  // Step 3: Insert into block index and tx index
  chain::CBlockIndex *pindex = nullptr;
  size_t txs_added = 0;
  {
    std::unique_lock<std::shared_mutex> index_lock(index_mutex_);
    pindex = block_manager_.AddToBlockIndex(std::move(block));
    if (pindex) {
      txs_added = tx_index_.AddBlock(pindex);
    }
  }
  if (!pindex) {
    state.Error("failed to add block to index");
    result.status = InsertResult::Status::MALFORMED;
    return result;
  }

  result.status = InsertResult::Status::INSERTED;
  result.height = pindex->nHeight;

  LOG_CHAIN_TRACE("Accepted new block: hash={}, height={}, txs={} (new {}), log2_work={:.6f}",
                  hash.ToString().substr(0, 16), pindex->nHeight,
                  pindex->block->vtx.size(), txs_added,
                  std::log(pindex->nChainWork.getdouble()) / std::log(2.0));

  // Step 4: Candidate bookkeeping and tip selection
  chain_selector_.TryAddBlockIndexCandidate(pindex);
  if (!ActivateBestChain(result)) {
    state.Error("activate-best-chain-failed");
  }

  return result;
}

bool ChainstateManager::ActivateBestChain(InsertResult &result) {
  // PRE: writer_mutex_ is held by caller
  for (;;) {
    chain::CBlockIndex *pindexMostWork = chain_selector_.FindMostWorkChain();
    if (!pindexMostWork || pindexMostWork == m_tip) {
      return true;
    }

    ActivateResult res = ActivateBestChainStep(pindexMostWork, result);
    if (res == ActivateResult::OK) {
      return true;
    }

    if (res == ActivateResult::POLICY_REFUSED) {
      // Demote this candidate and try the next
      result.reorg_refused = true;
      chain_selector_.RemoveCandidate(pindexMostWork);
      continue;
    }

    // SYSTEM_ERROR - give up
    return false;
  }
}

ChainstateManager::ActivateResult
ChainstateManager::ActivateBestChainStep(chain::CBlockIndex *pindexMostWork,
                                         InsertResult &result) {
  chain::CBlockIndex *pindexOldTip = m_tip;

  LOG_CHAIN_TRACE("ActivateBestChainStep: pindexOldTip={} (height={}), pindexMostWork={} (height={})",
                  pindexOldTip ? pindexOldTip->GetBlockHash().ToString().substr(0, 16) : "null",
                  pindexOldTip ? pindexOldTip->nHeight : -1,
                  pindexMostWork->GetBlockHash().ToString().substr(0, 16),
                  pindexMostWork->nHeight);

  // Require strictly more work to switch: equal work keeps the first-seen tip
  if (pindexOldTip && pindexMostWork->nChainWork <= pindexOldTip->nChainWork) {
    LOG_CHAIN_TRACE("Candidate has insufficient work; keeping current tip. Height: {}, Hash: {}",
                    pindexMostWork->nHeight,
                    pindexMostWork->GetBlockHash().ToString().substr(0, 16));
    return ActivateResult::OK;
  }

  // Fork point; nullptr when the candidate roots in a different genesis
  const chain::CBlockIndex *pindexFork =
      chain::LastCommonAncestor(pindexOldTip, pindexMostWork);
  const int fork_height = pindexFork ? pindexFork->nHeight : -1;

  int disconnect_count = pindexOldTip ? pindexOldTip->nHeight - fork_height : 0;
  int connect_count = pindexMostWork->nHeight - fork_height;

  if (pindexOldTip && max_reorg_depth_ > 0 && disconnect_count > max_reorg_depth_) {
    LOG_CHAIN_ERROR("Refusing reorg of {} blocks (max {}).", disconnect_count,
                    max_reorg_depth_);
    LOG_CHAIN_ERROR("* current tip @ height {} ({})", pindexOldTip->nHeight,
                    pindexOldTip->GetBlockHash().ToString());
    LOG_CHAIN_ERROR("*   reorg tip @ height {} ({})", pindexMostWork->nHeight,
                    pindexMostWork->GetBlockHash().ToString());
    LOG_CHAIN_ERROR("*  fork point @ height {} ({})", fork_height,
                    pindexFork ? pindexFork->GetBlockHash().ToString() : std::string("null"));
    return ActivateResult::POLICY_REFUSED;
  }

  if (connect_count <= 0) {
    LOG_CHAIN_ERROR("ActivateBestChainStep: candidate {} does not extend past fork point",
                    pindexMostWork->GetBlockHash().ToString().substr(0, 16));
    return ActivateResult::SYSTEM_ERROR;
  }

  if (disconnect_count > 0) {
    LOG_CHAIN_INFO("REORGANIZE: Disconnect {} blocks; Connect {} blocks",
                   disconnect_count, connect_count);
    LOG_CHAIN_DEBUG("REORGANIZE: Old tip: height={}, hash={}", pindexOldTip->nHeight,
                    pindexOldTip->GetBlockHash().ToString().substr(0, 16));
    LOG_CHAIN_DEBUG("REORGANIZE: New tip: height={}, hash={}", pindexMostWork->nHeight,
                    pindexMostWork->GetBlockHash().ToString().substr(0, 16));
    LOG_CHAIN_DEBUG("REORGANIZE: Fork point: height={}, hash={}", fork_height,
                    pindexFork ? pindexFork->GetBlockHash().ToString().substr(0, 16) : "null");
  } else {
    LOG_CHAIN_DEBUG("UpdateTip: new best={} height={} log2_work={:.6f}",
                    pindexMostWork->GetBlockHash().ToString(),
                    pindexMostWork->nHeight,
                    std::log(pindexMostWork->nChainWork.getdouble()) / std::log(2.0));
  }

  // The whole switch is computed; publish it in one step
  m_tip = pindexMostWork;
  PublishSnapshot(m_tip);

  result.tip_changed = true;
  result.reorg_depth = std::max(result.reorg_depth, disconnect_count);

  chain_selector_.PruneBlockIndexCandidates(m_tip);
  return ActivateResult::OK;
}

void ChainstateManager::PublishSnapshot(const chain::CBlockIndex *pindexNew) {
  auto snapshot = std::make_shared<ChainSnapshot>();
  snapshot->tip = pindexNew;
  if (pindexNew) {
    snapshot->height = pindexNew->nHeight;
    snapshot->hash = pindexNew->GetBlockHash();
    snapshot->chain_work = pindexNew->nChainWork;
  }
  snapshot->sequence = ++m_snapshot_sequence;

  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  m_snapshot = std::move(snapshot);
}

std::shared_ptr<const ChainSnapshot> ChainstateManager::GetSnapshot() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return m_snapshot;
}

const chain::CBlockIndex *ChainstateManager::GetTip() const {
  return GetSnapshot()->tip;
}

const chain::CBlockIndex *
ChainstateManager::LookupBlockIndex(const uint256 &hash) const {
  std::shared_lock<std::shared_mutex> lock(index_mutex_);
  return block_manager_.LookupBlockIndex(hash);
}

bool ChainstateManager::HaveBlock(const uint256 &hash) const {
  return LookupBlockIndex(hash) != nullptr;
}

std::optional<int> ChainstateManager::GetHeight(const uint256 &hash) const {
  const chain::CBlockIndex *pindex = LookupBlockIndex(hash);
  if (!pindex) {
    return std::nullopt;
  }
  return pindex->nHeight;
}

std::optional<bool> ChainstateManager::IsOnMainChain(const uint256 &hash) const {
  auto snapshot = GetSnapshot();
  const chain::CBlockIndex *pindex = LookupBlockIndex(hash);
  if (!pindex) {
    return std::nullopt;
  }
  return snapshot->Contains(pindex);
}

std::optional<TxLookup>
ChainstateManager::LocateTransaction(const uint256 &txid) const {
  std::optional<chain::TxLocation> loc;
  {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    loc = tx_index_.Locate(txid);
  }
  if (!loc || !loc->pindex->block || loc->pos >= loc->pindex->block->vtx.size()) {
    return std::nullopt;
  }
  return TxLookup{loc->pindex, loc->pindex->block->vtx[loc->pos], loc->pos};
}

size_t ChainstateManager::GetBlockCount() const {
  std::shared_lock<std::shared_mutex> lock(index_mutex_);
  return block_manager_.GetBlockCount();
}

size_t ChainstateManager::GetTransactionCount() const {
  std::shared_lock<std::shared_mutex> lock(index_mutex_);
  return tx_index_.Size();
}

int ChainstateManager::GetChainHeight() const {
  return GetSnapshot()->height;
}

} // namespace validation
} // namespace chainquery
