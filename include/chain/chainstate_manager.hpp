// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <stddef.h>
#include <stdint.h>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>
#include "chain/block.hpp"
#include "chain/block_manager.hpp"
#include "chain/chain_selector.hpp"
#include "chain/tx_index.hpp"
#include "util/arith_uint256.hpp"
#include "util/uint.hpp"

namespace chainquery {

namespace chain {
class CBlockIndex;
} // namespace chain

namespace validation {

class ValidationState;

/**
 * Immutable view of the active chain, published by the writer in one pointer
 * swap. Readers take one snapshot per query and answer everything from it,
 * so they never see a half-applied reorg.
 *
 * The main chain is not stored: membership is derived from the tip through
 * the skip list (tip->GetAncestor(h) == node).
 */
struct ChainSnapshot {
  const chain::CBlockIndex *tip{nullptr};
  int height{-1};
  uint256 hash{};
  arith_uint256 chain_work{};
  uint64_t sequence{0}; // increases with every publication

  bool IsEmpty() const { return tip == nullptr; }

  // True if pindex is on the path from the tip back to its genesis
  bool Contains(const chain::CBlockIndex *pindex) const;
};

// Outcome of AcceptBlock()
struct InsertResult {
  enum class Status {
    INSERTED,        // indexed (tip may or may not have moved)
    MALFORMED,       // null block or block without transactions
    DUPLICATE_BLOCK, // hash already indexed
    UNKNOWN_PARENT   // hashPrevBlock is neither null nor indexed
  };

  Status status{Status::MALFORMED};
  uint256 hash{};
  int height{-1};
  bool tip_changed{false};
  int reorg_depth{0};       // blocks disconnected from the old tip
  bool reorg_refused{false}; // a heavier branch was refused by max_reorg_depth

  bool Inserted() const { return status == Status::INSERTED; }
};

// Result of a transaction lookup: containing block plus the transaction
struct TxLookup {
  const chain::CBlockIndex *pindex{nullptr};
  CTransactionRef tx;
  uint32_t pos{0};
};

struct ChainstateOptions {
  // Deepest reorg (blocks disconnected) the manager will perform;
  // 0 = unlimited
  int max_reorg_depth{0};
};

// ChainstateManager - Owns the block tree, the transaction index and the
// published tip. Main entry point for adding blocks.
//
// THREAD SAFETY:
// - AcceptBlock() is serialized by writer_mutex_ (single writer).
// - index_mutex_ (shared_mutex) guards block_manager_ and tx_index_: shared
//   for lookups, exclusive only while a node is inserted.
// - The tip is published as a shared_ptr<const ChainSnapshot> under
//   snapshot_mutex_; readers copy the pointer and release the lock.
// - CBlockIndex nodes are immutable once inserted and never erased.
class ChainstateManager {
public:
  explicit ChainstateManager(const ChainstateOptions &options = {});

  ChainstateManager(const ChainstateManager &) = delete;
  ChainstateManager &operator=(const ChainstateManager &) = delete;

  // Index a decoded block: reject duplicates and unknown parents, create the
  // node, index its transactions, then move the tip if a candidate now has
  // strictly more work than the current tip.
  InsertResult AcceptBlock(std::shared_ptr<const CBlock> block,
                           ValidationState &state);
  InsertResult AcceptBlock(const CBlock &block, ValidationState &state);

  // Current published view (never null; empty before the first block)
  std::shared_ptr<const ChainSnapshot> GetSnapshot() const;
  const chain::CBlockIndex *GetTip() const;

  // Height of an indexed block, nullopt if unknown
  std::optional<int> GetHeight(const uint256 &hash) const;

  // Main-chain membership against the current snapshot, nullopt if unknown
  std::optional<bool> IsOnMainChain(const uint256 &hash) const;

  const chain::CBlockIndex *LookupBlockIndex(const uint256 &hash) const;
  bool HaveBlock(const uint256 &hash) const;

  // Containing block and transaction for a txid, on any branch
  std::optional<TxLookup> LocateTransaction(const uint256 &txid) const;

  size_t GetBlockCount() const;
  size_t GetTransactionCount() const;
  // Height of the published tip, -1 when the chain is empty
  int GetChainHeight() const;

  int GetMaxReorgDepth() const { return max_reorg_depth_; }

  // === Test/Diagnostic Methods ===
  size_t DebugCandidateCount() const {
    std::lock_guard<std::mutex> lock(writer_mutex_);
    return chain_selector_.GetCandidateCount();
  }
  std::vector<uint256> DebugCandidateHashes() const {
    std::lock_guard<std::mutex> lock(writer_mutex_);
    return chain_selector_.DebugCandidateHashes();
  }

private:
  enum class ActivateResult {
    OK,             // activation complete or nothing to do
    POLICY_REFUSED, // refused by local policy (reorg deeper than allowed)
    SYSTEM_ERROR    // unexpected failure
  };

  // Loop over candidates until one activates or none beats the tip.
  // Assumes writer_mutex_ is held.
  bool ActivateBestChain(InsertResult &result);

  // One activation attempt for a specific candidate; does not loop.
  // Assumes writer_mutex_ is held.
  ActivateResult ActivateBestChainStep(chain::CBlockIndex *pindexMostWork,
                                       InsertResult &result);

  // Swap in a new snapshot for pindexNew. Assumes writer_mutex_ is held.
  void PublishSnapshot(const chain::CBlockIndex *pindexNew);

  chain::BlockManager block_manager_;
  chain::TxIndex tx_index_;
  ChainSelector chain_selector_;
  const int max_reorg_depth_;

  // Active tip as seen by the writer (protected by writer_mutex_)
  chain::CBlockIndex *m_tip{nullptr};
  uint64_t m_snapshot_sequence{0};

  mutable std::mutex writer_mutex_;
  mutable std::shared_mutex index_mutex_;
  mutable std::mutex snapshot_mutex_;
  std::shared_ptr<const ChainSnapshot> m_snapshot;
};

} // namespace validation
} // namespace chainquery
