// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "util/uint.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace chainquery {

namespace validation {
class ChainstateManager;
} // namespace validation

namespace ingest {

class BlockFeed;

// Counters reported by IngestionPipeline::GetStats()
struct IngestStats {
  uint64_t blocks_read{0};      // blobs pulled from the feed
  uint64_t accepted{0};         // blocks indexed (including resolved orphans)
  uint64_t malformed{0};        // MalformedBlock
  uint64_t bad_merkle{0};       // merkle root mismatch
  uint64_t duplicate{0};        // DuplicateBlock
  uint64_t unknown_parent{0};   // orphans never resolved (evicted or left at end)
  uint64_t orphans_resolved{0}; // orphans indexed once their parent arrived
  uint64_t orphans_evicted{0};
};

/**
 * IngestionPipeline - pulls raw blocks from a BlockFeed, decodes them and
 * hands them to the ChainstateManager.
 *
 * Per blob: decode (malformed -> skip), merkle check (mismatch -> skip),
 * AcceptBlock. Duplicates are skipped. A block whose parent is not indexed
 * yet waits in a bounded orphan pool and is retried when the parent is
 * accepted, so block files written out of order still load completely.
 *
 * Errors are logged and counted; nothing escapes as an exception and the
 * chain index is never left half-updated.
 *
 * THREAD SAFETY: Run() is meant for one ingestion thread. GetStats() may be
 * called from any thread.
 */
class IngestionPipeline {
public:
  struct Options {
    size_t max_orphan_blocks{1000};
    // Info-level progress line every N accepted blocks (0 = never)
    uint64_t progress_interval{10000};
  };

  // LIFETIME: chainstate and feed must outlive the pipeline
  IngestionPipeline(validation::ChainstateManager &chainstate, BlockFeed &feed);
  IngestionPipeline(validation::ChainstateManager &chainstate, BlockFeed &feed,
                    const Options &options);

  // Pull until end of feed or until stop is set. Returns false if stopped
  // before the feed ended.
  bool Run(const std::atomic<bool> &stop);

  // Decode and process a single blob (Run() calls this per block)
  void ProcessBlob(const std::vector<uint8_t> &blob);

  IngestStats GetStats() const;
  size_t GetOrphanCount() const { return m_orphans.size(); }

private:
  struct OrphanBlock {
    std::shared_ptr<const CBlock> block;
    uint64_t arrival{0};
  };

  // Accept a decoded block; on success drain any orphans waiting on it
  void ProcessBlock(std::shared_ptr<const CBlock> block);

  // Accept orphans whose ancestry is now complete, breadth-first from parent
  void ProcessOrphanBlocks(const uint256 &parent_hash);

  bool TryAddOrphanBlock(std::shared_ptr<const CBlock> block, const uint256 &hash);
  size_t EvictOrphanBlocks();
  void EraseOrphan(std::map<uint256, OrphanBlock>::iterator it);

  void MaybeLogProgress();

  validation::ChainstateManager &chainstate_;
  BlockFeed &feed_;
  const Options options_;

  // Orphan pool: hash -> block, plus parent and arrival-order indexes
  std::map<uint256, OrphanBlock> m_orphans;
  std::multimap<uint256, uint256> m_orphans_by_parent;
  std::map<uint64_t, uint256> m_orphans_by_arrival;
  uint64_t m_next_arrival{0};

  mutable std::mutex stats_mutex_;
  IngestStats stats_;
};

} // namespace ingest
} // namespace chainquery
