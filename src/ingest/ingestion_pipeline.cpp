// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "ingest/ingestion_pipeline.hpp"
#include "chain/chainstate_manager.hpp"
#include "chain/validation.hpp"
#include "ingest/block_feed.hpp"
#include "util/logging.hpp"
#include <deque>
#include <utility>

namespace chainquery {
namespace ingest {

IngestionPipeline::IngestionPipeline(validation::ChainstateManager &chainstate,
                                     BlockFeed &feed)
    : IngestionPipeline(chainstate, feed, Options{}) {}

IngestionPipeline::IngestionPipeline(validation::ChainstateManager &chainstate,
                                     BlockFeed &feed, const Options &options)
    : chainstate_(chainstate), feed_(feed), options_(options) {}

bool IngestionPipeline::Run(const std::atomic<bool> &stop) {
  LOG_INGEST_INFO("Ingestion started (max orphans {})", options_.max_orphan_blocks);

  while (!stop.load(std::memory_order_relaxed)) {
    auto blob = feed_.NextBlock();
    if (!blob) {
      // End of feed: whatever is still waiting will never see its parent
      if (!m_orphans.empty()) {
        LOG_INGEST_WARN("End of feed with {} orphan blocks whose parent never "
                        "arrived",
                        m_orphans.size());
        for (const auto &[hash, orphan] : m_orphans) {
          LOG_INGEST_DEBUG("Unresolved orphan {} (prev {})",
                           hash.ToString().substr(0, 16),
                           orphan.block->hashPrevBlock.ToString().substr(0, 16));
        }
        {
          std::lock_guard<std::mutex> lock(stats_mutex_);
          stats_.unknown_parent += m_orphans.size();
        }
        m_orphans.clear();
        m_orphans_by_parent.clear();
        m_orphans_by_arrival.clear();
      }

      IngestStats s = GetStats();
      LOG_INGEST_INFO("Ingestion finished: read={} accepted={} malformed={} "
                      "bad_merkle={} duplicate={} unknown_parent={} tip_height={}",
                      s.blocks_read, s.accepted, s.malformed, s.bad_merkle,
                      s.duplicate, s.unknown_parent,
                      chainstate_.GetChainHeight());
      return true;
    }

    ProcessBlob(*blob);
  }

  LOG_INGEST_INFO("Ingestion stopped before end of feed");
  return false;
}

void IngestionPipeline::ProcessBlob(const std::vector<uint8_t> &blob) {
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.blocks_read;
  }

  auto block = std::make_shared<CBlock>();
  validation::ValidationState state;
  if (!validation::DecodeBlock(blob, *block, state)) {
    LOG_INGEST_WARN("Skipping malformed block ({} bytes): {}", blob.size(),
                    state.ToString());
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.malformed;
    return;
  }

  if (!validation::CheckMerkleRoot(*block, state)) {
    LOG_INGEST_WARN("Skipping block {}: {}",
                    block->GetHash().ToString().substr(0, 16), state.ToString());
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.bad_merkle;
    return;
  }

  ProcessBlock(std::move(block));
}

void IngestionPipeline::ProcessBlock(std::shared_ptr<const CBlock> block) {
  const uint256 hash = block->GetHash();

  validation::ValidationState state;
  validation::InsertResult result = chainstate_.AcceptBlock(block, state);

  switch (result.status) {
  case validation::InsertResult::Status::INSERTED: {
    {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      ++stats_.accepted;
    }
    if (state.IsError()) {
      LOG_INGEST_ERROR("Block {} indexed but tip update failed: {}",
                       hash.ToString().substr(0, 16), state.ToString());
    }
    MaybeLogProgress();
    ProcessOrphanBlocks(hash);
    break;
  }
  case validation::InsertResult::Status::DUPLICATE_BLOCK: {
    LOG_INGEST_DEBUG("Skipping duplicate block {}", hash.ToString().substr(0, 16));
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.duplicate;
    break;
  }
  case validation::InsertResult::Status::UNKNOWN_PARENT:
    if (m_orphans.count(hash)) {
      LOG_INGEST_DEBUG("Orphan block {} already waiting", hash.ToString().substr(0, 16));
      std::lock_guard<std::mutex> lock(stats_mutex_);
      ++stats_.duplicate;
    } else if (!TryAddOrphanBlock(block, hash)) {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      ++stats_.unknown_parent;
    }
    break;
  case validation::InsertResult::Status::MALFORMED: {
    LOG_INGEST_WARN("Block {} rejected: {}", hash.ToString().substr(0, 16),
                    state.ToString());
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.malformed;
    break;
  }
  }
}

void IngestionPipeline::ProcessOrphanBlocks(const uint256 &parent_hash) {
  // Iterative so a long out-of-order run cannot blow the stack
  std::deque<uint256> parents{parent_hash};

  while (!parents.empty()) {
    const uint256 parent = parents.front();
    parents.pop_front();

    auto range = m_orphans_by_parent.equal_range(parent);
    if (range.first == range.second) {
      continue;
    }

    std::vector<std::shared_ptr<const CBlock>> children;
    for (auto it = range.first; it != range.second; ++it) {
      auto orphan_it = m_orphans.find(it->second);
      if (orphan_it != m_orphans.end()) {
        children.push_back(orphan_it->second.block);
      }
    }
    // Remove from orphan pool BEFORE processing
    for (const auto &child : children) {
      auto orphan_it = m_orphans.find(child->GetHash());
      if (orphan_it != m_orphans.end()) {
        EraseOrphan(orphan_it);
      }
    }

    LOG_INGEST_TRACE("Processing {} orphan blocks that were waiting for parent {}",
                     children.size(), parent.ToString().substr(0, 16));

    for (const auto &child : children) {
      const uint256 child_hash = child->GetHash();
      validation::ValidationState state;
      validation::InsertResult result = chainstate_.AcceptBlock(child, state);
      if (result.Inserted()) {
        {
          std::lock_guard<std::mutex> lock(stats_mutex_);
          ++stats_.accepted;
          ++stats_.orphans_resolved;
        }
        MaybeLogProgress();
        parents.push_back(child_hash);
      } else if (result.status == validation::InsertResult::Status::DUPLICATE_BLOCK) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.duplicate;
      } else {
        LOG_INGEST_WARN("Orphan block {} rejected after parent arrived: {}",
                        child_hash.ToString().substr(0, 16), state.ToString());
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.unknown_parent;
      }
    }
  }
}

bool IngestionPipeline::TryAddOrphanBlock(std::shared_ptr<const CBlock> block,
                                          const uint256 &hash) {
  if (options_.max_orphan_blocks == 0) {
    LOG_INGEST_DEBUG("Orphan pool disabled, dropping block {} (prev {})",
                     hash.ToString().substr(0, 16),
                     block->hashPrevBlock.ToString().substr(0, 16));
    return false;
  }

  if (m_orphans.size() >= options_.max_orphan_blocks) {
    LOG_INGEST_TRACE("Orphan pool full ({}/{}), evicting oldest", m_orphans.size(),
                     options_.max_orphan_blocks);
    if (EvictOrphanBlocks() == 0) {
      LOG_INGEST_ERROR("Failed to evict any orphans, pool stuck at max size");
      return false;
    }
  }

  const uint64_t arrival = m_next_arrival++;
  m_orphans_by_parent.emplace(block->hashPrevBlock, hash);
  m_orphans_by_arrival.emplace(arrival, hash);
  m_orphans.emplace(hash, OrphanBlock{std::move(block), arrival});

  LOG_INGEST_TRACE("Added orphan block to pool: hash={}, pool_size={}",
                   hash.ToString().substr(0, 16), m_orphans.size());
  return true;
}

size_t IngestionPipeline::EvictOrphanBlocks() {
  if (m_orphans_by_arrival.empty()) {
    return 0;
  }

  auto oldest = m_orphans.find(m_orphans_by_arrival.begin()->second);
  if (oldest == m_orphans.end()) {
    m_orphans_by_arrival.erase(m_orphans_by_arrival.begin());
    return 0;
  }

  LOG_INGEST_WARN("Orphan pool full, evicting oldest orphan {} (prev {})",
                  oldest->first.ToString().substr(0, 16),
                  oldest->second.block->hashPrevBlock.ToString().substr(0, 16));
  EraseOrphan(oldest);

  std::lock_guard<std::mutex> lock(stats_mutex_);
  ++stats_.orphans_evicted;
  ++stats_.unknown_parent;
  return 1;
}

void IngestionPipeline::EraseOrphan(std::map<uint256, OrphanBlock>::iterator it) {
  const uint256 &prev = it->second.block->hashPrevBlock;
  auto range = m_orphans_by_parent.equal_range(prev);
  for (auto pit = range.first; pit != range.second; ++pit) {
    if (pit->second == it->first) {
      m_orphans_by_parent.erase(pit);
      break;
    }
  }
  m_orphans_by_arrival.erase(it->second.arrival);
  m_orphans.erase(it);
}

void IngestionPipeline::MaybeLogProgress() {
  if (options_.progress_interval == 0) {
    return;
  }
  uint64_t accepted;
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    accepted = stats_.accepted;
  }
  if (accepted % options_.progress_interval == 0) {
    LOG_INGEST_INFO("Progress: {} blocks indexed, tip height {}, {} orphans waiting",
                    accepted, chainstate_.GetChainHeight(), m_orphans.size());
  }
}

IngestStats IngestionPipeline::GetStats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

} // namespace ingest
} // namespace chainquery
