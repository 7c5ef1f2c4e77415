// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block_index.hpp"
#include "util/uint.hpp"
#include <set>
#include <vector>

namespace chainquery {
namespace validation {

// Comparator for sorting block indices by chain work (strict weak ordering for std::set)
// Ordering (descending sort - best candidates first):
//   1) More chain work (pa->nChainWork > pb->nChainWork)
//   2) Seen earlier (pa->nSequenceId < pb->nSequenceId)
//   3) Pointer address (only reachable for nodes from different managers)
//
// Receive order as tie-breaker means an equal-work competitor never ranks
// ahead of the block that got there first.
//
// CRITICAL INVARIANT: nChainWork and nSequenceId must NOT be modified after
// insertion into the set.
struct CBlockIndexWorkComparator {
  bool operator()(const chain::CBlockIndex *pa,
                  const chain::CBlockIndex *pb) const;
};

// ChainSelector - Manages candidate tips and selects the best chain
// Maintains the set of leaf nodes that could be chain tips, ordered by
// accumulated work.
//
// THREAD SAFETY: No internal mutex - caller (ChainstateManager) must hold
// its writer mutex
class ChainSelector {
public:
  ChainSelector() = default;

  // Candidate with the most work (first in sorted set), nullptr when empty
  chain::CBlockIndex *FindMostWorkChain() const;

  // Add a freshly indexed block. New blocks are always leaves (orphans are
  // never indexed), so the only bookkeeping is dropping the parent, which
  // stops being a tip.
  void TryAddBlockIndexCandidate(chain::CBlockIndex *pindex);

  // Prune stale candidates: less work than the tip, the tip itself, or an
  // ancestor of the tip
  void PruneBlockIndexCandidates(const chain::CBlockIndex *pindexTip);

  void RemoveCandidate(chain::CBlockIndex *pindex);

  size_t GetCandidateCount() const { return m_candidates.size(); }

  // Test-only
  std::vector<uint256> DebugCandidateHashes() const {
    std::vector<uint256> out;
    out.reserve(m_candidates.size());
    for (auto* p : m_candidates) {
      out.push_back(p->GetBlockHash());
    }
    return out;
  }

private:
  // Set of blocks that could be chain tips (sorted by descending chain work)
  std::set<chain::CBlockIndex *, CBlockIndexWorkComparator> m_candidates;
};

} // namespace validation
} // namespace chainquery
