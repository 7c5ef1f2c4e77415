// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/chain_selector.hpp"
#include "util/logging.hpp"
#include <cmath>
#include <functional>

namespace chainquery {
namespace validation {

bool CBlockIndexWorkComparator::operator()(const chain::CBlockIndex *pa,
                                           const chain::CBlockIndex *pb) const {
  // First, sort by chain work (descending - most work first)
  if (pa->nChainWork != pb->nChainWork) {
    return pa->nChainWork > pb->nChainWork;
  }

  // Same work: first-seen wins
  if (pa->nSequenceId != pb->nSequenceId) {
    return pa->nSequenceId < pb->nSequenceId;
  }

  return std::less<const chain::CBlockIndex *>()(pa, pb);
}

chain::CBlockIndex *ChainSelector::FindMostWorkChain() const {
  if (m_candidates.empty()) {
    LOG_CHAIN_TRACE("No candidates in set");
    return nullptr;
  }
  return *m_candidates.begin();
}

void ChainSelector::TryAddBlockIndexCandidate(chain::CBlockIndex *pindex) {
  if (!pindex) {
    return;
  }

  // If this block extends a candidate, the parent is no longer a tip
  if (pindex->pprev) {
    auto it = m_candidates.find(pindex->pprev);
    if (it != m_candidates.end()) {
      LOG_CHAIN_TRACE("Removed parent from candidates (extended): height={}, hash={}",
                      pindex->pprev->nHeight,
                      pindex->pprev->GetBlockHash().ToString().substr(0, 16));
      m_candidates.erase(it);
    }
  }

  m_candidates.insert(pindex);

  LOG_CHAIN_TRACE("Added candidate: height={}, hash={}, log2_work={:.6f}, candidates_count={}",
                  pindex->nHeight, pindex->GetBlockHash().ToString().substr(0, 16),
                  std::log(pindex->nChainWork.getdouble()) / std::log(2.0),
                  m_candidates.size());
}

void ChainSelector::PruneBlockIndexCandidates(const chain::CBlockIndex *pindexTip) {
  if (!pindexTip) {
    return;
  }

  auto it = m_candidates.begin();
  size_t removed = 0;

  while (it != m_candidates.end()) {
    chain::CBlockIndex *pindex = *it;
    bool should_remove = false;

    // Equal-work competitors stay: a descendant may still overtake the tip
    if (pindex->nChainWork < pindexTip->nChainWork) {
      LOG_CHAIN_TRACE("Pruning candidate (< tip work): height={}, hash={}",
                      pindex->nHeight,
                      pindex->GetBlockHash().ToString().substr(0, 16));
      should_remove = true;
    } else if (pindex == pindexTip) {
      should_remove = true;
    } else if (pindexTip->GetAncestor(pindex->nHeight) == pindex) {
      LOG_CHAIN_TRACE("Pruning candidate (on active chain): height={}, hash={}",
                      pindex->nHeight,
                      pindex->GetBlockHash().ToString().substr(0, 16));
      should_remove = true;
    }

    if (should_remove) {
      it = m_candidates.erase(it);
      removed++;
    } else {
      ++it;
    }
  }

  if (removed > 0) {
    LOG_CHAIN_TRACE("Pruned {} stale candidates (remaining: {})", removed,
                    m_candidates.size());
  }
}

void ChainSelector::RemoveCandidate(chain::CBlockIndex *pindex) {
  if (pindex) {
    m_candidates.erase(pindex);
  }
}

} // namespace validation
} // namespace chainquery
