// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/tx_index.hpp"
#include "chain/block_index.hpp"
#include "util/logging.hpp"

namespace chainquery {
namespace chain {

size_t TxIndex::AddBlock(const CBlockIndex *pindex) {
  if (!pindex || !pindex->block) {
    return 0;
  }

  size_t added = 0;
  const auto &vtx = pindex->block->vtx;
  for (size_t i = 0; i < vtx.size(); ++i) {
    const uint256 &txid = vtx[i]->GetHash();
    auto [it, inserted] =
        m_index.try_emplace(txid, TxLocation{pindex, static_cast<uint32_t>(i)});
    if (inserted) {
      ++added;
    } else {
      // Pre-BIP30 duplicate coinbases, or the same tx in competing forks
      LOG_CHAIN_DEBUG("TxIndex: txid {} already indexed in block {}, keeping "
                      "first occurrence (ignored block {})",
                      txid.ToString().substr(0, 16),
                      it->second.pindex->GetBlockHash().ToString().substr(0, 16),
                      pindex->GetBlockHash().ToString().substr(0, 16));
    }
  }
  return added;
}

std::optional<TxLocation> TxIndex::Locate(const uint256 &txid) const {
  auto it = m_index.find(txid);
  if (it == m_index.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace chain
} // namespace chainquery
