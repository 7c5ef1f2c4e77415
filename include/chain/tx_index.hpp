// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <cstdint>
#include <optional>
#include <unordered_map>

namespace chainquery {
namespace chain {

class CBlockIndex;

// Where a transaction lives: the containing block and its position in vtx
struct TxLocation {
  const CBlockIndex *pindex{nullptr};
  uint32_t pos{0};
};

// TxIndex - txid -> containing block, for every indexed block
//
// Independent of main-chain membership: entries are added as blocks are
// indexed and never removed, so a transaction in a block that was reorged
// out stays locatable. The first indexed occurrence of a txid wins.
//
// THREAD SAFETY: No internal mutex - owned by ChainstateManager and guarded
// by its index_mutex_ (shared for Locate, exclusive for AddBlock)
class TxIndex {
public:
  // Index every transaction of a node that carries its block body.
  // Returns the number of new entries.
  size_t AddBlock(const CBlockIndex *pindex);

  std::optional<TxLocation> Locate(const uint256 &txid) const;

  size_t Size() const { return m_index.size(); }

private:
  std::unordered_map<uint256, TxLocation, Uint256Hasher> m_index;
};

} // namespace chain
} // namespace chainquery
