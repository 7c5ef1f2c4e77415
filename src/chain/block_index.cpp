// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/block_index.hpp"
#include "util/arith_uint256.hpp"
#include <sstream>
#include <string>

namespace chainquery {
namespace chain {

// Helper function for skip list: inverts the lowest set bit
static inline int InvertLowestOne(int n) { return n & (n - 1); }

// Height of the ancestor a block at this height skips to
static int GetSkipHeight(int height) {
  if (height < 2)
    return 0;

  // Even heights clear the lowest set bit; odd heights do it twice on
  // height - 1 and step forward. Gives a binary-tree shaped skip list.
  return (height & 1) ? InvertLowestOne(InvertLowestOne(height - 1)) + 1
                      : InvertLowestOne(height);
}

void CBlockIndex::BuildSkip() {
  if (pprev)
    pskip = pprev->GetAncestor(GetSkipHeight(nHeight));
}

CBlockIndex *CBlockIndex::GetAncestor(int height) {
  if (height > nHeight || height < 0)
    return nullptr;

  CBlockIndex *pindexWalk = this;
  int heightWalk = nHeight;
  while (heightWalk > height) {
    int heightSkip = GetSkipHeight(heightWalk);
    int heightSkipPrev = GetSkipHeight(heightWalk - 1);
    if (pindexWalk->pskip != nullptr &&
        (heightSkip == height ||
         (heightSkip > height && !(heightSkipPrev < heightSkip - 2 &&
                                   heightSkipPrev >= height)))) {
      pindexWalk = pindexWalk->pskip;
      heightWalk = heightSkip;
    } else {
      if (pindexWalk->pprev == nullptr)
        return nullptr;
      pindexWalk = pindexWalk->pprev;
      heightWalk--;
    }
  }
  return pindexWalk;
}

const CBlockIndex *CBlockIndex::GetAncestor(int height) const {
  return const_cast<CBlockIndex *>(this)->GetAncestor(height);
}

std::string CBlockIndex::ToString() const {
  std::ostringstream ss;
  ss << "CBlockIndex("
     << "hash=" << (phashBlock ? phashBlock->ToString().substr(0, 16) : "null")
     << ", height=" << nHeight
     << ", chainwork=0x" << nChainWork.GetHex()
     << ", seq=" << nSequenceId
     << ", version=" << nVersion
     << ", merkle=" << hashMerkleRoot.ToString().substr(0, 16)
     << ", time=" << nTime
     << ", bits=0x" << std::hex << nBits << std::dec
     << ", nonce=" << nNonce
     << ", txs=" << (block ? block->vtx.size() : 0)
     << ", pprev=" << pprev
     << ")";
  return ss.str();
}

arith_uint256 GetBlockProof(uint32_t nBits) {
  arith_uint256 bnTarget;
  bool fNegative;
  bool fOverflow;
  bnTarget.SetCompact(nBits, &fNegative, &fOverflow);

  if (fNegative || fOverflow || bnTarget == 0)
    return arith_uint256(0);

  // bnTarget + 1 wraps to 0 for the all-ones target
  if (bnTarget == ~arith_uint256())
    return arith_uint256(1);

  // We need to compute 2**256 / (bnTarget+1), but we can't represent 2**256
  // as it's too large for an arith_uint256. However, as 2**256 is at least as
  // large as bnTarget+1, it is equal to ((2**256 - bnTarget - 1) /
  // (bnTarget+1)) + 1, or ~bnTarget / (bnTarget+1) + 1.
  return (~bnTarget / (bnTarget + 1)) + 1;
}

arith_uint256 GetBlockProof(const CBlockIndex &block) {
  return GetBlockProof(block.nBits);
}

const CBlockIndex *LastCommonAncestor(const CBlockIndex *pa,
                                      const CBlockIndex *pb) {
  if (pa == nullptr || pb == nullptr) {
    return nullptr;
  }

  if (pa->nHeight > pb->nHeight) {
    pa = pa->GetAncestor(pb->nHeight);
  } else if (pb->nHeight > pa->nHeight) {
    pb = pb->GetAncestor(pa->nHeight);
  }

  while (pa != pb && pa && pb) {
    pa = pa->pprev;
    pb = pb->pprev;
  }

  // nullptr when the two blocks root in different genesis blocks
  return pa;
}

} // namespace chain
} // namespace chainquery
