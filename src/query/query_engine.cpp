// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "query/query_engine.hpp"
#include "chain/block_index.hpp"
#include "chain/chainstate_manager.hpp"
#include "util/string_parsing.hpp"
#include <nlohmann/json.hpp>

namespace chainquery {
namespace query {

using json = nlohmann::json;

const char *QueryErrorMessage(QueryError error) {
  switch (error) {
  case QueryError::BLOCK_NOT_FOUND:
    return "Invalid Block Hash";
  case QueryError::TX_NOT_FOUND:
    return "Invalid Transaction Hash";
  case QueryError::CHAIN_EMPTY:
    return "Chain is empty";
  }
  return "Unknown error";
}

void to_json(json &j, const BlockHeaderInfo &info) {
  j = json{{"version", info.version},
           {"prev_block", info.prev_block.GetHex()},
           {"mrkl_root", info.mrkl_root.GetHex()},
           {"time", info.time},
           {"bits", info.bits},
           {"nonce", info.nonce}};
}

void to_json(json &j, const TransactionSummary &info) {
  j = json{{"tx_hash", info.tx_hash.GetHex()}, {"value", info.value}};
}

void to_json(json &j, const BlockTransactionsInfo &info) {
  j = json{{"tx_count", info.transactions.size()},
           {"transactions", info.transactions}};
}

void to_json(json &j, const TransactionInfo &info) {
  j = json{{"block_hash", info.block_hash.GetHex()},
           {"version", info.version},
           {"input_tx_count", info.input_tx_count},
           {"output_tx_count", info.output_tx_count},
           {"value", info.value},
           {"lock_time", info.lock_time}};
}

void to_json(json &j, const InputInfo &info) {
  j = json{{"prev_hash", info.prev_hash.GetHex()},
           {"sig_script", util::HexStr(info.sig_script)},
           {"seq_num", info.seq_num}};
}

void to_json(json &j, const TransactionInputsInfo &info) {
  j = json{{"input_tx_count", info.inputs.size()},
           {"input_transactions", info.inputs}};
}

void to_json(json &j, const OutputInfo &info) {
  j = json{{"value", info.value},
           {"sig_script", util::HexStr(info.sig_script)}};
}

void to_json(json &j, const TransactionOutputsInfo &info) {
  j = json{{"output_tx_count", info.outputs.size()},
           {"output_transactions", info.outputs}};
}

QueryEngine::QueryEngine(const validation::ChainstateManager &chainstate)
    : chainstate_(chainstate) {}

QueryResult<BlockHeaderInfo>
QueryEngine::GetBlockHeader(const uint256 &block_hash) const {
  const chain::CBlockIndex *pindex = chainstate_.LookupBlockIndex(block_hash);
  if (!pindex) {
    return QueryError::BLOCK_NOT_FOUND;
  }

  const CBlockHeader header = pindex->GetBlockHeader();
  BlockHeaderInfo info;
  info.version = header.nVersion;
  info.prev_block = header.hashPrevBlock;
  info.mrkl_root = header.hashMerkleRoot;
  info.time = header.nTime;
  info.bits = header.nBits;
  info.nonce = header.nNonce;
  return info;
}

QueryResult<BlockTransactionsInfo>
QueryEngine::GetBlockTransactions(const uint256 &block_hash) const {
  const chain::CBlockIndex *pindex = chainstate_.LookupBlockIndex(block_hash);
  if (!pindex || !pindex->block) {
    return QueryError::BLOCK_NOT_FOUND;
  }

  BlockTransactionsInfo info;
  info.transactions.reserve(pindex->block->vtx.size());
  for (const auto &tx : pindex->block->vtx) {
    info.transactions.push_back(TransactionSummary{tx->GetHash(), tx->GetValueOut()});
  }
  return info;
}

QueryResult<int> QueryEngine::GetBlockHeight(const uint256 &block_hash) const {
  const chain::CBlockIndex *pindex = chainstate_.LookupBlockIndex(block_hash);
  if (!pindex) {
    return QueryError::BLOCK_NOT_FOUND;
  }
  return pindex->nHeight;
}

QueryResult<bool> QueryEngine::IsMainChain(const uint256 &block_hash) const {
  // Snapshot first: a block indexed after it is simply not on its chain
  auto snapshot = chainstate_.GetSnapshot();
  const chain::CBlockIndex *pindex = chainstate_.LookupBlockIndex(block_hash);
  if (!pindex) {
    return QueryError::BLOCK_NOT_FOUND;
  }
  return snapshot->Contains(pindex);
}

QueryResult<uint256> QueryEngine::GetLatestBlock() const {
  auto snapshot = chainstate_.GetSnapshot();
  if (snapshot->IsEmpty()) {
    return QueryError::CHAIN_EMPTY;
  }
  return snapshot->hash;
}

QueryResult<int> QueryEngine::GetLatestHeight() const {
  auto snapshot = chainstate_.GetSnapshot();
  if (snapshot->IsEmpty()) {
    return QueryError::CHAIN_EMPTY;
  }
  return snapshot->height;
}

QueryResult<TransactionInfo>
QueryEngine::GetTransactionInfo(const uint256 &txid) const {
  auto found = chainstate_.LocateTransaction(txid);
  if (!found) {
    return QueryError::TX_NOT_FOUND;
  }

  const CTransaction &tx = *found->tx;
  TransactionInfo info;
  info.block_hash = found->pindex->GetBlockHash();
  info.version = tx.nVersion;
  info.input_tx_count = tx.vin.size();
  info.output_tx_count = tx.vout.size();
  info.value = tx.GetValueOut();
  info.lock_time = tx.nLockTime;
  return info;
}

QueryResult<TransactionInputsInfo>
QueryEngine::GetTransactionInputs(const uint256 &txid) const {
  auto found = chainstate_.LocateTransaction(txid);
  if (!found) {
    return QueryError::TX_NOT_FOUND;
  }

  TransactionInputsInfo info;
  info.inputs.reserve(found->tx->vin.size());
  for (const auto &in : found->tx->vin) {
    info.inputs.push_back(InputInfo{in.prevout.hash, in.scriptSig, in.nSequence});
  }
  return info;
}

QueryResult<TransactionOutputsInfo>
QueryEngine::GetTransactionOutputs(const uint256 &txid) const {
  auto found = chainstate_.LocateTransaction(txid);
  if (!found) {
    return QueryError::TX_NOT_FOUND;
  }

  TransactionOutputsInfo info;
  info.outputs.reserve(found->tx->vout.size());
  for (const auto &out : found->tx->vout) {
    info.outputs.push_back(OutputInfo{out.nValue, out.scriptPubKey});
  }
  return info;
}

} // namespace query
} // namespace chainquery
