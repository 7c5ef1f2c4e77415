// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace chainquery {

namespace validation {
class ChainstateManager;
} // namespace validation

namespace query {

enum class QueryError {
  BLOCK_NOT_FOUND, // unknown block hash
  TX_NOT_FOUND,    // unknown txid
  CHAIN_EMPTY      // nothing ingested yet
};

// Message used for error bodies ("Invalid Block Hash", ...)
const char *QueryErrorMessage(QueryError error);

/**
 * Value-or-error result of a query. Query failures are expected outcomes
 * and never thrown.
 */
template <typename T> class QueryResult {
public:
  QueryResult(T value) : result_(std::move(value)) {}
  QueryResult(QueryError error) : result_(error) {}

  bool ok() const { return std::holds_alternative<T>(result_); }
  explicit operator bool() const { return ok(); }

  const T &value() const { return std::get<T>(result_); }
  const T &operator*() const { return value(); }
  const T *operator->() const { return &value(); }

  QueryError error() const { return std::get<QueryError>(result_); }

private:
  std::variant<T, QueryError> result_;
};

struct BlockHeaderInfo {
  int32_t version{0};
  uint256 prev_block{};
  uint256 mrkl_root{};
  uint32_t time{0};
  uint32_t bits{0};
  uint32_t nonce{0};
};

struct TransactionSummary {
  uint256 tx_hash{};
  int64_t value{0}; // total output value, satoshis
};

struct BlockTransactionsInfo {
  std::vector<TransactionSummary> transactions;
};

struct TransactionInfo {
  uint256 block_hash{};
  int32_t version{0};
  size_t input_tx_count{0};
  size_t output_tx_count{0};
  int64_t value{0}; // satoshis
  uint32_t lock_time{0};
};

struct InputInfo {
  uint256 prev_hash{};
  std::vector<uint8_t> sig_script;
  uint32_t seq_num{0};
};

struct TransactionInputsInfo {
  std::vector<InputInfo> inputs;
};

struct OutputInfo {
  int64_t value{0}; // satoshis
  std::vector<uint8_t> sig_script;
};

struct TransactionOutputsInfo {
  std::vector<OutputInfo> outputs;
};

// JSON bodies with the REST field names. Hashes are display-order hex,
// scripts are hex of the raw script bytes.
void to_json(nlohmann::json &j, const BlockHeaderInfo &info);
void to_json(nlohmann::json &j, const TransactionSummary &info);
void to_json(nlohmann::json &j, const BlockTransactionsInfo &info);
void to_json(nlohmann::json &j, const TransactionInfo &info);
void to_json(nlohmann::json &j, const InputInfo &info);
void to_json(nlohmann::json &j, const TransactionInputsInfo &info);
void to_json(nlohmann::json &j, const OutputInfo &info);
void to_json(nlohmann::json &j, const TransactionOutputsInfo &info);

/**
 * QueryEngine - read-only answers over the chain index.
 *
 * Every call takes one ChainSnapshot at its start and answers from it, so
 * a concurrent reorg is either fully visible or not at all. Safe to call
 * from any number of threads while ingestion runs.
 */
class QueryEngine {
public:
  // LIFETIME: chainstate must outlive the engine
  explicit QueryEngine(const validation::ChainstateManager &chainstate);

  QueryResult<BlockHeaderInfo> GetBlockHeader(const uint256 &block_hash) const;
  QueryResult<BlockTransactionsInfo>
  GetBlockTransactions(const uint256 &block_hash) const;
  QueryResult<int> GetBlockHeight(const uint256 &block_hash) const;
  QueryResult<bool> IsMainChain(const uint256 &block_hash) const;
  QueryResult<uint256> GetLatestBlock() const;
  QueryResult<int> GetLatestHeight() const;
  QueryResult<TransactionInfo> GetTransactionInfo(const uint256 &txid) const;
  QueryResult<TransactionInputsInfo>
  GetTransactionInputs(const uint256 &txid) const;
  QueryResult<TransactionOutputsInfo>
  GetTransactionOutputs(const uint256 &txid) const;

private:
  const validation::ChainstateManager &chainstate_;
};

} // namespace query
} // namespace chainquery
