// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include "util/uint.hpp"

// Forward declarations
class CBlock;

namespace chainquery {
namespace validation {

/**
 * ============================================================================
 * BLOCK DECODING AND CONTEXT-FREE CHECKS
 * ============================================================================
 *
 * DecodeBlock()     : raw bytes -> CBlock, rejects anything that is not
 *                     exactly one well-formed block ("malformed-block")
 * CheckMerkleRoot() : header commits to the decoded transactions
 *                     ("bad-txnmrklroot")
 *
 * Contextual checks (parent known, not a duplicate) happen in
 * ChainstateManager::AcceptBlock(). Proof of work is not verified.
 * ============================================================================
 */

/**
 * Validation state - tracks why validation failed
 * Simplified from Bitcoin Core's BlockValidationState
 */
class ValidationState {
public:
  enum class Result {
    VALID,
    INVALID, // Invalid block
    ERROR    // System error
  };

  ValidationState() : result_(Result::VALID) {}

  bool IsValid() const { return result_ == Result::VALID; }
  bool IsInvalid() const { return result_ == Result::INVALID; }
  bool IsError() const { return result_ == Result::ERROR; }

  bool Invalid(const std::string &reject_reason,
               const std::string &debug_message = "") {
    result_ = Result::INVALID;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  bool Error(const std::string &reject_reason,
             const std::string &debug_message = "") {
    result_ = Result::ERROR;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  const std::string& GetRejectReason() const { return reject_reason_; }
  const std::string& GetDebugMessage() const { return debug_message_; }

  std::string ToString() const {
    if (IsValid())
      return "valid";
    return debug_message_.empty() ? reject_reason_
                                  : reject_reason_ + " (" + debug_message_ + ")";
  }

private:
  Result result_;
  std::string reject_reason_;
  std::string debug_message_;
};

// Reject reasons
inline constexpr const char *REJECT_MALFORMED = "malformed-block";
inline constexpr const char *REJECT_BAD_MERKLE = "bad-txnmrklroot";
inline constexpr const char *REJECT_DUPLICATE = "duplicate";
inline constexpr const char *REJECT_PREV_NOT_FOUND = "prev-blk-not-found";

// Decode one serialized block. Fails with "malformed-block" on truncation,
// oversized script or count fields, non-canonical CompactSize, trailing
// bytes, or a block without transactions. Pure and deterministic.
bool DecodeBlock(std::span<const uint8_t> bytes, CBlock &block,
                 ValidationState &state);

// Inverse of DecodeBlock (witness data included where present)
std::vector<uint8_t> EncodeBlock(const CBlock &block);

// Bitcoin merkle root over txids; odd levels duplicate the last hash.
// Returns the null hash for an empty list.
uint256 ComputeMerkleRoot(std::vector<uint256> hashes);

uint256 BlockMerkleRoot(const CBlock &block);

bool CheckMerkleRoot(const CBlock &block, ValidationState &state);

} // namespace validation
} // namespace chainquery
