// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/uint.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

struct evp_md_ctx_st;

/**
 * Incremental SHA-256 hasher backed by OpenSSL's EVP interface.
 *
 *   uint8_t out[CSHA256::OUTPUT_SIZE];
 *   CSHA256().Write(data, len).Finalize(out);
 *
 * Finalize() may be called once; Reset() starts a new digest.
 */
class CSHA256 {
public:
  static constexpr size_t OUTPUT_SIZE = 32;

  CSHA256();
  ~CSHA256();

  CSHA256(const CSHA256 &) = delete;
  CSHA256 &operator=(const CSHA256 &) = delete;

  CSHA256 &Write(const uint8_t *data, size_t len);
  void Finalize(uint8_t hash[OUTPUT_SIZE]);
  CSHA256 &Reset();

private:
  struct CtxDeleter {
    void operator()(evp_md_ctx_st *ctx) const;
  };
  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

// Double SHA-256 of a byte range: the hash used for block ids, txids and
// merkle nodes
uint256 Hash256(std::span<const uint8_t> data);

// Double SHA-256 of two concatenated 32-byte nodes (merkle tree step)
uint256 Hash256Pair(const uint256 &left, const uint256 &right);
