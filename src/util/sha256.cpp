// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/sha256.hpp"
#include <openssl/evp.h>
#include <stdexcept>

void CSHA256::CtxDeleter::operator()(evp_md_ctx_st *ctx) const {
  EVP_MD_CTX_free(ctx);
}

CSHA256::CSHA256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  Reset();
}

CSHA256::~CSHA256() = default;

CSHA256 &CSHA256::Reset() {
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
  }
  return *this;
}

CSHA256 &CSHA256::Write(const uint8_t *data, size_t len) {
  if (len > 0 && EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
  return *this;
}

void CSHA256::Finalize(uint8_t hash[OUTPUT_SIZE]) {
  unsigned int out_len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), hash, &out_len) != 1 ||
      out_len != OUTPUT_SIZE) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
}

uint256 Hash256(std::span<const uint8_t> data) {
  uint8_t tmp[CSHA256::OUTPUT_SIZE];
  CSHA256().Write(data.data(), data.size()).Finalize(tmp);

  uint256 out;
  CSHA256().Write(tmp, sizeof(tmp)).Finalize(out.begin());
  return out;
}

uint256 Hash256Pair(const uint256 &left, const uint256 &right) {
  uint8_t tmp[CSHA256::OUTPUT_SIZE];
  CSHA256().Write(left.begin(), left.size()).Write(right.begin(), right.size())
      .Finalize(tmp);

  uint256 out;
  CSHA256().Write(tmp, sizeof(tmp)).Finalize(out.begin());
  return out;
}
