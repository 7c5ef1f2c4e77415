// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/block.hpp"
#include "chain/serialize.hpp"
#include "util/sha256.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {

// Smallest possible encodings, used to bound element counts before
// allocating: outpoint + empty script + sequence, value + empty script
static constexpr size_t kMinTxInSize = 32 + 4 + 1 + 4;
static constexpr size_t kMinTxOutSize = 8 + 1;

// BIP144 extended serialization: 0x00 marker then flag byte
static constexpr uint8_t kWitnessFlag = 0x01;

void SerializeTxIn(ser::Writer &w, const CTxIn &in) {
  w.write_hash(in.prevout.hash);
  w.write_uint32(in.prevout.n);
  w.write_var_bytes(in.scriptSig);
  w.write_uint32(in.nSequence);
}

void SerializeTxOut(ser::Writer &w, const CTxOut &out) {
  w.write_int64(out.nValue);
  w.write_var_bytes(out.scriptPubKey);
}

bool ReadInputs(ser::Reader &r, std::vector<CTxIn> &vin, uint64_t count) {
  vin.reserve(count);
  for (uint64_t i = 0; i < count && !r.has_error(); ++i) {
    CTxIn in;
    in.prevout.hash = r.read_hash();
    in.prevout.n = r.read_uint32();
    in.scriptSig = r.read_var_bytes();
    in.nSequence = r.read_uint32();
    vin.push_back(std::move(in));
  }
  return !r.has_error();
}

bool ReadOutputs(ser::Reader &r, std::vector<CTxOut> &vout) {
  uint64_t count = r.read_count(kMinTxOutSize);
  vout.reserve(count);
  int64_t total = 0;
  for (uint64_t i = 0; i < count && !r.has_error(); ++i) {
    CTxOut out;
    out.nValue = r.read_int64();
    if (!r.has_error() && !MoneyRange(out.nValue)) {
      r.set_error("output value out of range");
      break;
    }
    total += out.nValue;
    if (!MoneyRange(total)) {
      r.set_error("output total out of range");
      break;
    }
    out.scriptPubKey = r.read_var_bytes();
    vout.push_back(std::move(out));
  }
  return !r.has_error();
}

} // namespace

// CBlockHeader

uint256 CBlockHeader::GetHash() const {
  const auto s = SerializeFixed();
  return Hash256(s);
}

CBlockHeader::HeaderBytes CBlockHeader::SerializeFixed() const noexcept {
  HeaderBytes data{};

  ser::WriteLE32(data.data() + OFF_VERSION, static_cast<uint32_t>(nVersion));
  std::copy(hashPrevBlock.begin(), hashPrevBlock.end(), data.begin() + OFF_PREV);
  std::copy(hashMerkleRoot.begin(), hashMerkleRoot.end(),
            data.begin() + OFF_MERKLE);
  ser::WriteLE32(data.data() + OFF_TIME, nTime);
  ser::WriteLE32(data.data() + OFF_BITS, nBits);
  ser::WriteLE32(data.data() + OFF_NONCE, nNonce);

  return data;
}

bool CBlockHeader::Deserialize(const uint8_t *data, size_t size) noexcept {
  if (size != HEADER_SIZE) {
    return false;
  }

  nVersion = static_cast<int32_t>(ser::ReadLE32(data + OFF_VERSION));
  std::copy(data + OFF_PREV, data + OFF_PREV + UINT256_BYTES,
            hashPrevBlock.begin());
  std::copy(data + OFF_MERKLE, data + OFF_MERKLE + UINT256_BYTES,
            hashMerkleRoot.begin());
  nTime = ser::ReadLE32(data + OFF_TIME);
  nBits = ser::ReadLE32(data + OFF_BITS);
  nNonce = ser::ReadLE32(data + OFF_NONCE);

  return true;
}

std::string CBlockHeader::ToString() const {
  std::stringstream s;
  s << "CBlockHeader(\n";
  s << "  version=" << nVersion << "\n";
  s << "  hashPrevBlock=" << hashPrevBlock.GetHex() << "\n";
  s << "  hashMerkleRoot=" << hashMerkleRoot.GetHex() << "\n";
  s << "  nTime=" << nTime << "\n";
  s << "  nBits=0x" << std::hex << std::setw(8) << std::setfill('0') << nBits
    << std::dec << "\n";
  s << "  nNonce=" << nNonce << "\n";
  s << "  hash=" << GetHash().GetHex() << "\n";
  s << ")\n";
  return s.str();
}

// CTransaction

CTransaction::CTransaction(const CMutableTransaction &tx)
    : nVersion(tx.nVersion), vin(tx.vin), vout(tx.vout),
      nLockTime(tx.nLockTime), hash_(ComputeHash()) {}

CTransaction::CTransaction(CMutableTransaction &&tx)
    : nVersion(tx.nVersion), vin(std::move(tx.vin)), vout(std::move(tx.vout)),
      nLockTime(tx.nLockTime), hash_(ComputeHash()) {}

uint256 CTransaction::ComputeHash() const {
  ser::Writer w;
  Serialize(w, /*include_witness=*/false);
  return Hash256(w.data());
}

int64_t CTransaction::GetValueOut() const {
  int64_t total = 0;
  for (const auto &out : vout) {
    if (!MoneyRange(out.nValue) || !MoneyRange(total + out.nValue)) {
      throw std::runtime_error(std::string(__func__) + ": value out of range");
    }
    total += out.nValue;
  }
  return total;
}

bool CTransaction::HasWitness() const noexcept {
  return std::any_of(vin.begin(), vin.end(), [](const CTxIn &in) {
    return !in.scriptWitness.empty();
  });
}

void CTransaction::Serialize(ser::Writer &w, bool include_witness) const {
  const bool witness = include_witness && HasWitness();

  w.write_int32(nVersion);
  if (witness) {
    w.write_uint8(0x00);
    w.write_uint8(kWitnessFlag);
  }
  w.write_compact_size(vin.size());
  for (const auto &in : vin) {
    SerializeTxIn(w, in);
  }
  w.write_compact_size(vout.size());
  for (const auto &out : vout) {
    SerializeTxOut(w, out);
  }
  if (witness) {
    for (const auto &in : vin) {
      w.write_compact_size(in.scriptWitness.size());
      for (const auto &item : in.scriptWitness) {
        w.write_var_bytes(item);
      }
    }
  }
  w.write_uint32(nLockTime);
}

std::string CTransaction::ToString() const {
  std::stringstream s;
  s << "CTransaction(hash=" << hash_.GetHex().substr(0, 10)
    << ", ver=" << nVersion << ", vin.size=" << vin.size()
    << ", vout.size=" << vout.size() << ", nLockTime=" << nLockTime << ")\n";
  for (const auto &in : vin) {
    s << "    CTxIn(" << in.prevout.hash.GetHex().substr(0, 10) << ", "
      << in.prevout.n << ", scriptSig="
      << chainquery::util::HexStr(in.scriptSig).substr(0, 24)
      << ", nSequence=" << in.nSequence << ")\n";
  }
  for (const auto &out : vout) {
    s << "    CTxOut(nValue=" << out.nValue << ", scriptPubKey="
      << chainquery::util::HexStr(out.scriptPubKey).substr(0, 30) << ")\n";
  }
  return s.str();
}

CTransactionRef DeserializeTransaction(ser::Reader &r) {
  CMutableTransaction tx;
  tx.nVersion = r.read_int32();

  bool has_witness = false;
  uint64_t vin_count = r.read_count(kMinTxInSize);
  if (r.has_error()) {
    return nullptr;
  }
  if (vin_count == 0) {
    // Empty vin is the BIP144 marker; the flag byte must follow
    uint8_t flag = r.read_uint8();
    if (r.has_error()) {
      return nullptr;
    }
    if (flag != kWitnessFlag) {
      r.set_error("unknown transaction optional data");
      return nullptr;
    }
    has_witness = true;
    vin_count = r.read_count(kMinTxInSize);
  }

  if (!ReadInputs(r, tx.vin, vin_count) || !ReadOutputs(r, tx.vout)) {
    return nullptr;
  }

  if (has_witness) {
    bool any_witness = false;
    for (auto &in : tx.vin) {
      uint64_t items = r.read_count(1);
      in.scriptWitness.reserve(items);
      for (uint64_t i = 0; i < items && !r.has_error(); ++i) {
        in.scriptWitness.push_back(r.read_var_bytes());
      }
      if (r.has_error()) {
        return nullptr;
      }
      any_witness = any_witness || !in.scriptWitness.empty();
    }
    if (!any_witness) {
      r.set_error("superfluous witness record");
      return nullptr;
    }
  }

  tx.nLockTime = r.read_uint32();
  if (r.has_error()) {
    return nullptr;
  }
  return MakeTransactionRef(std::move(tx));
}

// CBlock

std::string CBlock::ToString() const {
  std::stringstream s;
  s << "CBlock(hash=" << GetHash().GetHex() << ", ver=" << nVersion
    << ", hashPrevBlock=" << hashPrevBlock.GetHex()
    << ", hashMerkleRoot=" << hashMerkleRoot.GetHex() << ", nTime=" << nTime
    << ", nBits=" << std::hex << std::setw(8) << std::setfill('0') << nBits
    << std::dec << ", nNonce=" << nNonce << ", vtx=" << vtx.size() << ")\n";
  for (const auto &tx : vtx) {
    s << "  " << tx->ToString();
  }
  return s.str();
}
