// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#pragma once

#include "util/uint.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace ser {
class Reader;
class Writer;
} // namespace ser

// CBlockHeader - Bitcoin block header (80 bytes on the wire)
class CBlockHeader
{
public:
    int32_t nVersion{0};
    uint256 hashPrevBlock{};        // Hash of previous block header (wire byte order)
    uint256 hashMerkleRoot{};       // Merkle root of the block's txids (wire byte order)
    uint32_t nTime{0};              // Unix timestamp
    uint32_t nBits{0};              // Difficulty target (compact format)
    uint32_t nNonce{0};

    static constexpr size_t UINT256_BYTES = 32;

    // Serialized header size: 4 + 32 + 32 + 4 + 4 + 4 = 80 bytes
    static constexpr size_t HEADER_SIZE =
        4 +                          // nVersion (int32_t)
        UINT256_BYTES +              // hashPrevBlock
        UINT256_BYTES +              // hashMerkleRoot
        4 +                          // nTime (uint32_t)
        4 +                          // nBits (uint32_t)
        4;                           // nNonce (uint32_t)

    static constexpr size_t OFF_VERSION  = 0;
    static constexpr size_t OFF_PREV     = OFF_VERSION + 4;
    static constexpr size_t OFF_MERKLE   = OFF_PREV + UINT256_BYTES;
    static constexpr size_t OFF_TIME     = OFF_MERKLE + UINT256_BYTES;
    static constexpr size_t OFF_BITS     = OFF_TIME + 4;
    static constexpr size_t OFF_NONCE    = OFF_BITS + 4;

    static_assert(sizeof(uint256) == UINT256_BYTES, "uint256 must be 32 bytes");
    static_assert(HEADER_SIZE == 80, "Header size must be 80 bytes");
    static_assert(OFF_NONCE + 4 == HEADER_SIZE, "offset math must be correct");

    using HeaderBytes = std::array<uint8_t, HEADER_SIZE>;

    void SetNull() noexcept
    {
        nVersion = 0;
        hashPrevBlock.SetNull();
        hashMerkleRoot.SetNull();
        nTime = 0;
        nBits = 0;
        nNonce = 0;
    }

    [[nodiscard]] bool IsNull() const noexcept
    {
        return nBits == 0;
    }

    // Double SHA-256 of the 80 serialized header bytes
    [[nodiscard]] uint256 GetHash() const;

    [[nodiscard]] HeaderBytes SerializeFixed() const noexcept;

    // Deserialize from exactly HEADER_SIZE bytes
    [[nodiscard]] bool Deserialize(const uint8_t* data, size_t size) noexcept;

    [[nodiscard]] bool Deserialize(std::span<const uint8_t> bytes) noexcept {
        return Deserialize(bytes.data(), bytes.size());
    }

    [[nodiscard]] std::string ToString() const;

    friend bool operator==(const CBlockHeader& a, const CBlockHeader& b)
    {
        return a.nVersion == b.nVersion && a.hashPrevBlock == b.hashPrevBlock &&
               a.hashMerkleRoot == b.hashMerkleRoot && a.nTime == b.nTime &&
               a.nBits == b.nBits && a.nNonce == b.nNonce;
    }
};

// COutPoint - reference to output n of a previous transaction
struct COutPoint
{
    uint256 hash{};
    uint32_t n{NULL_INDEX};

    static constexpr uint32_t NULL_INDEX = 0xffffffff;

    // Coinbase inputs spend the null outpoint
    [[nodiscard]] bool IsNull() const noexcept { return hash.IsNull() && n == NULL_INDEX; }

    friend bool operator==(const COutPoint& a, const COutPoint& b)
    {
        return a.hash == b.hash && a.n == b.n;
    }
};

struct CTxIn
{
    COutPoint prevout;
    std::vector<uint8_t> scriptSig;
    uint32_t nSequence{SEQUENCE_FINAL};
    std::vector<std::vector<uint8_t>> scriptWitness;   // BIP144 witness stack, may be empty

    static constexpr uint32_t SEQUENCE_FINAL = 0xffffffff;

    friend bool operator==(const CTxIn& a, const CTxIn& b)
    {
        return a.prevout == b.prevout && a.scriptSig == b.scriptSig &&
               a.nSequence == b.nSequence && a.scriptWitness == b.scriptWitness;
    }
};

// Satoshis per bitcoin and the total supply cap
static constexpr int64_t COIN = 100000000;
static constexpr int64_t MAX_MONEY = 21000000 * COIN;

inline bool MoneyRange(int64_t value) { return value >= 0 && value <= MAX_MONEY; }

struct CTxOut
{
    int64_t nValue{-1};             // Satoshis
    std::vector<uint8_t> scriptPubKey;

    friend bool operator==(const CTxOut& a, const CTxOut& b)
    {
        return a.nValue == b.nValue && a.scriptPubKey == b.scriptPubKey;
    }
};

// Mutable builder for CTransaction (decoder output, test fixtures)
struct CMutableTransaction
{
    int32_t nVersion{1};
    std::vector<CTxIn> vin;
    std::vector<CTxOut> vout;
    uint32_t nLockTime{0};
};

/**
 * CTransaction - immutable transaction.
 *
 * The txid is computed once at construction from the non-witness
 * serialization, so witness data never changes it.
 */
class CTransaction
{
public:
    const int32_t nVersion;
    const std::vector<CTxIn> vin;
    const std::vector<CTxOut> vout;
    const uint32_t nLockTime;

    explicit CTransaction(const CMutableTransaction& tx);
    explicit CTransaction(CMutableTransaction&& tx);

    [[nodiscard]] const uint256& GetHash() const noexcept { return hash_; }

    // Sum of output values. Throws std::runtime_error when an output or the
    // running total leaves MoneyRange.
    [[nodiscard]] int64_t GetValueOut() const;

    [[nodiscard]] bool HasWitness() const noexcept;

    [[nodiscard]] bool IsCoinBase() const noexcept
    {
        return vin.size() == 1 && vin[0].prevout.IsNull();
    }

    // Wire serialization; include_witness selects the BIP144 format when the
    // transaction carries witness data
    void Serialize(ser::Writer& w, bool include_witness = true) const;

    [[nodiscard]] std::string ToString() const;

    friend bool operator==(const CTransaction& a, const CTransaction& b)
    {
        return a.nVersion == b.nVersion && a.vin == b.vin &&
               a.vout == b.vout && a.nLockTime == b.nLockTime;
    }

private:
    uint256 ComputeHash() const;

    const uint256 hash_;
};

using CTransactionRef = std::shared_ptr<const CTransaction>;

template <typename Tx>
CTransactionRef MakeTransactionRef(Tx&& tx)
{
    return std::make_shared<const CTransaction>(std::forward<Tx>(tx));
}

// CBlock - header plus transactions. Immutable once handed to the chain index.
class CBlock : public CBlockHeader
{
public:
    std::vector<CTransactionRef> vtx;

    CBlock() = default;
    explicit CBlock(const CBlockHeader& header) : CBlockHeader(header) {}

    [[nodiscard]] const CBlockHeader& GetBlockHeader() const noexcept { return *this; }

    [[nodiscard]] std::string ToString() const;
};

// Transaction decoding from a wire cursor. Sets the reader's error flag on
// any format violation; returns nullptr in that case.
CTransactionRef DeserializeTransaction(ser::Reader& r);
