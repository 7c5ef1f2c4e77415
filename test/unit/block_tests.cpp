// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for chain/block.cpp - headers, transactions and the block codec

#include <catch2/catch_test_macros.hpp>
#include "chain/block.hpp"
#include "chain/serialize.hpp"
#include "chain/validation.hpp"
#include "util/string_parsing.hpp"
#include "../test_blocks.hpp"
#include <cstdint>
#include <stdexcept>

using namespace chainquery;
using namespace chainquery::test;
using chainquery::validation::ValidationState;

TEST_CASE("Block codec - genesis block decodes", "[block][codec]") {
    const auto bytes = ParseHex(GENESIS_BLOCK_HEX);
    REQUIRE(bytes.size() == 285);

    CBlock block;
    ValidationState state;
    REQUIRE(validation::DecodeBlock(bytes, block, state));
    REQUIRE(state.IsValid());

    SECTION("Header fields") {
        REQUIRE(block.nVersion == 1);
        REQUIRE(block.hashPrevBlock.IsNull());
        REQUIRE(block.hashMerkleRoot.GetHex() == GENESIS_MERKLE_ROOT);
        REQUIRE(block.nTime == 1231006505);
        REQUIRE(block.nBits == 0x1d00ffff);
        REQUIRE(block.nNonce == 2083236893);
        REQUIRE(block.GetHash().GetHex() == GENESIS_HASH);
    }

    SECTION("Coinbase transaction") {
        REQUIRE(block.vtx.size() == 1);
        const CTransaction& tx = *block.vtx[0];
        REQUIRE(tx.IsCoinBase());
        REQUIRE_FALSE(tx.HasWitness());
        REQUIRE(tx.nVersion == 1);
        REQUIRE(tx.vin.size() == 1);
        REQUIRE(tx.vin[0].prevout.IsNull());
        REQUIRE(tx.vin[0].scriptSig.size() == 77);
        REQUIRE(tx.vin[0].nSequence == 0xffffffff);
        REQUIRE(tx.vout.size() == 1);
        REQUIRE(tx.vout[0].nValue == 5000000000LL);
        REQUIRE(tx.vout[0].scriptPubKey.size() == 67);
        REQUIRE(tx.nLockTime == 0);
        // Single transaction: txid is the merkle root
        REQUIRE(tx.GetHash().GetHex() == GENESIS_MERKLE_ROOT);
        REQUIRE(tx.GetValueOut() == 5000000000LL);
    }

    SECTION("Merkle root matches") {
        REQUIRE(validation::CheckMerkleRoot(block, state));
    }

    SECTION("Re-encoding reproduces the original bytes") {
        REQUIRE(validation::EncodeBlock(block) == bytes);
    }
}

TEST_CASE("Block codec - header layout", "[block][codec]") {
    auto block = MakeBlock(uint256S("0102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f20"), 7);
    const CBlockHeader& header = block->GetBlockHeader();
    auto bytes = header.SerializeFixed();

    REQUIRE(bytes.size() == CBlockHeader::HEADER_SIZE);
    REQUIRE(ser::ReadLE32(bytes.data() + CBlockHeader::OFF_VERSION) == 1);
    // Previous hash in wire order: last display byte first
    REQUIRE(bytes[CBlockHeader::OFF_PREV] == 0x20);
    REQUIRE(bytes[CBlockHeader::OFF_PREV + 31] == 0x01);
    REQUIRE(ser::ReadLE32(bytes.data() + CBlockHeader::OFF_BITS) == EASY_BITS);
    REQUIRE(ser::ReadLE32(bytes.data() + CBlockHeader::OFF_NONCE) == 7);

    CBlockHeader decoded;
    REQUIRE(decoded.Deserialize(bytes.data(), bytes.size()));
    REQUIRE(decoded == header);
    REQUIRE_FALSE(decoded.Deserialize(bytes.data(), bytes.size() - 1));
}

TEST_CASE("Block codec - round trip of a multi-transaction block", "[block][codec]") {
    auto parent = MakeBlock(uint256(), 1);
    auto spend1 = MakeSpend(parent->vtx[0]->GetHash(), 0, 1000);
    auto spend2 = MakeSpend(spend1->GetHash(), 0, 900, 0x12345678);
    auto block = MakeBlock(parent->GetHash(), 2, {spend1, spend2});

    auto bytes = validation::EncodeBlock(*block);

    CBlock decoded;
    ValidationState state;
    REQUIRE(validation::DecodeBlock(bytes, decoded, state));
    REQUIRE(decoded.GetHash() == block->GetHash());
    REQUIRE(decoded.vtx.size() == 3);
    for (size_t i = 0; i < decoded.vtx.size(); i++) {
        REQUIRE(*decoded.vtx[i] == *block->vtx[i]);
        REQUIRE(decoded.vtx[i]->GetHash() == block->vtx[i]->GetHash());
    }
    REQUIRE(decoded.vtx[2]->vin[0].nSequence == 0x12345678);
    REQUIRE(validation::CheckMerkleRoot(decoded, state));
}

TEST_CASE("Block codec - segwit transactions", "[block][codec][segwit]") {
    CMutableTransaction mtx;
    mtx.nVersion = 2;
    CTxIn in;
    in.prevout.hash = uint256S("aa");
    in.prevout.n = 1;
    in.scriptWitness = {{0x30, 0x44}, {0x02, 0x21, 0x03}};
    mtx.vin.push_back(in);
    CTxOut out;
    out.nValue = 12345;
    out.scriptPubKey = {0x00, 0x14};
    mtx.vout.push_back(out);
    mtx.nLockTime = 500000;

    CMutableTransaction stripped = mtx;
    stripped.vin[0].scriptWitness.clear();

    auto tx = MakeTransactionRef(mtx);
    auto tx_stripped = MakeTransactionRef(stripped);

    SECTION("Witness data does not change the txid") {
        REQUIRE(tx->HasWitness());
        REQUIRE(tx->GetHash() == tx_stripped->GetHash());
    }

    SECTION("Extended serialization carries marker and flag") {
        ser::Writer w;
        tx->Serialize(w);
        REQUIRE(w.data()[4] == 0x00);
        REQUIRE(w.data()[5] == 0x01);

        ser::Writer plain;
        tx->Serialize(plain, false);
        REQUIRE(plain.size() < w.size());
    }

    SECTION("Witness block round trip") {
        auto block = MakeBlock(uint256(), 3, {tx});
        auto bytes = validation::EncodeBlock(*block);

        CBlock decoded;
        ValidationState state;
        REQUIRE(validation::DecodeBlock(bytes, decoded, state));
        REQUIRE(decoded.vtx[1]->vin[0].scriptWitness == in.scriptWitness);
        REQUIRE(decoded.vtx[1]->GetHash() == tx->GetHash());
        REQUIRE(validation::EncodeBlock(decoded) == bytes);
    }

    SECTION("Unknown flag byte is rejected") {
        ser::Writer w;
        tx->Serialize(w);
        auto bytes = w.release();
        bytes[5] = 0x02;
        ser::Reader r(bytes);
        REQUIRE(DeserializeTransaction(r) == nullptr);
        REQUIRE(r.has_error());
        REQUIRE(std::string(r.error_reason()) == "unknown transaction optional data");
    }

    SECTION("Witness marker with all-empty witnesses is rejected") {
        ser::Writer w;
        w.write_int32(2);
        w.write_uint8(0x00);
        w.write_uint8(0x01);
        w.write_compact_size(1);
        w.write_hash(uint256S("aa"));
        w.write_uint32(1);
        w.write_var_bytes(std::vector<uint8_t>{});
        w.write_uint32(0xffffffff);
        w.write_compact_size(1);
        w.write_int64(1);
        w.write_var_bytes(std::vector<uint8_t>{0x51});
        w.write_compact_size(0); // empty witness stack
        w.write_uint32(0);

        ser::Reader r(w.data());
        REQUIRE(DeserializeTransaction(r) == nullptr);
        REQUIRE(std::string(r.error_reason()) == "superfluous witness record");
    }
}

TEST_CASE("CTransaction - value and coinbase detection", "[block]") {
    auto coinbase = MakeCoinbase(1, 625000000);
    REQUIRE(coinbase->IsCoinBase());
    REQUIRE(coinbase->GetValueOut() == 625000000);

    CMutableTransaction mtx;
    mtx.vin.resize(1);
    mtx.vin[0].prevout.hash = uint256S("01");
    mtx.vin[0].prevout.n = 0;
    mtx.vout.resize(2);
    mtx.vout[0].nValue = 100;
    mtx.vout[1].nValue = 250;
    CTransaction tx(mtx);
    REQUIRE_FALSE(tx.IsCoinBase());
    REQUIRE(tx.GetValueOut() == 350);
}

TEST_CASE("CTransaction - GetValueOut rejects values outside the money range", "[block][money]") {
    CMutableTransaction mtx;
    mtx.vin.resize(1);
    mtx.vin[0].prevout.hash = uint256S("01");
    mtx.vout.resize(2);

    SECTION("Sum that would overflow int64") {
        mtx.vout[0].nValue = INT64_MAX;
        mtx.vout[1].nValue = INT64_MAX;
        CTransaction tx(mtx);
        REQUIRE_THROWS_AS(tx.GetValueOut(), std::runtime_error);
    }

    SECTION("Negative output") {
        mtx.vout[0].nValue = 10;
        mtx.vout[1].nValue = -1;
        CTransaction tx(mtx);
        REQUIRE_THROWS_AS(tx.GetValueOut(), std::runtime_error);
    }

    SECTION("Total above MAX_MONEY") {
        mtx.vout[0].nValue = MAX_MONEY;
        mtx.vout[1].nValue = 1;
        CTransaction tx(mtx);
        REQUIRE_THROWS_AS(tx.GetValueOut(), std::runtime_error);
    }

    SECTION("Total at MAX_MONEY") {
        mtx.vout[0].nValue = MAX_MONEY - 1;
        mtx.vout[1].nValue = 1;
        CTransaction tx(mtx);
        REQUIRE(tx.GetValueOut() == MAX_MONEY);
    }
}
