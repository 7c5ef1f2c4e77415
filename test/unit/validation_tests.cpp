// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for chain/validation.cpp - block decoding errors and merkle roots

#include <catch2/catch_test_macros.hpp>
#include "chain/serialize.hpp"
#include "chain/validation.hpp"
#include "util/sha256.hpp"
#include "../test_blocks.hpp"
#include <cstdint>
#include <string>

using namespace chainquery;
using namespace chainquery::test;
using namespace chainquery::validation;

TEST_CASE("DecodeBlock - malformed input", "[validation][codec]") {
    const auto genesis = ParseHex(GENESIS_BLOCK_HEX);
    CBlock block;
    ValidationState state;

    SECTION("Empty input") {
        std::vector<uint8_t> empty;
        REQUIRE_FALSE(DecodeBlock(empty, block, state));
        REQUIRE(state.IsInvalid());
        REQUIRE(state.GetRejectReason() == REJECT_MALFORMED);
    }

    SECTION("Truncated header") {
        std::vector<uint8_t> bytes(genesis.begin(), genesis.begin() + 79);
        REQUIRE_FALSE(DecodeBlock(bytes, block, state));
        REQUIRE(state.GetRejectReason() == REJECT_MALFORMED);
    }

    SECTION("Header without transaction count") {
        std::vector<uint8_t> bytes(genesis.begin(), genesis.begin() + 80);
        REQUIRE_FALSE(DecodeBlock(bytes, block, state));
        REQUIRE(state.GetRejectReason() == REJECT_MALFORMED);
    }

    SECTION("Zero transactions") {
        std::vector<uint8_t> bytes(genesis.begin(), genesis.begin() + 80);
        bytes.push_back(0x00);
        REQUIRE_FALSE(DecodeBlock(bytes, block, state));
        REQUIRE(state.GetDebugMessage() == "block has no transactions");
    }

    SECTION("Every truncation of the genesis block is rejected") {
        for (size_t len = 0; len < genesis.size(); len++) {
            std::vector<uint8_t> bytes(genesis.begin(), genesis.begin() + len);
            ValidationState s;
            CBlock b;
            INFO("length " << len);
            REQUIRE_FALSE(DecodeBlock(bytes, b, s));
            REQUIRE(s.GetRejectReason() == REJECT_MALFORMED);
        }
    }

    SECTION("Trailing bytes") {
        auto bytes = genesis;
        bytes.push_back(0x00);
        REQUIRE_FALSE(DecodeBlock(bytes, block, state));
        REQUIRE(state.GetRejectReason() == REJECT_MALFORMED);
    }

    SECTION("Transaction count larger than the data") {
        std::vector<uint8_t> bytes(genesis.begin(), genesis.begin() + 80);
        bytes.push_back(0xfd);
        bytes.push_back(0xff);
        bytes.push_back(0xff);
        REQUIRE_FALSE(DecodeBlock(bytes, block, state));
        REQUIRE(state.GetRejectReason() == REJECT_MALFORMED);
    }

    SECTION("Non-canonical compact size") {
        std::vector<uint8_t> bytes(genesis.begin(), genesis.begin() + 80);
        // 1 encoded in three bytes
        bytes.push_back(0xfd);
        bytes.push_back(0x01);
        bytes.push_back(0x00);
        bytes.insert(bytes.end(), genesis.begin() + 81, genesis.end());
        REQUIRE_FALSE(DecodeBlock(bytes, block, state));
        REQUIRE(state.GetDebugMessage().find("non-canonical") != std::string::npos);
    }

    SECTION("Script length past the end") {
        auto bytes = genesis;
        // Coinbase scriptSig length byte (0x4d) sits after header, tx count,
        // version, vin count and the 36-byte outpoint
        const size_t script_len_pos = 80 + 1 + 4 + 1 + 36;
        REQUIRE(bytes[script_len_pos] == 0x4d);
        bytes[script_len_pos] = 0xfc;
        REQUIRE_FALSE(DecodeBlock(bytes, block, state));
        REQUIRE(state.GetRejectReason() == REJECT_MALFORMED);
    }

    SECTION("Failed decode leaves the output untouched") {
        block.nNonce = 42;
        std::vector<uint8_t> bytes(genesis.begin(), genesis.begin() + 100);
        REQUIRE_FALSE(DecodeBlock(bytes, block, state));
        REQUIRE(block.nNonce == 42);
        REQUIRE(block.vtx.empty());
    }
}

static CTransactionRef MakePayout(const std::vector<int64_t> &values) {
    CMutableTransaction tx;
    CTxIn in;
    in.prevout.hash = uint256S("07");
    in.prevout.n = 0;
    tx.vin.push_back(in);
    for (int64_t value : values) {
        CTxOut out;
        out.nValue = value;
        out.scriptPubKey = {0x51};
        tx.vout.push_back(out);
    }
    return MakeTransactionRef(std::move(tx));
}

TEST_CASE("DecodeBlock - output values outside the money range", "[validation][codec][money]") {
    CBlock decoded;
    ValidationState state;

    SECTION("Outputs that would overflow the sum") {
        auto block = MakeBlock(uint256(), 1, {MakePayout({INT64_MAX, INT64_MAX})});
        REQUIRE_FALSE(DecodeBlock(EncodeBlock(*block), decoded, state));
        REQUIRE(state.GetRejectReason() == REJECT_MALFORMED);
        REQUIRE(state.GetDebugMessage().find("output value out of range") != std::string::npos);
    }

    SECTION("Negative output") {
        auto block = MakeBlock(uint256(), 1, {MakePayout({-1})});
        REQUIRE_FALSE(DecodeBlock(EncodeBlock(*block), decoded, state));
        REQUIRE(state.GetRejectReason() == REJECT_MALFORMED);
    }

    SECTION("Single output just above the cap") {
        auto block = MakeBlock(uint256(), 1, {MakePayout({MAX_MONEY + 1})});
        REQUIRE_FALSE(DecodeBlock(EncodeBlock(*block), decoded, state));
        REQUIRE(state.GetRejectReason() == REJECT_MALFORMED);
    }

    SECTION("Outputs in range whose total is not") {
        auto block = MakeBlock(uint256(), 1, {MakePayout({MAX_MONEY, 1})});
        REQUIRE_FALSE(DecodeBlock(EncodeBlock(*block), decoded, state));
        REQUIRE(state.GetRejectReason() == REJECT_MALFORMED);
        REQUIRE(state.GetDebugMessage().find("output total out of range") != std::string::npos);
    }

    SECTION("Total exactly at the cap is accepted") {
        auto block = MakeBlock(uint256(), 1, {MakePayout({MAX_MONEY - 5, 5})});
        REQUIRE(DecodeBlock(EncodeBlock(*block), decoded, state));
        REQUIRE(decoded.vtx.size() == 2);
        REQUIRE(decoded.vtx[1]->GetValueOut() == MAX_MONEY);
    }
}

TEST_CASE("ComputeMerkleRoot", "[validation][merkle]") {
    const uint256 a = uint256S("01");
    const uint256 b = uint256S("02");
    const uint256 c = uint256S("03");

    SECTION("Empty list gives null root") {
        REQUIRE(ComputeMerkleRoot({}).IsNull());
    }

    SECTION("Single leaf is its own root") {
        REQUIRE(ComputeMerkleRoot({a}) == a);
    }

    SECTION("Two leaves hash as a pair") {
        REQUIRE(ComputeMerkleRoot({a, b}) == Hash256Pair(a, b));
    }

    SECTION("Odd level duplicates the last hash") {
        const uint256 expected = Hash256Pair(Hash256Pair(a, b), Hash256Pair(c, c));
        REQUIRE(ComputeMerkleRoot({a, b, c}) == expected);
    }
}

TEST_CASE("CheckMerkleRoot - mismatch", "[validation][merkle]") {
    auto block = MakeBlock(uint256(), 1, {MakeSpend(uint256S("05"), 0, 10)});
    ValidationState state;
    REQUIRE(CheckMerkleRoot(*block, state));

    block->hashMerkleRoot = uint256S("dead");
    REQUIRE_FALSE(CheckMerkleRoot(*block, state));
    REQUIRE(state.GetRejectReason() == REJECT_BAD_MERKLE);
}

TEST_CASE("ValidationState - reporting", "[validation]") {
    ValidationState state;
    REQUIRE(state.IsValid());
    REQUIRE(state.ToString() == "valid");

    REQUIRE_FALSE(state.Invalid(REJECT_DUPLICATE, "block already indexed"));
    REQUIRE(state.IsInvalid());
    REQUIRE(state.ToString() == "duplicate (block already indexed)");

    ValidationState error;
    REQUIRE_FALSE(error.Error("io"));
    REQUIRE(error.IsError());
    REQUIRE(error.ToString() == "io");
}
