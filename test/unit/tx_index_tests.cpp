// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for chain/tx_index.cpp

#include <catch2/catch_test_macros.hpp>
#include "chain/tx_index.hpp"
#include "chain/block_index.hpp"
#include "chain/block_manager.hpp"
#include "chain/chainstate_manager.hpp"
#include "chain/validation.hpp"
#include "../test_blocks.hpp"

using namespace chainquery;
using namespace chainquery::chain;
using namespace chainquery::test;

TEST_CASE("TxIndex - AddBlock and Locate", "[tx_index]") {
    BlockManager bm;
    TxIndex index;

    auto genesis = MakeBlock(uint256(), 0);
    auto spend_a = MakeSpend(genesis->vtx[0]->GetHash(), 0, 100);
    auto spend_b = MakeSpend(spend_a->GetHash(), 0, 90);
    auto block = MakeBlock(genesis->GetHash(), 1, {spend_a, spend_b});

    CBlockIndex* g = bm.AddToBlockIndex(genesis);
    CBlockIndex* pindex = bm.AddToBlockIndex(block);

    REQUIRE(index.AddBlock(g) == 1);
    REQUIRE(index.AddBlock(pindex) == 3);
    REQUIRE(index.Size() == 4);

    SECTION("Positions within the block") {
        auto loc = index.Locate(spend_b->GetHash());
        REQUIRE(loc.has_value());
        REQUIRE(loc->pindex == pindex);
        REQUIRE(loc->pos == 2);

        loc = index.Locate(block->vtx[0]->GetHash());
        REQUIRE(loc.has_value());
        REQUIRE(loc->pos == 0);
    }

    SECTION("Unknown txid") {
        REQUIRE_FALSE(index.Locate(uint256S("77")).has_value());
    }

    SECTION("Re-adding a block adds nothing") {
        REQUIRE(index.AddBlock(pindex) == 0);
        REQUIRE(index.Size() == 4);
    }

    SECTION("Null input") {
        REQUIRE(index.AddBlock(nullptr) == 0);
    }
}

TEST_CASE("TxIndex - first occurrence wins", "[tx_index]") {
    // The same transaction mined in two competing blocks
    BlockManager bm;
    TxIndex index;

    auto genesis = MakeBlock(uint256(), 0);
    auto shared_tx = MakeSpend(uint256S("aa"), 3, 5000);
    auto first = MakeBlock(genesis->GetHash(), 1, {shared_tx});
    auto second = MakeBlock(genesis->GetHash(), 2, {shared_tx});

    index.AddBlock(bm.AddToBlockIndex(genesis));
    CBlockIndex* first_index = bm.AddToBlockIndex(first);
    CBlockIndex* second_index = bm.AddToBlockIndex(second);
    REQUIRE(index.AddBlock(first_index) == 2);
    // Only the second block's coinbase is new
    REQUIRE(index.AddBlock(second_index) == 1);

    auto loc = index.Locate(shared_tx->GetHash());
    REQUIRE(loc.has_value());
    REQUIRE(loc->pindex == first_index);
    REQUIRE(loc->pos == 1);
}

TEST_CASE("TxIndex - duplicate txid keeps the earlier block through the manager",
          "[tx_index][chainstate_manager]") {
    // Mirrors the pre-BIP30 duplicate coinbases: identical coinbase in two
    // blocks of the same chain
    validation::ChainstateManager csm;
    auto genesis = MakeBlock(uint256(), 0);
    auto dup_coinbase = MakeCoinbase(4242);

    auto b1 = std::make_shared<CBlock>();
    b1->nVersion = 1;
    b1->hashPrevBlock = genesis->GetHash();
    b1->nTime = 1231007000;
    b1->nBits = EASY_BITS;
    b1->nNonce = 1;
    b1->vtx.push_back(dup_coinbase);
    b1->hashMerkleRoot = validation::BlockMerkleRoot(*b1);

    auto b2 = std::make_shared<CBlock>(*b1);
    b2->hashPrevBlock = b1->GetHash();
    b2->nNonce = 2;

    for (const auto& block : {genesis, b1, b2}) {
        validation::ValidationState state;
        REQUIRE(csm.AcceptBlock(block, state).Inserted());
    }

    REQUIRE(csm.GetChainHeight() == 2);
    REQUIRE(csm.GetTransactionCount() == 2);
    auto lookup = csm.LocateTransaction(dup_coinbase->GetHash());
    REQUIRE(lookup.has_value());
    REQUIRE(lookup->pindex->GetBlockHash() == b1->GetHash());
    REQUIRE(lookup->pindex->nHeight == 1);
}
