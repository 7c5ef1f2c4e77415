// Copyright (c) 2025 The Unicity Foundation
// Unit tests for chain/chain_selector.cpp - Chain selection logic
//
// These tests verify:
// - CBlockIndexWorkComparator ordering (chain work, then receive order)
// - Finding the candidate with most work
// - Leaf-only bookkeeping when blocks extend candidates
// - Pruning stale candidates against the active tip

#include <catch2/catch_test_macros.hpp>
#include "chain/chain_selector.hpp"
#include "chain/block_manager.hpp"
#include "util/arith_uint256.hpp"
#include "../test_blocks.hpp"

using namespace chainquery;
using namespace chainquery::validation;
using namespace chainquery::chain;
using namespace chainquery::test;

// Helper: index count blocks on top of prev and return the nodes
static std::vector<CBlockIndex*> AddBlocks(BlockManager& bm, const uint256& prev,
                                           int count, uint32_t first_nonce) {
    std::vector<CBlockIndex*> out;
    for (const auto& block : BuildChain(prev, count, first_nonce)) {
        out.push_back(bm.AddToBlockIndex(block));
    }
    return out;
}

TEST_CASE("CBlockIndexWorkComparator - ordering", "[chain_selector]") {
    BlockManager bm;
    auto genesis = MakeBlock(uint256(), 0);
    CBlockIndex* g = bm.AddToBlockIndex(genesis);
    auto a = AddBlocks(bm, genesis->GetHash(), 2, 1);
    auto b = AddBlocks(bm, genesis->GetHash(), 2, 100);
    CBlockIndexWorkComparator cmp;

    SECTION("More work sorts first") {
        REQUIRE(cmp(a[1], a[0]));
        REQUIRE_FALSE(cmp(a[0], a[1]));
        REQUIRE(cmp(a[0], g));
    }

    SECTION("Equal work: earlier sequence sorts first") {
        REQUIRE(a[1]->nChainWork == b[1]->nChainWork);
        REQUIRE(a[1]->nSequenceId < b[1]->nSequenceId);
        REQUIRE(cmp(a[1], b[1]));
        REQUIRE_FALSE(cmp(b[1], a[1]));
    }

    SECTION("Irreflexive") {
        REQUIRE_FALSE(cmp(a[0], a[0]));
    }
}

TEST_CASE("ChainSelector - empty selector", "[chain_selector]") {
    ChainSelector selector;
    REQUIRE(selector.FindMostWorkChain() == nullptr);
    REQUIRE(selector.GetCandidateCount() == 0);

    // Null inputs are ignored
    selector.TryAddBlockIndexCandidate(nullptr);
    selector.PruneBlockIndexCandidates(nullptr);
    selector.RemoveCandidate(nullptr);
    REQUIRE(selector.GetCandidateCount() == 0);
}

TEST_CASE("ChainSelector - candidates stay leaves", "[chain_selector]") {
    BlockManager bm;
    ChainSelector selector;
    auto genesis = MakeBlock(uint256(), 0);
    CBlockIndex* g = bm.AddToBlockIndex(genesis);
    selector.TryAddBlockIndexCandidate(g);
    REQUIRE(selector.FindMostWorkChain() == g);

    SECTION("Extending a candidate replaces it") {
        auto chain = AddBlocks(bm, genesis->GetHash(), 3, 1);
        for (auto* pindex : chain) {
            selector.TryAddBlockIndexCandidate(pindex);
        }
        REQUIRE(selector.GetCandidateCount() == 1);
        REQUIRE(selector.FindMostWorkChain() == chain.back());
    }

    SECTION("A fork adds a second leaf") {
        auto a = AddBlocks(bm, genesis->GetHash(), 2, 1);
        auto b = AddBlocks(bm, genesis->GetHash(), 3, 100);
        for (auto* pindex : a) selector.TryAddBlockIndexCandidate(pindex);
        for (auto* pindex : b) selector.TryAddBlockIndexCandidate(pindex);

        REQUIRE(selector.GetCandidateCount() == 2);
        REQUIRE(selector.FindMostWorkChain() == b.back());

        auto hashes = selector.DebugCandidateHashes();
        REQUIRE(hashes.size() == 2);
        REQUIRE(hashes[0] == b.back()->GetBlockHash());
        REQUIRE(hashes[1] == a.back()->GetBlockHash());
    }

    SECTION("Equal-work fork keeps the first-seen leaf on top") {
        auto a = AddBlocks(bm, genesis->GetHash(), 2, 1);
        auto b = AddBlocks(bm, genesis->GetHash(), 2, 100);
        for (auto* pindex : a) selector.TryAddBlockIndexCandidate(pindex);
        for (auto* pindex : b) selector.TryAddBlockIndexCandidate(pindex);
        REQUIRE(selector.FindMostWorkChain() == a.back());
    }

    SECTION("RemoveCandidate") {
        selector.RemoveCandidate(g);
        REQUIRE(selector.GetCandidateCount() == 0);
        REQUIRE(selector.FindMostWorkChain() == nullptr);
    }
}

TEST_CASE("ChainSelector - PruneBlockIndexCandidates", "[chain_selector]") {
    BlockManager bm;
    ChainSelector selector;
    auto genesis = MakeBlock(uint256(), 0);
    bm.AddToBlockIndex(genesis);

    auto main_chain = AddBlocks(bm, genesis->GetHash(), 4, 1);
    auto short_fork = AddBlocks(bm, main_chain[0]->GetBlockHash(), 1, 100);
    auto equal_fork = AddBlocks(bm, main_chain[1]->GetBlockHash(), 2, 200);

    selector.TryAddBlockIndexCandidate(main_chain.back());
    selector.TryAddBlockIndexCandidate(short_fork.back());
    selector.TryAddBlockIndexCandidate(equal_fork.back());
    // An ancestor of the tip left over as a candidate
    selector.TryAddBlockIndexCandidate(main_chain[2]);
    REQUIRE(selector.GetCandidateCount() == 4);

    selector.PruneBlockIndexCandidates(main_chain.back());

    // Tip, its ancestor and the lighter fork go; the equal-work fork stays
    REQUIRE(selector.GetCandidateCount() == 1);
    REQUIRE(selector.FindMostWorkChain() == equal_fork.back());
    REQUIRE(equal_fork.back()->nChainWork == main_chain.back()->nChainWork);
}
