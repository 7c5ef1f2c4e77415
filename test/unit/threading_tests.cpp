// Copyright (c) 2025 The Unicity Foundation
// Threading tests for ChainstateManager

#include <catch2/catch_test_macros.hpp>
#include "chain/validation.hpp"
#include "chain/chainstate_manager.hpp"
#include "chain/block_index.hpp"
#include "chain/block.hpp"
#include "../test_blocks.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace chainquery;
using namespace chainquery::test;

TEST_CASE("ChainstateManager thread safety", "[validation][threading]") {
    validation::ChainstateManager chainstate;
    auto genesis = MakeBlock(uint256(), 0);
    validation::ValidationState genesis_state;
    REQUIRE(chainstate.AcceptBlock(genesis, genesis_state).Inserted());

    SECTION("Readers see consistent snapshots during a reorg-heavy write load") {
        constexpr int NUM_READERS = 4;
        constexpr int BRANCH_LENGTH = 40;

        // Two branches that keep overtaking each other
        auto a_chain = BuildChain(genesis->GetHash(), BRANCH_LENGTH, 1);
        auto b_chain = BuildChain(genesis->GetHash(), BRANCH_LENGTH, 10000);

        std::atomic<bool> done{false};
        std::atomic<int> inconsistent{0};
        std::atomic<int> reads{0};
        std::vector<std::thread> readers;

        for (int r = 0; r < NUM_READERS; r++) {
            readers.emplace_back([&]() {
                while (!done.load()) {
                    auto snapshot = chainstate.GetSnapshot();
                    if (snapshot->IsEmpty()) {
                        inconsistent++;
                        continue;
                    }
                    const chain::CBlockIndex* tip = snapshot->tip;
                    if (tip->nHeight != snapshot->height ||
                        tip->GetBlockHash() != snapshot->hash ||
                        tip->nChainWork != snapshot->chain_work ||
                        !snapshot->Contains(tip->GetAncestor(0))) {
                        inconsistent++;
                    }
                    // Lookups through the index while the writer inserts
                    if (!chainstate.HaveBlock(snapshot->hash)) {
                        inconsistent++;
                    }
                    reads++;
                }
            });
        }

        for (int i = 0; i < BRANCH_LENGTH; i++) {
            validation::ValidationState state;
            REQUIRE(chainstate.AcceptBlock(a_chain[i], state).Inserted());
            REQUIRE(chainstate.AcceptBlock(b_chain[i], state).Inserted());
        }
        auto last = MakeBlock(b_chain.back()->GetHash(), 20000);
        validation::ValidationState state;
        REQUIRE(chainstate.AcceptBlock(last, state).tip_changed);

        done = true;
        for (auto& t : readers) {
            t.join();
        }

        REQUIRE(inconsistent.load() == 0);
        REQUIRE(chainstate.GetChainHeight() == BRANCH_LENGTH + 1);
        REQUIRE(chainstate.GetBlockCount() == 2 * BRANCH_LENGTH + 2);
    }

    SECTION("Concurrent writers on independent branches") {
        constexpr int NUM_THREADS = 4;
        constexpr int BLOCKS_PER_THREAD = 25;

        std::atomic<int> successful_accepts{0};
        std::vector<std::thread> threads;

        for (int t = 0; t < NUM_THREADS; t++) {
            threads.emplace_back([&, t]() {
                auto branch = BuildChain(genesis->GetHash(), BLOCKS_PER_THREAD,
                                         static_cast<uint32_t>(1000 * (t + 1)));
                for (const auto& block : branch) {
                    validation::ValidationState s;
                    if (chainstate.AcceptBlock(block, s).Inserted()) {
                        successful_accepts++;
                    }
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }

        REQUIRE(successful_accepts.load() == NUM_THREADS * BLOCKS_PER_THREAD);
        REQUIRE(chainstate.GetBlockCount() == NUM_THREADS * BLOCKS_PER_THREAD + 1);
        REQUIRE(chainstate.GetChainHeight() == BLOCKS_PER_THREAD);
        REQUIRE(chainstate.GetTransactionCount() == NUM_THREADS * BLOCKS_PER_THREAD + 1);
    }
}
