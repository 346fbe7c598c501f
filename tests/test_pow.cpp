#include "core/pow/pow.hpp"
#include "core/pow/pow_worker.hpp"
#include "crypto/sha256.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace powgate;
using namespace powgate::core;

class PoWTest : public ::testing::Test {
protected:
    PowPuzzle make_puzzle(const std::string& challenge, uint32_t difficulty) {
        PowPuzzle puzzle;
        puzzle.challenge = challenge;
        puzzle.difficulty = difficulty;
        return puzzle;
    }
};

TEST_F(PoWTest, CandidateMessageIsBareConcatenation) {
    EXPECT_EQ(ProofOfWork::candidate_message("abc123", 0), "abc1230");
    EXPECT_EQ(ProofOfWork::candidate_message("abc123", 17), "abc12317");
    EXPECT_EQ(ProofOfWork::candidate_message("", 42), "42");
    
    // "12" + 3 and "1" + 23 hash the same input
    EXPECT_EQ(ProofOfWork::candidate_digest("12", 3), ProofOfWork::candidate_digest("1", 23));
}

TEST_F(PoWTest, DifficultyIsHexPrefixMatch) {
    EXPECT_TRUE(ProofOfWork::meets_difficulty("0f", 1));
    EXPECT_FALSE(ProofOfWork::meets_difficulty("0f", 2));
    EXPECT_TRUE(ProofOfWork::meets_difficulty("00ff", 2));
    
    // A small numeric value with a non-zero first nibble does not count
    EXPECT_FALSE(ProofOfWork::meets_difficulty("1000", 1));
    
    // Empty prefix always matches
    EXPECT_TRUE(ProofOfWork::meets_difficulty("ffff", 0));
    
    // Longer than the digest can never match
    EXPECT_FALSE(ProofOfWork::meets_difficulty("0000", 5));
}

TEST_F(PoWTest, ZeroDifficultyAcceptsFirstNonce) {
    auto solution = ProofOfWork::solve(make_puzzle("anything", 0));
    
    EXPECT_EQ(solution.nonce, 0u);
    EXPECT_EQ(solution.attempts, 1u);
    EXPECT_EQ(solution.digest, crypto::Sha256::hex_digest("anything0"));
}

TEST_F(PoWTest, ReferenceScanAbc123) {
    // Every nonce in 0..1000 whose digest of "abc123"+nonce starts with '0'
    const std::vector<uint64_t> reference = {
        17, 22, 53, 71, 78, 93, 102, 126, 133, 139, 140, 157, 165, 188, 199, 205, 210,
        214, 224, 304, 309, 315, 323, 324, 337, 338, 358, 363, 394, 410, 414, 419, 426,
        438, 440, 441, 465, 469, 476, 506, 509, 520, 531, 545, 546, 551, 554, 593, 625,
        627, 641, 642, 648, 681, 682, 684, 697, 716, 744, 783, 799, 806, 808, 810, 826,
        836, 851, 874, 877, 912, 917, 935, 957, 971, 984, 985
    };
    
    std::vector<uint64_t> matches;
    for (uint64_t nonce = 0; nonce <= 1000; ++nonce) {
        if (ProofOfWork::meets_difficulty(ProofOfWork::candidate_digest("abc123", nonce), 1)) {
            matches.push_back(nonce);
        }
    }
    EXPECT_EQ(matches, reference);
    
    auto solution = ProofOfWork::solve(make_puzzle("abc123", 1));
    EXPECT_EQ(solution.nonce, reference.front());
    EXPECT_EQ(solution.digest, "0419759720a926ce720b064c835fcdbccae38d6405d760983ca943e773b73567");
}

TEST_F(PoWTest, SolutionIsSmallestSatisfyingNonce) {
    struct Case {
        std::string challenge;
        uint32_t difficulty;
        uint64_t nonce;
    };
    const std::vector<Case> cases = {
        {"abc123", 2, 188},
        {"abc123", 3, 506},
        {"test-challenge", 1, 8},
        {"test-challenge", 2, 153},
        {"test-challenge", 3, 388},
    };
    
    for (const auto& c : cases) {
        auto solution = ProofOfWork::solve(make_puzzle(c.challenge, c.difficulty));
        EXPECT_EQ(solution.nonce, c.nonce) << c.challenge << " / " << c.difficulty;
        
        // No smaller nonce satisfies the predicate
        for (uint64_t n = 0; n < solution.nonce; ++n) {
            ASSERT_FALSE(ProofOfWork::meets_difficulty(
                ProofOfWork::candidate_digest(c.challenge, n), c.difficulty));
        }
    }
}

TEST_F(PoWTest, SolvingIsDeterministic) {
    auto puzzle = make_puzzle("test-challenge", 2);
    
    auto first = ProofOfWork::solve(puzzle);
    auto second = ProofOfWork::solve(puzzle);
    
    EXPECT_EQ(first.nonce, second.nonce);
    EXPECT_EQ(first.digest, second.digest);
}

TEST_F(PoWTest, StoredDigestMatchesRecomputation) {
    auto puzzle = make_puzzle("abc123", 2);
    auto solution = ProofOfWork::solve(puzzle);
    
    EXPECT_EQ(solution.digest,
              crypto::Sha256::hex_digest(puzzle.challenge + std::to_string(solution.nonce)));
    EXPECT_TRUE(ProofOfWork::verify_solution(puzzle, solution));
}

TEST_F(PoWTest, InvalidSolutionRejection) {
    auto puzzle = make_puzzle("abc123", 1);
    auto solution = ProofOfWork::solve(puzzle);
    
    // Wrong nonce for the digest
    auto wrong_nonce = solution;
    wrong_nonce.nonce++;
    EXPECT_FALSE(ProofOfWork::verify_solution(puzzle, wrong_nonce));
    
    // Correct digest for a nonce that misses the target
    PowSolution miss;
    miss.nonce = 0;
    miss.digest = ProofOfWork::candidate_digest("abc123", 0);
    miss.attempts = 1;
    miss.compute_time_ms = 0;
    EXPECT_FALSE(ProofOfWork::verify_solution(puzzle, miss));
}

TEST_F(PoWTest, SearchCanBeStepped) {
    PowSearch search(make_puzzle("abc123", 2));
    
    // 188 is the answer; stop short of it
    EXPECT_FALSE(search.step(100).has_value());
    EXPECT_EQ(search.next_nonce(), 100u);
    EXPECT_FALSE(search.finished());
    
    auto solution = search.step(100);
    ASSERT_TRUE(solution.has_value());
    EXPECT_EQ(solution->nonce, 188u);
    EXPECT_EQ(solution->attempts, 189u);
    EXPECT_TRUE(search.finished());
    
    // Further steps return the same solution
    auto again = search.step(10);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->nonce, 188u);
}

TEST_F(PoWTest, PreCancelledSearchStops) {
    std::atomic<bool> cancelled{true};
    
    auto solution = ProofOfWork::solve(make_puzzle("abc123", 1), cancelled);
    EXPECT_FALSE(solution.has_value());
}

TEST_F(PoWTest, ProgressReportedBetweenBatches) {
    std::atomic<bool> cancelled{false};
    std::vector<uint64_t> progress;
    
    // "1" needs 72608 attempts at difficulty 4
    auto solution = ProofOfWork::solve(make_puzzle("1", 4), cancelled, [&](uint64_t attempts) {
        progress.push_back(attempts);
    });
    
    ASSERT_TRUE(solution.has_value());
    EXPECT_EQ(solution->nonce, 72608u);
    ASSERT_FALSE(progress.empty());
    EXPECT_EQ(progress.front(), ProofOfWork::CANCEL_CHECK_INTERVAL);
    EXPECT_TRUE(std::is_sorted(progress.begin(), progress.end()));
}

TEST_F(PoWTest, WorkerCancelsUnsatisfiableSearch) {
    PowWorker worker;
    
    // Difficulty above the digest length never terminates on its own
    ASSERT_TRUE(worker.start(make_puzzle("abc123", ProofOfWork::MAX_DIFFICULTY + 1)));
    EXPECT_TRUE(worker.is_running());
    EXPECT_FALSE(worker.start(make_puzzle("abc123", 1)));
    
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    worker.cancel();
    
    auto solution = worker.wait();
    EXPECT_FALSE(solution.has_value());
    EXPECT_FALSE(worker.is_running());
}

TEST_F(PoWTest, WorkerReturnsSolution) {
    PowWorker worker;
    
    ASSERT_TRUE(worker.start(make_puzzle("test-challenge", 3)));
    auto solution = worker.wait();
    
    ASSERT_TRUE(solution.has_value());
    EXPECT_EQ(solution->nonce, 388u);
    EXPECT_EQ(worker.attempts(), 389u);
    
    // Reusable after completion
    ASSERT_TRUE(worker.start(make_puzzle("abc123", 1)));
    auto next = worker.wait();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->nonce, 17u);
}

TEST_F(PoWTest, ExpectedAttempts) {
    EXPECT_DOUBLE_EQ(ProofOfWork::expected_attempts(0), 1.0);
    EXPECT_DOUBLE_EQ(ProofOfWork::expected_attempts(1), 16.0);
    EXPECT_DOUBLE_EQ(ProofOfWork::expected_attempts(4), 65536.0);
}

TEST_F(PoWTest, NodeBenchmarking) {
    uint64_t rate = ProofOfWork::benchmark(50);
    EXPECT_GT(rate, 0u);
}
