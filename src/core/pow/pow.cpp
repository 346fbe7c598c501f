#include "pow.hpp"
#include "crypto/sha256.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>

namespace powgate::core {

namespace {
    uint64_t elapsed_ms_since(std::chrono::steady_clock::time_point start) {
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start
        );
        return static_cast<uint64_t>(duration.count());
    }
}

// PowSearch implementation

PowSearch::PowSearch(PowPuzzle puzzle)
    : puzzle_(std::move(puzzle)) {
}

std::optional<PowSolution> PowSearch::step(uint64_t max_iterations) {
    if (solution_) {
        return solution_;
    }
    
    auto start_time = std::chrono::steady_clock::now();
    
    for (uint64_t i = 0; i < max_iterations; ++i) {
        uint64_t nonce = next_nonce_;
        std::string digest = ProofOfWork::candidate_digest(puzzle_.challenge, nonce);
        
        if (ProofOfWork::meets_difficulty(digest, puzzle_.difficulty)) {
            elapsed_ms_ += elapsed_ms_since(start_time);
            
            PowSolution solution;
            solution.nonce = nonce;
            solution.digest = std::move(digest);
            solution.attempts = nonce + 1;
            solution.compute_time_ms = elapsed_ms_;
            solution_ = solution;
            return solution_;
        }
        
        ++next_nonce_;
    }
    
    elapsed_ms_ += elapsed_ms_since(start_time);
    return std::nullopt;
}

// ProofOfWork implementation

std::string ProofOfWork::candidate_message(const std::string& challenge, uint64_t nonce) {
    return challenge + std::to_string(nonce);
}

std::string ProofOfWork::candidate_digest(const std::string& challenge, uint64_t nonce) {
    return crypto::Sha256::hex_digest(candidate_message(challenge, nonce));
}

bool ProofOfWork::meets_difficulty(const std::string& hex_digest, uint32_t difficulty) {
    if (difficulty > hex_digest.size()) {
        return false;
    }
    for (uint32_t i = 0; i < difficulty; ++i) {
        if (hex_digest[i] != '0') {
            return false;
        }
    }
    return true;
}

PowSolution ProofOfWork::solve(const PowPuzzle& puzzle) {
    std::atomic<bool> never_cancelled{false};
    // Without a cancellation source the search only ends with a solution
    return *solve(puzzle, never_cancelled);
}

std::optional<PowSolution> ProofOfWork::solve(
    const PowPuzzle& puzzle,
    const std::atomic<bool>& cancelled,
    const ProgressCallback& progress
) {
    POWGATE_LOG_INFO("Solving PoW puzzle (difficulty={}, expected attempts={})",
                     puzzle.difficulty, expected_attempts(puzzle.difficulty));
    
    if (puzzle.difficulty > MAX_DIFFICULTY) {
        POWGATE_LOG_WARN("PoW difficulty {} exceeds digest length, search cannot terminate",
                         puzzle.difficulty);
    }
    
    PowSearch search(puzzle);
    
    while (!cancelled.load()) {
        auto solution = search.step(CANCEL_CHECK_INTERVAL);
        if (solution) {
            POWGATE_LOG_INFO("PoW solved! nonce={}, attempts={}, time={}ms",
                             solution->nonce, solution->attempts, solution->compute_time_ms);
            return solution;
        }
        
        if (progress) {
            progress(search.next_nonce());
        }
        
        // Log progress every 64 batches
        if (search.next_nonce() % (CANCEL_CHECK_INTERVAL * 64) == 0) {
            POWGATE_LOG_DEBUG("PoW progress: {} attempts", search.next_nonce());
        }
    }
    
    POWGATE_LOG_WARN("PoW search cancelled after {} attempts", search.next_nonce());
    return std::nullopt;
}

bool ProofOfWork::verify_solution(const PowPuzzle& puzzle, const PowSolution& solution) {
    // Recompute hash with claimed nonce
    std::string computed = candidate_digest(puzzle.challenge, solution.nonce);
    
    if (computed != solution.digest) {
        POWGATE_LOG_ERROR("PoW verification failed: hash mismatch");
        return false;
    }
    
    if (!meets_difficulty(computed, puzzle.difficulty)) {
        POWGATE_LOG_ERROR("PoW verification failed: insufficient difficulty");
        return false;
    }
    
    POWGATE_LOG_DEBUG("PoW solution verified");
    return true;
}

double ProofOfWork::expected_attempts(uint32_t difficulty) {
    return std::pow(16.0, static_cast<double>(difficulty));
}

uint64_t ProofOfWork::benchmark(uint64_t test_duration_ms) {
    POWGATE_LOG_INFO("Benchmarking local hash rate...");
    
    test_duration_ms = std::max<uint64_t>(test_duration_ms, 1);
    
    const std::string challenge = "powgate-benchmark";
    auto start = std::chrono::steady_clock::now();
    uint64_t hashes = 0;
    
    while (true) {
        // Check the clock once per batch
        for (uint64_t i = 0; i < CANCEL_CHECK_INTERVAL; ++i) {
            candidate_digest(challenge, hashes++);
        }
        
        if (elapsed_ms_since(start) >= test_duration_ms) {
            break;
        }
    }
    
    uint64_t elapsed = std::max<uint64_t>(elapsed_ms_since(start), 1);
    uint64_t hashes_per_second = (hashes * 1000) / elapsed;
    POWGATE_LOG_INFO("Benchmark complete: {} hashes/sec", hashes_per_second);
    
    return hashes_per_second;
}

} // namespace powgate::core
