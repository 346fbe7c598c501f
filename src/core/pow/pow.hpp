#pragma once

#include "powgate/common.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace powgate::core {

/**
 * Proof-of-Work puzzle as issued by the challenge service
 */
struct PowPuzzle {
    std::string challenge;        // Opaque challenge string
    uint32_t difficulty;          // Required leading '0' hex characters
};

struct PowSolution {
    uint64_t nonce;               // Smallest nonce satisfying the puzzle
    std::string digest;           // Lower-case hex SHA-256 of challenge || nonce
    uint64_t attempts;            // Digests computed (nonce + 1)
    uint64_t compute_time_ms;     // Time taken to solve (for benchmarking)
};

/**
 * Resumable nonce search
 *
 * Each call to step() hashes at most the given number of candidates in
 * ascending nonce order, so the caller decides when to yield.
 */
class PowSearch {
public:
    explicit PowSearch(PowPuzzle puzzle);
    
    /**
     * Advance the search
     * @param max_iterations Upper bound on digests computed by this call
     * @return Solution once found, nullopt while still searching
     */
    std::optional<PowSolution> step(uint64_t max_iterations);
    
    const PowPuzzle& puzzle() const { return puzzle_; }
    uint64_t next_nonce() const { return next_nonce_; }
    bool finished() const { return solution_.has_value(); }
    const std::optional<PowSolution>& solution() const { return solution_; }
    
private:
    PowPuzzle puzzle_;
    uint64_t next_nonce_ = 0;
    uint64_t elapsed_ms_ = 0;
    std::optional<PowSolution> solution_;
};

/**
 * Proof-of-Work solver for registration challenges
 *
 * A candidate digest is sha256(challenge + decimal(nonce)). It satisfies a
 * puzzle when its first `difficulty` hex characters are all '0'. The search
 * starts at nonce 0 and never skips, so the solution is the smallest
 * satisfying nonce.
 */
class ProofOfWork {
public:
    using ProgressCallback = std::function<void(uint64_t attempts)>;
    
    /**
     * Iterations between cancellation checks
     */
    static constexpr uint64_t CANCEL_CHECK_INTERVAL = 1024;
    
    /**
     * Largest satisfiable difficulty (hex length of a SHA-256 digest)
     */
    static constexpr uint32_t MAX_DIFFICULTY = static_cast<uint32_t>(constants::SHA256_HEX_LENGTH);
    
    /**
     * Build the hash input for a nonce: challenge followed by the decimal
     * nonce, no separator
     */
    static std::string candidate_message(const std::string& challenge, uint64_t nonce);
    
    /**
     * Digest of a single candidate
     */
    static std::string candidate_digest(const std::string& challenge, uint64_t nonce);
    
    /**
     * Check if a hex digest starts with `difficulty` '0' characters
     */
    static bool meets_difficulty(const std::string& hex_digest, uint32_t difficulty);
    
    /**
     * Solve a puzzle (blocking, no upper bound on attempts)
     */
    static PowSolution solve(const PowPuzzle& puzzle);
    
    /**
     * Solve a puzzle with cooperative cancellation
     * @param puzzle Puzzle to solve
     * @param cancelled Checked every CANCEL_CHECK_INTERVAL attempts
     * @param progress Invoked with the attempt count at each check
     * @return Solution or nullopt if cancelled
     */
    static std::optional<PowSolution> solve(
        const PowPuzzle& puzzle,
        const std::atomic<bool>& cancelled,
        const ProgressCallback& progress = nullptr
    );
    
    /**
     * Verify a puzzle solution
     * @param puzzle Puzzle the solution claims to solve
     * @param solution Claimed solution
     * @return True if the digest matches the nonce and meets the difficulty
     */
    static bool verify_solution(const PowPuzzle& puzzle, const PowSolution& solution);
    
    /**
     * Expected number of attempts for a difficulty (16^difficulty)
     */
    static double expected_attempts(uint32_t difficulty);
    
    /**
     * Benchmark local hash rate
     * @param test_duration_ms Duration to run benchmark
     * @return Estimated hashes per second
     */
    static uint64_t benchmark(uint64_t test_duration_ms = 1000);
};

} // namespace powgate::core
