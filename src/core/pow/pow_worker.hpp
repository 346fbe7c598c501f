#pragma once

#include "core/pow/pow.hpp"
#include <thread>
#include <atomic>
#include <mutex>
#include <optional>

namespace powgate::core {

/**
 * PowWorker - Runs a nonce search on a dedicated thread
 *
 * The owning thread stays free while the search runs. cancel() is
 * cooperative and takes effect at the next cancellation check.
 */
class PowWorker {
public:
    PowWorker() = default;
    ~PowWorker();
    
    PowWorker(const PowWorker&) = delete;
    PowWorker& operator=(const PowWorker&) = delete;
    
    /**
     * Start searching; fails if a search is already running
     */
    bool start(const PowPuzzle& puzzle);
    
    /**
     * Request the running search to stop
     */
    void cancel();
    
    /**
     * Block until the search ends
     * @return Solution, or nullopt if cancelled or never started
     */
    std::optional<PowSolution> wait();
    
    bool is_running() const { return running_; }
    
    /**
     * Candidates hashed so far by the current search
     */
    uint64_t attempts() const { return attempts_; }
    
private:
    void join();
    
    std::thread worker_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> cancelled_{false};
    std::atomic<uint64_t> attempts_{0};
    
    mutable std::mutex result_mutex_;
    std::optional<PowSolution> result_;
};

} // namespace powgate::core
