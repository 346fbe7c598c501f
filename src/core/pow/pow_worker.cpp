#include "core/pow/pow_worker.hpp"
#include "utils/logger.hpp"

namespace powgate::core {

PowWorker::~PowWorker() {
    cancel();
    join();
}

bool PowWorker::start(const PowPuzzle& puzzle) {
    if (running_) {
        POWGATE_LOG_WARN("PowWorker already running");
        return false;
    }
    
    // Reap a previous finished search
    join();
    
    cancelled_ = false;
    attempts_ = 0;
    {
        std::lock_guard<std::mutex> lock(result_mutex_);
        result_.reset();
    }
    running_ = true;
    
    worker_thread_ = std::thread([this, puzzle]() {
        auto solution = ProofOfWork::solve(puzzle, cancelled_, [this](uint64_t attempts) {
            attempts_ = attempts;
        });
        
        if (solution) {
            attempts_ = solution->attempts;
        }
        
        {
            std::lock_guard<std::mutex> lock(result_mutex_);
            result_ = std::move(solution);
        }
        running_ = false;
    });
    
    return true;
}

void PowWorker::cancel() {
    if (!running_) {
        return;
    }
    
    POWGATE_LOG_DEBUG("Cancelling PoW search...");
    cancelled_ = true;
}

std::optional<PowSolution> PowWorker::wait() {
    join();
    
    std::lock_guard<std::mutex> lock(result_mutex_);
    return result_;
}

void PowWorker::join() {
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
}

} // namespace powgate::core
