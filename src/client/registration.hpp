#pragma once

#include "client/api_client.hpp"
#include "core/pow/pow.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace powgate::client {

/**
 * RegistrationState - Progress of one registration attempt
 */
enum class RegistrationState : uint8_t {
    IDLE = 0,
    FETCHING_CHALLENGE = 1,
    SOLVING = 2,
    SUBMITTING = 3,
    SUCCESS = 4,
    FAILED = 5
};

const char* registration_state_to_string(RegistrationState state);

/**
 * Final result of an attempt, ready for display
 */
struct RegistrationOutcome {
    bool success = false;
    std::string message;
    std::optional<ErrorKind> error_kind;        // set on failure
    std::optional<core::PowSolution> solution;  // set once the puzzle was solved
};

/**
 * RegistrationFlow - Challenge, proof-of-work and submission for one form
 *
 * IDLE -> FETCHING_CHALLENGE -> SOLVING -> SUBMITTING -> SUCCESS | FAILED -> IDLE
 *
 * A new attempt is refused while one is in flight. Nothing is retried; a
 * failed attempt needs a new submit.
 */
class RegistrationFlow {
public:
    using StateCallback = std::function<void(RegistrationState)>;
    using ProgressCallback = core::ProofOfWork::ProgressCallback;
    
    static constexpr const char* SUCCESS_MESSAGE = "Registration successful!";
    static constexpr const char* GENERIC_FAILURE = "Registration failed. Please try again.";
    static constexpr const char* CANCELLED_MESSAGE = "Registration cancelled";
    static constexpr const char* MISSING_FIELDS_MESSAGE = "Username and password are required";
    
    explicit RegistrationFlow(std::shared_ptr<ApiClient> api);
    ~RegistrationFlow();
    
    RegistrationFlow(const RegistrationFlow&) = delete;
    RegistrationFlow& operator=(const RegistrationFlow&) = delete;
    
    /**
     * Start an attempt on a background thread. Missing credentials fail the
     * attempt at once without starting a thread.
     * @return False if an attempt is already in flight, or when called from
     *         a callback running on the flow's own thread
     */
    bool submit(const std::string& username, const std::string& password);
    
    /**
     * Run an attempt on the calling thread
     */
    RegistrationOutcome run(const std::string& username, const std::string& password);
    
    /**
     * Wait for the background attempt and return its outcome
     */
    RegistrationOutcome wait();
    
    /**
     * Stop the proof-of-work search of the attempt in flight
     */
    void cancel();
    
    /**
     * Return to IDLE after SUCCESS or FAILED
     */
    void acknowledge();
    
    RegistrationState state() const;
    bool is_busy() const;
    std::optional<RegistrationOutcome> last_outcome() const;
    
    void set_state_callback(StateCallback callback);
    void set_progress_callback(ProgressCallback callback);
    
private:
    enum class Begin { Busy, Rejected, Started };
    
    Begin begin(const std::string& username, const std::string& password);
    RegistrationOutcome execute(std::string username, std::string password);
    RegistrationOutcome finish(RegistrationOutcome outcome);
    RegistrationOutcome fail(const Error& error, const std::string& fallback);
    void transition(RegistrationState state);
    void join();
    
    std::shared_ptr<ApiClient> api_;
    
    std::mutex thread_mutex_;
    std::thread worker_thread_;
    std::thread::id worker_id_;
    std::atomic<bool> cancelled_{false};
    
    mutable std::mutex mutex_;
    RegistrationState state_ = RegistrationState::IDLE;
    std::optional<RegistrationOutcome> last_outcome_;
    StateCallback state_callback_;
    ProgressCallback progress_callback_;
};

} // namespace powgate::client
