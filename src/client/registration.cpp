#include "client/registration.hpp"
#include "utils/logger.hpp"
#include <sodium.h>

namespace powgate::client {

namespace {
    void wipe(std::string& secret) {
        if (!secret.empty()) {
            sodium_memzero(&secret[0], secret.size());
        }
        secret.clear();
    }

    bool is_terminal(RegistrationState state) {
        return state == RegistrationState::SUCCESS || state == RegistrationState::FAILED;
    }
}

const char* registration_state_to_string(RegistrationState state) {
    switch (state) {
        case RegistrationState::IDLE: return "idle";
        case RegistrationState::FETCHING_CHALLENGE: return "fetching-challenge";
        case RegistrationState::SOLVING: return "solving";
        case RegistrationState::SUBMITTING: return "submitting";
        case RegistrationState::SUCCESS: return "success";
        case RegistrationState::FAILED: return "failed";
        default: return "unknown";
    }
}

RegistrationFlow::RegistrationFlow(std::shared_ptr<ApiClient> api)
    : api_(std::move(api)) {
}

RegistrationFlow::~RegistrationFlow() {
    cancel();
    join();
}

bool RegistrationFlow::submit(const std::string& username, const std::string& password) {
    {
        std::lock_guard<std::mutex> lock(thread_mutex_);
        if (worker_id_ == std::this_thread::get_id()) {
            POWGATE_LOG_WARN("Registration submit from its own callback ignored");
            return false;
        }
    }
    
    switch (begin(username, password)) {
        case Begin::Busy:
            POWGATE_LOG_WARN("Registration already in progress, ignoring submit");
            return false;
        case Begin::Rejected:
            return true;
        case Begin::Started:
            break;
    }
    
    // The previous attempt has reached a terminal state, reap its thread
    std::thread finished;
    {
        std::lock_guard<std::mutex> lock(thread_mutex_);
        finished = std::move(worker_thread_);
        worker_thread_ = std::thread([this, username, password]() {
            execute(username, password);
        });
        worker_id_ = worker_thread_.get_id();
    }
    
    if (finished.joinable()) {
        finished.join();
    }
    return true;
}

RegistrationOutcome RegistrationFlow::run(const std::string& username, const std::string& password) {
    switch (begin(username, password)) {
        case Begin::Busy: {
            POWGATE_LOG_WARN("Registration already in progress, ignoring submit");
            Error busy(ErrorCode::RequestInFlight, "Registration already in progress");
            RegistrationOutcome outcome;
            outcome.message = busy.message();
            outcome.error_kind = busy.kind();
            return outcome;
        }
        case Begin::Rejected:
            return *last_outcome();
        case Begin::Started:
            break;
    }
    
    return execute(username, password);
}

RegistrationOutcome RegistrationFlow::wait() {
    join();

    std::lock_guard<std::mutex> lock(mutex_);
    if (last_outcome_) {
        return *last_outcome_;
    }

    RegistrationOutcome outcome;
    outcome.message = "No registration attempted";
    outcome.error_kind = ErrorKind::Internal;
    return outcome;
}

void RegistrationFlow::cancel() {
    if (!is_busy()) {
        return;
    }

    POWGATE_LOG_INFO("Cancelling registration...");
    cancelled_ = true;
}

void RegistrationFlow::acknowledge() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!is_terminal(state_)) {
            return;
        }
    }
    transition(RegistrationState::IDLE);
}

RegistrationState RegistrationFlow::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool RegistrationFlow::is_busy() const {
    auto current = state();
    return current == RegistrationState::FETCHING_CHALLENGE ||
           current == RegistrationState::SOLVING ||
           current == RegistrationState::SUBMITTING;
}

std::optional<RegistrationOutcome> RegistrationFlow::last_outcome() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_outcome_;
}

void RegistrationFlow::set_state_callback(StateCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_callback_ = std::move(callback);
}

void RegistrationFlow::set_progress_callback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_callback_ = std::move(callback);
}

RegistrationFlow::Begin RegistrationFlow::begin(const std::string& username, const std::string& password) {
    RegistrationState next = RegistrationState::FETCHING_CHALLENGE;
    StateCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != RegistrationState::IDLE && !is_terminal(state_)) {
            return Begin::Busy;
        }
        
        last_outcome_.reset();
        if (username.empty() || password.empty()) {
            // Nothing to send, the attempt fails before any request
            Error missing(ErrorCode::ValidationFailed, "Missing credentials", MISSING_FIELDS_MESSAGE);
            RegistrationOutcome outcome;
            outcome.message = user_message(missing, MISSING_FIELDS_MESSAGE);
            outcome.error_kind = missing.kind();
            last_outcome_ = outcome;
            next = RegistrationState::FAILED;
        }
        
        if (state_ != next) {
            state_ = next;
            callback = state_callback_;
        }
    }
    
    cancelled_ = false;
    POWGATE_LOG_DEBUG("Registration state -> {}", registration_state_to_string(next));
    if (callback) {
        callback(next);
    }
    return next == RegistrationState::FAILED ? Begin::Rejected : Begin::Started;
}

RegistrationOutcome RegistrationFlow::execute(std::string username, std::string password) {
    // Step 1: challenge
    POWGATE_LOG_INFO("Requesting registration challenge for {}", username);
    auto challenge = api_->get_challenge();
    if (challenge.is_err()) {
        POWGATE_LOG_WARN("Challenge request failed: {}", challenge.error().to_string());
        wipe(password);
        return fail(challenge.error(), GENERIC_FAILURE);
    }

    if (cancelled_) {
        wipe(password);
        return fail(Error(ErrorCode::PoWCancelled, CANCELLED_MESSAGE), CANCELLED_MESSAGE);
    }

    // Step 2: proof of work
    transition(RegistrationState::SOLVING);

    core::PowPuzzle puzzle;
    puzzle.challenge = challenge.value().challenge;
    puzzle.difficulty = challenge.value().difficulty;

    ProgressCallback progress;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        progress = progress_callback_;
    }

    auto solution = core::ProofOfWork::solve(puzzle, cancelled_, progress);
    if (!solution) {
        wipe(password);
        return fail(Error(ErrorCode::PoWCancelled, CANCELLED_MESSAGE), CANCELLED_MESSAGE);
    }

    if (!core::ProofOfWork::verify_solution(puzzle, *solution)) {
        wipe(password);
        return fail(Error(ErrorCode::PoWInvalidSolution, "Solution failed local verification"),
                    GENERIC_FAILURE);
    }

    // Step 3: submit
    transition(RegistrationState::SUBMITTING);

    RegistrationRequest request;
    request.username = username;
    request.password = password;
    request.nonce = std::to_string(solution->nonce);
    request.hash = solution->digest;
    request.active = false;

    auto submitted = api_->register_user(request, challenge.value().token);
    wipe(request.password);
    wipe(password);

    if (submitted.is_err()) {
        POWGATE_LOG_WARN("Registration failed ({}): {}",
                         error_kind_to_string(submitted.error().kind()), submitted.error().to_string());
        RegistrationOutcome outcome;
        outcome.message = user_message(submitted.error(), GENERIC_FAILURE);
        outcome.error_kind = submitted.error().kind();
        outcome.solution = solution;
        return finish(std::move(outcome));
    }

    POWGATE_LOG_INFO("Registered {} (nonce={}, {}ms)", username, solution->nonce,
                     solution->compute_time_ms);

    RegistrationOutcome outcome;
    outcome.success = true;
    outcome.message = SUCCESS_MESSAGE;
    outcome.solution = solution;
    return finish(std::move(outcome));
}

RegistrationOutcome RegistrationFlow::fail(const Error& error, const std::string& fallback) {
    POWGATE_LOG_DEBUG("Registration attempt ended ({}): {}",
                      error_kind_to_string(error.kind()), error.message());
    RegistrationOutcome outcome;
    outcome.message = user_message(error, fallback);
    outcome.error_kind = error.kind();
    return finish(std::move(outcome));
}

RegistrationOutcome RegistrationFlow::finish(RegistrationOutcome outcome) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_outcome_ = outcome;
    }
    transition(outcome.success ? RegistrationState::SUCCESS : RegistrationState::FAILED);
    return outcome;
}

void RegistrationFlow::transition(RegistrationState state) {
    StateCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == state) {
            return;
        }
        state_ = state;
        callback = state_callback_;
    }

    POWGATE_LOG_DEBUG("Registration state -> {}", registration_state_to_string(state));
    if (callback) {
        callback(state);
    }
}

void RegistrationFlow::join() {
    std::thread finished;
    {
        std::lock_guard<std::mutex> lock(thread_mutex_);
        if (!worker_thread_.joinable() || worker_id_ == std::this_thread::get_id()) {
            return;
        }
        finished = std::move(worker_thread_);
    }
    finished.join();
}

} // namespace powgate::client
