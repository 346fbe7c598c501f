#pragma once

#include "client/auth_protocol.hpp"
#include "storage/token_store.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace powgate::client {

/**
 * SessionState - Client authentication state
 */
enum class SessionState : uint8_t {
    ANONYMOUS = 0,
    AUTHENTICATING = 1,   // Login in flight
    AUTHENTICATED = 2     // Token valid, profile known
};

const char* session_state_to_string(SessionState state);

/**
 * SessionManager - Owns the persisted session token
 *
 * restore(), login() and logout() run one at a time; a second call waits
 * for the first to finish. The token store is written only from here.
 * State accessors never wait on an operation in flight.
 */
class SessionManager {
public:
    using StateCallback = std::function<void(SessionState)>;
    
    SessionManager(std::shared_ptr<AuthProtocol> auth,
                   std::shared_ptr<storage::TokenStore> store,
                   std::string token_key = constants::AUTH_TOKEN_KEY);
    ~SessionManager() = default;
    
    POWGATE_DISALLOW_COPY_AND_MOVE(SessionManager);
    
    /**
     * Validate the persisted token, if any. A token the session service does
     * not accept is removed from the store.
     * @return Resulting state (ANONYMOUS or AUTHENTICATED)
     */
    SessionState restore();
    
    /**
     * Log in and persist the issued token. On failure the previous state is
     * kept and the error is returned for display.
     */
    Result<Profile> login(const std::string& username, const std::string& password);
    
    /**
     * Forget the token and return to ANONYMOUS. Safe to call repeatedly.
     */
    void logout();
    
    // State
    SessionState state() const;
    bool is_authenticated() const { return state() == SessionState::AUTHENTICATED; }
    std::optional<Profile> profile() const;
    
    /**
     * Persisted token, if any
     */
    std::optional<std::string> token() const;
    
    void set_state_callback(StateCallback callback);
    
private:
    void transition(SessionState state, std::optional<Profile> profile);
    
    std::shared_ptr<AuthProtocol> auth_;
    std::shared_ptr<storage::TokenStore> store_;
    std::string token_key_;
    
    std::mutex operation_mutex_;    // one auth operation at a time
    mutable std::mutex state_mutex_;
    SessionState state_ = SessionState::ANONYMOUS;
    std::optional<Profile> profile_;
    StateCallback state_callback_;
};

} // namespace powgate::client
