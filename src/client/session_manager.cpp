#include "client/session_manager.hpp"
#include "utils/logger.hpp"

namespace powgate::client {

const char* session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::ANONYMOUS: return "anonymous";
        case SessionState::AUTHENTICATING: return "authenticating";
        case SessionState::AUTHENTICATED: return "authenticated";
        default: return "unknown";
    }
}

SessionManager::SessionManager(std::shared_ptr<AuthProtocol> auth,
                               std::shared_ptr<storage::TokenStore> store,
                               std::string token_key)
    : auth_(std::move(auth)),
      store_(std::move(store)),
      token_key_(std::move(token_key)) {
}

SessionState SessionManager::restore() {
    std::lock_guard<std::mutex> operation(operation_mutex_);
    
    auto token = store_->get(token_key_);
    if (!token) {
        POWGATE_LOG_DEBUG("No stored session token");
        transition(SessionState::ANONYMOUS, std::nullopt);
        return SessionState::ANONYMOUS;
    }
    
    auto profile = auth_->fetch_profile(*token);
    if (profile.is_err()) {
        // Stale or unverifiable token, drop it silently
        POWGATE_LOG_DEBUG("Stored session not restored ({}), clearing token",
                          profile.error().to_string());
        if (!store_->clear(token_key_)) {
            POWGATE_LOG_ERROR("Failed to remove stale session token");
        }
        transition(SessionState::ANONYMOUS, std::nullopt);
        return SessionState::ANONYMOUS;
    }
    
    POWGATE_LOG_INFO("Session restored for {}", profile.value().username);
    transition(SessionState::AUTHENTICATED, profile.value());
    return SessionState::AUTHENTICATED;
}

Result<Profile> SessionManager::login(const std::string& username, const std::string& password) {
    std::lock_guard<std::mutex> operation(operation_mutex_);
    
    SessionState previous_state;
    std::optional<Profile> previous_profile;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        previous_state = state_;
        previous_profile = profile_;
    }
    
    transition(SessionState::AUTHENTICATING, previous_profile);
    
    auto token = auth_->authenticate(username, password);
    if (token.is_err()) {
        transition(previous_state, previous_profile);
        return Result<Profile>::Err(token.error());
    }
    
    auto profile = auth_->fetch_profile(token.value());
    if (profile.is_err()) {
        POWGATE_LOG_WARN("Login succeeded but profile fetch failed: {}", profile.error().to_string());
        transition(previous_state, previous_profile);
        return profile;
    }
    
    if (!store_->set(token_key_, token.value())) {
        transition(previous_state, previous_profile);
        return Result<Profile>::Err(ErrorCode::StorageWriteFailed, "Failed to persist session token");
    }
    
    POWGATE_LOG_INFO("Logged in as {}", profile.value().username);
    transition(SessionState::AUTHENTICATED, profile.value());
    return profile;
}

void SessionManager::logout() {
    std::lock_guard<std::mutex> operation(operation_mutex_);
    
    if (!store_->clear(token_key_)) {
        POWGATE_LOG_ERROR("Failed to remove session token on logout");
    }
    
    if (state() != SessionState::ANONYMOUS) {
        POWGATE_LOG_INFO("Logged out");
    }
    transition(SessionState::ANONYMOUS, std::nullopt);
}

SessionState SessionManager::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::optional<Profile> SessionManager::profile() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != SessionState::AUTHENTICATED) {
        return std::nullopt;
    }
    return profile_;
}

std::optional<std::string> SessionManager::token() const {
    return store_->get(token_key_);
}

void SessionManager::set_state_callback(StateCallback callback) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_callback_ = std::move(callback);
}

void SessionManager::transition(SessionState state, std::optional<Profile> profile) {
    StateCallback callback;
    bool changed;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        changed = state_ != state;
        state_ = state;
        profile_ = std::move(profile);
        callback = state_callback_;
    }
    
    if (changed) {
        POWGATE_LOG_DEBUG("Session state -> {}", session_state_to_string(state));
        if (callback) {
            callback(state);
        }
    }
}

} // namespace powgate::client
