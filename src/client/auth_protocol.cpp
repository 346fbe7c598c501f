#include "client/auth_protocol.hpp"
#include "utils/logger.hpp"

namespace powgate::client {

AuthProtocol::AuthProtocol(std::shared_ptr<ApiClient> api)
    : api_(std::move(api)) {
}

Result<std::string> AuthProtocol::authenticate(const std::string& username, const std::string& password) {
    if (username.empty() || password.empty()) {
        return Result<std::string>::Err(Error(ErrorCode::ValidationFailed,
                                              "Missing credentials",
                                              "Username and password are required"));
    }
    
    POWGATE_LOG_INFO("Authenticating user {}", username);
    
    auto token = api_->login(username, password);
    if (token.is_err()) {
        POWGATE_LOG_WARN("Authentication failed for {}: {}", username, token.error().to_string());
    }
    return token;
}

Result<Profile> AuthProtocol::fetch_profile(const std::string& token) {
    if (token.empty()) {
        return Result<Profile>::Err(ErrorCode::SessionRejected, "Empty session token");
    }
    
    auto profile = api_->current_user(token);
    if (profile.is_ok()) {
        POWGATE_LOG_DEBUG("Fetched profile for {}", profile.value().username);
    }
    return profile;
}

} // namespace powgate::client
