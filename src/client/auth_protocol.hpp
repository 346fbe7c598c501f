#pragma once

#include "client/api_client.hpp"
#include <memory>
#include <string>

namespace powgate::client {

/**
 * AuthProtocol - Exchanges credentials for a session token and resolves a
 * token to the current-user profile
 */
class AuthProtocol {
public:
    explicit AuthProtocol(std::shared_ptr<ApiClient> api);
    
    /**
     * Log in with username and password
     * @return Session token, or ValidationFailed when a field is empty
     *         (no request is made), or the service error
     */
    Result<std::string> authenticate(const std::string& username, const std::string& password);
    
    /**
     * Fetch the profile the token belongs to
     */
    Result<Profile> fetch_profile(const std::string& token);
    
private:
    std::shared_ptr<ApiClient> api_;
};

} // namespace powgate::client
