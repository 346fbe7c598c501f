#pragma once

#include "powgate/common.hpp"
#include "powgate/error.hpp"
#include "network/http_client.hpp"
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace powgate::client {

/**
 * Challenge issued by the challenge service. Single use; the token scopes
 * it to one registration attempt.
 */
struct Challenge {
    std::string challenge;
    uint32_t difficulty = 0;
    std::string token;
};

/**
 * Body of a registration submission. `active` is always false, accounts are
 * activated separately.
 */
struct RegistrationRequest {
    std::string username;
    std::string password;
    std::string nonce;   // decimal
    std::string hash;    // hex digest for the nonce
    bool active = false;
    
    nlohmann::json to_json() const;
};

/**
 * Current-user profile returned by the session service
 */
struct Profile {
    std::string username;
    nlohmann::json fields = nlohmann::json::object();  // every other profile field
};

/**
 * Service paths, relative to the transport's base URL
 */
struct ApiEndpoints {
    std::string challenge_path = "/users/challenge";
    std::string register_path = "/users/register";
    std::string login_path = constants::DEFAULT_LOGIN_PATH;
    std::string profile_path = constants::DEFAULT_PROFILE_PATH;
};

/**
 * ApiClient - Client side of the challenge, registration, login and
 * session services
 *
 * Every call returns a Result. Transport failures keep their network error
 * codes; non-2xx responses become ServerRejected (SessionRejected for a
 * 401/403 from the session service) with the body's `detail` text in
 * Error::details(); unexpected bodies become NetworkInvalidMessage.
 */
class ApiClient {
public:
    ApiClient(std::shared_ptr<network::HttpTransport> transport, ApiEndpoints endpoints = {});
    
    // GET challenge
    Result<Challenge> get_challenge();
    
    // POST registration with the challenge token in the query string
    Result<void> register_user(const RegistrationRequest& request, const std::string& token);
    
    // POST credentials, returns access_token
    Result<std::string> login(const std::string& username, const std::string& password);
    
    // GET current user with a bearer token
    Result<Profile> current_user(const std::string& token);
    
    const ApiEndpoints& endpoints() const { return endpoints_; }
    
    /**
     * Build the error for a non-2xx response
     */
    static Error error_from_response(const network::HttpResponse& response, ErrorCode code);
    
    /**
     * Extract the `detail` text from an error body, empty if there is none
     */
    static std::string extract_detail(const std::string& body);
    
private:
    std::shared_ptr<network::HttpTransport> transport_;
    ApiEndpoints endpoints_;
};

} // namespace powgate::client
