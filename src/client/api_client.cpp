#include "client/api_client.hpp"
#include "core/pow/pow.hpp"
#include "utils/logger.hpp"

namespace powgate::client {

using json = nlohmann::json;
using network::HttpMethod;
using network::HttpRequest;
using network::HttpResponse;

namespace {
    // Parse a JSON object body or explain why it isn't one
    Result<json> parse_object(const std::string& body, const char* what) {
        json parsed = json::parse(body, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            return Result<json>::Err(ErrorCode::NetworkInvalidMessage,
                                     std::string("Malformed ") + what + " response");
        }
        return Result<json>::Ok(std::move(parsed));
    }
}

json RegistrationRequest::to_json() const {
    return json{
        {"username", username},
        {"password", password},
        {"nonce", nonce},
        {"hash", hash},
        {"active", active}
    };
}

ApiClient::ApiClient(std::shared_ptr<network::HttpTransport> transport, ApiEndpoints endpoints)
    : transport_(std::move(transport)),
      endpoints_(std::move(endpoints)) {
}

std::string ApiClient::extract_detail(const std::string& body) {
    json parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object() || !parsed.contains("detail")) {
        return "";
    }

    const json& detail = parsed["detail"];
    if (detail.is_string()) {
        return detail.get<std::string>();
    }

    // Validation errors arrive as a list of {loc, msg, type}
    if (detail.is_array()) {
        std::string joined;
        for (const auto& item : detail) {
            if (item.is_object() && item.contains("msg") && item["msg"].is_string()) {
                if (!joined.empty()) {
                    joined += "; ";
                }
                joined += item["msg"].get<std::string>();
            }
        }
        return joined;
    }

    return "";
}

Error ApiClient::error_from_response(const HttpResponse& response, ErrorCode code) {
    return Error(code, "HTTP " + std::to_string(response.status), extract_detail(response.body));
}

Result<Challenge> ApiClient::get_challenge() {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.path = endpoints_.challenge_path;

    auto sent = transport_->send(request);
    if (sent.is_err()) {
        return Result<Challenge>::Err(sent.error());
    }

    const HttpResponse& response = sent.value();
    if (!response.is_success()) {
        POWGATE_LOG_WARN("Challenge request rejected: HTTP {}", response.status);
        return Result<Challenge>::Err(error_from_response(response, ErrorCode::ServerRejected));
    }

    auto parsed = parse_object(response.body, "challenge");
    if (parsed.is_err()) {
        return Result<Challenge>::Err(parsed.error());
    }
    const json& body = parsed.value();

    if (!body.contains("challenge") || !body["challenge"].is_string() ||
        !body.contains("token") || !body["token"].is_string() ||
        !body.contains("difficulty") || !body["difficulty"].is_number_integer()) {
        return Result<Challenge>::Err(ErrorCode::NetworkInvalidMessage,
                                      "Challenge response is missing required fields");
    }

    int64_t difficulty = body["difficulty"].get<int64_t>();
    if (difficulty < 0 || difficulty > static_cast<int64_t>(core::ProofOfWork::MAX_DIFFICULTY)) {
        return Result<Challenge>::Err(ErrorCode::NetworkInvalidMessage,
                                      "Challenge difficulty out of range: " + std::to_string(difficulty));
    }

    Challenge challenge;
    challenge.challenge = body["challenge"].get<std::string>();
    challenge.difficulty = static_cast<uint32_t>(difficulty);
    challenge.token = body["token"].get<std::string>();

    POWGATE_LOG_DEBUG("Received challenge (difficulty={})", challenge.difficulty);
    return Result<Challenge>::Ok(std::move(challenge));
}

Result<void> ApiClient::register_user(const RegistrationRequest& registration, const std::string& token) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.path = endpoints_.register_path + "?token=" + url_encode(token);
    request.set_json_body(registration.to_json().dump());

    auto sent = transport_->send(request);
    if (sent.is_err()) {
        return Result<void>::Err(sent.error());
    }

    const HttpResponse& response = sent.value();
    if (!response.is_success()) {
        POWGATE_LOG_WARN("Registration rejected: HTTP {}", response.status);
        return Result<void>::Err(error_from_response(response, ErrorCode::ServerRejected));
    }

    return Result<void>::Ok();
}

Result<std::string> ApiClient::login(const std::string& username, const std::string& password) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.path = endpoints_.login_path;
    request.set_json_body(json{{"username", username}, {"password", password}}.dump());

    auto sent = transport_->send(request);
    if (sent.is_err()) {
        return Result<std::string>::Err(sent.error());
    }

    const HttpResponse& response = sent.value();
    if (!response.is_success()) {
        POWGATE_LOG_WARN("Login rejected: HTTP {}", response.status);
        return Result<std::string>::Err(error_from_response(response, ErrorCode::ServerRejected));
    }

    auto parsed = parse_object(response.body, "login");
    if (parsed.is_err()) {
        return Result<std::string>::Err(parsed.error());
    }
    const json& body = parsed.value();

    if (!body.contains("access_token") || !body["access_token"].is_string() ||
        body["access_token"].get<std::string>().empty()) {
        return Result<std::string>::Err(ErrorCode::NetworkInvalidMessage,
                                        "Login response has no access_token");
    }

    return Result<std::string>::Ok(body["access_token"].get<std::string>());
}

Result<Profile> ApiClient::current_user(const std::string& token) {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.path = endpoints_.profile_path;
    request.set_bearer_token(token);

    auto sent = transport_->send(request);
    if (sent.is_err()) {
        return Result<Profile>::Err(sent.error());
    }

    const HttpResponse& response = sent.value();
    if (response.status == 401 || response.status == 403) {
        return Result<Profile>::Err(error_from_response(response, ErrorCode::SessionRejected));
    }
    if (!response.is_success()) {
        POWGATE_LOG_WARN("Profile request rejected: HTTP {}", response.status);
        return Result<Profile>::Err(error_from_response(response, ErrorCode::ServerRejected));
    }

    auto parsed = parse_object(response.body, "profile");
    if (parsed.is_err()) {
        return Result<Profile>::Err(parsed.error());
    }
    json body = std::move(parsed.value());

    if (!body.contains("username") || !body["username"].is_string()) {
        return Result<Profile>::Err(ErrorCode::NetworkInvalidMessage,
                                    "Profile response has no username");
    }

    Profile profile;
    profile.username = body["username"].get<std::string>();
    body.erase("username");
    profile.fields = std::move(body);

    return Result<Profile>::Ok(std::move(profile));
}

} // namespace powgate::client
