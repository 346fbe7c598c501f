#pragma once

#include "network/http_client.hpp"
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace powgate::testing {

/**
 * Scripted transport: answers requests in order from a queue and records
 * every request it sees.
 */
class FakeTransport : public network::HttpTransport {
public:
    void push_response(int status, const std::string& body) {
        network::HttpResponse response;
        response.status = status;
        response.body = body;
        response.headers["content-type"] = "application/json";
        std::lock_guard<std::mutex> lock(mutex_);
        responses_.push_back(Result<network::HttpResponse>::Ok(response));
    }
    
    void push_failure(ErrorCode code, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_.push_back(Result<network::HttpResponse>::Err(code, message));
    }
    
    Result<network::HttpResponse> send(const network::HttpRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        if (responses_.empty()) {
            return Result<network::HttpResponse>::Err(ErrorCode::NetworkConnectionFailed,
                                                      "No scripted response");
        }
        auto response = responses_.front();
        responses_.pop_front();
        return response;
    }
    
    std::vector<network::HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }
    
    size_t request_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }
    
private:
    mutable std::mutex mutex_;
    std::deque<Result<network::HttpResponse>> responses_;
    std::vector<network::HttpRequest> requests_;
};

} // namespace powgate::testing
