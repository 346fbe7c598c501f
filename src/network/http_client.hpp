#pragma once

#include "powgate/common.hpp"
#include "powgate/error.hpp"
#include <map>
#include <string>
#include <optional>

namespace powgate::network {

/**
 * HTTP request method types
 */
enum class HttpMethod {
    GET,
    POST
};

const char* http_method_to_string(HttpMethod method);

/**
 * HTTP request representation. `path` is relative to the client's base URL
 * and may carry a query string.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string path;
    std::map<std::string, std::string> headers;
    std::string body;
    
    void set_json_body(const std::string& json) {
        body = json;
        headers["Content-Type"] = "application/json";
    }
    
    void set_bearer_token(const std::string& token) {
        headers["Authorization"] = "Bearer " + token;
    }
};

/**
 * HTTP response representation. Header names are stored lower-case.
 */
struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;
    
    bool is_success() const { return status >= 200 && status < 300; }
    
    std::optional<std::string> header(const std::string& name) const;
};

/**
 * Transport seam between the API client and the wire
 *
 * Implementations report transport failures (no response at all) as
 * NetworkConnectionFailed or NetworkTimeout errors. Any response that was
 * received, whatever its status, is returned as Ok.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    
    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

/**
 * Parsed `http://host[:port][/prefix]` base URL
 */
struct BaseUrl {
    std::string host;
    uint16_t port = 80;
    std::string path_prefix;  // without trailing slash
    
    static std::optional<BaseUrl> parse(const std::string& url);
    
    std::string host_header() const;
};

/**
 * HttpClient - HTTP/1.1 client on cpp-httplib
 *
 * A fresh httplib::Client per request, so one instance can be shared by the
 * registration and session threads. Plain HTTP only.
 */
class HttpClient : public HttpTransport {
public:
    HttpClient(const std::string& base_url, uint32_t timeout_ms);
    
    Result<HttpResponse> send(const HttpRequest& request) override;
    
    const std::optional<BaseUrl>& base_url() const { return base_url_; }
    
private:
    std::string raw_base_url_;
    std::optional<BaseUrl> base_url_;
    uint32_t timeout_ms_;
};

} // namespace powgate::network
