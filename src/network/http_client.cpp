#include "network/http_client.hpp"
#include "utils/logger.hpp"
#include <httplib.h>
#include <algorithm>
#include <cctype>

namespace powgate::network {

namespace {
    std::string to_lower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    // A response that never arrived in full counts as a timeout
    ErrorCode classify(httplib::Error error) {
        switch (error) {
            case httplib::Error::Read:
            case httplib::Error::Write:
                return ErrorCode::NetworkTimeout;
            default:
                return ErrorCode::NetworkConnectionFailed;
        }
    }
}

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        default: return "GET";
    }
}

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

// BaseUrl implementation

std::optional<BaseUrl> BaseUrl::parse(const std::string& url) {
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        return std::nullopt;
    }

    std::string rest = url.substr(scheme.size());
    std::string authority = rest;
    std::string path;

    size_t slash = rest.find('/');
    if (slash != std::string::npos) {
        authority = rest.substr(0, slash);
        path = rest.substr(slash);
    }

    if (authority.empty()) {
        return std::nullopt;
    }

    BaseUrl result;

    // [v6addr]:port or host:port
    size_t colon = std::string::npos;
    if (authority.front() == '[') {
        size_t bracket = authority.find(']');
        if (bracket == std::string::npos) {
            return std::nullopt;
        }
        result.host = authority.substr(1, bracket - 1);
        if (bracket + 1 < authority.size()) {
            if (authority[bracket + 1] != ':') {
                return std::nullopt;
            }
            colon = bracket + 1;
        }
    } else {
        colon = authority.rfind(':');
        result.host = authority.substr(0, colon);
    }

    if (colon != std::string::npos) {
        std::string port_str = authority.substr(colon + 1);
        if (port_str.empty() || port_str.size() > 5 ||
            !std::all_of(port_str.begin(), port_str.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        unsigned long port = std::stoul(port_str);
        if (port == 0 || port > 65535) {
            return std::nullopt;
        }
        result.port = static_cast<uint16_t>(port);
    }

    if (result.host.empty()) {
        return std::nullopt;
    }

    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    result.path_prefix = path;

    return result;
}

std::string BaseUrl::host_header() const {
    std::string host_part = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (port == 80) {
        return host_part;
    }
    return host_part + ":" + std::to_string(port);
}

// HttpClient implementation

HttpClient::HttpClient(const std::string& base_url, uint32_t timeout_ms)
    : raw_base_url_(base_url),
      base_url_(BaseUrl::parse(base_url)),
      timeout_ms_(timeout_ms) {
    if (!base_url_) {
        POWGATE_LOG_ERROR("Unsupported server URL: {} (expected http://host[:port])", base_url);
    }
}

Result<HttpResponse> HttpClient::send(const HttpRequest& request) {
    if (!base_url_) {
        return Result<HttpResponse>::Err(ErrorCode::InvalidArgument,
                                         "Unsupported server URL: " + raw_base_url_);
    }

    const BaseUrl& url = *base_url_;
    const std::string path = url.path_prefix + request.path;
    POWGATE_LOG_DEBUG("{} {}", http_method_to_string(request.method), path);

    httplib::Client client(url.host, url.port);
    const time_t seconds = static_cast<time_t>(timeout_ms_ / 1000);
    const time_t micros = static_cast<time_t>((timeout_ms_ % 1000) * 1000);
    client.set_connection_timeout(seconds, micros);
    client.set_read_timeout(seconds, micros);
    client.set_write_timeout(seconds, micros);
    client.set_keep_alive(false);

    httplib::Headers headers = {
        {"User-Agent", std::string("powgate/") + POWGATE_VERSION_STRING},
        {"Accept", "application/json"}
    };
    std::string content_type = "application/json";
    for (const auto& [name, value] : request.headers) {
        if (to_lower(name) == "content-type") {
            content_type = value;
        } else {
            headers.emplace(name, value);
        }
    }

    httplib::Result result = request.method == HttpMethod::POST
        ? client.Post(path, headers, request.body, content_type)
        : client.Get(path, headers);

    if (!result) {
        auto error = result.error();
        POWGATE_LOG_WARN("{} {} failed: {}", http_method_to_string(request.method),
                         url.host_header(), httplib::to_string(error));
        return Result<HttpResponse>::Err(classify(error),
                                         "Request to " + url.host_header() + " failed: " +
                                         httplib::to_string(error));
    }

    HttpResponse response;
    response.status = result->status;
    response.body = result->body;
    for (const auto& [name, value] : result->headers) {
        response.headers[to_lower(name)] = value;
    }

    POWGATE_LOG_DEBUG("HTTP {} ({} bytes)", response.status, response.body.size());
    return Result<HttpResponse>::Ok(std::move(response));
}

} // namespace powgate::network
