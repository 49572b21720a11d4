#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace scoring {

class HttpTransportException : public std::runtime_error {
public:
    HttpTransportException(int code, const std::string& message)
        : std::runtime_error("http transport error [" + std::to_string(code) + "] " + message)
        , code_{code} {}

    int Code() const { return code_; }

private:
    int code_;
};

struct HttpRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::chrono::milliseconds timeout{10000};
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    // Blocks for at most request.timeout. Throws HttpTransportException on
    // connection failure or timeout; any HTTP status is a valid response.
    virtual HttpResponse Post(const HttpRequest& request) = 0;
};

} // namespace scoring
