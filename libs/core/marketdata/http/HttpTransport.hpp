#pragma once
#include <chrono>
#include <functional>
#include <string>

struct HttpRequest {
    std::string host;
    std::string port;
    std::string target;
    bool useTls = false;
    std::chrono::seconds timeout{15};
};

struct HttpResponse {
    int status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// Pure transport interface (no analytics logic).
// Exactly one of the two callbacks fires per request, on the transport's own thread.
class HttpTransport {
public:
    using ResponseCb = std::function<void(HttpResponse)>;
    using ErrorCb    = std::function<void(std::string)>;

    HttpTransport() = default;
    virtual ~HttpTransport() = default;

    virtual void get(HttpRequest request, ResponseCb onResponse, ErrorCb onError) = 0;
};
