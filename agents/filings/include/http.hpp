#pragma once
#include <string>
#include <stdexcept>

struct HttpResponse {
    long status{0};
    std::string body;
    std::string content_type;
};

// Raised when no HTTP status was received at all.
class HttpTransportError : public std::runtime_error {
public:
    HttpTransportError(const std::string& msg, bool timed_out)
        : std::runtime_error(msg), timed_out_(timed_out) {}
    bool timed_out() const { return timed_out_; }

private:
    bool timed_out_;
};

// Must run once before worker threads issue requests.
void http_global_init();

HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms = 30000);
HttpResponse http_get(const std::string& url, const std::string& user_agent, long timeout_ms = 30000);
