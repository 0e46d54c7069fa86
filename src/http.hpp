#pragma once
#include <string>
#include <vector>
#include <utility>
#include <atomic>

namespace rumormill {

// Initialize HTTP subsystem (call once at startup).
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

// Set a global abort flag checked by all in-flight transfers (~1s granularity).
// When the flag becomes true, in-flight HTTP requests abort promptly.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

// status_code 0 means the transfer itself failed (timeout, abort, DNS...).
struct HttpResponse {
    long status_code = 0;
    std::string body;
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 120) = 0;
};

// libcurl-backed client
class CurlHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 120) override;
};

// HTTP POST with JSON body
HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds = 120);

} // namespace rumormill
