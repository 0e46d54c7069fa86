#include "http.hpp"

#include <curl/curl.h>
#include <string>

namespace rumormill {

static const std::atomic<bool>* g_http_abort_flag = nullptr;

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_http_abort_flag = flag;
}

// Called by curl ~once per second; return non-zero to abort the transfer.
static int abort_progress_cb(void* /*clientp*/,
                             curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                             curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    if (g_http_abort_flag && g_http_abort_flag->load(std::memory_order_relaxed))
        return 1;
    return 0;
}

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, total);
    return total;
}

// ── RAII curl handle with common setup ────────────────────────

struct CurlRequest {
    CURL* curl = curl_easy_init();
    curl_slist* hlist = nullptr;

    CurlRequest() = default;
    ~CurlRequest() {
        curl_slist_free_all(hlist);
        if (curl) curl_easy_cleanup(curl);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    explicit operator bool() const { return curl != nullptr; }

    void setup(const std::string& url, const std::vector<Header>& headers, long timeout) {
        for (const auto& h : headers) {
            std::string entry = h.first + ": " + h.second;
            hlist = curl_slist_append(hlist, entry.c_str());
        }
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, hlist);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        if (g_http_abort_flag) {
            curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
            curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
        }
    }

    HttpResponse perform() {
        HttpResponse response;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
        CURLcode res = curl_easy_perform(curl);
        if (res == CURLE_OK) {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
        } else {
            response.body = curl_easy_strerror(res);
        }
        return response;
    }
};

// ── Public API ────────────────────────────────────────────────

HttpResponse CurlHttpClient::post(const std::string& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  long timeout_seconds) {
    return http_post(url, body, headers, timeout_seconds);
}

HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds) {
    CurlRequest req;
    if (!req) return {};
    req.setup(url, headers, timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_POST, 1L);
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    return req.perform();
}

} // namespace rumormill
