#include "http.hpp"

#include <curl/curl.h>
#include <iostream>
#include <string>

namespace papernotes {

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

// Called by curl ~once per second; return non-zero to abort the transfer.
static int abort_progress_cb(void* clientp,
                              curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                              curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* flag = static_cast<const std::atomic<bool>*>(clientp);
    if (flag && flag->load(std::memory_order_relaxed))
        return 1;
    return 0;
}

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, total);
    return total;
}

static curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        list = curl_slist_append(list, entry.c_str());
    }
    return list;
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
};

static void setup_request(CurlRequest& req, const std::string& url,
                           const std::vector<Header>& headers, long timeout,
                           const std::atomic<bool>* abort_flag) {
    req.hlist = build_headers(headers);
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, timeout);
    // Worker threads must not receive SIGALRM from the resolver
    curl_easy_setopt(req.curl, CURLOPT_NOSIGNAL, 1L);
    if (abort_flag) {
        curl_easy_setopt(req.curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(req.curl, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
        curl_easy_setopt(req.curl, CURLOPT_XFERINFODATA,
                         const_cast<std::atomic<bool>*>(abort_flag));
    }
}

static HttpResponse perform(CurlRequest& req, const std::string& url) {
    HttpResponse response;
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response.body);
    CURLcode res = curl_easy_perform(req.curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    } else if (res != CURLE_ABORTED_BY_CALLBACK) {
        std::cerr << "[http] " << url << ": " << curl_easy_strerror(res) << "\n";
        response.body.clear();
    } else {
        response.body.clear();
    }
    return response;
}

// ── Public API ────────────────────────────────────────────────

HttpResponse CurlHttpClient::post(const std::string& url,
                                   const std::string& body,
                                   const std::vector<Header>& headers,
                                   long timeout_seconds,
                                   const std::atomic<bool>* abort_flag) {
    CurlRequest req;
    if (!req) return {};
    setup_request(req, url, headers, timeout_seconds, abort_flag);
    curl_easy_setopt(req.curl, CURLOPT_POST, 1L);
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    return perform(req, url);
}

HttpResponse CurlHttpClient::get(const std::string& url,
                                  const std::vector<Header>& headers,
                                  long timeout_seconds,
                                  const std::atomic<bool>* abort_flag) {
    CurlRequest req;
    if (!req) return {};
    setup_request(req, url, headers, timeout_seconds, abort_flag);
    curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);
    return perform(req, url);
}

} // namespace papernotes
