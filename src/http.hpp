#pragma once
#include <string>
#include <vector>
#include <utility>
#include <atomic>

namespace papernotes {

// Initialize HTTP subsystem (call once at startup, before any worker threads).
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;   // 0 = transport failure or aborted
    std::string body;
};

// Abstract HTTP client interface (injectable for testing).
// `abort_flag`, when set, is polled during the transfer (~1s granularity);
// once it reads true the request is abandoned and status_code is 0.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 120,
                              const std::atomic<bool>* abort_flag = nullptr) = 0;

    virtual HttpResponse get(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 30,
                             const std::atomic<bool>* abort_flag = nullptr) = 0;
};

// libcurl-backed client. Each call uses its own easy handle, so one instance
// is safe to share between worker threads.
class CurlHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 120,
                      const std::atomic<bool>* abort_flag = nullptr) override;

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30,
                     const std::atomic<bool>* abort_flag = nullptr) override;
};

} // namespace papernotes
