#pragma once
#include <string>
#include <vector>
#include <utility>

namespace engram {

// Initialize HTTP subsystem (call once at startup).
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0; // 0 = transport failure (DNS, connect, timeout)
    std::string body;
    std::string error;    // transport error description when status_code == 0
};

// Abstract HTTP client interface (injectable for testing).
// Implementations must be safe to call from several threads at once.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_ms = 30000) = 0;
};

// libcurl client. One easy handle per request, so no shared state.
class CurlHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_ms = 30000) override;
};

// HTTP POST with JSON body
HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_ms = 30000);

} // namespace engram
