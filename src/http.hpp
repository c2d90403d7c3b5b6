#pragma once
#include <string>
#include <vector>
#include <functional>
#include <utility>
#include <atomic>
#include <cstdint>
#include <cstddef>

namespace kindling {

// Initialize HTTP subsystem (call once at startup).
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;   // 0 = transport failure (see error)
    std::string body;
    std::string error;      // transport error text, empty on success
    bool aborted = false;   // transfer cancelled by a callback or abort flag
};

// Raw-chunk streaming callback: receives raw bytes from the response.
// Return false to abort the stream.
using RawChunkCallback = std::function<bool(const char* data, size_t len)>;

// Request body reader: fill up to max bytes into buf, return the count.
// Return 0 at end of body, kAbortBody to cancel the transfer.
using BodyReader = std::function<size_t(char* buf, size_t max)>;
constexpr size_t kAbortBody = static_cast<size_t>(-1);

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 30) = 0;

    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 30) = 0;

    virtual HttpResponse put(const std::string& url,
                             const std::string& body,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 30) = 0;

    virtual HttpResponse del(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 30) = 0;

    // Long-lived GET. Delivers body bytes as they arrive until the server
    // closes, the callback returns false, or *abort_flag becomes true.
    // timeout_seconds = 0 means no overall timeout.
    virtual HttpResponse stream_get(const std::string& url,
                                    const std::vector<Header>& headers,
                                    RawChunkCallback callback,
                                    const std::atomic<bool>* abort_flag,
                                    long timeout_seconds = 0) = 0;

    // POST whose body is pulled from reader in pieces (no full buffering).
    // *abort_flag also cancels while waiting for the response.
    virtual HttpResponse post_body(const std::string& url,
                                   const std::vector<Header>& headers,
                                   uint64_t content_length,
                                   BodyReader reader,
                                   const std::atomic<bool>* abort_flag,
                                   long timeout_seconds = 0) = 0;
};

// libcurl implementation
class CurlHttpClient : public HttpClient {
public:
    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) override;

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30) override;

    HttpResponse put(const std::string& url,
                     const std::string& body,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) override;

    HttpResponse del(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) override;

    HttpResponse stream_get(const std::string& url,
                            const std::vector<Header>& headers,
                            RawChunkCallback callback,
                            const std::atomic<bool>* abort_flag,
                            long timeout_seconds = 0) override;

    HttpResponse post_body(const std::string& url,
                           const std::vector<Header>& headers,
                           uint64_t content_length,
                           BodyReader reader,
                           const std::atomic<bool>* abort_flag,
                           long timeout_seconds = 0) override;
};

} // namespace kindling
