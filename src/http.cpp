#include "http.hpp"

#include <curl/curl.h>
#include <string>

namespace kindling {

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

// Called by curl ~once per second even when idle; return non-zero to abort.
static int abort_progress_cb(void* clientp,
                             curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                             curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* flag = static_cast<const std::atomic<bool>*>(clientp);
    if (flag && flag->load(std::memory_order_relaxed))
        return 1;
    return 0;
}

static void apply_abort_hook(CURL* curl, const std::atomic<bool>* flag) {
    if (!flag) return;
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<std::atomic<bool>*>(flag));
}

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, total);
    return total;
}

struct RawStreamContext {
    RawChunkCallback* callback;
    bool aborted = false;
};

static size_t raw_stream_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* ctx = static_cast<RawStreamContext*>(userdata);
    if (ctx->aborted) return 0;

    if (!(*ctx->callback)(ptr, total)) {
        ctx->aborted = true;
        return 0;
    }

    return total;
}

struct BodyReadContext {
    BodyReader* reader;
    bool aborted = false;
};

static size_t body_read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<BodyReadContext*>(userdata);
    size_t n = (*ctx->reader)(buffer, size * nitems);
    if (n == kAbortBody) {
        ctx->aborted = true;
        return CURL_READFUNC_ABORT;
    }
    return n;
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
                          const std::vector<Header>& headers, long timeout) {
    req.hlist = build_headers(headers);
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, timeout);
    curl_easy_setopt(req.curl, CURLOPT_NOSIGNAL, 1L);
}

static void set_post_body(CURL* curl, const std::string& body) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
}

// Fills status/error in place; the write callback already points at response.body.
static void perform(CURL* curl, HttpResponse& response) {
    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    } else if (res == CURLE_HTTP_RETURNED_ERROR) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
        response.error = curl_easy_strerror(res);
    } else {
        response.status_code = 0;
        response.error = curl_easy_strerror(res);
        response.aborted = (res == CURLE_ABORTED_BY_CALLBACK);
    }
}

static HttpResponse failed_init() {
    HttpResponse response;
    response.error = "curl_easy_init failed";
    return response;
}

// ── Public API ────────────────────────────────────────────────

HttpResponse CurlHttpClient::get(const std::string& url,
                                 const std::vector<Header>& headers,
                                 long timeout_seconds) {
    CurlRequest req;
    if (!req) return failed_init();
    setup_request(req, url, headers, timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);
    HttpResponse response;
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response.body);
    perform(req.curl, response);
    return response;
}

HttpResponse CurlHttpClient::post(const std::string& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  long timeout_seconds) {
    CurlRequest req;
    if (!req) return failed_init();
    setup_request(req, url, headers, timeout_seconds);
    set_post_body(req.curl, body);
    HttpResponse response;
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response.body);
    perform(req.curl, response);
    return response;
}

HttpResponse CurlHttpClient::put(const std::string& url,
                                 const std::string& body,
                                 const std::vector<Header>& headers,
                                 long timeout_seconds) {
    CurlRequest req;
    if (!req) return failed_init();
    setup_request(req, url, headers, timeout_seconds);
    set_post_body(req.curl, body);
    curl_easy_setopt(req.curl, CURLOPT_CUSTOMREQUEST, "PUT");
    HttpResponse response;
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response.body);
    perform(req.curl, response);
    return response;
}

HttpResponse CurlHttpClient::del(const std::string& url,
                                 const std::vector<Header>& headers,
                                 long timeout_seconds) {
    CurlRequest req;
    if (!req) return failed_init();
    setup_request(req, url, headers, timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_CUSTOMREQUEST, "DELETE");
    HttpResponse response;
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response.body);
    perform(req.curl, response);
    return response;
}

HttpResponse CurlHttpClient::stream_get(const std::string& url,
                                        const std::vector<Header>& headers,
                                        RawChunkCallback callback,
                                        const std::atomic<bool>* abort_flag,
                                        long timeout_seconds) {
    CurlRequest req;
    if (!req) return failed_init();
    setup_request(req, url, headers, timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);
    // Error statuses must not reach the chunk callback as event data
    curl_easy_setopt(req.curl, CURLOPT_FAILONERROR, 1L);
    apply_abort_hook(req.curl, abort_flag);
    RawStreamContext ctx;
    ctx.callback = &callback;
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, raw_stream_write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &ctx);
    HttpResponse response;
    perform(req.curl, response);
    response.aborted = response.aborted || ctx.aborted;
    return response;
}

HttpResponse CurlHttpClient::post_body(const std::string& url,
                                       const std::vector<Header>& headers,
                                       uint64_t content_length,
                                       BodyReader reader,
                                       const std::atomic<bool>* abort_flag,
                                       long timeout_seconds) {
    CurlRequest req;
    if (!req) return failed_init();
    setup_request(req, url, headers, timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_POST, 1L);
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(content_length));
    apply_abort_hook(req.curl, abort_flag);
    BodyReadContext rctx;
    rctx.reader = &reader;
    curl_easy_setopt(req.curl, CURLOPT_READFUNCTION, body_read_callback);
    curl_easy_setopt(req.curl, CURLOPT_READDATA, &rctx);
    HttpResponse response;
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response.body);
    perform(req.curl, response);
    response.aborted = response.aborted || rctx.aborted;
    return response;
}

} // namespace kindling
