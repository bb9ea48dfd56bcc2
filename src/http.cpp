// libcurl upstream client for non-Linux builds (CMakeLists.txt gates the source file).
#include "http.hpp"

#include <curl/curl.h>
#include <string>

namespace fanrelay {

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

struct RawStreamContext {
    RawChunkCallback* callback;
    const std::atomic<bool>* abort = nullptr;
    CURL* curl = nullptr;
    bool status_checked = false;
    bool deliver = false;
    bool stopped = false;
};

static bool should_abort(const RawStreamContext* ctx) {
    if (ctx->abort && ctx->abort->load(std::memory_order_relaxed)) return true;
    return g_http_abort_flag && g_http_abort_flag->load(std::memory_order_relaxed);
}

// Called by curl ~once per second; return non-zero to abort the transfer.
static int abort_progress_cb(void* clientp,
                              curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                              curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    return should_abort(static_cast<RawStreamContext*>(clientp)) ? 1 : 0;
}

static size_t raw_stream_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* ctx = static_cast<RawStreamContext*>(userdata);
    if (ctx->stopped || should_abort(ctx)) return 0;

    // Only a 2xx body is relayed; error pages are discarded.
    if (!ctx->status_checked) {
        long code = 0;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &code);
        ctx->deliver = (code >= 200 && code < 300);
        ctx->status_checked = true;
    }
    if (!ctx->deliver) return total;

    if (!(*ctx->callback)(ptr, total)) {
        ctx->stopped = true;
        return 0;
    }
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

// ── Public API ────────────────────────────────────────────────

HttpResponse CurlHttpClient::stream_get_raw(const std::string& url,
                                             const std::vector<Header>& headers,
                                             RawChunkCallback callback,
                                             const StreamOptions& options) {
    return http_stream_get_raw(url, headers, std::move(callback), options);
}

HttpResponse http_stream_get_raw(const std::string& url,
                                 const std::vector<Header>& headers,
                                 RawChunkCallback callback,
                                 const StreamOptions& options) {
    HttpResponse response;
    CurlRequest req;
    if (!req) {
        response.error = "curl_easy_init failed";
        return response;
    }

    RawStreamContext ctx;
    ctx.callback = &callback;
    ctx.abort = options.abort;
    ctx.curl = req.curl;

    req.hlist = build_headers(headers);
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(req.curl, CURLOPT_USERAGENT, "fanrelay");
    curl_easy_setopt(req.curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(req.curl, CURLOPT_MAXREDIRS, static_cast<long>(options.max_redirects));
    curl_easy_setopt(req.curl, CURLOPT_CONNECTTIMEOUT, options.connect_timeout_seconds);
    if (options.idle_timeout_seconds > 0) {
        // Less than one byte per second for the whole window counts as idle.
        curl_easy_setopt(req.curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(req.curl, CURLOPT_LOW_SPEED_TIME, options.idle_timeout_seconds);
    }
    curl_easy_setopt(req.curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(req.curl, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
    curl_easy_setopt(req.curl, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, raw_stream_write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &ctx);

    CURLcode res = curl_easy_perform(req.curl);
    curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);

    if (response.status_code != 0 && !response.ok()) {
        response.error = "upstream returned HTTP " + std::to_string(response.status_code);
        return response;
    }
    bool aborted = ctx.stopped || should_abort(&ctx);
    if (res != CURLE_OK && !aborted)
        response.error = res == CURLE_OPERATION_TIMEDOUT
            ? std::string("upstream idle timeout")
            : std::string(curl_easy_strerror(res));
    return response;
}

} // namespace fanrelay
