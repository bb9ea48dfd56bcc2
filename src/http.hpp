#pragma once
#include <string>
#include <vector>
#include <functional>
#include <utility>
#include <atomic>

namespace fanrelay {

// Initialize HTTP subsystem (call once at startup).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl elsewhere.
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

// Set a global abort flag checked by all in-flight transfers (~1s granularity).
// When the flag becomes true, in-flight HTTP requests abort promptly.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

// status_code == 0 means no HTTP response was obtained (DNS, connect, TLS,
// malformed response); error then says why. A 2xx status with a non-empty
// error means the body ended abnormally (read error or idle timeout).
struct HttpResponse {
    long status_code = 0;
    std::string body;
    std::string error;

    bool ok() const { return status_code >= 200 && status_code < 300; }
};

// Raw-chunk streaming callback: receives raw bytes from the response.
// Return false to abort the stream.
using RawChunkCallback = std::function<bool(const char* data, size_t len)>;

struct StreamOptions {
    long connect_timeout_seconds = 10;
    long idle_timeout_seconds = 0;              // 0 = no limit between body bytes
    const std::atomic<bool>* abort = nullptr;   // per-request stop flag
    int max_redirects = 5;
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // GET url and deliver the body of a 2xx response to callback as it
    // arrives (dechunked). Non-2xx bodies are not delivered. Returns when the
    // body ends, the callback returns false, or the abort flag is raised.
    virtual HttpResponse stream_get_raw(const std::string& url,
                                        const std::vector<Header>& headers,
                                        RawChunkCallback callback,
                                        const StreamOptions& options) = 0;
};

// Platform-specific concrete implementations.
// Only one is compiled per build target (CMakeLists.txt gates the source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketHttpClient : public HttpClient {
public:
    HttpResponse stream_get_raw(const std::string& url,
                                const std::vector<Header>& headers,
                                RawChunkCallback callback,
                                const StreamOptions& options) override;
};
using PlatformHttpClient = SocketHttpClient;

#else

// Other platforms: libcurl
class CurlHttpClient : public HttpClient {
public:
    HttpResponse stream_get_raw(const std::string& url,
                                const std::vector<Header>& headers,
                                RawChunkCallback callback,
                                const StreamOptions& options) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

// HTTP GET with raw-chunk streaming of the response body
HttpResponse http_stream_get_raw(const std::string& url,
                                 const std::vector<Header>& headers,
                                 RawChunkCallback callback,
                                 const StreamOptions& options);

} // namespace fanrelay
