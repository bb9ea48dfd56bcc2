// Linux HTTP/HTTPS upstream client using POSIX sockets + OpenSSL.
// Implements the same public API as http.cpp (libcurl) with identical
// interface behaviour: http_init/cleanup are no-ops (OpenSSL 1.1+ auto-inits).
#ifdef __linux__

#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <cerrno>
#include <string>
#include <stdexcept>

// MSG_NOSIGNAL prevents SIGPIPE when the upstream resets the connection.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace fanrelay {

static const std::atomic<bool>* g_socket_abort_flag = nullptr;

void http_init() {}
void http_cleanup() {}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_socket_abort_flag = flag;
}

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result{};
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::runtime_error("invalid URL: " + url);

    std::string scheme = url.substr(0, scheme_end);
    for (auto& c : scheme) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    if (scheme != "http" && scheme != "https")
        throw std::runtime_error("unsupported scheme: " + scheme);
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find_first_of("/?", host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    if (path_start == std::string::npos) {
        result.path = "/";
    } else if (url[path_start] == '?') {
        result.path = "/" + url.substr(path_start);
    } else {
        result.path = url.substr(path_start);
    }
    auto frag = result.path.find('#');
    if (frag != std::string::npos) result.path.erase(frag);

    size_t colon = host_port.rfind(':');
    if (colon != std::string::npos && host_port.find(']') == std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    if (result.host.empty())
        throw std::runtime_error("missing host in URL: " + url);
    return result;
}

// Resolve a Location header against the URL that produced it.
static std::string resolve_location(const ParsedUrl& base, const std::string& location) {
    if (location.find("://") != std::string::npos) return location;
    std::string origin = std::string(base.tls ? "https" : "http") + "://" + base.host;
    bool default_port = (base.tls && base.port == "443") || (!base.tls && base.port == "80");
    if (!default_port) origin += ":" + base.port;
    if (!location.empty() && location[0] == '/') return origin + location;
    auto slash = base.path.rfind('/');
    return origin + base.path.substr(0, slash + 1) + location;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

enum class ReadStatus { Data, Eof, Error, IdleTimeout, Aborted };

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;

    const std::atomic<bool>* abort = nullptr;
    long idle_timeout_secs = 0;
    ReadStatus last_status = ReadStatus::Data;

    Connection() = default;
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool connect(const ParsedUrl& url, long timeout_secs, std::string& error) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int gai = getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res);
        if (gai != 0) {
            error = "cannot resolve " + url.host + ": " + gai_strerror(gai);
            return false;
        }

        bool connected = false;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;

            // Non-blocking connect so we can honour timeout_secs.
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                fcntl(fd, F_SETFL, flags);
                connected = true;
            } else if (errno == EINPROGRESS) {
                fd_set wset;
                FD_ZERO(&wset);
                FD_SET(fd, &wset);
                struct timeval tv{timeout_secs, 0};
                rc = select(fd + 1, nullptr, &wset, nullptr, &tv);
                if (rc > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                    if (err == 0) {
                        fcntl(fd, F_SETFL, flags);
                        connected = true;
                    }
                }
            }
            if (!connected) { ::close(fd); fd = -1; }
        }
        freeaddrinfo(res);
        if (!connected) {
            error = "cannot connect to " + url.host + ":" + url.port;
            return false;
        }

        // Use full timeout for TLS handshake, then switch to 1-second slices
        // so abort-flag checks work during body streaming.
        if (url.tls) {
            set_socket_timeout(timeout_secs);

            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) { error = "SSL_CTX_new failed"; return false; }
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) { error = "SSL_new failed"; return false; }
            SSL_set_fd(ssl, fd);
            SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI

            if (SSL_connect(ssl) != 1) {
                char buf[256];
                ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
                error = std::string("TLS handshake failed: ") + buf;
                return false;
            }
        }

        // 1-second slice timeout for body I/O (enables abort-flag polling).
        set_socket_timeout(1);
        return true;
    }

    bool aborted() const {
        if (abort && abort->load(std::memory_order_relaxed)) return true;
        return g_socket_abort_flag &&
               g_socket_abort_flag->load(std::memory_order_relaxed);
    }

    // Read some bytes; returns >0 on data, 0 on EOF, -1 on error, abort or
    // idle timeout (last_status tells which). Each EAGAIN is one 1-second
    // slice of silence.
    ssize_t read_some(char* buf, size_t len) {
        long idle_slices = 0;
        while (true) {
            if (aborted()) { last_status = ReadStatus::Aborted; return -1; }

            ssize_t n;
            bool slice_expired = false;
            if (ssl) {
                n = SSL_read(ssl, buf, static_cast<int>(len));
                if (n > 0) { last_status = ReadStatus::Data; return n; }
                int err = SSL_get_error(ssl, static_cast<int>(n));
                if (err == SSL_ERROR_ZERO_RETURN) { last_status = ReadStatus::Eof; return 0; }
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE ||
                    (err == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK))) {
                    slice_expired = true;
                } else if (err == SSL_ERROR_SYSCALL && n == 0) {
                    last_status = ReadStatus::Eof; // peer closed without close_notify
                    return 0;
                } else {
                    last_status = ReadStatus::Error;
                    return -1;
                }
            } else {
                n = ::recv(fd, buf, len, 0);
                if (n > 0) { last_status = ReadStatus::Data; return n; }
                if (n == 0) { last_status = ReadStatus::Eof; return 0; }
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                    slice_expired = true;
                } else {
                    last_status = ReadStatus::Error;
                    return -1;
                }
            }

            if (slice_expired && idle_timeout_secs > 0 && ++idle_slices >= idle_timeout_secs) {
                last_status = ReadStatus::IdleTimeout;
                return -1;
            }
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            if (aborted()) return false;
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    return false;
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

    std::string describe_failure() const {
        switch (last_status) {
            case ReadStatus::IdleTimeout: return "upstream idle timeout";
            case ReadStatus::Aborted:     return "";
            case ReadStatus::Error:       return std::string("upstream read error: ") + std::strerror(errno);
            default:                      return "";
        }
    }

private:
    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
};

// ── Request building ───────────────────────────────────────────

static std::string build_request(const ParsedUrl& url,
                                  const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512);
    req += "GET " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";

    bool has_user_agent = false;
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
        if (h.first == "User-Agent") has_user_agent = true;
    }
    if (!has_user_agent) req += "User-Agent: fanrelay\r\n";
    req += "Accept: */*\r\n";
    req += "Connection: close\r\n\r\n";
    return req;
}

// ── Response parsing ───────────────────────────────────────────

struct ResponseHead {
    long status = 0;
    bool is_chunked = false;
    bool has_length = false;
    size_t content_length = 0;
    std::string location;
};

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
// Returns false if the connection ended before a full line arrived.
static bool read_line(Connection& conn, std::string& leftover, std::string& line) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        if (leftover.size() > 65536) return false;
        char buf[4096];
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        leftover.append(buf, static_cast<size_t>(n));
    }
}

static bool parse_response_head(Connection& conn, std::string& leftover, ResponseHead& head) {
    std::string status_line;
    if (!read_line(conn, leftover, status_line)) return false;

    // "HTTP/1.1 200 OK": extract the three-digit code
    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string::npos || status_line.rfind("HTTP/", 0) != 0) return false;
    try { head.status = std::stol(status_line.substr(sp1 + 1, 3)); }
    catch (const std::exception&) { return false; }

    while (true) {
        std::string line;
        if (!read_line(conn, leftover, line)) return false;
        if (line.empty()) break; // blank line → end of headers

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name  = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
            value.erase(0, 1);
        for (auto& c : name) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));

        if (name == "transfer-encoding") {
            std::string lower = value;
            for (auto& c : lower) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
            head.is_chunked = (lower.find("chunked") != std::string::npos);
        } else if (name == "content-length") {
            try {
                head.content_length = std::stoul(value);
                head.has_length = true;
            } catch (const std::exception&) {}
        } else if (name == "location") {
            head.location = value;
        }
    }
    return head.status > 0;
}

enum class BodyEnd { Complete, CallbackStopped, Failed };

// Deliver min(n, available) bytes from leftover or the socket to callback.
static BodyEnd pump(Connection& conn, std::string& leftover, size_t& remaining,
                    bool bounded, RawChunkCallback& callback) {
    if (!leftover.empty()) {
        size_t take = bounded ? std::min(remaining, leftover.size()) : leftover.size();
        if (!callback(leftover.data(), take)) return BodyEnd::CallbackStopped;
        leftover.erase(0, take);
        if (bounded) remaining -= take;
        return BodyEnd::Complete;
    }
    char buf[4096];
    size_t want = bounded ? std::min(remaining, sizeof(buf)) : sizeof(buf);
    ssize_t n = conn.read_some(buf, want);
    if (n == 0) return BodyEnd::Complete;
    if (n < 0) return BodyEnd::Failed;
    if (!callback(buf, static_cast<size_t>(n))) return BodyEnd::CallbackStopped;
    if (bounded) remaining -= static_cast<size_t>(n);
    return BodyEnd::Complete;
}

// Stream body to a RawChunkCallback; dechunks if needed.
static BodyEnd stream_body_raw(Connection& conn, std::string& leftover,
                               const ResponseHead& head, RawChunkCallback& callback) {
    if (head.is_chunked) {
        for (;;) {
            std::string size_line;
            if (!read_line(conn, leftover, size_line))
                return conn.last_status == ReadStatus::Eof ? BodyEnd::Complete : BodyEnd::Failed;
            // Chunk size is hex, may have extensions after ';'
            size_t chunk_size = std::strtoul(size_line.c_str(), nullptr, 16);
            if (chunk_size == 0) return BodyEnd::Complete;

            size_t remaining = chunk_size;
            while (remaining > 0) {
                size_t before = remaining;
                BodyEnd r = pump(conn, leftover, remaining, true, callback);
                if (r != BodyEnd::Complete) return r;
                if (remaining == before && leftover.empty()) return BodyEnd::Complete; // EOF mid-chunk
            }
            std::string crlf;
            if (!read_line(conn, leftover, crlf)) return BodyEnd::Complete;
        }
    }

    if (head.has_length) {
        size_t remaining = head.content_length;
        while (remaining > 0) {
            size_t before = remaining;
            BodyEnd r = pump(conn, leftover, remaining, true, callback);
            if (r != BodyEnd::Complete) return r;
            if (remaining == before && leftover.empty()) break; // EOF
        }
        return BodyEnd::Complete;
    }

    // Live streams usually have neither length nor chunking: read to close.
    size_t unused = 0;
    for (;;) {
        bool had_leftover = !leftover.empty();
        BodyEnd r = pump(conn, leftover, unused, false, callback);
        if (r != BodyEnd::Complete) return r;
        if (!had_leftover && conn.last_status == ReadStatus::Eof) return BodyEnd::Complete;
    }
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::stream_get_raw(const std::string& url,
                                               const std::vector<Header>& headers,
                                               RawChunkCallback callback,
                                               const StreamOptions& options) {
    return http_stream_get_raw(url, headers, std::move(callback), options);
}

HttpResponse http_stream_get_raw(const std::string& url,
                                 const std::vector<Header>& headers,
                                 RawChunkCallback callback,
                                 const StreamOptions& options) {
    HttpResponse resp;
    std::string current = url;

    for (int hop = 0; hop <= options.max_redirects; ++hop) {
        ParsedUrl parsed;
        try {
            parsed = parse_url(current);
        } catch (const std::exception& e) {
            resp.error = e.what();
            return resp;
        }

        Connection conn;
        conn.abort = options.abort;
        conn.idle_timeout_secs = options.idle_timeout_seconds;
        if (!conn.connect(parsed, options.connect_timeout_seconds, resp.error))
            return resp;

        std::string request = build_request(parsed, headers);
        if (!conn.write_all(request.c_str(), request.size())) {
            resp.error = "failed to send request";
            return resp;
        }

        std::string leftover;
        ResponseHead head;
        if (!parse_response_head(conn, leftover, head)) {
            resp.error = conn.last_status == ReadStatus::IdleTimeout
                ? "upstream idle timeout" : "malformed or missing response";
            return resp;
        }

        if (head.status >= 300 && head.status < 400 && !head.location.empty()) {
            current = resolve_location(parsed, head.location);
            continue;
        }

        resp.status_code = head.status;
        if (!resp.ok()) {
            resp.error = "upstream returned HTTP " + std::to_string(head.status);
            return resp;
        }

        if (stream_body_raw(conn, leftover, head, callback) == BodyEnd::Failed)
            resp.error = conn.describe_failure();
        return resp;
    }

    resp.error = "too many redirects";
    return resp;
}

} // namespace fanrelay

#endif // __linux__
