#include "server/http_server.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace fanrelay {

// ── URL helpers ───────────────────────────────────────────────────────────────

static std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            char hex[3] = {s[i + 1], s[i + 2], '\0'};
            char* end;
            long val = std::strtol(hex, &end, 16);
            if (end == hex + 2) {
                out += static_cast<char>(val);
                i += 2;
                continue;
            }
        } else if (s[i] == '+') {
            out += ' ';
            continue;
        }
        out += s[i];
    }
    return out;
}

static std::map<std::string, std::string> parse_query_string(const std::string& qs) {
    std::map<std::string, std::string> result;
    for (const auto& pair : split(qs, '&')) {
        if (pair.empty()) continue;
        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            result[url_decode(pair)] = "";
        } else {
            result[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        }
    }
    return result;
}

std::string ServerRequest::query_param(const std::string& key) const {
    auto it = query_params.find(key);
    return it != query_params.end() ? it->second : "";
}

std::string ServerRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it != headers.end() ? it->second : "";
}

// ── Request head ─────────────────────────────────────────────────────────────

HeadParse parse_request_head(const std::string& buf, size_t max_header_bytes,
                             ServerRequest& req, size_t& head_end) {
    auto hdr_end = buf.find("\r\n\r\n");
    if (hdr_end == std::string::npos) {
        return buf.size() > max_header_bytes ? HeadParse::TooLarge : HeadParse::Incomplete;
    }
    if (hdr_end + 4 > max_header_bytes) return HeadParse::TooLarge;

    std::string headers_raw = buf.substr(0, hdr_end);
    auto rl_end = headers_raw.find("\r\n");
    if (rl_end == std::string::npos) rl_end = headers_raw.size();

    {
        std::istringstream ss(headers_raw.substr(0, rl_end));
        std::string ver;
        if (!(ss >> req.method >> req.target >> ver)) return HeadParse::Malformed;
        if (ver.compare(0, 5, "HTTP/") != 0) return HeadParse::Malformed;
        auto q = req.target.find('?');
        if (q != std::string::npos) {
            req.path         = req.target.substr(0, q);
            req.query_params = parse_query_string(req.target.substr(q + 1));
        } else {
            req.path = req.target;
        }
    }

    size_t pos = rl_end + 2;
    while (pos < headers_raw.size()) {
        auto ne = headers_raw.find("\r\n", pos);
        if (ne == std::string::npos) ne = headers_raw.size();
        std::string hline = headers_raw.substr(pos, ne - pos);
        pos = ne + 2;
        auto col = hline.find(':');
        if (col == std::string::npos) continue;
        req.headers[to_lower(trim(hline.substr(0, col)))] = trim(hline.substr(col + 1));
    }

    head_end = hdr_end + 4;
    return HeadParse::Complete;
}

const char* status_reason(int status) {
    switch (status) {
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "OK";
    }
}

// ── Address parsing ───────────────────────────────────────────────────────────

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port) {
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0) return false;
    host = addr.substr(0, pos);
    if (host.empty()) return false;
    if (host == "localhost") host = "127.0.0.1";
    std::string digits = addr.substr(pos + 1);
    if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        int p = std::stoi(digits);
        if (p < 0 || p > 65535) return false;
        port = static_cast<uint16_t>(p);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

// ── HttpServer ─────────────────────────────────────────────────────

HttpServer::HttpServer(std::string listen_addr,
                       uint32_t max_header_bytes,
                       uint32_t max_body,
                       Handler handler)
    : listen_addr_(std::move(listen_addr))
    , max_header_bytes_(max_header_bytes)
    , max_body_(max_body)
    , handler_(std::move(handler))
{}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start(std::string& error) {
    std::string host;
    uint16_t port;
    if (!parse_listen_addr(listen_addr_, host, port)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    if (::pipe(shutdown_pipe_) != 0) {
        error = "Failed to create shutdown pipe";
        return false;
    }

    auto fail = [this, &error](const std::string& msg) {
        error = msg;
        if (server_fd_ >= 0) { ::close(server_fd_); server_fd_ = -1; }
        ::close(shutdown_pipe_[0]); shutdown_pipe_[0] = -1;
        ::close(shutdown_pipe_[1]); shutdown_pipe_[1] = -1;
        return false;
    };

    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) return fail("Failed to create server socket");

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

#ifdef SO_NOSIGPIPE  // macOS
    ::setsockopt(server_fd_, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1) {
        return fail("Invalid bind address: " + host);
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        return fail(std::string("bind failed: ") + std::strerror(errno));
    }

    if (::listen(server_fd_, 64) != 0) {
        return fail(std::string("listen failed: ") + std::strerror(errno));
    }

    struct sockaddr_in bound{};
    socklen_t blen = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &blen) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = port;
    }

    running_.store(true);
    thread_ = std::thread([this]() { accept_loop(); });
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;
    char b = 0;
    if (shutdown_pipe_[1] >= 0) {
        ssize_t w = ::write(shutdown_pipe_[1], &b, 1);
        (void)w;  // poll timeout picks up running_ if the write fails
    }
    if (thread_.joinable()) thread_.join();
    if (server_fd_ >= 0)         { ::close(server_fd_);         server_fd_ = -1; }
    if (shutdown_pipe_[0] >= 0)  { ::close(shutdown_pipe_[0]);  shutdown_pipe_[0] = -1; }
    if (shutdown_pipe_[1] >= 0)  { ::close(shutdown_pipe_[1]);  shutdown_pipe_[1] = -1; }

    std::unique_lock<std::mutex> lock(conn_mutex_);
    for (int fd : live_fds_) ::shutdown(fd, SHUT_RDWR);
    conn_cv_.wait(lock, [this]() { return live_threads_ == 0; });
}

size_t HttpServer::active_connections() const {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    return live_threads_;
}

void HttpServer::accept_loop() {
    while (running_.load()) {
        struct pollfd fds[2];
        fds[0].fd = server_fd_;         fds[0].events = POLLIN;
        fds[1].fd = shutdown_pipe_[0];  fds[1].events = POLLIN;

        int ret = ::poll(fds, 2, 1000);
        if (ret <= 0) continue;              // timeout or transient error
        if (fds[1].revents & POLLIN) break;  // shutdown signal
        if (!(fds[0].revents & POLLIN)) continue;

        struct sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        int cfd = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&peer), &plen);
        if (cfd < 0) continue;

        struct timeval tv{10, 0};  // 10s recv timeout for the request head
        ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        {
            std::lock_guard<std::mutex> lock(conn_mutex_);
            live_fds_.insert(cfd);
            ++live_threads_;
        }
        try {
            std::thread([this, cfd]() { serve_connection(cfd); }).detach();
        } catch (const std::system_error& e) {
            std::cerr << "[server] Cannot spawn connection thread: " << e.what() << "\n";
            std::lock_guard<std::mutex> lock(conn_mutex_);
            live_fds_.erase(cfd);
            --live_threads_;
            ::close(cfd);
        }
    }
}

void HttpServer::serve_connection(int fd) {
    try {
        handle_connection(fd);
    } catch (const std::exception& e) {
        std::cerr << "[server] Connection error: " << e.what() << "\n";
    }

    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        live_fds_.erase(fd);
        ::close(fd);
        --live_threads_;
    }
    conn_cv_.notify_all();
}

// ── HTTP helpers ──────────────────────────────────────────────────────────────

static bool send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

static bool send_http_response(int fd, const ServerResponse& resp) {
    std::string out = "HTTP/1.1 " + std::to_string(resp.status) + " " +
                      status_reason(resp.status) + "\r\n";
    if (resp.status != 101) {
        out += "Content-Type: " + resp.content_type + "\r\n";
        out += "Content-Length: " + std::to_string(resp.body.size()) + "\r\n";
    }
    for (const auto& [name, value] : resp.headers) {
        out += name + ": " + value + "\r\n";
    }
    if (resp.status != 101) out += "Connection: close\r\n";
    out += "\r\n";
    if (resp.status != 101) out += resp.body;
    return send_all(fd, out);
}

static void send_plain(int fd, int status, const std::string& body) {
    ServerResponse resp;
    resp.status = status;
    resp.body = body;
    send_http_response(fd, resp);
}

void HttpServer::handle_connection(int fd) {
    std::string buf;
    buf.reserve(4096);
    char tmp[1024];

    ServerRequest req;
    size_t head_end = 0;
    while (true) {
        HeadParse res = parse_request_head(buf, max_header_bytes_, req, head_end);
        if (res == HeadParse::Complete) break;
        if (res == HeadParse::TooLarge) {
            send_plain(fd, 413, "Headers too large");
            return;
        }
        if (res == HeadParse::Malformed) {
            send_plain(fd, 400, "Malformed request");
            return;
        }
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return;
        buf.append(tmp, static_cast<size_t>(n));
    }

    size_t content_len = 0;
    std::string cl = req.header("content-length");
    if (!cl.empty()) {
        char* end = nullptr;
        unsigned long v = std::strtoul(cl.c_str(), &end, 10);
        if (end == cl.c_str() || *end != '\0') {
            send_plain(fd, 400, "Bad Content-Length");
            return;
        }
        content_len = static_cast<size_t>(v);
    }
    if (content_len > max_body_) {
        send_plain(fd, 413, "Payload too large");
        return;
    }

    req.body = buf.substr(head_end);
    while (req.body.size() < content_len) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return;
        req.body.append(tmp, static_cast<size_t>(n));
    }
    if (req.body.size() > content_len) req.body.resize(content_len);

    ServerResponse resp;
    try {
        resp = handler_(req);
    } catch (const std::exception& e) {
        std::cerr << "[server] Handler failed for " << req.method << " " << req.path
                  << ": " << e.what() << "\n";
        send_plain(fd, 500, "Internal error");
        return;
    }

    if (resp.status == 101 && resp.upgrade) {
        // The upgraded protocol writes its own response head and does its
        // own timing.
        struct timeval tv{0, 0};
        ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        resp.upgrade(fd);
        return;
    }

    send_http_response(fd, resp);
}

} // namespace fanrelay
