#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace fanrelay {

// A parsed inbound HTTP request.
struct ServerRequest {
    std::string method;   // "GET", "POST", "OPTIONS", ...
    std::string path;     // e.g. "/relay/abc", without the query string
    std::string target;   // raw request target, path plus query
    std::map<std::string, std::string> query_params;  // URL-decoded query parameters
    std::map<std::string, std::string> headers;        // header names lowercased
    std::string body;

    // Return a query parameter value, or "" if absent.
    std::string query_param(const std::string& key) const;

    // Return a header value (name is matched lowercased), or "" if absent.
    std::string header(const std::string& name) const;
};

struct ServerResponse {
    int         status       = 200;
    std::string content_type = "text/plain";
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;  // extra headers

    // Set on 101 responses: the server writes nothing and hands the
    // connection over. This runs on the connection thread, writes the
    // response head itself, and returns when the upgraded protocol is
    // finished. The server closes the fd afterwards.
    std::function<void(int fd)> upgrade;
};

enum class HeadParse { Incomplete, Complete, TooLarge, Malformed };

// Parse the request line and headers from buf. On Complete, `head_end` is the
// offset of the first body byte.
HeadParse parse_request_head(const std::string& buf, size_t max_header_bytes,
                             ServerRequest& req, size_t& head_end);

// Status line reason phrase for the codes the server emits.
const char* status_reason(int status);

// Threaded HTTP/1.1 server: one accept thread, one thread per connection.
// Every connection serves a single request (Connection: close) unless the
// handler upgrades it. stop() unblocks live connections and waits for them.
class HttpServer {
public:
    using Handler = std::function<ServerResponse(const ServerRequest&)>;

    // listen_addr:      "host:port"; port 0 binds an ephemeral port
    // max_header_bytes: request heads larger than this get 413
    // max_body:         request bodies larger than this get 413
    HttpServer(std::string listen_addr, uint32_t max_header_bytes, uint32_t max_body,
               Handler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Start background accept thread. Returns false and populates error on failure.
    bool start(std::string& error);

    // Stop accepting, shut down live connections, and join everything.
    void stop();

    // Bound port (valid after start()).
    uint16_t port() const { return bound_port_; }

    size_t active_connections() const;

private:
    void accept_loop();
    void serve_connection(int client_fd);
    void handle_connection(int client_fd);

    std::string listen_addr_;
    uint32_t    max_header_bytes_;
    uint32_t    max_body_;
    Handler     handler_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    uint16_t bound_port_   = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;

    mutable std::mutex conn_mutex_;
    std::condition_variable conn_cv_;
    std::set<int> live_fds_;
    size_t live_threads_ = 0;
};

// Parse "host:port" into host and port.  Returns false if the string is
// malformed or the port is out of range.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

} // namespace fanrelay
