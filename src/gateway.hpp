#pragma once
#include "lifecycle.hpp"
#include "server/http_server.hpp"
#include "server/websocket.hpp"
#include <cstdint>
#include <string>

namespace fanrelay {

// HTTP surface of the relay:
//
//   /create-relay?url=...&sessionId=...   create or resolve a session
//   /relay/{id}                           WebSocket subscriber
//   /stream/{id}                          metadata for an Active session
//   /status                               every session plus counters
//
// Every response carries permissive CORS headers; OPTIONS answers "ok".
class Gateway {
public:
    Gateway(LifecycleController& lifecycle, uint32_t client_send_timeout_seconds);

    ServerResponse handle(const ServerRequest& req);

    // Usable directly as an HttpServer::Handler.
    HttpServer::Handler handler() {
        return [this](const ServerRequest& req) { return handle(req); };
    }

private:
    ServerResponse handle_create(const ServerRequest& req);
    ServerResponse handle_relay(const ServerRequest& req, const std::string& id);
    ServerResponse handle_stream(const ServerRequest& req, const std::string& id);
    ServerResponse handle_status() const;

    // Runs on the connection thread: completes the handshake, joins the
    // session, and serves the subscriber until it goes away.
    void serve_subscriber(int fd, const std::string& id, const UpgradeRequest& upgrade);

    LifecycleController& lifecycle_;
    uint32_t send_timeout_seconds_;
};

// True if id can be embedded in a route path segment.
bool is_valid_session_id(const std::string& id);

} // namespace fanrelay
