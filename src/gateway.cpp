#include "gateway.hpp"
#include "server/websocket.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace fanrelay {

using json = nlohmann::json;

namespace {

constexpr size_t kMaxSessionIdLength = 128;

void add_cors(ServerResponse& resp) {
    resp.headers.emplace_back("Access-Control-Allow-Origin", "*");
    resp.headers.emplace_back("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    resp.headers.emplace_back("Access-Control-Allow-Headers", "Content-Type, Authorization");
}

ServerResponse text_response(int status, const std::string& body) {
    ServerResponse resp;
    resp.status = status;
    resp.body = body;
    return resp;
}

ServerResponse json_response(int status, const json& body) {
    ServerResponse resp;
    resp.status = status;
    resp.content_type = "application/json";
    resp.body = body.dump();
    return resp;
}

// "/relay/abc/extra" with prefix "/relay/" -> "abc"
std::string path_segment_after(const std::string& path, const std::string& prefix) {
    std::string rest = path.substr(prefix.size());
    auto slash = rest.find('/');
    return slash == std::string::npos ? rest : rest.substr(0, slash);
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

bool is_valid_session_id(const std::string& id) {
    if (id.empty() || id.size() > kMaxSessionIdLength) return false;
    for (char c : id) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u <= 0x20 || u >= 0x7F) return false;
        if (c == '/' || c == '?' || c == '#' || c == '%') return false;
    }
    return true;
}

Gateway::Gateway(LifecycleController& lifecycle, uint32_t client_send_timeout_seconds)
    : lifecycle_(lifecycle)
    , send_timeout_seconds_(client_send_timeout_seconds)
{}

ServerResponse Gateway::handle(const ServerRequest& req) {
    ServerResponse resp;
    if (req.method == "OPTIONS") {
        resp = text_response(200, "ok");
    } else if (req.path == "/create-relay") {
        resp = handle_create(req);
    } else if (starts_with(req.path, "/relay/")) {
        resp = handle_relay(req, path_segment_after(req.path, "/relay/"));
    } else if (starts_with(req.path, "/stream/")) {
        resp = handle_stream(req, path_segment_after(req.path, "/stream/"));
    } else if (req.path == "/status") {
        resp = handle_status();
    } else {
        resp = text_response(404, "Route not found");
    }
    add_cors(resp);
    return resp;
}

ServerResponse Gateway::handle_create(const ServerRequest& req) {
    std::string url = req.query_param("url");
    if (url.empty()) {
        return json_response(400, {{"error", "Stream URL is required"}});
    }
    if (!is_http_url(url)) {
        return json_response(400, {{"error", "Stream URL must be an http or https URL"}});
    }

    std::string id = req.query_param("sessionId");
    if (id.empty()) {
        id = generate_uuid();
    } else if (!is_valid_session_id(id)) {
        return json_response(400, {{"error", "Invalid sessionId"}});
    }

    auto session = lifecycle_.create_session(id, url);
    if (!session) {
        return json_response(503, {{"error", "Session could not be created"}});
    }

    json body = {
        {"sessionId", session->id},
        {"relayUrl", "/relay/" + session->id},
        {"httpUrl", "/stream/" + session->id},
        {"clientCount", session->subscribers.count()},
    };
    return json_response(200, body);
}

ServerResponse Gateway::handle_relay(const ServerRequest& req, const std::string& id) {
    if (to_lower(req.header("upgrade")) != "websocket") {
        return text_response(400, "WebSocket connection required");
    }
    if (req.header("sec-websocket-key").empty()) {
        return text_response(400, "Missing Sec-WebSocket-Key");
    }

    ServerResponse resp;
    resp.status = 101;
    resp.upgrade = [this, id, upgrade = make_upgrade_request(req)](int fd) {
        serve_subscriber(fd, id, upgrade);
    };
    return resp;
}

void Gateway::serve_subscriber(int fd, const std::string& id, const UpgradeRequest& upgrade) {
    std::shared_ptr<WebSocketConnection> conn;
    try {
        conn = std::make_shared<WebSocketConnection>(fd, send_timeout_seconds_);
    } catch (const std::exception& e) {
        std::cerr << "[gateway] Subscriber for " << id << " dropped: " << e.what() << "\n";
        return;
    }

    std::string error;
    if (!conn->accept(upgrade, error)) {
        std::cerr << "[gateway] WebSocket handshake for " << id << " failed: " << error << "\n";
        return;
    }

    auto session = lifecycle_.find_session(id);
    JoinStatus status = session ? lifecycle_.join(session, conn) : JoinStatus::NotFound;

    switch (status) {
        case JoinStatus::Joined:
            break;
        case JoinStatus::NotFound:
        case JoinStatus::Evicted:
            std::cerr << "[gateway] Rejecting subscriber for unknown session " << id << "\n";
            conn->close(close_codes::PolicyViolation, "Session not found");
            break;
        case JoinStatus::ShuttingDown:
            conn->close(close_codes::GoingAway, "Server shutting down");
            break;
    }

    conn->run();
    conn->mark_closed();
    if (status == JoinStatus::Joined) lifecycle_.leave(session, conn);
}

ServerResponse Gateway::handle_stream(const ServerRequest& req, const std::string& id) {
    auto session = lifecycle_.find_session(id);
    if (!session) return text_response(404, "Stream not available");

    SessionSummary summary = summarize(*session);
    if (!summary.is_active()) return text_response(404, "Stream not available");

    std::string stream_url = req.target + "/m3u8";
    std::string host = req.header("host");
    if (!host.empty()) stream_url = "http://" + host + stream_url;

    json body = {
        {"sessionId", summary.id},
        {"sourceUrl", summary.source_url},
        {"clientCount", summary.subscriber_count},
        {"isActive", summary.is_active()},
        {"httpStreamUrl", stream_url},
    };
    return json_response(200, body);
}

ServerResponse Gateway::handle_status() const {
    auto sessions = lifecycle_.list_sessions();
    json list = json::array();
    for (const auto& s : sessions) {
        list.push_back({
            {"id", s.id},
            {"sourceUrl", s.source_url},
            {"clientCount", s.subscriber_count},
            {"isActive", s.is_active()},
            {"state", session_state_name(s.state)},
            {"createdAt", s.created_at},
            {"relayStarts", s.relay_starts},
            {"chunksRelayed", s.chunks_relayed},
            {"bytesRelayed", s.bytes_relayed},
        });
    }
    json body = {
        {"activeSessions", list},
        {"totalSessions", sessions.size()},
        {"runningRelays", lifecycle_.running_engines()},
    };
    return json_response(200, body);
}

} // namespace fanrelay
