#include <catch2/catch.hpp>
#include "server/http_server.hpp"
#include "socket_helpers.hpp"
#include "test_helpers.hpp"
#include <stdexcept>

using namespace fanrelay;
using namespace fanrelay::testing;

// ── parse_request_head ──────────────────────────────────────────

TEST_CASE("parse_request_head: request line, query and headers", "[server]") {
    std::string buf = "GET /create-relay?url=http%3A%2F%2Fup%2Flive&sessionId=a+b HTTP/1.1\r\n"
                      "Host: relay.local:8080\r\n"
                      "Sec-WebSocket-Key:  abc== \r\n"
                      "\r\n"
                      "body";
    ServerRequest req;
    size_t head_end = 0;

    REQUIRE(parse_request_head(buf, 8192, req, head_end) == HeadParse::Complete);
    REQUIRE(req.method == "GET");
    REQUIRE(req.path == "/create-relay");
    REQUIRE(req.target == "/create-relay?url=http%3A%2F%2Fup%2Flive&sessionId=a+b");
    REQUIRE(req.query_param("url") == "http://up/live");
    REQUIRE(req.query_param("sessionId") == "a b");
    REQUIRE(req.query_param("missing") == "");
    REQUIRE(req.header("Host") == "relay.local:8080");
    REQUIRE(req.header("sec-websocket-key") == "abc==");
    REQUIRE(buf.substr(head_end) == "body");
}

TEST_CASE("parse_request_head: incomplete, oversized, malformed", "[server]") {
    ServerRequest req;
    size_t head_end = 0;

    REQUIRE(parse_request_head("GET / HTTP/1.1\r\nHost: x\r\n", 8192, req, head_end) ==
            HeadParse::Incomplete);
    REQUIRE(parse_request_head(std::string(600, 'a'), 512, req, head_end) == HeadParse::TooLarge);
    REQUIRE(parse_request_head("GET / HTTP/1.1\r\nX: " + std::string(600, 'a') + "\r\n\r\n", 512,
                               req, head_end) == HeadParse::TooLarge);

    ServerRequest bad;
    REQUIRE(parse_request_head("NONSENSE\r\n\r\n", 8192, bad, head_end) == HeadParse::Malformed);
    ServerRequest bad_version;
    REQUIRE(parse_request_head("GET / FTP/1.0\r\n\r\n", 8192, bad_version, head_end) ==
            HeadParse::Malformed);
}

TEST_CASE("status_reason: known codes", "[server]") {
    REQUIRE(std::string(status_reason(101)) == "Switching Protocols");
    REQUIRE(std::string(status_reason(404)) == "Not Found");
    REQUIRE(std::string(status_reason(413)) == "Payload Too Large");
    REQUIRE(std::string(status_reason(503)) == "Service Unavailable");
}

// ── parse_listen_addr ───────────────────────────────────────────

TEST_CASE("parse_listen_addr: valid and invalid forms", "[server]") {
    std::string host;
    uint16_t port = 1;

    REQUIRE(parse_listen_addr("0.0.0.0:8080", host, port));
    REQUIRE(host == "0.0.0.0");
    REQUIRE(port == 8080);

    REQUIRE(parse_listen_addr("localhost:0", host, port));
    REQUIRE(host == "127.0.0.1");
    REQUIRE(port == 0);

    REQUIRE_FALSE(parse_listen_addr("8080", host, port));
    REQUIRE_FALSE(parse_listen_addr(":8080", host, port));
    REQUIRE_FALSE(parse_listen_addr("host:", host, port));
    REQUIRE_FALSE(parse_listen_addr("host:80a", host, port));
    REQUIRE_FALSE(parse_listen_addr("host:70000", host, port));
}

// ── Live server ─────────────────────────────────────────────────

namespace {

std::string roundtrip(uint16_t port, const std::string& request) {
    int fd = connect_local(port);
    if (fd < 0) return "";
    send_all(fd, request);
    std::string out = read_all(fd);
    ::close(fd);
    return out;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

TEST_CASE("HttpServer: serves a request on an ephemeral port", "[server]") {
    HttpServer server("127.0.0.1:0", 8192, 1024, [](const ServerRequest& req) {
        ServerResponse resp;
        resp.body = req.method + " " + req.path + " " + req.query_param("name") + " " + req.body;
        resp.headers.emplace_back("X-Test", "1");
        return resp;
    });
    std::string error;
    REQUIRE(server.start(error));
    REQUIRE(server.port() != 0);

    std::string resp = roundtrip(server.port(),
                                 "POST /hello?name=a%20b HTTP/1.1\r\n"
                                 "Host: x\r\nContent-Length: 4\r\n\r\nping");
    REQUIRE(starts_with(resp, "HTTP/1.1 200 OK\r\n"));
    REQUIRE(resp.find("X-Test: 1\r\n") != std::string::npos);
    REQUIRE(resp.find("Content-Length: 20\r\n") != std::string::npos);
    REQUIRE(resp.find("\r\n\r\nPOST /hello a b ping") != std::string::npos);

    server.stop();
}

TEST_CASE("HttpServer: rejects oversized heads and bodies", "[server]") {
    HttpServer server("127.0.0.1:0", 256, 16, [](const ServerRequest&) {
        return ServerResponse{};
    });
    std::string error;
    REQUIRE(server.start(error));

    std::string big_head = "GET / HTTP/1.1\r\nX-Pad: " + std::string(600, 'a') + "\r\n\r\n";
    REQUIRE(starts_with(roundtrip(server.port(), big_head), "HTTP/1.1 413"));

    std::string big_body = "POST / HTTP/1.1\r\nContent-Length: 100\r\n\r\n";
    REQUIRE(starts_with(roundtrip(server.port(), big_body), "HTTP/1.1 413"));

    REQUIRE(starts_with(roundtrip(server.port(), "garbage\r\n\r\n"), "HTTP/1.1 400"));
}

TEST_CASE("HttpServer: handler exception becomes 500", "[server]") {
    HttpServer server("127.0.0.1:0", 8192, 1024, [](const ServerRequest&) -> ServerResponse {
        throw std::runtime_error("boom");
    });
    std::string error;
    REQUIRE(server.start(error));
    REQUIRE(starts_with(roundtrip(server.port(), "GET / HTTP/1.1\r\n\r\n"),
                        "HTTP/1.1 500 Internal Server Error"));
}

TEST_CASE("HttpServer: upgrade hands the socket to the handler", "[server]") {
    HttpServer server("127.0.0.1:0", 8192, 1024, [](const ServerRequest&) {
        ServerResponse resp;
        resp.status = 101;
        resp.headers.emplace_back("X-Ignored", "1");
        resp.upgrade = [](int fd) {
            // The server wrote nothing; the upgraded protocol answers itself.
            send_all(fd, "HTTP/1.1 101 Switching Protocols\r\nUpgrade: test\r\n\r\nhello");
            // Hold the connection until the peer or stop() ends it.
            char c;
            while (::recv(fd, &c, 1, 0) > 0) {}
        };
        return resp;
    });
    std::string error;
    REQUIRE(server.start(error));

    int fd = connect_local(server.port());
    REQUIRE(fd >= 0);
    REQUIRE(send_all(fd, "GET /up HTTP/1.1\r\n\r\n"));

    std::string head = read_head(fd);
    REQUIRE(starts_with(head, "HTTP/1.1 101 Switching Protocols\r\n"));
    REQUIRE(head.find("Upgrade: test\r\n") != std::string::npos);
    REQUIRE(head.find("X-Ignored") == std::string::npos);

    std::string greeting;
    REQUIRE(read_exact(fd, greeting, 5));
    REQUIRE(greeting == "hello");
    REQUIRE(wait_until([&]() { return server.active_connections() == 1; }));

    // stop() must unblock the upgraded connection and wait for it.
    server.stop();
    REQUIRE(server.active_connections() == 0);
    ::close(fd);
}

TEST_CASE("HttpServer: invalid listen address fails to start", "[server]") {
    HttpServer server("nope", 8192, 1024, [](const ServerRequest&) { return ServerResponse{}; });
    std::string error;
    REQUIRE_FALSE(server.start(error));
    REQUIRE(error.find("Invalid listen address") != std::string::npos);
}
