#pragma once
#include "server/http_server.hpp"
#include "sink.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>

namespace fanrelay {

namespace beast = boost::beast;
namespace net = boost::asio;
namespace websocket = beast::websocket;

using UpgradeRequest = beast::http::request<beast::http::empty_body>;

// Rebuild a parsed upgrade request so Beast can answer the handshake.
UpgradeRequest make_upgrade_request(const ServerRequest& req);

// A subscriber connected over an upgraded socket.
//
// The stream runs on a private io_context driven by run() on the connection
// thread. Relay threads call send_binary() and close(); both post into that
// io_context, so the stream itself is only touched by one thread.
class WebSocketConnection : public Sink {
public:
    // fd stays owned by the caller; the stream works on a duplicate.
    // send_timeout_seconds bounds each send_binary (0 = no bound).
    WebSocketConnection(int fd, uint32_t send_timeout_seconds);

    // Answer the client's handshake with 101. On failure Beast has already
    // written an error response and the connection must not be run.
    bool accept(const UpgradeRequest& req, std::string& error);

    bool send_binary(const std::string& chunk) override;
    void close(uint16_t code, const std::string& reason) override;
    bool is_open() const override { return open_.load(); }

    // Read client messages until the peer closes, the socket fails, or a
    // close() handshake finishes. Pings are answered; data is discarded.
    void run();

    // Release the socket. Call after run() has returned.
    void mark_closed();

    // Code of the close exchange: ours if we closed first, else the peer's.
    uint16_t close_code() const { return close_code_.load(); }

private:
    struct PendingWrite {
        std::string payload;
        std::shared_ptr<std::promise<bool>> done;
    };

    bool post(std::function<void()> fn);
    void do_read();
    void on_read_error(const beast::error_code& ec);
    void queue_write(std::string payload, std::shared_ptr<std::promise<bool>> done);
    void write_next();
    void start_close();
    void abort_socket();
    void fail_pending();

    net::io_context ioc_;
    websocket::stream<net::ip::tcp::socket> ws_;
    beast::flat_buffer read_buffer_;
    const std::chrono::seconds send_timeout_;

    // io thread only
    std::deque<PendingWrite> queue_;
    bool writing_ = false;
    bool close_requested_ = false;
    bool closing_ = false;
    bool finished_ = false;
    websocket::close_reason close_reason_;

    std::mutex post_mutex_;
    bool accepting_posts_ = true;

    std::atomic<bool> open_{false};
    std::atomic<uint16_t> close_code_{0};
};

} // namespace fanrelay
