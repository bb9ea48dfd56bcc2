#include "server/websocket.hpp"

#include <boost/asio/post.hpp>

#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace fanrelay {

namespace http = beast::http;
using tcp = net::ip::tcp;

namespace {

constexpr size_t kMaxCloseReason = 123;  // 125-byte control payload minus the code
constexpr size_t kMaxClientMessage = 1 << 20;
constexpr auto kCloseHandshakeTimeout = std::chrono::seconds(5);

} // namespace

UpgradeRequest make_upgrade_request(const ServerRequest& req) {
    UpgradeRequest out;
    out.method_string(req.method);
    out.target(req.target);
    out.version(11);
    for (const auto& [name, value] : req.headers) {
        out.set(name, value);
    }
    return out;
}

WebSocketConnection::WebSocketConnection(int fd, uint32_t send_timeout_seconds)
    : ws_(ioc_)
    , send_timeout_(send_timeout_seconds)
{
    // The server closes fd once the upgrade returns; the stream owns a duplicate.
    int own = ::dup(fd);
    if (own < 0) {
        throw std::runtime_error(std::string("Cannot duplicate socket: ") + std::strerror(errno));
    }
    beast::error_code ec;
    ws_.next_layer().assign(tcp::v4(), own, ec);
    if (ec) {
        ::close(own);
        throw std::runtime_error("Cannot adopt socket: " + ec.message());
    }

    ws_.set_option(websocket::stream_base::timeout{
        kCloseHandshakeTimeout,
        websocket::stream_base::none(),
        false,
    });
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, "fanrelay");
    }));
    ws_.read_message_max(kMaxClientMessage);
    ws_.binary(true);
}

bool WebSocketConnection::accept(const UpgradeRequest& req, std::string& error) {
    beast::error_code ec;
    ws_.accept(req, ec);
    if (ec) {
        error = ec.message();
        return false;
    }
    open_.store(true);
    return true;
}

bool WebSocketConnection::post(std::function<void()> fn) {
    std::lock_guard<std::mutex> lock(post_mutex_);
    if (!accepting_posts_) return false;
    net::post(ioc_, std::move(fn));
    return true;
}

bool WebSocketConnection::send_binary(const std::string& chunk) {
    if (!open_.load()) return false;

    auto done = std::make_shared<std::promise<bool>>();
    auto result = done->get_future();
    if (!post([this, chunk, done]() { queue_write(chunk, done); })) {
        open_.store(false);
        return false;
    }

    try {
        if (send_timeout_.count() > 0 &&
            result.wait_for(send_timeout_) != std::future_status::ready) {
            // The peer stopped reading. Tear the socket down so run() ends;
            // if run() has already returned there is nothing left to abort.
            open_.store(false);
            post([this]() { abort_socket(); });
            return false;
        }
        return result.get();
    } catch (const std::future_error&) {
        // The io_context went away with the write still queued.
        return false;
    }
}

void WebSocketConnection::close(uint16_t code, const std::string& reason) {
    if (!open_.exchange(false)) return;
    close_code_.store(code);

    websocket::close_reason cr(
        static_cast<websocket::close_code>(code),
        beast::string_view(reason.data(), std::min(reason.size(), kMaxCloseReason)));
    post([this, cr]() {
        close_requested_ = true;
        close_reason_ = cr;
        // Queued writes go out first; write_next() closes once they drain.
        if (!writing_) start_close();
    });
}

void WebSocketConnection::run() {
    do_read();
    ioc_.run();

    {
        std::lock_guard<std::mutex> lock(post_mutex_);
        accepting_posts_ = false;
    }
    open_.store(false);
    finished_ = true;

    // Settle anything posted while the loop was winding down.
    ioc_.restart();
    ioc_.poll();
    fail_pending();
}

void WebSocketConnection::mark_closed() {
    open_.store(false);
    beast::error_code ec;
    ws_.next_layer().close(ec);
    if (ec) {
        std::cerr << "[websocket] Socket close failed: " << ec.message() << "\n";
    }
}

// ── io thread ───────────────────────────────────────────────────

void WebSocketConnection::do_read() {
    ws_.async_read(read_buffer_, [this](beast::error_code ec, std::size_t) {
        if (ec) {
            on_read_error(ec);
            return;
        }
        // Client messages carry nothing the relay uses.
        read_buffer_.consume(read_buffer_.size());
        do_read();
    });
}

void WebSocketConnection::on_read_error(const beast::error_code& ec) {
    if (ec == websocket::error::closed) {
        // Beast has already echoed the peer's close frame.
        uint16_t none = 0;
        close_code_.compare_exchange_strong(none, ws_.reason().code);
    } else {
        abort_socket();
    }
    open_.store(false);
    finished_ = true;
    fail_pending();
}

void WebSocketConnection::queue_write(std::string payload,
                                      std::shared_ptr<std::promise<bool>> done) {
    if (finished_ || close_requested_) {
        done->set_value(false);
        return;
    }
    queue_.push_back(PendingWrite{std::move(payload), std::move(done)});
    write_next();
}

void WebSocketConnection::write_next() {
    if (writing_) return;
    if (queue_.empty()) {
        if (close_requested_) start_close();
        return;
    }

    writing_ = true;
    ws_.async_write(net::buffer(queue_.front().payload),
                    [this](beast::error_code ec, std::size_t) {
        writing_ = false;
        auto done = queue_.front().done;
        queue_.pop_front();
        if (ec) {
            open_.store(false);
            done->set_value(false);
            finished_ = true;
            fail_pending();
            return;
        }
        done->set_value(true);
        write_next();
    });
}

void WebSocketConnection::start_close() {
    if (closing_ || finished_ || !ws_.is_open()) return;
    closing_ = true;
    // Completes once the peer answers or the handshake timeout fires; the
    // pending read then fails and run() returns.
    ws_.async_close(close_reason_, [](beast::error_code) {});
}

void WebSocketConnection::abort_socket() {
    // Best effort: the socket may already be gone.
    beast::error_code ec;
    ws_.next_layer().shutdown(tcp::socket::shutdown_both, ec);
    ws_.next_layer().cancel(ec);
}

void WebSocketConnection::fail_pending() {
    // An in-flight write settles its own promise from its handler.
    size_t keep = writing_ ? 1 : 0;
    while (queue_.size() > keep) {
        queue_.back().done->set_value(false);
        queue_.pop_back();
    }
}

} // namespace fanrelay
