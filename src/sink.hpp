#pragma once
#include <cstdint>
#include <string>

namespace fanrelay {

// WebSocket close codes used by the relay (RFC 6455 §7.4.1).
namespace close_codes {
    constexpr uint16_t Normal          = 1000;  // stream ended
    constexpr uint16_t GoingAway       = 1001;  // server shutting down
    constexpr uint16_t PolicyViolation = 1008;  // unknown session
} // namespace close_codes

// One subscriber's output channel. Implementations must be safe to call from
// the relay thread while the owning connection thread reads from the peer.
class Sink {
public:
    virtual ~Sink() = default;

    // Deliver one chunk as a single binary message. Returns false if the
    // sink is closed or the send failed; the caller then drops the sink.
    virtual bool send_binary(const std::string& chunk) = 0;

    // Send a close directive. Idempotent.
    virtual void close(uint16_t code, const std::string& reason) = 0;

    virtual bool is_open() const = 0;
};

} // namespace fanrelay
