#pragma once
#include "sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fanrelay {

// Concurrency-safe collection of the sinks attached to one session.
//
// Membership changes are serialized by an internal mutex. broadcast() copies
// the member list under the mutex and sends outside it, so a slow sink never
// blocks add/remove; a sink removed mid-broadcast may still receive that one
// chunk. Sinks that fail are dropped after the pass.
class SubscriberSet {
public:
    using SinkPtr = std::shared_ptr<Sink>;

    // Returns the new cardinality. Adding a sink twice is a no-op.
    size_t add(SinkPtr sink);

    // Returns the new cardinality; removing an absent sink is a no-op.
    size_t remove(const SinkPtr& sink);

    // Send chunk to every current sink. Returns the number that accepted it.
    size_t broadcast(const std::string& chunk);

    // Remove every sink and hand them to the caller.
    std::vector<SinkPtr> detach_all();

    // Detach every sink, then send each a close directive.
    void close_all(uint16_t code, const std::string& reason);

    size_t count() const;
    bool empty() const { return count() == 0; }

    // Test hook.
    bool contains(const SinkPtr& sink) const;

private:
    mutable std::mutex mutex_;
    std::vector<SinkPtr> sinks_;
};

} // namespace fanrelay
