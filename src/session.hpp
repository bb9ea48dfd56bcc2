#pragma once
#include "subscriber_set.hpp"
#include "timer_queue.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace fanrelay {

class RelayEngine; // forward declaration

enum class SessionState { Idle, Active, Draining, Evicted };

const char* session_state_name(SessionState state);

// The unit of sharing: one upstream source, many sinks.
//
// Every field below `mutex` is guarded by it. `subscribers` has its own lock
// and may be read without holding `mutex`; membership changes that drive
// state transitions happen with `mutex` held. Lock order: registry mutex,
// then session mutex, then the subscriber set's mutex.
struct Session {
    Session(std::string session_id, std::string url);

    const std::string id;
    const uint64_t created_at;
    SubscriberSet subscribers;

    std::atomic<uint64_t> chunks_relayed{0};
    std::atomic<uint64_t> bytes_relayed{0};

    mutable std::mutex mutex;
    std::string source_url;
    SessionState state = SessionState::Idle;
    std::shared_ptr<RelayEngine> relay;   // alive engine thread, if any
    bool restart_pending = false;         // start a fresh engine when `relay` exits
    TimerHandle eviction_timer;
    uint64_t eviction_epoch = 0;          // bumped whenever a timer is armed or cancelled
    uint64_t relay_starts = 0;

    // Cancel any armed eviction and invalidate timers already in flight.
    // Caller holds `mutex`.
    void cancel_eviction_locked();
};

struct SessionSummary {
    std::string id;
    std::string source_url;
    size_t subscriber_count = 0;
    SessionState state = SessionState::Idle;
    uint64_t created_at = 0;
    uint64_t relay_starts = 0;
    uint64_t chunks_relayed = 0;
    uint64_t bytes_relayed = 0;

    bool is_active() const { return state == SessionState::Active; }
};

// Consistent snapshot of one session; takes the session mutex.
SessionSummary summarize(const Session& session);

} // namespace fanrelay
