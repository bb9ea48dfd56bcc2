#include "session.hpp"
#include "util.hpp"

namespace fanrelay {

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Idle:     return "idle";
        case SessionState::Active:   return "active";
        case SessionState::Draining: return "draining";
        case SessionState::Evicted:  return "evicted";
    }
    return "unknown";
}

Session::Session(std::string session_id, std::string url)
    : id(std::move(session_id))
    , created_at(epoch_seconds())
    , source_url(std::move(url))
{}

void Session::cancel_eviction_locked() {
    eviction_timer.cancel();
    eviction_timer = TimerHandle();
    ++eviction_epoch;
}

SessionSummary summarize(const Session& session) {
    SessionSummary s;
    std::lock_guard<std::mutex> lock(session.mutex);
    s.id = session.id;
    s.source_url = session.source_url;
    s.subscriber_count = session.subscribers.count();
    s.state = session.state;
    s.created_at = session.created_at;
    s.relay_starts = session.relay_starts;
    s.chunks_relayed = session.chunks_relayed.load();
    s.bytes_relayed = session.bytes_relayed.load();
    return s;
}

} // namespace fanrelay
