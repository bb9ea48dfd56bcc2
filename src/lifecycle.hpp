#pragma once
#include "http.hpp"
#include "relay_engine.hpp"
#include "session_registry.hpp"
#include "timer_queue.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fanrelay {

class EventBus;   // forward declaration
struct Config;    // forward declaration

struct LifecycleOptions {
    std::chrono::milliseconds eviction_delay{30000};
    std::chrono::milliseconds idle_session_timeout{0};  // 0 = disabled
    StreamOptions upstream;

    static LifecycleOptions from_config(const Config& config);
};

enum class JoinStatus {
    Joined,
    NotFound,      // no session under that id
    Evicted,       // session was evicted between lookup and join
    ShuttingDown,
};

// Drives the session state machine:
//
//   Idle --first join--> Active --last leave / upstream end--> Draining
//   Draining --join before timer--> Idle --> Active   (resurrection)
//   Draining --eviction timer, still empty--> Evicted (removed from registry)
//
// All transitions of one session happen under that session's mutex; there is
// no lock across sessions. Relay engines report back through on_relay_exit()
// on their own thread; eviction timers fire on the internal timer thread.
class LifecycleController {
public:
    using SessionPtr = std::shared_ptr<Session>;
    using SinkPtr = std::shared_ptr<Sink>;

    LifecycleController(SessionRegistry& registry, HttpClient& http, LifecycleOptions options);
    ~LifecycleController();

    LifecycleController(const LifecycleController&) = delete;
    LifecycleController& operator=(const LifecycleController&) = delete;

    // Optional event bus for lifecycle events
    void set_event_bus(EventBus* bus) { event_bus_ = bus; }

    // Create (or resolve) a session; see SessionRegistry::get_or_create.
    SessionPtr create_session(const std::string& id, const std::string& source_url,
                              Resolution* resolution = nullptr);

    SessionPtr find_session(const std::string& id) const;

    // Attach a sink. The first sink of an Idle or Draining session starts
    // the relay; a Draining session's eviction is cancelled.
    JoinStatus join(const SessionPtr& session, SinkPtr sink);
    JoinStatus join(const std::string& id, SinkPtr sink);

    // Detach a sink (no-op if already gone). Removing the last sink of an
    // Active session stops its relay and arms eviction.
    void leave(const SessionPtr& session, const SinkPtr& sink);

    std::vector<SessionSummary> list_sessions() const;

    // Stop all relays, close all sinks with 1001, clear the registry and
    // wait for engine threads to finish. Idempotent.
    void shutdown();

    // Relay threads that have not yet reported their exit.
    size_t running_engines() const;

    const LifecycleOptions& options() const { return options_; }

private:
    // Sinks that must be closed are appended to to_close; the caller closes
    // them once the session mutex is released.
    void start_relay_locked(const SessionPtr& session, std::vector<SinkPtr>& to_close);
    void on_relay_exit(const SessionPtr& session, uint64_t generation, const RelayResult& result);
    void finish_relay_locked(const SessionPtr& session, std::vector<SinkPtr>& to_close);
    void arm_eviction_locked(const SessionPtr& session, std::chrono::milliseconds delay);
    void on_eviction_timer(const std::weak_ptr<Session>& weak, uint64_t epoch, SessionState armed_state);
    void engine_finished();

    void publish_relay_started(const std::string& id, const std::string& url) const;

    SessionRegistry& registry_;
    HttpClient& http_;
    LifecycleOptions options_;
    EventBus* event_bus_ = nullptr;
    std::atomic<bool> shutting_down_{false};

    mutable std::mutex engines_mutex_;
    std::condition_variable engines_cv_;
    size_t live_engines_ = 0;

    // Declared last: destroyed (and its thread joined) first.
    TimerQueue timers_;
};

} // namespace fanrelay
