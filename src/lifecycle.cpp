#include "lifecycle.hpp"
#include "config.hpp"
#include "event.hpp"
#include "event_bus.hpp"

#include <iostream>
#include <system_error>

namespace fanrelay {

namespace {

void close_stream_ended(const std::vector<std::shared_ptr<Sink>>& sinks) {
    for (const auto& sink : sinks) sink->close(close_codes::Normal, "Stream ended");
}

} // namespace

LifecycleOptions LifecycleOptions::from_config(const Config& config) {
    LifecycleOptions opts;
    opts.eviction_delay = std::chrono::milliseconds(config.eviction_delay_ms);
    opts.idle_session_timeout = std::chrono::milliseconds(config.idle_session_timeout_ms);
    opts.upstream.connect_timeout_seconds = config.upstream.connect_timeout_seconds;
    opts.upstream.idle_timeout_seconds = config.upstream.idle_timeout_seconds;
    return opts;
}

LifecycleController::LifecycleController(SessionRegistry& registry,
                                         HttpClient& http,
                                         LifecycleOptions options)
    : registry_(registry)
    , http_(http)
    , options_(options)
{}

LifecycleController::~LifecycleController() {
    shutdown();
}

// ── Sessions ────────────────────────────────────────────────────

LifecycleController::SessionPtr LifecycleController::create_session(const std::string& id,
                                                                    const std::string& source_url,
                                                                    Resolution* resolution) {
    Resolution how = Resolution::Existing;
    SessionPtr session = registry_.get_or_create(id, source_url, &how);
    if (resolution) *resolution = how;
    if (!session) return nullptr;

    std::string url;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        url = session->source_url;
        if (session->state == SessionState::Idle) {
            // A resurrected session gets a fresh grace period; the first
            // join cancels it. Brand-new sessions are reaped only when the
            // idle timeout is set.
            if (how == Resolution::Resurrected) {
                arm_eviction_locked(session, options_.eviction_delay);
            } else if (how == Resolution::Created &&
                       options_.idle_session_timeout.count() > 0) {
                arm_eviction_locked(session, options_.idle_session_timeout);
            }
        }
    }

    if (event_bus_ && how == Resolution::Created) {
        SessionCreatedEvent ev;
        ev.session_id = id;
        ev.source_url = url;
        event_bus_->publish(ev);
    } else if (event_bus_ && how == Resolution::Resurrected) {
        SessionResurrectedEvent ev;
        ev.session_id = id;
        ev.source_url = url;
        event_bus_->publish(ev);
    }
    return session;
}

LifecycleController::SessionPtr LifecycleController::find_session(const std::string& id) const {
    return registry_.get(id);
}

std::vector<SessionSummary> LifecycleController::list_sessions() const {
    return registry_.list_all();
}

// ── Join / leave ────────────────────────────────────────────────

JoinStatus LifecycleController::join(const std::string& id, SinkPtr sink) {
    SessionPtr session = registry_.get(id);
    if (!session) return JoinStatus::NotFound;
    return join(session, std::move(sink));
}

JoinStatus LifecycleController::join(const SessionPtr& session, SinkPtr sink) {
    if (shutting_down_.load()) return JoinStatus::ShuttingDown;

    size_t count = 0;
    bool resurrected = false;
    bool started = false;
    std::string url;
    std::vector<SinkPtr> to_close;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->state == SessionState::Evicted) return JoinStatus::Evicted;

        count = session->subscribers.add(std::move(sink));

        if (session->state == SessionState::Draining) {
            session->state = SessionState::Idle;
            resurrected = true;
        }

        if (session->state == SessionState::Idle) {
            session->cancel_eviction_locked();
            if (session->relay) {
                // The previous engine has been asked to stop but has not
                // exited yet; it starts the replacement on its way out.
                session->restart_pending = true;
                session->state = SessionState::Active;
            } else {
                start_relay_locked(session, to_close);
                started = session->state == SessionState::Active;
            }
        } else if (session->state == SessionState::Active &&
                   session->relay && session->relay->stop_requested()) {
            session->restart_pending = true;
        }
        url = session->source_url;
    }
    close_stream_ended(to_close);

    if (event_bus_) {
        if (resurrected) {
            SessionResurrectedEvent ev;
            ev.session_id = session->id;
            ev.source_url = url;
            event_bus_->publish(ev);
        }
        ClientJoinedEvent ev;
        ev.session_id = session->id;
        ev.client_count = count;
        event_bus_->publish(ev);
        if (started) publish_relay_started(session->id, url);
    }
    return JoinStatus::Joined;
}

void LifecycleController::leave(const SessionPtr& session, const SinkPtr& sink) {
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        count = session->subscribers.remove(sink);
        if (count == 0 && session->state == SessionState::Active) {
            session->state = SessionState::Draining;
            session->restart_pending = false;
            if (session->relay) session->relay->request_stop();
            arm_eviction_locked(session, options_.eviction_delay);
        }
    }

    if (event_bus_) {
        ClientLeftEvent ev;
        ev.session_id = session->id;
        ev.client_count = count;
        event_bus_->publish(ev);
    }
}

// ── Relay engine ────────────────────────────────────────────────

void LifecycleController::start_relay_locked(const SessionPtr& session,
                                             std::vector<SinkPtr>& to_close) {
    uint64_t generation = ++session->relay_starts;

    // The exit callback owns the session, which keeps the subscriber set
    // referenced by the engine alive until the engine thread is done.
    auto engine = std::make_shared<RelayEngine>(
        session->id, session->source_url, session->subscribers, http_, options_.upstream,
        [this, session, generation](const RelayResult& result) {
            on_relay_exit(session, generation, result);
        });
    Session* raw = session.get();
    engine->set_chunk_observer([raw](size_t bytes) {
        raw->chunks_relayed.fetch_add(1);
        raw->bytes_relayed.fetch_add(bytes);
    });

    session->relay = engine;
    session->restart_pending = false;
    session->state = SessionState::Active;
    {
        std::lock_guard<std::mutex> lock(engines_mutex_);
        ++live_engines_;
    }

    try {
        engine->start();
    } catch (const std::system_error& e) {
        std::cerr << "[relay] " << session->id << ": cannot start relay thread: "
                  << e.what() << "\n";
        session->relay.reset();
        engine_finished();
        finish_relay_locked(session, to_close);
    }
}

void LifecycleController::on_relay_exit(const SessionPtr& session,
                                        uint64_t generation,
                                        const RelayResult& result) {
    bool restarted = false;
    std::string url;
    std::vector<SinkPtr> to_close;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (generation == session->relay_starts) {
            session->relay.reset();

            bool wants_restart =
                session->restart_pending ||
                result.reason == RelayExitReason::NoSubscribers ||
                result.reason == RelayExitReason::StopRequested;

            if (session->state == SessionState::Active && !shutting_down_.load()) {
                if (wants_restart && !session->subscribers.empty()) {
                    // Sinks joined while this engine was winding down.
                    start_relay_locked(session, to_close);
                    restarted = session->state == SessionState::Active;
                } else {
                    finish_relay_locked(session, to_close);
                }
            }
        }
        url = session->source_url;
    }
    close_stream_ended(to_close);

    if (event_bus_) {
        RelayStoppedEvent ev;
        ev.session_id = session->id;
        ev.reason = relay_exit_reason_name(result.reason);
        ev.detail = result.error;
        ev.chunks = result.chunks;
        ev.bytes = result.bytes;
        event_bus_->publish(ev);
        if (restarted) publish_relay_started(session->id, url);
    }

    engine_finished();
}

// Upstream is gone for an Active session: detach every client for a normal
// close and start the eviction grace period.
void LifecycleController::finish_relay_locked(const SessionPtr& session,
                                              std::vector<SinkPtr>& to_close) {
    auto detached = session->subscribers.detach_all();
    to_close.insert(to_close.end(), detached.begin(), detached.end());
    session->state = SessionState::Draining;
    session->restart_pending = false;
    arm_eviction_locked(session, options_.eviction_delay);
}

void LifecycleController::engine_finished() {
    {
        std::lock_guard<std::mutex> lock(engines_mutex_);
        if (live_engines_ > 0) --live_engines_;
    }
    engines_cv_.notify_all();
}

size_t LifecycleController::running_engines() const {
    std::lock_guard<std::mutex> lock(engines_mutex_);
    return live_engines_;
}

// ── Eviction ────────────────────────────────────────────────────

void LifecycleController::arm_eviction_locked(const SessionPtr& session,
                                              std::chrono::milliseconds delay) {
    session->cancel_eviction_locked();
    uint64_t epoch = session->eviction_epoch;
    SessionState armed_state = session->state;
    std::weak_ptr<Session> weak = session;
    session->eviction_timer = timers_.schedule(delay, [this, weak, epoch, armed_state]() {
        on_eviction_timer(weak, epoch, armed_state);
    });
}

void LifecycleController::on_eviction_timer(const std::weak_ptr<Session>& weak,
                                            uint64_t epoch,
                                            SessionState armed_state) {
    SessionPtr session = weak.lock();
    if (!session) return;

    // The epoch check rejects a timer that fired while a join was
    // resurrecting the session: the join bumped the epoch first.
    bool evicted = registry_.evict_if(session->id, session, [&](Session& s) {
        return s.eviction_epoch == epoch &&
               s.state == armed_state &&
               s.subscribers.empty();
    });
    if (!evicted) return;

    if (event_bus_) {
        SessionEvictedEvent ev;
        ev.session_id = session->id;
        event_bus_->publish(ev);
    }
}

// ── Shutdown ────────────────────────────────────────────────────

void LifecycleController::shutdown() {
    if (!shutting_down_.exchange(true)) {
        timers_.stop();

        for (const auto& session : registry_.take_all()) {
            {
                std::lock_guard<std::mutex> lock(session->mutex);
                session->cancel_eviction_locked();
                session->state = SessionState::Evicted;
                session->restart_pending = false;
                if (session->relay) session->relay->request_stop();
            }
            session->subscribers.close_all(close_codes::GoingAway, "Server shutting down");
        }
    }

    std::unique_lock<std::mutex> lock(engines_mutex_);
    if (!engines_cv_.wait_for(lock, std::chrono::seconds(5),
                              [this]() { return live_engines_ == 0; })) {
        std::cerr << "[relay] Waiting for " << live_engines_ << " relay engine(s) to stop\n";
        engines_cv_.wait(lock, [this]() { return live_engines_ == 0; });
    }
}

void LifecycleController::publish_relay_started(const std::string& id, const std::string& url) const {
    if (!event_bus_) return;
    RelayStartedEvent ev;
    ev.session_id = id;
    ev.source_url = url;
    event_bus_->publish(ev);
}

} // namespace fanrelay
