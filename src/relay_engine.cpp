#include "relay_engine.hpp"

#include <iostream>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace fanrelay {

const char* relay_exit_reason_name(RelayExitReason reason) {
    switch (reason) {
        case RelayExitReason::EndOfStream:   return "end_of_stream";
        case RelayExitReason::StopRequested: return "stop_requested";
        case RelayExitReason::NoSubscribers: return "no_subscribers";
        case RelayExitReason::OpenFailed:    return "open_failed";
        case RelayExitReason::ReadError:     return "read_error";
    }
    return "unknown";
}

RelayEngine::RelayEngine(std::string session_id,
                         std::string source_url,
                         SubscriberSet& subscribers,
                         HttpClient& http,
                         StreamOptions options,
                         ExitCallback on_exit)
    : session_id_(std::move(session_id))
    , source_url_(std::move(source_url))
    , subscribers_(subscribers)
    , http_(http)
    , options_(options)
    , on_exit_(std::move(on_exit))
{
    options_.abort = &stop_requested_;
}

bool RelayEngine::start() {
    if (started_.exchange(true)) return false;
    running_.store(true);
    try {
        // Detached: the thread holds the only guaranteed reference to the
        // engine and reports back through the exit callback.
        std::thread([self = shared_from_this()]() { self->thread_main(); }).detach();
    } catch (const std::system_error&) {
        running_.store(false);
        throw;
    }
    return true;
}

void RelayEngine::request_stop() {
    stop_requested_.store(true);
}

bool RelayEngine::should_stop() const {
    return stop_requested_.load() || subscribers_.empty();
}

RelayResult RelayEngine::run() {
    RelayResult result;
    if (should_stop()) {
        result.reason = stop_requested_.load() ? RelayExitReason::StopRequested
                                               : RelayExitReason::NoSubscribers;
        return result;
    }

    bool loop_stopped = false;
    RawChunkCallback on_chunk = [this, &loop_stopped](const char* data, size_t len) -> bool {
        subscribers_.broadcast(std::string(data, len));
        chunks_.fetch_add(1);
        bytes_.fetch_add(len);
        if (chunk_observer_) chunk_observer_(len);
        if (should_stop()) {
            loop_stopped = true;
            return false;
        }
        return true;
    };

    HttpResponse resp = http_.stream_get_raw(source_url_, {}, std::move(on_chunk), options_);
    result.status_code = resp.status_code;
    result.error = resp.error;
    result.chunks = chunks_.load();
    result.bytes = bytes_.load();

    if (stop_requested_.load()) {
        result.reason = RelayExitReason::StopRequested;
    } else if (loop_stopped) {
        result.reason = RelayExitReason::NoSubscribers;
    } else if (!resp.ok()) {
        result.reason = RelayExitReason::OpenFailed;
    } else if (!resp.error.empty()) {
        result.reason = RelayExitReason::ReadError;
    } else {
        result.reason = RelayExitReason::EndOfStream;
    }
    return result;
}

void RelayEngine::thread_main() {
    RelayResult result;
    try {
        result = run();
    } catch (const std::exception& e) {
        result.reason = RelayExitReason::ReadError;
        result.error = e.what();
        result.chunks = chunks_.load();
        result.bytes = bytes_.load();
    }
    running_.store(false);

    if (!on_exit_) return;
    try {
        on_exit_(result);
    } catch (const std::exception& e) {
        std::cerr << "[relay] " << session_id_ << ": exit handler failed: " << e.what() << "\n";
    }
}

} // namespace fanrelay
