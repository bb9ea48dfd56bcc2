#pragma once
#include "http.hpp"
#include "subscriber_set.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace fanrelay {

enum class RelayExitReason {
    EndOfStream,    // upstream closed the body normally
    StopRequested,  // request_stop() observed
    NoSubscribers,  // subscriber set emptied
    OpenFailed,     // no 2xx response (connect error or HTTP error status)
    ReadError,      // body ended abnormally, including idle timeout
};

const char* relay_exit_reason_name(RelayExitReason reason);

struct RelayResult {
    RelayExitReason reason = RelayExitReason::EndOfStream;
    long status_code = 0;
    std::string error;
    uint64_t chunks = 0;
    uint64_t bytes = 0;
};

// Owns the single upstream read loop of one session.
//
// Every chunk read from upstream is broadcast synchronously to the
// subscriber set before the next read is issued, so a slow sink delays the
// whole fan-out by up to its send timeout. After each broadcast the loop
// stops if a stop was requested or no subscribers remain. The exit callback
// runs exactly once on the engine thread, whatever ended the loop.
//
// The caller guarantees `subscribers` outlives the engine thread (the
// lifecycle controller's exit callback holds the owning session).
class RelayEngine : public std::enable_shared_from_this<RelayEngine> {
public:
    using ExitCallback = std::function<void(const RelayResult&)>;
    using ChunkObserver = std::function<void(size_t bytes)>;

    RelayEngine(std::string session_id,
                std::string source_url,
                SubscriberSet& subscribers,
                HttpClient& http,
                StreamOptions options,
                ExitCallback on_exit);

    // Spawn the engine thread. Returns false (and does nothing) if this
    // engine was already started. Throws std::system_error if the thread
    // cannot be created; the exit callback is not invoked in that case.
    bool start();

    // Cooperative stop: observed after the current broadcast, or within one
    // read slice if the loop is blocked waiting for upstream bytes.
    void request_stop();

    bool stop_requested() const { return stop_requested_.load(); }
    bool running() const { return running_.load(); }
    uint64_t chunks() const { return chunks_.load(); }
    uint64_t bytes() const { return bytes_.load(); }

    const std::string& session_id() const { return session_id_; }
    const std::string& source_url() const { return source_url_; }

    // Called after each broadcast with the chunk size (counters, tests).
    void set_chunk_observer(ChunkObserver observer) { chunk_observer_ = std::move(observer); }

    // Run the loop on the calling thread. start() runs this on its own thread.
    RelayResult run();

private:
    void thread_main();
    bool should_stop() const;

    const std::string session_id_;
    const std::string source_url_;
    SubscriberSet& subscribers_;
    HttpClient& http_;
    StreamOptions options_;
    ExitCallback on_exit_;
    ChunkObserver chunk_observer_;

    std::atomic<bool> started_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<uint64_t> chunks_{0};
    std::atomic<uint64_t> bytes_{0};
};

} // namespace fanrelay
