#pragma once
#include "session.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace fanrelay {

// How get_or_create resolved an id.
enum class Resolution {
    Created,      // id was unknown; a fresh Idle session was inserted
    Existing,     // Idle or Active session returned unchanged
    Resurrected,  // Draining session returned to Idle, eviction cancelled
};

// Single authority for id → Session. An injected instance, created at server
// start and drained at shutdown; not process-global.
class SessionRegistry {
public:
    using SessionPtr = std::shared_ptr<Session>;

    // Resolve id atomically (lookup-then-insert under one lock).
    // Unknown id + empty source_url returns nullptr. For an Idle/Active
    // session a different source_url is ignored; a Draining session takes
    // the new one (last write wins).
    SessionPtr get_or_create(const std::string& id,
                             const std::string& source_url,
                             Resolution* resolution = nullptr);

    // nullptr if unknown.
    SessionPtr get(const std::string& id) const;

    // Unconditionally drop the entry and mark the session Evicted.
    // Returns the removed session (nullptr if none). Idempotent.
    SessionPtr remove(const std::string& id);

    // Remove id only while it still maps to `expected` and `predicate`
    // (called with the session mutex held) returns true. On removal the
    // session is marked Evicted before the lock is released.
    bool evict_if(const std::string& id,
                  const SessionPtr& expected,
                  const std::function<bool(Session&)>& predicate);

    // Observability snapshot, ordered by id.
    std::vector<SessionSummary> list_all() const;

    size_t size() const;

    // Remove and return every session (shutdown drain).
    std::vector<SessionPtr> take_all();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, SessionPtr> sessions_;
};

} // namespace fanrelay
