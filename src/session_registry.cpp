#include "session_registry.hpp"

#include <algorithm>
#include <iostream>

namespace fanrelay {

SessionRegistry::SessionPtr SessionRegistry::get_or_create(const std::string& id,
                                                          const std::string& source_url,
                                                          Resolution* resolution) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        if (source_url.empty()) return nullptr;
        auto session = std::make_shared<Session>(id, source_url);
        sessions_.emplace(id, session);
        if (resolution) *resolution = Resolution::Created;
        return session;
    }

    SessionPtr session = it->second;
    std::lock_guard<std::mutex> session_lock(session->mutex);

    if (session->state == SessionState::Draining) {
        session->cancel_eviction_locked();
        session->state = SessionState::Idle;
        if (!source_url.empty()) session->source_url = source_url;
        if (resolution) *resolution = Resolution::Resurrected;
        return session;
    }

    if (!source_url.empty() && source_url != session->source_url) {
        std::cerr << "[session] " << id << ": keeping source " << session->source_url
                  << ", ignoring " << source_url << " while "
                  << session_state_name(session->state) << "\n";
    }
    if (resolution) *resolution = Resolution::Existing;
    return session;
}

SessionRegistry::SessionPtr SessionRegistry::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return nullptr;
    return it->second;
}

SessionRegistry::SessionPtr SessionRegistry::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return nullptr;

    SessionPtr session = std::move(it->second);
    sessions_.erase(it);

    std::lock_guard<std::mutex> session_lock(session->mutex);
    session->cancel_eviction_locked();
    session->state = SessionState::Evicted;
    return session;
}

bool SessionRegistry::evict_if(const std::string& id,
                               const SessionPtr& expected,
                               const std::function<bool(Session&)>& predicate) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end() || it->second != expected) return false;

    std::lock_guard<std::mutex> session_lock(expected->mutex);
    if (!predicate(*expected)) return false;

    expected->state = SessionState::Evicted;
    expected->eviction_timer = TimerHandle();
    sessions_.erase(it);
    return true;
}

std::vector<SessionSummary> SessionRegistry::list_all() const {
    std::vector<SessionPtr> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.reserve(sessions_.size());
        for (const auto& [id, session] : sessions_) sessions.push_back(session);
    }

    // Session locks are taken one at a time, never under the registry lock.
    std::vector<SessionSummary> out;
    out.reserve(sessions.size());
    for (const auto& session : sessions) out.push_back(summarize(*session));
    std::sort(out.begin(), out.end(), [](const SessionSummary& a, const SessionSummary& b) {
        return a.id < b.id;
    });
    return out;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<SessionRegistry::SessionPtr> SessionRegistry::take_all() {
    std::vector<SessionPtr> out;
    std::lock_guard<std::mutex> lock(mutex_);
    out.reserve(sessions_.size());
    for (auto& [id, session] : sessions_) {
        out.push_back(std::move(session));
    }
    sessions_.clear();
    return out;
}

} // namespace fanrelay
