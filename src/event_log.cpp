#include "event_log.hpp"
#include "util.hpp"

#include <iostream>
#include <sstream>

namespace fanrelay {

namespace {

// One write per line so lines from different threads do not interleave.
void log_line(const std::string& tag, const std::string& msg) {
    std::ostringstream line;
    line << timestamp_now() << " [" << tag << "] " << msg << "\n";
    std::cerr << line.str() << std::flush;
}

} // namespace

std::vector<ScopedSubscription> attach_event_log(EventBus& bus) {
    std::vector<ScopedSubscription> subs;

    subs.push_back(subscribe_scoped<SessionCreatedEvent>(bus,
        [](const SessionCreatedEvent& ev) {
            log_line("session", ev.session_id + ": created for " + ev.source_url);
        }));

    subs.push_back(subscribe_scoped<SessionResurrectedEvent>(bus,
        [](const SessionResurrectedEvent& ev) {
            log_line("session", ev.session_id + ": resurrected (" + ev.source_url + ")");
        }));

    subs.push_back(subscribe_scoped<SessionEvictedEvent>(bus,
        [](const SessionEvictedEvent& ev) {
            log_line("session", ev.session_id + ": evicted");
        }));

    subs.push_back(subscribe_scoped<ClientJoinedEvent>(bus,
        [](const ClientJoinedEvent& ev) {
            log_line("session", ev.session_id + ": client connected, total " +
                                std::to_string(ev.client_count));
        }));

    subs.push_back(subscribe_scoped<ClientLeftEvent>(bus,
        [](const ClientLeftEvent& ev) {
            log_line("session", ev.session_id + ": client disconnected, remaining " +
                                std::to_string(ev.client_count));
        }));

    subs.push_back(subscribe_scoped<RelayStartedEvent>(bus,
        [](const RelayStartedEvent& ev) {
            log_line("relay", ev.session_id + ": starting relay from " + ev.source_url);
        }));

    subs.push_back(subscribe_scoped<RelayStoppedEvent>(bus,
        [](const RelayStoppedEvent& ev) {
            std::string msg = ev.session_id + ": relay stopped (" + ev.reason + ") after " +
                              std::to_string(ev.chunks) + " chunks, " +
                              std::to_string(ev.bytes) + " bytes";
            if (!ev.detail.empty()) msg += ": " + ev.detail;
            log_line("relay", msg);
        }));

    return subs;
}

} // namespace fanrelay
