#pragma once
#include <string>
#include <cstdint>

namespace fanrelay {

// Events are dispatched by string tag, without RTTI.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* SessionCreated     = "SessionCreated";
    constexpr const char* SessionResurrected = "SessionResurrected";
    constexpr const char* SessionEvicted     = "SessionEvicted";
    constexpr const char* ClientJoined       = "ClientJoined";
    constexpr const char* ClientLeft         = "ClientLeft";
    constexpr const char* RelayStarted       = "RelayStarted";
    constexpr const char* RelayStopped       = "RelayStopped";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct SessionCreatedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionCreated;
    std::string session_id;
    std::string source_url;

    SessionCreatedEvent() { type_tag = TAG; }
};

// A draining session took a new join (or create) before its eviction fired.
struct SessionResurrectedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionResurrected;
    std::string session_id;
    std::string source_url;

    SessionResurrectedEvent() { type_tag = TAG; }
};

struct SessionEvictedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionEvicted;
    std::string session_id;

    SessionEvictedEvent() { type_tag = TAG; }
};

struct ClientJoinedEvent : Event {
    static constexpr const char* TAG = event_tags::ClientJoined;
    std::string session_id;
    size_t client_count = 0;

    ClientJoinedEvent() { type_tag = TAG; }
};

struct ClientLeftEvent : Event {
    static constexpr const char* TAG = event_tags::ClientLeft;
    std::string session_id;
    size_t client_count = 0;

    ClientLeftEvent() { type_tag = TAG; }
};

struct RelayStartedEvent : Event {
    static constexpr const char* TAG = event_tags::RelayStarted;
    std::string session_id;
    std::string source_url;

    RelayStartedEvent() { type_tag = TAG; }
};

struct RelayStoppedEvent : Event {
    static constexpr const char* TAG = event_tags::RelayStopped;
    std::string session_id;
    std::string reason;   // relay_exit_reason_name()
    std::string detail;   // upstream error text, if any
    uint64_t chunks = 0;
    uint64_t bytes = 0;

    RelayStoppedEvent() { type_tag = TAG; }
};

} // namespace fanrelay
