#pragma once
#include <string>
#include <cstdint>

namespace parley {

// Tag-based event dispatch: no RTTI, no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* SessionCreated  = "SessionCreated";
    constexpr const char* SessionExpired  = "SessionExpired";
    constexpr const char* SessionEnded    = "SessionEnded";
    constexpr const char* MemoryEvicted   = "MemoryEvicted";
    constexpr const char* HistoryArchived = "HistoryArchived";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct SessionCreatedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionCreated;
    std::string session_id;

    SessionCreatedEvent() { type_tag = TAG; }
};

// Published by the sweep, after the session has left the registry
struct SessionExpiredEvent : Event {
    static constexpr const char* TAG = event_tags::SessionExpired;
    std::string session_id;
    uint64_t last_active_at = 0;

    SessionExpiredEvent() { type_tag = TAG; }
};

struct SessionEndedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionEnded;
    std::string session_id;

    SessionEndedEvent() { type_tag = TAG; }
};

struct MemoryEvictedEvent : Event {
    static constexpr const char* TAG = event_tags::MemoryEvicted;
    std::string session_id;
    size_t evicted = 0;

    MemoryEvictedEvent() { type_tag = TAG; }
};

struct HistoryArchivedEvent : Event {
    static constexpr const char* TAG = event_tags::HistoryArchived;
    std::string session_id;
    std::string path;
    size_t message_count = 0;

    HistoryArchivedEvent() { type_tag = TAG; }
};

} // namespace parley
