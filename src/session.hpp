#pragma once
#include "config.hpp"
#include "sharded_map.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace parley {

class EventBus; // forward declaration

enum class SessionStatus { Active, Idle, Expired };

struct Session {
    std::string id;
    uint64_t created_at = 0;
    uint64_t last_active_at = 0;
    SessionStatus status = SessionStatus::Active;
    uint64_t token_count_estimate = 0;
    std::optional<std::string> active_persona_id;
};

std::string status_to_string(SessionStatus status);

// Thread-safe registry of live sessions keyed by id. Lookups return
// snapshots; the registry keeps the only mutable copy.
class SessionRegistry {
public:
    explicit SessionRegistry(const SessionConfig& config);

    // Return the session, refreshing last_active_at, or create it.
    Session get_or_create(const std::string& session_id);
    Session get_or_create(const std::string& session_id, uint64_t now);

    // Lookup. A hit counts as activity and refreshes last_active_at.
    std::optional<Session> get(const std::string& session_id);
    std::optional<Session> get(const std::string& session_id, uint64_t now);

    // Remove a session immediately. Returns false if it was not registered.
    bool end(const std::string& session_id);

    // Add to the running token estimate. Returns false if the session is absent.
    bool add_tokens(const std::string& session_id, uint64_t tokens);

    // Set or clear the active persona. Returns false if the session is absent.
    bool set_persona(const std::string& session_id, std::optional<std::string> persona_id);

    // Remove sessions idle longer than the configured timeout.
    // Returns the removed session ids.
    std::vector<std::string> sweep();
    std::vector<std::string> sweep(uint64_t now);

    size_t active_count() const;

    std::vector<std::string> list_sessions() const;

    // Snapshots of every session as of `now`, without counting as activity.
    std::vector<Session> snapshot_sessions(uint64_t now) const;

    // Optional event bus for lifecycle events (non-owning)
    void set_event_bus(EventBus* bus) { event_bus_ = bus; }

    const SessionConfig& config() const { return config_; }

private:
    Session snapshot(const Session& session, uint64_t now) const;

    SessionConfig config_;
    ShardedMap<Session> sessions_;
    EventBus* event_bus_ = nullptr;
};

} // namespace parley
