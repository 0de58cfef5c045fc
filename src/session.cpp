#include "session.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "util.hpp"
#include <iostream>

namespace parley {

std::string status_to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Active:  return "active";
        case SessionStatus::Idle:    return "idle";
        case SessionStatus::Expired: return "expired";
    }
    return "active";
}

SessionRegistry::SessionRegistry(const SessionConfig& config)
    : config_(config)
{}

Session SessionRegistry::snapshot(const Session& session, uint64_t now) const {
    Session copy = session;
    uint64_t idle_for = now > session.last_active_at ? now - session.last_active_at : 0;
    copy.status = idle_for > config_.idle_after_seconds
        ? SessionStatus::Idle : SessionStatus::Active;
    return copy;
}

Session SessionRegistry::get_or_create(const std::string& session_id) {
    return get_or_create(session_id, epoch_seconds());
}

Session SessionRegistry::get_or_create(const std::string& session_id, uint64_t now) {
    bool created = false;
    Session result = sessions_.upsert(session_id, [&](Session& s, bool is_new) {
        if (is_new) {
            s.id = session_id;
            s.created_at = now;
            created = true;
        }
        // Never move last_active_at behind created_at
        if (now > s.last_active_at) s.last_active_at = now;
        if (s.last_active_at < s.created_at) s.last_active_at = s.created_at;
        s.status = SessionStatus::Active;
        return snapshot(s, now);
    });

    if (created && event_bus_) {
        SessionCreatedEvent ev;
        ev.session_id = session_id;
        event_bus_->publish(ev);
    }
    return result;
}

std::optional<Session> SessionRegistry::get(const std::string& session_id) {
    return get(session_id, epoch_seconds());
}

std::optional<Session> SessionRegistry::get(const std::string& session_id, uint64_t now) {
    std::optional<Session> result;
    sessions_.visit(session_id, [&](Session& s) {
        if (now > s.last_active_at) s.last_active_at = now;
        result = snapshot(s, now);
    });
    return result;
}

bool SessionRegistry::end(const std::string& session_id) {
    if (!sessions_.erase(session_id)) return false;

    if (event_bus_) {
        SessionEndedEvent ev;
        ev.session_id = session_id;
        event_bus_->publish(ev);
    }
    return true;
}

bool SessionRegistry::add_tokens(const std::string& session_id, uint64_t tokens) {
    return sessions_.visit(session_id, [tokens](Session& s) {
        s.token_count_estimate += tokens;
    });
}

bool SessionRegistry::set_persona(const std::string& session_id,
                                  std::optional<std::string> persona_id) {
    return sessions_.visit(session_id, [&persona_id](Session& s) {
        s.active_persona_id = std::move(persona_id);
    });
}

std::vector<std::string> SessionRegistry::sweep() {
    return sweep(epoch_seconds());
}

std::vector<std::string> SessionRegistry::sweep(uint64_t now) {
    uint64_t timeout = config_.timeout_seconds;
    auto removed = sessions_.erase_if([now, timeout](const std::string&, const Session& s) {
        return now > s.last_active_at && (now - s.last_active_at) > timeout;
    });

    std::vector<std::string> ids;
    ids.reserve(removed.size());
    for (const auto& entry : removed) {
        std::cerr << "[session] Expired idle session " << entry.first << "\n";
        ids.push_back(entry.first);
    }

    // Publish outside the shard locks so handlers may call back into the registry
    if (event_bus_) {
        for (const auto& [id, session] : removed) {
            SessionExpiredEvent ev;
            ev.session_id = id;
            ev.last_active_at = session.last_active_at;
            event_bus_->publish(ev);
        }
    }
    return ids;
}

size_t SessionRegistry::active_count() const {
    return sessions_.size();
}

std::vector<std::string> SessionRegistry::list_sessions() const {
    return sessions_.keys();
}

std::vector<Session> SessionRegistry::snapshot_sessions(uint64_t now) const {
    std::vector<Session> out;
    sessions_.for_each([&](const std::string&, const Session& s) {
        out.push_back(snapshot(s, now));
    });
    return out;
}

} // namespace parley
