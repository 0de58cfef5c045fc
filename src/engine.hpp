#pragma once
#include "config.hpp"
#include "event_bus.hpp"
#include "history.hpp"
#include "memory.hpp"
#include "session.hpp"
#include "sweeper.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace parley {

// Per-process conversational state: session registry, session-scoped
// memory and transcript persistence, plus the background expiry sweep.
// All methods are safe to call concurrently from transport threads.
class ConversationEngine {
public:
    explicit ConversationEngine(const Config& config);
    ~ConversationEngine();

    ConversationEngine(const ConversationEngine&) = delete;
    ConversationEngine& operator=(const ConversationEngine&) = delete;

    Session get_or_create_session(const std::string& session_id);

    // Record one message. Returns false only if the live transcript could
    // not be written; the turn is still buffered and remembered.
    bool record_turn(const std::string& session_id, const std::string& role,
                     const std::string& text);

    // Memory digest for the query ("- item\n" lines), empty when nothing matches.
    std::string retrieve_memory(const std::string& session_id, const std::string& query);

    // retrieve_memory() wrapped around the message for an LLM prompt.
    std::string enrich_prompt(const std::string& session_id, const std::string& user_message);

    // Archive the transcript and drop the session. Returns the archive path.
    std::optional<std::string> end_session(const std::string& session_id);

    std::vector<ChatMessage> get_history(const std::string& session_id);

    MemoryStats memory_stats(const std::string& session_id) const;

    size_t active_sessions() const;

    // One expiry pass. The background sweeper calls this every interval.
    std::vector<std::string> sweep();
    std::vector<std::string> sweep(uint64_t now);

    // Start/stop the background sweep
    void start();
    void stop();
    bool running() const { return sweeper_.is_running(); }

    EventBus& events() { return event_bus_; }
    SessionRegistry& sessions() { return registry_; }
    MemoryStore& memory() { return *memory_; }
    HistoryStore& history() { return history_; }
    const Config& config() const { return config_; }

private:
    void on_session_expired(const SessionExpiredEvent& ev);

    Config config_;
    EventBus event_bus_;
    SessionRegistry registry_;
    std::unique_ptr<MemoryStore> memory_;
    HistoryStore history_;
    uint64_t expired_sub_ = 0;
    Sweeper sweeper_;   // last: joined before the state it sweeps is destroyed
};

} // namespace parley
