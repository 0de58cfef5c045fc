#include "engine.hpp"
#include "event.hpp"
#include "util.hpp"
#include <chrono>
#include <iostream>

namespace parley {

ConversationEngine::ConversationEngine(const Config& config)
    : config_(config),
      registry_(config.session),
      memory_(create_memory(config)),
      history_(config.data_dir(), config.history.archive_search_days),
      sweeper_(std::chrono::seconds(config.session.sweep_interval_seconds),
               [this]() { sweep(); })
{
    registry_.set_event_bus(&event_bus_);
    memory_->set_event_bus(&event_bus_);
    history_.set_event_bus(&event_bus_);

    // Expiry never loses buffered turns
    expired_sub_ = subscribe<SessionExpiredEvent>(event_bus_,
        [this](const SessionExpiredEvent& ev) { on_session_expired(ev); });
}

ConversationEngine::~ConversationEngine() {
    stop();
    event_bus_.unsubscribe(expired_sub_);
}

void ConversationEngine::on_session_expired(const SessionExpiredEvent& ev) {
    if (!history_.end_conversation(ev.session_id)) {
        std::cerr << "[engine] Nothing archived for expired session " << ev.session_id << "\n";
    }
}

Session ConversationEngine::get_or_create_session(const std::string& session_id) {
    return registry_.get_or_create(session_id);
}

bool ConversationEngine::record_turn(const std::string& session_id, const std::string& role,
                                     const std::string& text) {
    registry_.get_or_create(session_id);
    registry_.add_tokens(session_id, estimate_tokens(text));

    // First turn of a returning session picks up where the transcript left off
    history_.resume_conversation(session_id);

    ChatMessage msg;
    msg.role = role;
    msg.content = text;
    history_.add_message(session_id, std::move(msg));

    if (role != "system") {
        memory_->update(session_id, text);
    }

    if (!config_.history.flush_every_turn) return true;
    return history_.flush(session_id);
}

std::string ConversationEngine::retrieve_memory(const std::string& session_id,
                                                const std::string& query) {
    return memory_->retrieve(session_id, query).summary_text;
}

std::string ConversationEngine::enrich_prompt(const std::string& session_id,
                                              const std::string& user_message) {
    return memory_enrich(memory_->retrieve(session_id, user_message), user_message);
}

std::optional<std::string> ConversationEngine::end_session(const std::string& session_id) {
    auto path = history_.end_conversation(session_id);
    registry_.end(session_id);
    return path;
}

std::vector<ChatMessage> ConversationEngine::get_history(const std::string& session_id) {
    return history_.load_history(session_id);
}

MemoryStats ConversationEngine::memory_stats(const std::string& session_id) const {
    return memory_->stats(session_id);
}

size_t ConversationEngine::active_sessions() const {
    return registry_.active_count();
}

std::vector<std::string> ConversationEngine::sweep() {
    return registry_.sweep();
}

std::vector<std::string> ConversationEngine::sweep(uint64_t now) {
    return registry_.sweep(now);
}

void ConversationEngine::start() {
    if (sweeper_.is_running()) return;
    std::cerr << "[engine] Sweeping idle sessions every "
              << config_.session.sweep_interval_seconds << "s (timeout "
              << config_.session.timeout_seconds << "s)\n";
    sweeper_.start();
}

void ConversationEngine::stop() {
    sweeper_.stop();
}

} // namespace parley
