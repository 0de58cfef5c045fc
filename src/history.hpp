#pragma once
#include "sharded_map.hpp"
#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include <cstdint>

namespace parley {

class EventBus; // forward declaration

struct ChatMessage {
    std::string role;                   // "user", "assistant", "system", ...
    std::string content;
    uint64_t timestamp = 0;             // epoch seconds; 0 = stamp on add
    std::string type = "text";          // in-process only, not persisted
};

// Where save_history() writes a transcript
enum class StorageStrategy { BySession, ByDate };

struct HistoryStats {
    size_t total_sessions = 0;          // live transcript files
    size_t total_messages = 0;          // persisted + buffered
    uint64_t total_file_size = 0;       // bytes across live files
    size_t active_conversations = 0;    // sessions with a buffer
};

struct ConversationRecord {
    std::string session_id;             // decoded from the file name
    std::string path;
    std::vector<ChatMessage> messages;
};

// Per-session message buffers plus JSON transcripts on disk:
//
//   {data_dir}/sessions/{id}_history.json                      live
//   {data_dir}/conversations/YYYY/MM/DD/{id}_{YYYYMMDD_HHMMSS}.json  archive
//
// Writes for one session are serialized; different sessions only share a
// lock stripe by hash collision. Reads never block on writers since every
// write lands through a rename.
class HistoryStore {
public:
    explicit HistoryStore(std::string data_dir, uint32_t archive_search_days = 7);

    HistoryStore(const HistoryStore&) = delete;
    HistoryStore& operator=(const HistoryStore&) = delete;

    // Begin (or restart) an empty buffer for the session.
    void start_conversation(const std::string& session_id);

    // Append to the session buffer, creating it if needed.
    void add_message(const std::string& session_id, ChatMessage msg);

    // Read the persisted transcript (live file, then archive), append the
    // message and write the live file back. Does not touch the buffer.
    bool add_message_and_save(const std::string& session_id, ChatMessage msg);

    // Write a transcript with the given strategy. Returns the written path.
    std::optional<std::string> save_history(const std::string& session_id,
                                            const std::vector<ChatMessage>& messages,
                                            StorageStrategy strategy = StorageStrategy::BySession);

    // Write an archive file dated `now`. Returns its path.
    std::optional<std::string> archive_history(const std::string& session_id,
                                               const std::vector<ChatMessage>& messages,
                                               uint64_t now);

    // Write the current buffer to the live file.
    bool flush(const std::string& session_id);

    // Seed the buffer from disk unless one already exists. Returns the
    // buffer size afterwards.
    size_t resume_conversation(const std::string& session_id);

    // Buffer if present, else live file, else the newest archive within the
    // search window. Empty when nothing is found.
    std::vector<ChatMessage> load_history(const std::string& session_id);
    std::vector<ChatMessage> load_history(const std::string& session_id, uint64_t now);

    // Last `limit` messages of load_history().
    std::vector<ChatMessage> recent_messages(const std::string& session_id, size_t limit);

    // Persist the buffer to the live file and an archive, then drop the
    // buffer. Returns the archive path; nullopt when there was no buffered
    // content or the archive write failed.
    std::optional<std::string> end_conversation(const std::string& session_id);
    std::optional<std::string> end_conversation(const std::string& session_id, uint64_t now);

    // Drop the buffer and remove the live file. Archives are kept.
    bool delete_history(const std::string& session_id);

    // True if the session has a buffer or a live file.
    bool has_history(const std::string& session_id) const;

    size_t active_conversation_count() const;

    HistoryStats statistics() const;

    // Every archived conversation filed under the local date of `day`.
    std::vector<ConversationRecord> conversations_by_date(uint64_t day) const;

    std::string live_path(const std::string& session_id) const;
    std::string archive_dir(uint64_t when) const;
    const std::string& data_dir() const { return data_dir_; }

    // Optional event bus for archive events (non-owning)
    void set_event_bus(EventBus* bus) { event_bus_ = bus; }

private:
    std::mutex& file_lock(const std::string& session_id);

    // Callers hold file_lock(session_id).
    bool write_live(const std::string& session_id, const std::vector<ChatMessage>& messages);
    std::optional<std::string> write_archive(const std::string& session_id,
                                             const std::vector<ChatMessage>& messages,
                                             uint64_t now);

    // nullopt when the file is absent or corrupt
    std::optional<std::vector<ChatMessage>> read_live(const std::string& session_id,
                                                      uint64_t now) const;
    std::optional<std::vector<ChatMessage>> read_archive(const std::string& session_id,
                                                         uint64_t now) const;
    std::vector<ChatMessage> load_persisted(const std::string& session_id, uint64_t now) const;

    void report_archive(const std::string& session_id, const std::string& path, size_t count);

    std::string data_dir_;
    uint32_t archive_search_days_;
    ShardedMap<std::vector<ChatMessage>> buffers_;
    std::vector<std::mutex> file_locks_;
    EventBus* event_bus_ = nullptr;
};

// File-name form of a session id. '%', path separators, control bytes and a
// leading '.' become %XX; everything else, UTF-8 included, passes through.
// Distinct ids always get distinct names.
std::string encode_session_id(const std::string& session_id);

// Inverse of encode_session_id()
std::string decode_session_id(const std::string& encoded);

} // namespace parley
