#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <memory>

namespace parley {

struct Config; // forward declaration
class EventBus;

enum class MemoryType { Preference, Fact, Relationship, Event };

struct MemoryItem {
    std::string id;
    std::string session_id;
    std::string content;
    MemoryType type = MemoryType::Event;
    int importance = 5;                     // always within [1, 10]
    std::vector<std::string> keywords;      // at most 5, first-seen order
    uint64_t created_at = 0;
    std::optional<uint64_t> last_used_at;
    uint32_t access_count = 0;
    bool active = true;
    int score = 0;                          // relevance, filled by retrieve()
};

struct MemoryStats {
    size_t total = 0;
    size_t active = 0;
    size_t evicted = 0;                     // deactivated by capacity eviction
};

struct RetrievalResult {
    std::vector<MemoryItem> items;          // best first
    std::string summary_text;               // "- <content>\n" per item

    bool empty() const { return items.empty(); }
};

// Session-scoped long-term memory. Implementations must be safe for
// concurrent use across sessions. The heuristic store scores lexically;
// an embedding-backed store can replace it behind the same contract.
class MemoryStore {
public:
    virtual ~MemoryStore() = default;

    virtual std::string backend_name() const = 0;

    // Extract candidate items from turn text, keep those that qualify,
    // then enforce the per-session capacity.
    virtual void update(const std::string& session_id, const std::string& turn_text) = 0;

    // Top-ranked active items for the query. Never throws; empty when the
    // session has no active items. Selected items get their access recorded.
    virtual RetrievalResult retrieve(const std::string& session_id,
                                     const std::string& query) = 0;

    virtual MemoryStats stats(const std::string& session_id) const = 0;

    // Active items in insertion order.
    virtual std::vector<MemoryItem> list(const std::string& session_id) const = 0;

    // Store a prepared item (importance is clamped), then enforce capacity.
    // Returns the item id.
    virtual std::string add(MemoryItem item) = 0;

    // Export a session's active items as a JSON array string.
    virtual std::string snapshot_export(const std::string& session_id) const = 0;

    // Import items from a JSON array string. Returns number imported.
    virtual uint32_t snapshot_import(const std::string& json_str) = 0;

    // Optional: receive eviction events (non-owning). Default is a no-op.
    virtual void set_event_bus(EventBus* /*bus*/) {}
};

// Type string conversions
std::string memory_type_to_string(MemoryType type);
MemoryType memory_type_from_string(const std::string& s);

// Clamp importance into [1, 10]
int clamp_importance(int importance);

// Bullet list of item contents, one "- <content>\n" line per item.
std::string build_memory_summary(const std::vector<MemoryItem>& items);

// Prepend a retrieval summary to a prompt. Returns the prompt unchanged
// when the summary is empty.
std::string memory_enrich(const RetrievalResult& result, const std::string& user_message);

// Create the memory backend configured for this process.
std::unique_ptr<MemoryStore> create_memory(const Config& config);

} // namespace parley
