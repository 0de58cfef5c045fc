#pragma once
#include "../memory.hpp"
#include "../config.hpp"
#include "../sharded_map.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace parley {

class EventBus; // forward declaration

// In-process memory store with rule-based extraction and lexical ranking.
// Each session's items live behind their own mutex; sessions never contend.
class HeuristicMemoryStore : public MemoryStore {
public:
    explicit HeuristicMemoryStore(const MemoryConfig& config);

    std::string backend_name() const override { return "heuristic"; }

    void update(const std::string& session_id, const std::string& turn_text) override;
    void update(const std::string& session_id, const std::string& turn_text, uint64_t now);

    RetrievalResult retrieve(const std::string& session_id, const std::string& query) override;
    RetrievalResult retrieve(const std::string& session_id, const std::string& query,
                             uint64_t now);

    MemoryStats stats(const std::string& session_id) const override;

    std::vector<MemoryItem> list(const std::string& session_id) const override;

    std::string add(MemoryItem item) override;

    std::string snapshot_export(const std::string& session_id) const override;

    uint32_t snapshot_import(const std::string& json_str) override;

    void set_event_bus(EventBus* bus) override { event_bus_ = bus; }

    const MemoryConfig& config() const { return config_; }

private:
    struct SessionMemory {
        mutable std::mutex mutex;
        std::vector<MemoryItem> items;   // working set, insertion order
        size_t evicted = 0;
    };
    using SessionMemoryPtr = std::shared_ptr<SessionMemory>;

    SessionMemoryPtr find(const std::string& session_id) const;
    SessionMemoryPtr find_or_create(const std::string& session_id);
    std::string next_id(const std::string& session_id, MemoryType type);

    // Must be called with the session's mutex held. Returns items evicted.
    size_t evict_over_capacity(SessionMemory& mem);
    void report_eviction(const std::string& session_id, size_t evicted);

    MemoryConfig config_;
    ShardedMap<SessionMemoryPtr> sessions_;
    std::atomic<uint64_t> sequence_{0};
    EventBus* event_bus_ = nullptr;
};

} // namespace parley
