#include "heuristic_memory.hpp"
#include "extractor.hpp"
#include "item_json.hpp"
#include "../event.hpp"
#include "../event_bus.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <exception>
#include <iostream>

namespace parley {

HeuristicMemoryStore::HeuristicMemoryStore(const MemoryConfig& config)
    : config_(config)
{}

HeuristicMemoryStore::SessionMemoryPtr
HeuristicMemoryStore::find(const std::string& session_id) const {
    auto found = sessions_.get(session_id);
    return found ? *found : nullptr;
}

HeuristicMemoryStore::SessionMemoryPtr
HeuristicMemoryStore::find_or_create(const std::string& session_id) {
    return sessions_.upsert(session_id, [](SessionMemoryPtr& mem, bool) {
        if (!mem) mem = std::make_shared<SessionMemory>();
        return mem;
    });
}

std::string HeuristicMemoryStore::next_id(const std::string& session_id, MemoryType type) {
    return "mem_" + session_id + "_" + memory_type_to_string(type) + "_" +
           std::to_string(epoch_millis()) + "_" + std::to_string(sequence_.fetch_add(1));
}

size_t HeuristicMemoryStore::evict_over_capacity(SessionMemory& mem) {
    size_t active = static_cast<size_t>(std::count_if(mem.items.begin(), mem.items.end(),
        [](const MemoryItem& m) { return m.active; }));
    if (active <= config_.capacity) return 0;

    // Rank active items: importance desc, then newest first. created_at has
    // one-second resolution, so a later insertion counts as newer on a tie.
    std::vector<size_t> order;
    order.reserve(active);
    for (size_t i = 0; i < mem.items.size(); ++i) {
        if (mem.items[i].active) order.push_back(i);
    }
    std::sort(order.begin(), order.end(), [&mem](size_t a, size_t b) {
        const auto& x = mem.items[a];
        const auto& y = mem.items[b];
        if (x.importance != y.importance) return x.importance > y.importance;
        if (x.created_at != y.created_at) return x.created_at > y.created_at;
        return a > b;
    });

    for (size_t r = config_.capacity; r < order.size(); ++r) {
        mem.items[order[r]].active = false;
    }

    // Survivors keep their insertion order
    size_t before = mem.items.size();
    mem.items.erase(std::remove_if(mem.items.begin(), mem.items.end(),
        [](const MemoryItem& m) { return !m.active; }), mem.items.end());
    size_t evicted = before - mem.items.size();
    mem.evicted += evicted;
    return evicted;
}

void HeuristicMemoryStore::report_eviction(const std::string& session_id, size_t evicted) {
    if (evicted == 0) return;
    std::cerr << "[memory] Evicted " << evicted << " items over capacity, session "
              << session_id << "\n";
    if (event_bus_) {
        MemoryEvictedEvent ev;
        ev.session_id = session_id;
        ev.evicted = evicted;
        event_bus_->publish(ev);
    }
}

void HeuristicMemoryStore::update(const std::string& session_id, const std::string& turn_text) {
    update(session_id, turn_text, epoch_seconds());
}

void HeuristicMemoryStore::update(const std::string& session_id, const std::string& turn_text,
                                  uint64_t now) {
    size_t evicted = 0;
    try {
        auto candidates = extract_candidates(strip_reasoning(turn_text));
        if (candidates.empty()) return;

        std::vector<MemoryItem> fresh;
        fresh.reserve(candidates.size());
        for (auto& content : candidates) {
            MemoryItem item;
            item.type = classify_memory(content);
            item.id = next_id(session_id, item.type);
            item.session_id = session_id;
            item.importance = score_importance(content);
            item.keywords = extract_keywords(content);
            item.created_at = now;
            item.content = std::move(content);
            fresh.push_back(std::move(item));
        }

        auto mem = find_or_create(session_id);
        std::lock_guard<std::mutex> lock(mem->mutex);
        for (auto& item : fresh) {
            mem->items.push_back(std::move(item));
        }
        evicted = evict_over_capacity(*mem);
    } catch (const std::exception& e) {
        std::cerr << "[memory] Update failed for session " << session_id
                  << ": " << e.what() << "\n";
        return;
    }
    report_eviction(session_id, evicted);
}

RetrievalResult HeuristicMemoryStore::retrieve(const std::string& session_id,
                                               const std::string& query) {
    return retrieve(session_id, query, epoch_seconds());
}

RetrievalResult HeuristicMemoryStore::retrieve(const std::string& session_id,
                                               const std::string& query, uint64_t now) {
    RetrievalResult result;
    auto mem = find(session_id);
    if (!mem) return result;

    try {
        std::lock_guard<std::mutex> lock(mem->mutex);

        std::vector<std::pair<int, size_t>> scored;
        scored.reserve(mem->items.size());
        for (size_t i = 0; i < mem->items.size(); ++i) {
            if (!mem->items[i].active) continue;
            scored.emplace_back(relevance_score(mem->items[i], query, now), i);
        }

        // Stable: equal scores keep insertion order
        std::stable_sort(scored.begin(), scored.end(),
                         [](const auto& a, const auto& b) { return a.first > b.first; });

        size_t k = std::min(static_cast<size_t>(config_.retrieve_limit), scored.size());
        result.items.reserve(k);
        for (size_t r = 0; r < k; ++r) {
            auto& item = mem->items[scored[r].second];
            item.access_count++;
            item.last_used_at = now;
            MemoryItem copy = item;
            copy.score = scored[r].first;
            result.items.push_back(std::move(copy));
        }
        result.summary_text = build_memory_summary(result.items);
    } catch (const std::exception& e) {
        std::cerr << "[memory] Retrieve failed for session " << session_id
                  << ": " << e.what() << "\n";
        return RetrievalResult{};
    }
    return result;
}

MemoryStats HeuristicMemoryStore::stats(const std::string& session_id) const {
    MemoryStats s;
    auto mem = find(session_id);
    if (!mem) return s;

    std::lock_guard<std::mutex> lock(mem->mutex);
    s.total = mem->items.size();
    s.active = static_cast<size_t>(std::count_if(mem->items.begin(), mem->items.end(),
        [](const MemoryItem& m) { return m.active; }));
    s.evicted = mem->evicted;
    return s;
}

std::vector<MemoryItem> HeuristicMemoryStore::list(const std::string& session_id) const {
    std::vector<MemoryItem> out;
    auto mem = find(session_id);
    if (!mem) return out;

    std::lock_guard<std::mutex> lock(mem->mutex);
    for (const auto& item : mem->items) {
        if (item.active) out.push_back(item);
    }
    return out;
}

std::string HeuristicMemoryStore::add(MemoryItem item) {
    if (item.session_id.empty()) {
        std::cerr << "[memory] Ignoring item without a session id\n";
        return {};
    }

    if (item.id.empty()) item.id = next_id(item.session_id, item.type);
    if (item.created_at == 0) item.created_at = epoch_seconds();
    if (item.keywords.empty()) item.keywords = extract_keywords(item.content);
    if (item.keywords.size() > kMaxKeywords) item.keywords.resize(kMaxKeywords);
    item.importance = clamp_importance(item.importance);
    item.active = true;
    item.score = 0;

    std::string id = item.id;
    std::string session_id = item.session_id;
    size_t evicted = 0;
    {
        auto mem = find_or_create(session_id);
        std::lock_guard<std::mutex> lock(mem->mutex);
        mem->items.push_back(std::move(item));
        evicted = evict_over_capacity(*mem);
    }
    report_eviction(session_id, evicted);
    return id;
}

std::string HeuristicMemoryStore::snapshot_export(const std::string& session_id) const {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& item : list(session_id)) {
        j.push_back(item_to_json(item));
    }
    return j.dump(2);
}

uint32_t HeuristicMemoryStore::snapshot_import(const std::string& json_str) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[memory] Snapshot import rejected: " << e.what() << "\n";
        return 0;
    }
    if (!j.is_array()) return 0;

    uint32_t imported = 0;
    for (const auto& entry : j) {
        MemoryItem item;
        try {
            item = item_from_json(entry);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[memory] Skipping malformed snapshot item: " << e.what() << "\n";
            continue;
        }
        if (item.session_id.empty() || trim(item.content).empty()) continue;

        // Skip ids already present in the session
        bool exists = false;
        if (!item.id.empty()) {
            if (auto mem = find(item.session_id)) {
                std::lock_guard<std::mutex> lock(mem->mutex);
                exists = std::any_of(mem->items.begin(), mem->items.end(),
                    [&item](const MemoryItem& m) { return m.id == item.id; });
            }
        }
        if (exists) continue;

        add(std::move(item));
        imported++;
    }
    return imported;
}

} // namespace parley
