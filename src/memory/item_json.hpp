#pragma once
#include "../memory.hpp"
#include <nlohmann/json.hpp>

namespace parley {

// JSON ↔ MemoryItem conversion used by snapshot export/import.

inline MemoryItem item_from_json(const nlohmann::json& item) {
    MemoryItem m;
    m.id = item.value("id", "");
    m.session_id = item.value("session_id", "");
    m.content = item.value("content", "");
    m.type = memory_type_from_string(item.value("type", "event"));
    m.importance = clamp_importance(item.value("importance", 5));
    m.created_at = item.value("created_at", uint64_t{0});
    m.access_count = item.value("access_count", uint32_t{0});
    if (item.contains("last_used_at") && item["last_used_at"].is_number_unsigned()) {
        m.last_used_at = item["last_used_at"].get<uint64_t>();
    }
    if (item.contains("keywords") && item["keywords"].is_array()) {
        for (const auto& kw : item["keywords"]) {
            if (kw.is_string()) m.keywords.push_back(kw.get<std::string>());
        }
    }
    return m;
}

inline nlohmann::json item_to_json(const MemoryItem& m) {
    nlohmann::json item = {
        {"id", m.id},
        {"session_id", m.session_id},
        {"content", m.content},
        {"type", memory_type_to_string(m.type)},
        {"importance", m.importance},
        {"keywords", m.keywords},
        {"created_at", m.created_at},
        {"access_count", m.access_count}
    };
    if (m.last_used_at) {
        item["last_used_at"] = *m.last_used_at;
    }
    return item;
}

} // namespace parley
