#pragma once
#include "history.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>

namespace parley {

// JSON ↔ ChatMessage conversion for live and archived transcripts.
// Records are written as {timestamp, role, content} in that order.

inline nlohmann::ordered_json message_to_json(const ChatMessage& msg) {
    nlohmann::ordered_json record;
    record["timestamp"] = format_timestamp(msg.timestamp);
    record["role"] = msg.role;
    record["content"] = msg.content;
    return record;
}

// A record whose timestamp is missing or unparsable is stamped with `now`.
inline ChatMessage message_from_json(const nlohmann::json& record, uint64_t now) {
    ChatMessage msg;
    if (record.contains("role") && record["role"].is_string()) {
        msg.role = record["role"].get<std::string>();
    }
    if (record.contains("content") && record["content"].is_string()) {
        msg.content = record["content"].get<std::string>();
    }
    msg.timestamp = now;
    if (record.contains("timestamp") && record["timestamp"].is_string()) {
        uint64_t parsed = 0;
        if (parse_timestamp(record["timestamp"].get<std::string>(), parsed)) {
            msg.timestamp = parsed;
        }
    }
    return msg;
}

// Blank messages are not persisted.
inline std::string messages_to_json_text(const std::vector<ChatMessage>& messages) {
    nlohmann::ordered_json arr = nlohmann::ordered_json::array();
    for (const auto& msg : messages) {
        if (trim(msg.content).empty()) continue;
        arr.push_back(message_to_json(msg));
    }
    return arr.dump(2);
}

// Returns false when the text is not a JSON array.
inline bool messages_from_json_text(const std::string& text, uint64_t now,
                                    std::vector<ChatMessage>& out) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_array()) return false;

    out.clear();
    out.reserve(j.size());
    for (const auto& record : j) {
        if (!record.is_object()) continue;
        out.push_back(message_from_json(record, now));
    }
    return true;
}

} // namespace parley
