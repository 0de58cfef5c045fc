#include "memory.hpp"
#include "config.hpp"
#include "memory/heuristic_memory.hpp"
#include <algorithm>
#include <sstream>

namespace parley {

std::string memory_type_to_string(MemoryType type) {
    switch (type) {
        case MemoryType::Preference:   return "preference";
        case MemoryType::Fact:         return "fact";
        case MemoryType::Relationship: return "relationship";
        case MemoryType::Event:        return "event";
    }
    return "event";
}

MemoryType memory_type_from_string(const std::string& s) {
    if (s == "preference")   return MemoryType::Preference;
    if (s == "fact")         return MemoryType::Fact;
    if (s == "relationship") return MemoryType::Relationship;
    return MemoryType::Event;
}

int clamp_importance(int importance) {
    return std::max(1, std::min(10, importance));
}

std::string build_memory_summary(const std::vector<MemoryItem>& items) {
    std::ostringstream ss;
    for (const auto& item : items) {
        ss << "- " << item.content << "\n";
    }
    return ss.str();
}

std::string memory_enrich(const RetrievalResult& result, const std::string& user_message) {
    if (result.summary_text.empty()) return user_message;

    std::ostringstream ss;
    ss << "[Memory context]\n"
       << result.summary_text
       << "[/Memory context]\n\n"
       << user_message;
    return ss.str();
}

std::unique_ptr<MemoryStore> create_memory(const Config& config) {
    return std::make_unique<HeuristicMemoryStore>(config.memory);
}

} // namespace parley
