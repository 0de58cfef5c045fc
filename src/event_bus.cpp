#include "event_bus.hpp"
#include <algorithm>
#include <exception>
#include <iostream>

namespace parley {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    auto shared = std::make_shared<const EventHandler>(std::move(handler));
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    by_tag_[tag].push_back(Subscription{id, std::move(shared)});
    tag_of_.emplace(id, tag);
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto tag_it = tag_of_.find(id);
    if (tag_it == tag_of_.end()) return false;

    auto subs_it = by_tag_.find(tag_it->second);
    if (subs_it != by_tag_.end()) {
        auto& subs = subs_it->second;
        subs.erase(std::remove_if(subs.begin(), subs.end(),
                                  [id](const Subscription& s) { return s.id == id; }),
                   subs.end());
        if (subs.empty()) by_tag_.erase(subs_it);
    }
    tag_of_.erase(tag_it);
    return true;
}

size_t EventBus::publish(const Event& event) {
    std::vector<HandlerPtr> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = by_tag_.find(event.type_tag);
        if (it == by_tag_.end()) return 0;
        targets.reserve(it->second.size());
        for (const auto& sub : it->second) targets.push_back(sub.handler);
    }

    size_t delivered = 0;
    for (const auto& handler : targets) {
        try {
            (*handler)(event);
            ++delivered;
        } catch (const std::exception& e) {
            failed_.fetch_add(1);
            std::cerr << "[events] " << event.type_tag << " handler failed: "
                      << e.what() << "\n";
        }
    }
    return delivered;
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_tag_.find(tag);
    return it == by_tag_.end() ? 0 : it->second.size();
}

} // namespace parley
