#pragma once
#include "event.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace parley {

using EventHandler = std::function<void(const Event&)>;

// Synchronous in-process pub/sub for lifecycle events. Components hold a
// non-owning pointer; the engine owns the bus and outlives them.
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // Register a handler for one tag. Ids start at 1 and are never reused.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Returns false for an unknown or already removed id.
    bool unsubscribe(uint64_t id);

    // Deliver on the calling thread in subscription order. Handlers run
    // without the bus lock, so they may publish, subscribe or unsubscribe.
    // A handler that throws is logged and skipped. Returns the number of
    // handlers that completed.
    size_t publish(const Event& event);

    size_t subscriber_count(const std::string& tag) const;

    // Handler invocations that threw since construction
    uint64_t failed_deliveries() const { return failed_.load(); }

private:
    using HandlerPtr = std::shared_ptr<const EventHandler>;

    struct Subscription {
        uint64_t id;
        HandlerPtr handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Subscription>> by_tag_;
    std::unordered_map<uint64_t, std::string> tag_of_;
    uint64_t next_id_ = 1;
    std::atomic<uint64_t> failed_{0};
};

// Typed subscribe: the handler receives the concrete event struct.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

} // namespace parley
