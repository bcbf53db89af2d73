#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace streamgate {

using EventHandler = std::function<void(const Event&)>;

// Synchronous observer hub. Publishing happens on the publisher's thread
// (an approval waiter, a session creator, the converter's context).
class EventBus {
public:
    // Subscribe to events with a given tag. Returns a subscription ID.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Subscribe to every tag (diagnostic observers). Returns a subscription ID.
    uint64_t subscribe_all(EventHandler handler);

    // Unsubscribe by ID. Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    // Publish an event synchronously. Tag handlers run in registration
    // order, then catch-all handlers. The mutex is released before calling
    // handlers; a throwing handler is logged and skipped.
    void publish(const Event& event);

    // Remove all subscriptions.
    void clear();

    // Number of subscriptions for a given tag (0 if none).
    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Subscription>> handlers_;
    std::vector<Subscription> catch_all_;
    uint64_t next_id_ = 1;
};

// Type-safe subscribe helper: auto-casts Event& to the concrete type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

// Publish only when a bus is attached.
inline void publish_if(EventBus* bus, const Event& event) {
    if (bus) bus->publish(event);
}

} // namespace streamgate
