#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace rumormill {

using EventHandler = std::function<void(const Event&)>;

// Synchronous publish/subscribe. Handlers run on the publishing thread,
// in registration order, with no bus lock held, so a handler may
// subscribe, unsubscribe or publish.
class EventBus {
public:
    // Returns a subscription ID.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    // Returns the number of handlers invoked.
    size_t publish(const Event& event);

    void clear();

    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Subscription>> handlers_;
    uint64_t next_id_ = 1;
};

// Type-safe subscribe helper: auto-casts Event& to the concrete type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

} // namespace rumormill
