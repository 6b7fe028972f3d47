#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <cstdint>

namespace cordbridge {

using EventHandler = std::function<void(const Event&)>;

// In-process bus living on the event loop thread. Handlers for one tag run
// in subscription order against the list as it stood when publish() began,
// so a handler may publish, subscribe or unsubscribe freely.
class EventBus {
public:
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // False if the id is unknown or already removed.
    bool unsubscribe(uint64_t id);

    void publish(const Event& event);

private:
    struct Subscription {
        uint64_t id;
        EventHandler handler;
    };
    using HandlerList = std::vector<Subscription>;

    // Lists are replaced, never edited in place; publish() holds a reference.
    std::unordered_map<std::string, std::shared_ptr<const HandlerList>> lists_;
    std::unordered_map<uint64_t, std::string> tag_of_;
    uint64_t next_id_ = 1;
};

// Subscribe with the concrete event type; E must carry a TAG.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

} // namespace cordbridge
