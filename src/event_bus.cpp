#include "event_bus.hpp"
#include <algorithm>

namespace cordbridge {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    uint64_t id = next_id_++;
    auto& current = lists_[tag];
    auto next = current ? std::make_shared<HandlerList>(*current)
                        : std::make_shared<HandlerList>();
    next->push_back(Subscription{id, std::move(handler)});
    current = std::move(next);
    tag_of_[id] = tag;
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    auto tag = tag_of_.find(id);
    if (tag == tag_of_.end()) return false;

    auto list = lists_.find(tag->second);
    tag_of_.erase(tag);
    if (list == lists_.end() || !list->second) return false;

    auto next = std::make_shared<HandlerList>(*list->second);
    next->erase(std::remove_if(next->begin(), next->end(),
                               [id](const Subscription& s) { return s.id == id; }),
                next->end());
    if (next->empty()) {
        lists_.erase(list);
    } else {
        list->second = std::move(next);
    }
    return true;
}

void EventBus::publish(const Event& event) {
    auto it = lists_.find(event.type_tag);
    if (it == lists_.end()) return;
    std::shared_ptr<const HandlerList> snapshot = it->second;
    for (const auto& sub : *snapshot) {
        sub.handler(event);
    }
}

} // namespace cordbridge
