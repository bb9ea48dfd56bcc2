#include "event_bus.hpp"

#include <iostream>
#include <stdexcept>

namespace fanrelay {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    auto& current = handlers_[tag];
    auto next = current ? std::make_shared<HandlerList>(*current)
                        : std::make_shared<HandlerList>();
    next->push_back(Subscription{id, std::move(handler)});
    current = std::move(next);
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [tag, list] : handlers_) {
        if (!list) continue;
        for (size_t i = 0; i < list->size(); ++i) {
            if ((*list)[i].id != id) continue;
            auto next = std::make_shared<HandlerList>(*list);
            next->erase(next->begin() + static_cast<std::ptrdiff_t>(i));
            list = std::move(next);
            return true;
        }
    }
    return false;
}

void EventBus::publish(const Event& event) const {
    std::shared_ptr<const HandlerList> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(event.type_tag);
        if (it == handlers_.end()) return;
        snapshot = it->second;
    }
    if (!snapshot) return;

    for (const auto& sub : *snapshot) {
        try {
            sub.handler(event);
        } catch (const std::exception& e) {
            std::cerr << "[events] " << event.type_tag << " handler failed: "
                      << e.what() << "\n";
        }
    }
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(tag);
    if (it == handlers_.end() || !it->second) return 0;
    return it->second->size();
}

} // namespace fanrelay
