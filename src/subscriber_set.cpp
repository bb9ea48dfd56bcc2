#include "subscriber_set.hpp"

#include <algorithm>

namespace fanrelay {

size_t SubscriberSet::add(SinkPtr sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(sinks_.begin(), sinks_.end(), sink) == sinks_.end())
        sinks_.push_back(std::move(sink));
    return sinks_.size();
}

size_t SubscriberSet::remove(const SinkPtr& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(sinks_.begin(), sinks_.end(), sink);
    if (it != sinks_.end()) sinks_.erase(it);
    return sinks_.size();
}

size_t SubscriberSet::broadcast(const std::string& chunk) {
    std::vector<SinkPtr> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = sinks_;
    }

    size_t delivered = 0;
    std::vector<SinkPtr> failed;
    for (const auto& sink : snapshot) {
        if (sink->is_open() && sink->send_binary(chunk)) {
            ++delivered;
        } else {
            failed.push_back(sink);
        }
    }

    if (!failed.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& sink : failed) {
            auto it = std::find(sinks_.begin(), sinks_.end(), sink);
            if (it != sinks_.end()) sinks_.erase(it);
        }
    }
    return delivered;
}

std::vector<SubscriberSet::SinkPtr> SubscriberSet::detach_all() {
    std::vector<SinkPtr> detached;
    std::lock_guard<std::mutex> lock(mutex_);
    detached.swap(sinks_);
    return detached;
}

void SubscriberSet::close_all(uint16_t code, const std::string& reason) {
    for (const auto& sink : detach_all()) {
        sink->close(code, reason);
    }
}

size_t SubscriberSet::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_.size();
}

bool SubscriberSet::contains(const SinkPtr& sink) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::find(sinks_.begin(), sinks_.end(), sink) != sinks_.end();
}

} // namespace fanrelay
