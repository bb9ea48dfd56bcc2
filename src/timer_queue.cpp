#include "timer_queue.hpp"

#include <iostream>
#include <stdexcept>

namespace fanrelay {

TimerQueue::TimerQueue()
    : thread_([this]() { run(); })
{}

TimerQueue::~TimerQueue() {
    stop();
}

TimerHandle TimerQueue::schedule(std::chrono::milliseconds delay, Action action) {
    auto state = std::make_shared<TimerHandle::State>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            state->done.store(true);
            return TimerHandle(state);
        }
        queue_.push(Entry{Clock::now() + delay, next_seq_++, state, std::move(action)});
    }
    cv_.notify_one();
    return TimerHandle(state);
}

void TimerQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !thread_.joinable()) return;
        stopping_ = true;
        while (!queue_.empty()) {
            queue_.top().state->done.store(true);
            queue_.pop();
        }
    }
    cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
        thread_.join();
}

size_t TimerQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void TimerQueue::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (queue_.empty()) {
            cv_.wait(lock);
            continue;
        }
        auto deadline = queue_.top().deadline;
        if (Clock::now() < deadline) {
            cv_.wait_until(lock, deadline);
            continue;
        }

        Entry entry = queue_.top();
        queue_.pop();

        // Claim the entry; a concurrent cancel() may already have.
        if (entry.state->done.exchange(true)) continue;

        lock.unlock();
        try {
            entry.action();
        } catch (const std::exception& e) {
            std::cerr << "[timer] scheduled action failed: " << e.what() << "\n";
        }
        lock.lock();
    }
}

} // namespace fanrelay
