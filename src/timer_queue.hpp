#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace fanrelay {

// Handle to a scheduled action. Cancelling is idempotent and wins against a
// timer that is due but not yet dispatched; an action that has already begun
// running is not interrupted.
class TimerHandle {
public:
    TimerHandle() = default;

    // Returns true if this call prevented the action from running.
    bool cancel() {
        if (!state_) return false;
        return !state_->done.exchange(true);
    }

    bool armed() const { return state_ && !state_->done.load(); }

private:
    friend class TimerQueue;
    struct State {
        std::atomic<bool> done{false};  // fired or cancelled
    };
    explicit TimerHandle(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

// Single background thread running delayed actions in deadline order.
class TimerQueue {
public:
    using Clock = std::chrono::steady_clock;
    using Action = std::function<void()>;

    TimerQueue();
    ~TimerQueue();

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    // Run action on the timer thread after delay. Actions scheduled after
    // stop() are dropped and the returned handle is already done.
    TimerHandle schedule(std::chrono::milliseconds delay, Action action);

    // Drop all pending actions and join the thread. Idempotent.
    void stop();

    size_t pending() const;

private:
    struct Entry {
        Clock::time_point deadline;
        uint64_t seq;
        std::shared_ptr<TimerHandle::State> state;
        Action action;
    };
    struct Later {
        bool operator()(const Entry& a, const Entry& b) const {
            if (a.deadline != b.deadline) return a.deadline > b.deadline;
            return a.seq > b.seq;
        }
    };

    void run();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::priority_queue<Entry, std::vector<Entry>, Later> queue_;
    uint64_t next_seq_ = 1;
    bool stopping_ = false;
    std::thread thread_;
};

} // namespace fanrelay
