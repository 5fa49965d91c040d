#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_set>
#include <vector>

namespace engram {

// Single-threaded timer service over a min-heap of deadlines.
//
// Callbacks run on the queue's own thread, one at a time, once their
// deadline passes. A callback whose deadline passes while the queue runs is
// always fired unless cancelled first. Timers still pending at stop() are
// dropped.
class TimerQueue {
public:
    using TimerId = uint64_t;
    using Callback = std::function<void()>;
    using TimePoint = std::chrono::steady_clock::time_point;

    TimerQueue();
    ~TimerQueue();

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    TimerId schedule_at(TimePoint when, Callback callback);
    TimerId schedule_after(std::chrono::milliseconds delay, Callback callback);

    // Cancel a pending timer. Returns true if it had not fired yet. When the
    // callback is running right now on another thread, waits for it to
    // finish and returns false.
    bool cancel(TimerId id);

    size_t pending() const;

    // Stop the worker thread. Idempotent.
    void stop();

private:
    struct Entry {
        TimePoint when;
        TimerId id;
        Callback callback;
    };
    struct Later {
        bool operator()(const Entry& a, const Entry& b) const {
            if (a.when != b.when) return a.when > b.when;
            return a.id > b.id;
        }
    };

    void run();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable done_cv_;
    std::priority_queue<Entry, std::vector<Entry>, Later> heap_;
    std::unordered_set<TimerId> active_;
    TimerId next_id_ = 1;
    TimerId running_id_ = 0;
    bool stopping_ = false;
    std::thread thread_;
};

// Timers owned by one session. Destruction cancels everything still pending
// and waits for a callback that is mid-flight, so callbacks may safely
// capture the owner.
class SessionTimers {
public:
    explicit SessionTimers(TimerQueue& queue);
    ~SessionTimers();

    SessionTimers(const SessionTimers&) = delete;
    SessionTimers& operator=(const SessionTimers&) = delete;

    TimerQueue::TimerId schedule(std::chrono::milliseconds delay, TimerQueue::Callback callback);

    bool cancel(TimerQueue::TimerId id);
    void cancel_all();

    size_t pending() const;

private:
    struct Owned {
        std::mutex mutex;
        std::unordered_set<TimerQueue::TimerId> ids;
    };

    TimerQueue& queue_;
    std::shared_ptr<Owned> owned_;
};

} // namespace engram
