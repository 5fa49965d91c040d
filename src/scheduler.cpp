#include "scheduler.hpp"
#include <iostream>
#include <stdexcept>

namespace engram {

// ── TimerQueue ──────────────────────────────────────────────────

TimerQueue::TimerQueue() {
    thread_ = std::thread([this] { run(); });
}

TimerQueue::~TimerQueue() {
    stop();
}

TimerQueue::TimerId TimerQueue::schedule_at(TimePoint when, Callback callback) {
    if (!callback) {
        throw std::invalid_argument("TimerQueue: empty callback");
    }
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::logic_error("TimerQueue: schedule after stop");
        }
        id = next_id_++;
        heap_.push(Entry{when, id, std::move(callback)});
        active_.insert(id);
    }
    cv_.notify_all();
    return id;
}

TimerQueue::TimerId TimerQueue::schedule_after(std::chrono::milliseconds delay,
                                               Callback callback) {
    return schedule_at(std::chrono::steady_clock::now() + delay, std::move(callback));
}

bool TimerQueue::cancel(TimerId id) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (active_.erase(id) > 0) return true;
    if (running_id_ == id && std::this_thread::get_id() != thread_.get_id()) {
        done_cv_.wait(lock, [this, id] { return running_id_ != id; });
    }
    return false;
}

size_t TimerQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

void TimerQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable() && std::this_thread::get_id() != thread_.get_id()) {
        thread_.join();
    }
}

void TimerQueue::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (heap_.empty()) {
            cv_.wait(lock, [this] { return stopping_ || !heap_.empty(); });
            continue;
        }

        auto when = heap_.top().when;
        if (std::chrono::steady_clock::now() < when) {
            // Woken early by a new, possibly earlier, timer or by stop()
            cv_.wait_until(lock, when);
            continue;
        }

        Entry entry = heap_.top();
        heap_.pop();
        if (active_.erase(entry.id) == 0) continue; // cancelled

        running_id_ = entry.id;
        lock.unlock();
        try {
            entry.callback();
        } catch (const std::exception& e) {
            std::cerr << "[timers] Timer " << entry.id << " callback threw: " << e.what() << "\n";
        }
        lock.lock();
        running_id_ = 0;
        done_cv_.notify_all();
    }
    active_.clear();
}

// ── SessionTimers ───────────────────────────────────────────────

SessionTimers::SessionTimers(TimerQueue& queue)
    : queue_(queue), owned_(std::make_shared<Owned>()) {}

SessionTimers::~SessionTimers() {
    cancel_all();
}

TimerQueue::TimerId SessionTimers::schedule(std::chrono::milliseconds delay,
                                            TimerQueue::Callback callback) {
    // Hold the lock across scheduling so a zero-delay timer cannot fire and
    // try to forget its id before it has been recorded.
    std::lock_guard<std::mutex> lock(owned_->mutex);
    std::weak_ptr<Owned> weak = owned_;
    auto id_holder = std::make_shared<TimerQueue::TimerId>(0);
    auto id = queue_.schedule_after(delay, [weak, id_holder, cb = std::move(callback)]() {
        // The id stays owned until the callback returns, so a concurrent
        // cancel_all() waits for it instead of racing it.
        struct Forget {
            std::weak_ptr<Owned> weak;
            TimerQueue::TimerId id;
            ~Forget() {
                if (auto owned = weak.lock()) {
                    std::lock_guard<std::mutex> guard(owned->mutex);
                    owned->ids.erase(id);
                }
            }
        } forget{weak, 0};
        if (auto owned = weak.lock()) {
            std::lock_guard<std::mutex> guard(owned->mutex);
            forget.id = *id_holder;
        }
        cb();
    });
    *id_holder = id;
    owned_->ids.insert(id);
    return id;
}

bool SessionTimers::cancel(TimerQueue::TimerId id) {
    {
        std::lock_guard<std::mutex> lock(owned_->mutex);
        if (owned_->ids.erase(id) == 0) return false;
    }
    return queue_.cancel(id);
}

void SessionTimers::cancel_all() {
    std::unordered_set<TimerQueue::TimerId> ids;
    {
        std::lock_guard<std::mutex> lock(owned_->mutex);
        ids.swap(owned_->ids);
    }
    for (auto id : ids) queue_.cancel(id);
}

size_t SessionTimers::pending() const {
    std::lock_guard<std::mutex> lock(owned_->mutex);
    return owned_->ids.size();
}

} // namespace engram
