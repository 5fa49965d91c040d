#pragma once
#include "record.hpp"
#include "scheduler.hpp"
#include "clock.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace engram {

// Live state of one conversation: transcript, engagement counters, current
// task and the session's check-in timers. Destroying a session cancels its
// pending check-ins.
class Session {
public:
    Session(std::string id, std::string user_id, TimerQueue& timers,
            const Clock& clock = system_clock());

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& id() const { return id_; }
    const std::string& user_id() const { return user_id_; }
    uint64_t started_at() const { return started_at_; }

    void add_turn(const std::string& role, const std::string& content);
    Transcript transcript() const;

    // Bumps the interaction count and the last-interaction time.
    void record_interaction();
    void record_distraction();

    void start_task(const std::string& task, uint32_t steps = 1);
    // Advances the current task; clears it once every step is done.
    void complete_step();
    std::optional<std::string> current_task() const;

    uint32_t interaction_count() const;
    uint32_t distraction_count() const;
    uint32_t completed_steps() const;
    uint64_t last_interaction() const;

    // Fire `callback` after `delay` unless the session ends first. The
    // check-in time is updated just before the callback runs.
    TimerQueue::TimerId schedule_checkin(std::chrono::milliseconds delay,
                                         std::function<void()> callback);
    bool cancel_checkin(TimerQueue::TimerId id);
    size_t pending_checkins() const { return timers_.pending(); }

    std::optional<uint64_t> last_checkin() const;
    // Millis since the last check-in, or since the session started when no
    // check-in has fired yet.
    uint64_t time_since_last_checkin() const;

private:
    std::string id_;
    std::string user_id_;
    const Clock& clock_;
    uint64_t started_at_;

    mutable std::mutex mutex_;
    Transcript transcript_;
    uint32_t interaction_count_ = 0;
    uint32_t distraction_count_ = 0;
    uint64_t last_interaction_;
    std::optional<std::string> current_task_;
    uint32_t current_step_ = 0;
    uint32_t total_steps_ = 0;
    uint32_t completed_steps_ = 0;
    std::optional<uint64_t> last_checkin_;

    // Declared last: destroyed first, so in-flight check-ins finish while
    // the rest of the session is still alive.
    SessionTimers timers_;
};

class SessionManager {
public:
    SessionManager(TimerQueue& timers, const Clock& clock = system_clock());

    // Get or create a session. An existing session keeps its user.
    Session& get_session(const std::string& session_id, const std::string& user_id);

    std::shared_ptr<Session> find(const std::string& session_id) const;

    // Remove a session, returning it so the caller can close it out.
    std::shared_ptr<Session> remove_session(const std::string& session_id);

    // Evict sessions idle longer than max_idle_ms. Returns the evicted sessions.
    std::vector<std::shared_ptr<Session>> evict_idle(uint64_t max_idle_ms);

    std::vector<std::string> list_sessions() const;

private:
    TimerQueue& timers_;
    const Clock& clock_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    mutable std::mutex mutex_;
};

} // namespace engram
