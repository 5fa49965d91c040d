#include "session.hpp"
#include "errors.hpp"

namespace engram {

// ── Session ─────────────────────────────────────────────────────

Session::Session(std::string id, std::string user_id, TimerQueue& timers, const Clock& clock)
    : id_(std::move(id))
    , user_id_(std::move(user_id))
    , clock_(clock)
    , started_at_(clock.now_millis())
    , last_interaction_(started_at_)
    , timers_(timers)
{
    validate_user_id(user_id_);
}

void Session::add_turn(const std::string& role, const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    transcript_.push_back(Turn{role, content});
}

Transcript Session::transcript() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transcript_;
}

void Session::record_interaction() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++interaction_count_;
    last_interaction_ = clock_.now_millis();
}

void Session::record_distraction() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++distraction_count_;
}

void Session::start_task(const std::string& task, uint32_t steps) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_task_ = task;
    current_step_ = 0;
    total_steps_ = steps == 0 ? 1 : steps;
}

void Session::complete_step() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_task_) return;
    ++completed_steps_;
    ++current_step_;
    if (current_step_ >= total_steps_) current_task_.reset();
}

std::optional<std::string> Session::current_task() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_task_;
}

uint32_t Session::interaction_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return interaction_count_;
}

uint32_t Session::distraction_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return distraction_count_;
}

uint32_t Session::completed_steps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_steps_;
}

uint64_t Session::last_interaction() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_interaction_;
}

TimerQueue::TimerId Session::schedule_checkin(std::chrono::milliseconds delay,
                                              std::function<void()> callback) {
    return timers_.schedule(delay, [this, cb = std::move(callback)]() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_checkin_ = clock_.now_millis();
        }
        if (cb) cb();
    });
}

bool Session::cancel_checkin(TimerQueue::TimerId id) {
    return timers_.cancel(id);
}

std::optional<uint64_t> Session::last_checkin() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_checkin_;
}

uint64_t Session::time_since_last_checkin() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t since = last_checkin_.value_or(started_at_);
    uint64_t now = clock_.now_millis();
    return now > since ? now - since : 0;
}

// ── SessionManager ──────────────────────────────────────────────

SessionManager::SessionManager(TimerQueue& timers, const Clock& clock)
    : timers_(timers), clock_(clock)
{}

Session& SessionManager::get_session(const std::string& session_id,
                                     const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        return *it->second;
    }

    auto session = std::make_shared<Session>(session_id, user_id, timers_, clock_);
    auto [inserted, _] = sessions_.emplace(session_id, std::move(session));
    return *inserted->second;
}

std::shared_ptr<Session> SessionManager::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return nullptr;
    return it->second;
}

std::shared_ptr<Session> SessionManager::remove_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return nullptr;
    auto session = std::move(it->second);
    sessions_.erase(it);
    return session;
}

std::vector<std::shared_ptr<Session>> SessionManager::evict_idle(uint64_t max_idle_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t now = clock_.now_millis();
    std::vector<std::shared_ptr<Session>> evicted;

    for (auto it = sessions_.begin(); it != sessions_.end(); ) {
        uint64_t last = it->second->last_interaction();
        if (now > last && (now - last) > max_idle_ms) {
            evicted.push_back(std::move(it->second));
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
    return evicted;
}

std::vector<std::string> SessionManager::list_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, _] : sessions_) ids.push_back(id);
    return ids;
}

} // namespace engram
