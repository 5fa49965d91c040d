#include "retention.hpp"
#include "config.hpp"
#include "errors.hpp"
#include <iostream>
#include <stdexcept>

namespace engram {

RetentionPolicy RetentionPolicy::from_config(const RetentionConfig& config) {
    RetentionPolicy policy;
    // A zero ttl would expire every record on write; keep the default instead
    if (config.intervention_ttl > 0) {
        policy.intervention_ttl_ms = static_cast<uint64_t>(config.intervention_ttl) * 1000ULL;
    } else {
        std::cerr << "[config] retention.intervention_ttl must be positive, using default\n";
    }
    if (config.reflection_ttl > 0) {
        policy.reflection_ttl_ms = static_cast<uint64_t>(config.reflection_ttl) * 1000ULL;
    } else {
        std::cerr << "[config] retention.reflection_ttl must be positive, using default\n";
    }
    return policy;
}

RetentionManager::RetentionManager(PurgeFn purge, std::chrono::milliseconds interval)
    : purge_(std::move(purge)), interval_(interval) {
    if (!purge_) {
        throw std::invalid_argument("RetentionManager requires a purge function");
    }
    if (interval_.count() > 0) {
        thread_ = std::thread([this] { run(); });
    }
}

RetentionManager::~RetentionManager() {
    stop();
}

void RetentionManager::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

bool RetentionManager::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return thread_.joinable() && !stopping_;
}

uint64_t RetentionManager::sweeps_completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sweeps_;
}

uint32_t RetentionManager::sweep_now() {
    uint32_t removed = purge_();
    std::lock_guard<std::mutex> lock(mutex_);
    ++sweeps_;
    return removed;
}

void RetentionManager::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (cv_.wait_for(lock, interval_, [this] { return stopping_; })) break;

        lock.unlock();
        try {
            uint32_t removed = purge_();
            if (removed > 0) {
                std::cerr << "[retention] Swept " << removed << " expired records\n";
            }
        } catch (const StoreUnavailableError& e) {
            std::cerr << "[retention] Sweep skipped, store unavailable: " << e.what() << "\n";
        }
        lock.lock();
        ++sweeps_;
    }
}

} // namespace engram
