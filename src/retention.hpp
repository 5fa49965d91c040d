#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace engram {

struct RetentionConfig; // forward declare

// Default lifetimes applied to records written without an explicit ttl.
struct RetentionPolicy {
    uint64_t intervention_ttl_ms = 30 * 86400ULL * 1000ULL;
    uint64_t reflection_ttl_ms = 90 * 86400ULL * 1000ULL;

    static RetentionPolicy from_config(const RetentionConfig& config);
};

// Periodic physical cleanup of expired records.
//
// Reads never depend on the sweep: every read path filters by expiry on its
// own, so a sweep only reclaims space. The sweep thread starts in the
// constructor when the interval is non-zero and is stopped and joined by
// stop() or the destructor.
class RetentionManager {
public:
    using PurgeFn = std::function<uint32_t()>;

    RetentionManager(PurgeFn purge, std::chrono::milliseconds interval);
    ~RetentionManager();

    RetentionManager(const RetentionManager&) = delete;
    RetentionManager& operator=(const RetentionManager&) = delete;

    // Run one sweep on the calling thread. Returns records removed.
    uint32_t sweep_now();

    void stop();

    bool running() const;
    uint64_t sweeps_completed() const;

private:
    void run();

    PurgeFn purge_;
    std::chrono::milliseconds interval_;
    std::thread thread_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
    uint64_t sweeps_ = 0;
};

} // namespace engram
