#pragma once
#include "../embedder.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <random>

namespace engram {

struct BackoffPolicy {
    uint32_t max_attempts = 3;
    std::chrono::milliseconds initial_delay{100};
    std::chrono::milliseconds max_delay{2000};
    double multiplier = 2.0;
    double min_jitter = 0.5; // each delay is scaled by a factor in [min_jitter, 1.0]
};

// Un-jittered delay before retry number `attempt` (1-based: the delay that
// follows the first failure is attempt 1).
std::chrono::milliseconds backoff_delay(const BackoffPolicy& policy, uint32_t attempt);

// Wraps an embedder with bounded, jittered exponential-backoff retries.
// EmbeddingError triggers a retry; DeadlineExceededError is surfaced
// immediately. Never sleeps past the deadline.
class ReliableEmbedder : public Embedder {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    explicit ReliableEmbedder(std::unique_ptr<Embedder> inner,
                              BackoffPolicy policy = {},
                              SleepFn sleep = {});

    Embedding embed(const std::string& text, Deadline deadline) override;
    uint32_t dimensions() const override { return inner_->dimensions(); }
    std::string embedder_name() const override { return inner_->embedder_name(); }

private:
    std::chrono::milliseconds jittered(std::chrono::milliseconds delay);

    std::unique_ptr<Embedder> inner_;
    BackoffPolicy policy_;
    SleepFn sleep_;
    std::mutex rng_mutex_;
    std::mt19937 rng_{std::random_device{}()};
};

} // namespace engram
