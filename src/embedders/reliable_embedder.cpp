#include "reliable_embedder.hpp"
#include "../errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace engram {

std::chrono::milliseconds backoff_delay(const BackoffPolicy& policy, uint32_t attempt) {
    if (attempt == 0) return std::chrono::milliseconds(0);
    double ms = static_cast<double>(policy.initial_delay.count()) *
                std::pow(policy.multiplier, static_cast<double>(attempt - 1));
    double cap = static_cast<double>(policy.max_delay.count());
    return std::chrono::milliseconds(static_cast<long long>(std::min(ms, cap)));
}

ReliableEmbedder::ReliableEmbedder(std::unique_ptr<Embedder> inner,
                                   BackoffPolicy policy, SleepFn sleep)
    : inner_(std::move(inner)), policy_(policy), sleep_(std::move(sleep)) {
    if (!inner_) {
        throw std::invalid_argument("ReliableEmbedder requires an embedder");
    }
    if (policy_.max_attempts == 0) policy_.max_attempts = 1;
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

std::chrono::milliseconds ReliableEmbedder::jittered(std::chrono::milliseconds delay) {
    double lo = std::clamp(policy_.min_jitter, 0.0, 1.0);
    std::uniform_real_distribution<double> dist(lo, 1.0);
    double factor;
    {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        factor = dist(rng_);
    }
    return std::chrono::milliseconds(
        static_cast<long long>(static_cast<double>(delay.count()) * factor));
}

Embedding ReliableEmbedder::embed(const std::string& text, Deadline deadline) {
    std::string last_error;
    for (uint32_t attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
        check_deadline(deadline, inner_->embedder_name() + " embed");
        try {
            return inner_->embed(text, deadline);
        } catch (const EmbeddingError& e) {
            last_error = e.what();
            std::cerr << "[embedder] " << inner_->embedder_name()
                      << " attempt " << attempt << "/" << policy_.max_attempts
                      << " failed: " << last_error << '\n';
        }
        if (attempt == policy_.max_attempts) break;

        auto delay = jittered(backoff_delay(policy_, attempt));
        auto left = std::chrono::milliseconds(millis_remaining(deadline));
        if (delay >= left) {
            throw DeadlineExceededError(inner_->embedder_name() +
                                        " embed: deadline exceeded before retry " +
                                        std::to_string(attempt + 1));
        }
        sleep_(delay);
    }
    throw EmbeddingError("embedding failed after " + std::to_string(policy_.max_attempts) +
                         " attempts. Last error: " + last_error);
}

} // namespace engram
