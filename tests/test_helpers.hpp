#pragma once
#include "clock.hpp"
#include "embedder.hpp"
#include "errors.hpp"
#include "text_generator.hpp"
#include "store/in_memory_store.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>

namespace engram {

// Clock that only moves when told to.
class ManualClock : public Clock {
public:
    explicit ManualClock(uint64_t start = 1700000000000ULL) : now_(start) {}

    uint64_t now_millis() const override { return now_.load(); }

    void advance(uint64_t millis) { now_ += millis; }
    void advance_seconds(uint64_t secs) { now_ += secs * 1000ULL; }
    void set(uint64_t millis) { now_ = millis; }

private:
    std::atomic<uint64_t> now_;
};

// Unit vector along `axis`, optionally tilted toward axis+1 by `tilt`.
inline Embedding axis_vector(uint32_t dims, uint32_t axis, float tilt = 0.0f) {
    Embedding v(dims, 0.0f);
    v[axis % dims] = 1.0f;
    if (tilt != 0.0f) v[(axis + 1) % dims] = tilt;
    return v;
}

// Deterministic embedder: texts registered with set() map to fixed vectors,
// anything else maps to a vector derived from its length.
class FakeEmbedder : public Embedder {
public:
    explicit FakeEmbedder(uint32_t dims = 4) : dims_(dims) {}

    void set(const std::string& text, Embedding v) {
        std::lock_guard<std::mutex> lock(mutex_);
        fixed_[text] = std::move(v);
    }

    // Throw EmbeddingError on the next `n` calls
    void fail_next(int n) { failures_ = n; }
    // Throw a plain std::runtime_error on the next `n` calls
    void crash_next(int n) { crashes_ = n; }
    void set_delay(std::chrono::milliseconds d) { delay_ = d; }

    Embedding embed(const std::string& text, Deadline deadline) override {
        calls++;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_text = text;
        }
        if (delay_.count() > 0) std::this_thread::sleep_for(delay_);
        check_deadline(deadline, "fake embed");
        if (failures_ > 0) {
            --failures_;
            throw EmbeddingError("fake embedder failure");
        }
        if (crashes_ > 0) {
            --crashes_;
            throw std::runtime_error("socket reset");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = fixed_.find(text);
        if (it != fixed_.end()) return it->second;
        return axis_vector(dims_, static_cast<uint32_t>(text.size()));
    }

    uint32_t dimensions() const override { return dims_; }
    std::string embedder_name() const override { return "fake"; }

    std::atomic<int> calls{0};
    std::string last_text;

private:
    uint32_t dims_;
    std::atomic<int> failures_{0};
    std::atomic<int> crashes_{0};
    std::chrono::milliseconds delay_{0};
    std::mutex mutex_;
    std::unordered_map<std::string, Embedding> fixed_;
};

class FakeGenerator : public TextGenerator {
public:
    std::string response = "User responds well to short, concrete next steps.";
    bool fail = false;
    bool crash = false;
    int calls = 0;
    std::string last_prompt;

    std::string generate(const std::string& prompt, Deadline deadline) override {
        calls++;
        last_prompt = prompt;
        check_deadline(deadline, "fake generate");
        if (fail) throw GenerationError("fake generator failure");
        if (crash) throw std::runtime_error("unexpected reply shape");
        return response;
    }

    std::string generator_name() const override { return "fake"; }
};

// Backend whose every operation fails as if the durable store were down.
class UnavailableStore : public StoreBackend {
public:
    std::string backend_name() const override { return "unavailable"; }
    void put_intervention(const Intervention&) override { down(); }
    void put_reflection(const Reflection&) override { down(); }
    std::vector<Intervention> scan_interventions(const std::string&, uint64_t,
                                                 const std::vector<Outcome>&) override { down(); return {}; }
    uint32_t count_interventions(const std::string&, uint64_t) override { down(); return 0; }
    std::vector<Reflection> recent_reflections(const std::string&, uint64_t,
                                               uint32_t) override { down(); return {}; }
    uint32_t count_reflections(const std::string&, uint64_t) override { down(); return 0; }
    uint32_t purge_expired(uint64_t) override { down(); return 0; }
    uint32_t delete_user(const std::string&) override { down(); return 0; }
    void ping() override { down(); }

private:
    [[noreturn]] static void down() { throw StoreUnavailableError("connection refused"); }
};

// In-memory backend with an artificial read latency.
class SlowStore : public InMemoryStore {
public:
    explicit SlowStore(std::chrono::milliseconds delay) : delay_(delay) {}

    std::vector<Reflection> recent_reflections(const std::string& user_id, uint64_t now,
                                               uint32_t limit) override {
        std::this_thread::sleep_for(delay_);
        return InMemoryStore::recent_reflections(user_id, now, limit);
    }

private:
    std::chrono::milliseconds delay_;
};

// In-memory backend whose reads fail with a non-engram exception.
class CrashingStore : public InMemoryStore {
public:
    std::vector<Reflection> recent_reflections(const std::string&, uint64_t,
                                               uint32_t) override {
        throw std::runtime_error("corrupt row");
    }
};

// Backend whose writes block until released. Lets tests hold writes in flight.
class GatedStore : public InMemoryStore {
public:
    void put_intervention(const Intervention& record) override {
        {
            std::unique_lock<std::mutex> lock(gate_mutex_);
            gate_cv_.wait(lock, [this] { return open_; });
        }
        InMemoryStore::put_intervention(record);
    }

    void open() {
        {
            std::lock_guard<std::mutex> lock(gate_mutex_);
            open_ = true;
        }
        gate_cv_.notify_all();
    }

private:
    std::mutex gate_mutex_;
    std::condition_variable gate_cv_;
    bool open_ = false;
};

} // namespace engram
