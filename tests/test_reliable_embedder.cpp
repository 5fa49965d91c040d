#include <catch2/catch_test_macros.hpp>
#include "embedders/reliable_embedder.hpp"
#include "errors.hpp"
#include <stdexcept>
#include <vector>

using namespace engram;
using namespace std::chrono_literals;

// ── Mock embedder for testing retry logic ────────────────────────

class FlakyEmbedder : public Embedder {
public:
    int fail_count;     // how many calls should throw before succeeding
    int call_count = 0;

    explicit FlakyEmbedder(int fail_count) : fail_count(fail_count) {}

    Embedding embed(const std::string&, Deadline) override {
        call_count++;
        if (call_count <= fail_count) {
            throw EmbeddingError("flaky failed attempt " + std::to_string(call_count));
        }
        return {1.0f, 0.0f};
    }

    uint32_t dimensions() const override { return 2; }
    std::string embedder_name() const override { return "flaky"; }
};

class TimeoutEmbedder : public Embedder {
public:
    int call_count = 0;
    Embedding embed(const std::string&, Deadline) override {
        call_count++;
        throw DeadlineExceededError("upstream deadline");
    }
    uint32_t dimensions() const override { return 2; }
    std::string embedder_name() const override { return "timeout"; }
};

struct SleepRecorder {
    std::vector<std::chrono::milliseconds> sleeps;
    ReliableEmbedder::SleepFn fn() {
        return [this](std::chrono::milliseconds d) { sleeps.push_back(d); };
    }
};

static Deadline far() { return deadline_after(60s); }

// ── Constructor ──────────────────────────────────────────────────

TEST_CASE("ReliableEmbedder: requires an inner embedder", "[reliable]") {
    REQUIRE_THROWS_AS(ReliableEmbedder(nullptr), std::invalid_argument);
}

TEST_CASE("ReliableEmbedder: forwards name and dimensions", "[reliable]") {
    ReliableEmbedder r(std::make_unique<FlakyEmbedder>(0));
    REQUIRE(r.embedder_name() == "flaky");
    REQUIRE(r.dimensions() == 2);
}

// ── Retry behavior ───────────────────────────────────────────────

TEST_CASE("ReliableEmbedder: succeeds on first try without sleeping", "[reliable]") {
    auto inner = std::make_unique<FlakyEmbedder>(0);
    auto* raw = inner.get();
    SleepRecorder rec;
    ReliableEmbedder r(std::move(inner), {}, rec.fn());

    auto v = r.embed("x", far());
    REQUIRE(v.size() == 2);
    REQUIRE(raw->call_count == 1);
    REQUIRE(rec.sleeps.empty());
}

TEST_CASE("ReliableEmbedder: recovers after transient failures", "[reliable]") {
    auto inner = std::make_unique<FlakyEmbedder>(2);
    auto* raw = inner.get();
    SleepRecorder rec;
    ReliableEmbedder r(std::move(inner), {}, rec.fn());

    auto v = r.embed("x", far());
    REQUIRE(v.size() == 2);
    REQUIRE(raw->call_count == 3);
    REQUIRE(rec.sleeps.size() == 2);
}

TEST_CASE("ReliableEmbedder: gives up after max attempts", "[reliable]") {
    auto inner = std::make_unique<FlakyEmbedder>(10);
    auto* raw = inner.get();
    SleepRecorder rec;
    ReliableEmbedder r(std::move(inner), {}, rec.fn());

    REQUIRE_THROWS_AS(r.embed("x", far()), EmbeddingError);
    REQUIRE(raw->call_count == 3);
    REQUIRE(rec.sleeps.size() == 2);
}

TEST_CASE("ReliableEmbedder: deadline errors are not retried", "[reliable]") {
    auto inner = std::make_unique<TimeoutEmbedder>();
    auto* raw = inner.get();
    SleepRecorder rec;
    ReliableEmbedder r(std::move(inner), {}, rec.fn());

    REQUIRE_THROWS_AS(r.embed("x", far()), DeadlineExceededError);
    REQUIRE(raw->call_count == 1);
    REQUIRE(rec.sleeps.empty());
}

TEST_CASE("ReliableEmbedder: never sleeps past the deadline", "[reliable]") {
    auto inner = std::make_unique<FlakyEmbedder>(10);
    auto* raw = inner.get();
    SleepRecorder rec;
    BackoffPolicy policy;
    policy.initial_delay = 1000ms;
    ReliableEmbedder r(std::move(inner), policy, rec.fn());

    // 200ms budget cannot cover a 500-1000ms backoff
    REQUIRE_THROWS_AS(r.embed("x", deadline_after(200ms)), DeadlineExceededError);
    REQUIRE(raw->call_count == 1);
    REQUIRE(rec.sleeps.empty());
}

TEST_CASE("ReliableEmbedder: expired deadline makes no call", "[reliable]") {
    auto inner = std::make_unique<FlakyEmbedder>(0);
    auto* raw = inner.get();
    ReliableEmbedder r(std::move(inner), {}, [](std::chrono::milliseconds) {});
    REQUIRE_THROWS_AS(r.embed("x", std::chrono::steady_clock::now() - 1ms),
                      DeadlineExceededError);
    REQUIRE(raw->call_count == 0);
}

// ── Backoff schedule ─────────────────────────────────────────────

TEST_CASE("backoff_delay: doubles from initial and caps at max", "[reliable]") {
    BackoffPolicy p;
    REQUIRE(backoff_delay(p, 1) == 100ms);
    REQUIRE(backoff_delay(p, 2) == 200ms);
    REQUIRE(backoff_delay(p, 3) == 400ms);
    REQUIRE(backoff_delay(p, 5) == 1600ms);
    REQUIRE(backoff_delay(p, 6) == 2000ms);
    REQUIRE(backoff_delay(p, 20) == 2000ms);
}

TEST_CASE("ReliableEmbedder: jittered sleeps stay within [0.5, 1.0] of the schedule", "[reliable]") {
    BackoffPolicy policy;
    policy.max_attempts = 6;
    for (int trial = 0; trial < 20; ++trial) {
        SleepRecorder rec;
        ReliableEmbedder r(std::make_unique<FlakyEmbedder>(10), policy, rec.fn());
        REQUIRE_THROWS_AS(r.embed("x", far()), EmbeddingError);
        REQUIRE(rec.sleeps.size() == 5);
        for (size_t i = 0; i < rec.sleeps.size(); ++i) {
            auto base = backoff_delay(policy, static_cast<uint32_t>(i + 1));
            REQUIRE(rec.sleeps[i].count() >= base.count() / 2);
            REQUIRE(rec.sleeps[i].count() <= base.count());
        }
    }
}
