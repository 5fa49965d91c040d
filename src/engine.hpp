#pragma once
#include "memory_store.hpp"
#include "context_assembler.hpp"
#include "reflection.hpp"
#include "retention.hpp"
#include "embedder.hpp"
#include "text_generator.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace engram {

class EventBus;   // forward declare
class HttpClient; // forward declare
struct Config;    // forward declare

struct EngineOptions {
    StoreOptions store;
    ContextOptions context;
    ReflectionOptions reflection;
    std::chrono::milliseconds context_timeout{2000};
    std::chrono::milliseconds grace_period{5000};
    std::chrono::milliseconds embed_timeout{5000};
    std::chrono::milliseconds generate_timeout{15000};
    std::chrono::milliseconds sweep_interval{300000}; // 0 = no background sweep

    static EngineOptions from_config(const Config& config);
};

struct HealthReport {
    bool store_ok = false;
    std::string backend;
    double store_latency_ms = 0.0;
    std::string store_error;
    std::string embedder;  // empty = embeddings disabled
    std::string generator; // empty = reflections disabled
    uint32_t dimensions = 0;
};

// Per-user memory engine: the surface session handlers talk to.
//
// Only input validation throws (ValidationError, synchronously). Embedding,
// generation, timeout and store failures degrade the operation to an empty
// or partial result, are logged, and are published as MemoryDegradedEvent.
class MemoryEngine {
public:
    // `embedder` and `generator` may be null; similarity lookup, embedding
    // of async writes and reflection synthesis are then disabled.
    MemoryEngine(std::shared_ptr<StoreBackend> backend,
                 std::unique_ptr<Embedder> embedder,
                 std::unique_ptr<TextGenerator> generator,
                 EngineOptions options = {},
                 const Clock& clock = system_clock());

    // Waits for detached writes and context loads, then stops the sweep.
    ~MemoryEngine();

    MemoryEngine(const MemoryEngine&) = delete;
    MemoryEngine& operator=(const MemoryEngine&) = delete;

    // Store an intervention with a caller-supplied embedding. Returns the
    // record id, or an empty string when the store dropped the write.
    std::string record_intervention(const std::string& user_id,
                                    const std::string& intervention_text,
                                    const std::string& context_text,
                                    const std::string& task_label,
                                    Outcome outcome,
                                    const Embedding& embedding);

    // Fire-and-forget variant. Fields are validated before returning; the
    // embedding (computed from "context text" when absent) and the write
    // happen on a detached thread that is never cancelled.
    void record_intervention_async(const std::string& user_id,
                                   const std::string& intervention_text,
                                   const std::string& context_text,
                                   const std::string& task_label,
                                   Outcome outcome,
                                   std::optional<Embedding> embedding = std::nullopt);

    std::vector<ScoredIntervention> find_similar(const std::string& user_id,
                                                 const Embedding& embedding,
                                                 uint32_t k,
                                                 bool successful_only);

    // Bounded by the context timeout; returns an empty bundle on timeout or
    // store failure.
    PersonalizationBundle get_context(const std::string& user_id,
                                      const std::optional<std::string>& current_message = std::nullopt);

    // Waits up to the grace period for this user's in-flight writes, then
    // synthesizes a reflection from whatever is visible.
    std::optional<Reflection> close_session(const std::string& user_id,
                                            const Transcript& transcript);

    MemoryStats stats(const std::string& user_id);
    std::vector<Reflection> reflections(const std::string& user_id, uint32_t limit);
    std::vector<Intervention> interventions(const std::string& user_id);
    HealthReport health();
    uint32_t sweep_now();

    // Erase all of one user's records once their in-flight writes settle.
    // Unlike the read paths this does not degrade: a failed erase throws
    // StoreUnavailableError.
    uint32_t clear(const std::string& user_id);

    // Block until the user's in-flight writes finish or the timeout passes.
    // Returns true when none remain.
    bool wait_for_pending(const std::string& user_id, std::chrono::milliseconds timeout);
    size_t pending_writes(const std::string& user_id) const;

    // Optional event bus (non-owning; must outlive the engine).
    void set_event_bus(EventBus* bus) { event_bus_ = bus; }

    MemoryStore& store() { return store_; }
    const EngineOptions& options() const { return options_; }

private:
    void write_in_background(Intervention record, bool needs_embedding);
    void begin_task(const std::string& user_id);
    void end_task(const std::string& user_id);
    void publish_degraded(const std::string& user_id, const std::string& operation,
                          const std::string& reason);

    EngineOptions options_;
    MemoryStore store_;
    std::unique_ptr<Embedder> embedder_;
    std::unique_ptr<TextGenerator> generator_;
    ContextAssembler assembler_;
    ReflectionSynthesizer synthesizer_;
    EventBus* event_bus_ = nullptr;

    mutable std::mutex tasks_mutex_;
    std::condition_variable tasks_cv_;
    std::unordered_map<std::string, size_t> pending_writes_;
    size_t background_tasks_ = 0;

    // Declared last: the sweep thread stops before the store goes away.
    std::unique_ptr<RetentionManager> retention_;
};

// Backend named by config.store.backend. Falls back to "none" (with a
// warning) when the name is unknown or the durable store cannot be opened.
std::shared_ptr<StoreBackend> create_store_backend(const Config& config);

// Engine wired from config: backend, retrying embedder, text generator.
std::unique_ptr<MemoryEngine> create_engine(const Config& config, HttpClient& http);

} // namespace engram
