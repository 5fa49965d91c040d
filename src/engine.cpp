#include "engine.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "http.hpp"
#include "util.hpp"
#include "store/in_memory_store.hpp"
#include "store/none_store.hpp"
#include "store/sqlite_store.hpp"
#include <future>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace engram {

EngineOptions EngineOptions::from_config(const Config& config) {
    EngineOptions opts;
    opts.store.dimensions = config.embedding.dimensions;
    opts.store.retention = RetentionPolicy::from_config(config.retention);
    opts.store.summary_max_chars = config.reflection.summary_max_chars;
    opts.context = ContextOptions::from_config(config.context);
    opts.reflection = ReflectionOptions::from_config(config.reflection);
    opts.context_timeout = std::chrono::milliseconds(config.context.load_timeout_ms);
    opts.grace_period = std::chrono::milliseconds(config.reflection.grace_period_ms);
    opts.embed_timeout = std::chrono::milliseconds(config.embedding.timeout_ms);
    opts.generate_timeout = std::chrono::milliseconds(config.generator.timeout_ms);
    opts.sweep_interval = std::chrono::milliseconds(
        static_cast<uint64_t>(config.retention.sweep_interval) * 1000ULL);
    return opts;
}

MemoryEngine::MemoryEngine(std::shared_ptr<StoreBackend> backend,
                           std::unique_ptr<Embedder> embedder,
                           std::unique_ptr<TextGenerator> generator,
                           EngineOptions options,
                           const Clock& clock)
    : options_(options)
    , store_(std::move(backend), options.store, clock)
    , embedder_(std::move(embedder))
    , generator_(std::move(generator))
    , assembler_(store_, embedder_.get(), options.context)
    , synthesizer_(store_, assembler_, options.reflection)
{
    if (embedder_ && embedder_->dimensions() != 0 &&
        embedder_->dimensions() != store_.dimensions()) {
        throw std::invalid_argument(
            "embedder dimension " + std::to_string(embedder_->dimensions()) +
            " does not match store dimension " + std::to_string(store_.dimensions()));
    }
    retention_ = std::make_unique<RetentionManager>(
        [this] { return store_.sweep(); }, options_.sweep_interval);
}

MemoryEngine::~MemoryEngine() {
    std::unique_lock<std::mutex> lock(tasks_mutex_);
    if (background_tasks_ > 0) {
        std::cerr << "[engine] Waiting for " << background_tasks_ << " background tasks\n";
    }
    tasks_cv_.wait(lock, [this] { return background_tasks_ == 0; });
}

// An empty user_id marks a task that is not a write (context loads).
void MemoryEngine::begin_task(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    ++background_tasks_;
    if (!user_id.empty()) ++pending_writes_[user_id];
}

void MemoryEngine::end_task(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    --background_tasks_;
    if (!user_id.empty()) {
        auto it = pending_writes_.find(user_id);
        if (it != pending_writes_.end() && --it->second == 0) {
            pending_writes_.erase(it);
        }
    }
    // Notify under the lock: the destructor may be waiting to tear down the cv
    tasks_cv_.notify_all();
}

void MemoryEngine::publish_degraded(const std::string& user_id, const std::string& operation,
                                    const std::string& reason) {
    if (!event_bus_) return;
    MemoryDegradedEvent ev;
    ev.user_id = user_id;
    ev.operation = operation;
    ev.reason = reason;
    event_bus_->publish(ev);
}

std::string MemoryEngine::record_intervention(const std::string& user_id,
                                              const std::string& intervention_text,
                                              const std::string& context_text,
                                              const std::string& task_label,
                                              Outcome outcome,
                                              const Embedding& embedding) {
    Intervention record;
    record.user_id = user_id;
    record.intervention_text = intervention_text;
    record.context_text = context_text;
    record.task_label = task_label;
    record.outcome = outcome;
    record.embedding = embedding;

    std::string id;
    try {
        id = store_.put(std::move(record));
    } catch (const StoreUnavailableError& e) {
        std::cerr << "[engine] Dropping intervention for " << user_id
                  << ", store unavailable: " << e.what() << "\n";
        publish_degraded(user_id, "record_intervention", e.what());
        return {};
    }

    if (event_bus_) {
        InterventionRecordedEvent ev;
        ev.user_id = user_id;
        ev.record_id = id;
        ev.outcome = outcome;
        event_bus_->publish(ev);
    }
    return id;
}

void MemoryEngine::record_intervention_async(const std::string& user_id,
                                             const std::string& intervention_text,
                                             const std::string& context_text,
                                             const std::string& task_label,
                                             Outcome outcome,
                                             std::optional<Embedding> embedding) {
    Intervention record;
    record.user_id = user_id;
    record.intervention_text = intervention_text;
    record.context_text = context_text;
    record.task_label = task_label;
    record.outcome = outcome;

    bool needs_embedding = !embedding.has_value();
    if (needs_embedding) {
        validate_intervention_fields(record);
    } else {
        record.embedding = std::move(*embedding);
        validate_intervention(record, store_.dimensions());
    }
    // Stamp now so the record orders by when it happened, not when it landed
    record.created_at = store_.clock().now_millis();

    write_in_background(std::move(record), needs_embedding);
}

void MemoryEngine::write_in_background(Intervention record, bool needs_embedding) {
    auto task = [this, needs_embedding](Intervention rec) {
        try {
            if (needs_embedding) {
                if (!embedder_) {
                    throw EmbeddingError("no embedder configured");
                }
                std::string text = rec.context_text.empty()
                    ? rec.intervention_text
                    : rec.context_text + " " + rec.intervention_text;
                rec.embedding = embedder_->embed(text, deadline_after(options_.embed_timeout));
            }
            std::string id = store_.put(rec);
            if (event_bus_) {
                InterventionRecordedEvent ev;
                ev.user_id = rec.user_id;
                ev.record_id = id;
                ev.outcome = rec.outcome;
                ev.background = true;
                event_bus_->publish(ev);
            }
        } catch (const MemoryError& e) {
            std::cerr << "[engine] Background write for " << rec.user_id
                      << " dropped: " << e.what() << "\n";
            publish_degraded(rec.user_id, "record_intervention_async", e.what());
        } catch (const std::exception& e) {
            std::cerr << "[engine] Background write for " << rec.user_id
                      << " failed unexpectedly: " << e.what() << "\n";
            publish_degraded(rec.user_id, "record_intervention_async", e.what());
        }
    };

    std::string user_id = record.user_id;
    auto shared = std::make_shared<Intervention>(std::move(record));
    begin_task(user_id);
    try {
        std::thread([this, task, user_id, shared]() {
            task(std::move(*shared));
            end_task(user_id);
        }).detach();
    } catch (const std::system_error& e) {
        std::cerr << "[engine] Could not start writer thread (" << e.what()
                  << "), writing inline\n";
        task(std::move(*shared));
        end_task(user_id);
    }
}

std::vector<ScoredIntervention> MemoryEngine::find_similar(const std::string& user_id,
                                                           const Embedding& embedding,
                                                           uint32_t k,
                                                           bool successful_only) {
    std::optional<std::vector<Outcome>> filter;
    if (successful_only) filter = successful_outcomes();
    try {
        return store_.query(user_id, embedding, k, filter);
    } catch (const StoreUnavailableError& e) {
        std::cerr << "[engine] find_similar degraded for " << user_id << ": " << e.what() << "\n";
        publish_degraded(user_id, "find_similar", e.what());
        return {};
    }
}

PersonalizationBundle MemoryEngine::get_context(const std::string& user_id,
                                                const std::optional<std::string>& current_message) {
    validate_user_id(user_id);

    auto started = std::chrono::steady_clock::now();
    Deadline deadline = started + options_.context_timeout;
    auto promise = std::make_shared<std::promise<PersonalizationBundle>>();
    auto future = promise->get_future();

    auto load = [this, promise, user_id, current_message, deadline]() {
        try {
            if (current_message) {
                promise->set_value(assembler_.assemble(user_id, *current_message, deadline));
            } else {
                promise->set_value(assembler_.assemble(user_id));
            }
        } catch (...) {
            // Handed to the waiting caller, which decides what to log
            promise->set_exception(std::current_exception());
        }
    };

    begin_task({});
    try {
        std::thread([this, load]() {
            load();
            end_task({});
        }).detach();
    } catch (const std::system_error& e) {
        std::cerr << "[engine] Could not start context loader (" << e.what()
                  << "), loading inline\n";
        load();
        end_task({});
    }

    if (future.wait_until(deadline) != std::future_status::ready) {
        std::cerr << "[engine] Context load for " << user_id << " exceeded "
                  << options_.context_timeout.count() << "ms, using empty context\n";
        publish_degraded(user_id, "get_context", "timeout");
        return {};
    }

    PersonalizationBundle bundle;
    try {
        bundle = future.get();
    } catch (const MemoryError& e) {
        std::cerr << "[engine] Context load for " << user_id << " failed: " << e.what() << "\n";
        publish_degraded(user_id, "get_context", e.what());
        return {};
    } catch (const std::exception& e) {
        std::cerr << "[engine] Context load for " << user_id
                  << " failed unexpectedly: " << e.what() << "\n";
        publish_degraded(user_id, "get_context", e.what());
        return {};
    }

    if (event_bus_) {
        ContextAssembledEvent ev;
        ev.user_id = user_id;
        ev.reflection_count = bundle.recent_reflections.size();
        ev.intervention_count = bundle.intervention_count;
        ev.similar_count = bundle.similar_successes.size();
        ev.elapsed_ms = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started).count());
        event_bus_->publish(ev);
    }
    return bundle;
}

std::optional<Reflection> MemoryEngine::close_session(const std::string& user_id,
                                                      const Transcript& transcript) {
    validate_user_id(user_id);

    if (!wait_for_pending(user_id, options_.grace_period)) {
        std::cerr << "[engine] Grace period elapsed with " << pending_writes(user_id)
                  << " writes still in flight for " << user_id << "\n";
    }

    if (!generator_) {
        std::cerr << "[engine] No text generator configured, skipping reflection for "
                  << user_id << "\n";
        return std::nullopt;
    }

    std::optional<Reflection> reflection;
    try {
        reflection = synthesizer_.synthesize(user_id, transcript, *generator_,
                                             deadline_after(options_.generate_timeout));
    } catch (const std::exception& e) {
        std::cerr << "[engine] Reflection for " << user_id << " failed: " << e.what() << "\n";
        publish_degraded(user_id, "close_session", e.what());
        return std::nullopt;
    }
    if (reflection && event_bus_) {
        ReflectionStoredEvent ev;
        ev.user_id = user_id;
        ev.record_id = reflection->id;
        ev.insight_text = reflection->insight_text;
        event_bus_->publish(ev);
    }
    return reflection;
}

MemoryStats MemoryEngine::stats(const std::string& user_id) {
    try {
        return store_.stats(user_id);
    } catch (const StoreUnavailableError& e) {
        std::cerr << "[engine] stats unavailable for " << user_id << ": " << e.what() << "\n";
        publish_degraded(user_id, "stats", e.what());
        MemoryStats empty;
        empty.user_id = user_id;
        return empty;
    }
}

std::vector<Reflection> MemoryEngine::reflections(const std::string& user_id, uint32_t limit) {
    try {
        return store_.recent_reflections(user_id, limit);
    } catch (const StoreUnavailableError& e) {
        std::cerr << "[engine] reflections unavailable for " << user_id << ": " << e.what() << "\n";
        publish_degraded(user_id, "reflections", e.what());
        return {};
    }
}

std::vector<Intervention> MemoryEngine::interventions(const std::string& user_id) {
    try {
        return store_.interventions(user_id);
    } catch (const StoreUnavailableError& e) {
        std::cerr << "[engine] interventions unavailable for " << user_id << ": " << e.what() << "\n";
        publish_degraded(user_id, "interventions", e.what());
        return {};
    }
}

HealthReport MemoryEngine::health() {
    HealthReport report;
    report.backend = store_.backend().backend_name();
    report.dimensions = store_.dimensions();
    if (embedder_) report.embedder = embedder_->embedder_name();
    if (generator_) report.generator = generator_->generator_name();

    auto start = std::chrono::steady_clock::now();
    try {
        store_.backend().ping();
        report.store_ok = true;
    } catch (const StoreUnavailableError& e) {
        report.store_error = e.what();
    }
    report.store_latency_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
    return report;
}

uint32_t MemoryEngine::clear(const std::string& user_id) {
    validate_user_id(user_id);
    if (!wait_for_pending(user_id, options_.grace_period)) {
        std::cerr << "[engine] Clearing " << user_id << " with " << pending_writes(user_id)
                  << " writes still in flight\n";
    }
    try {
        uint32_t removed = store_.clear(user_id);
        std::cerr << "[engine] Cleared " << removed << " records for " << user_id << "\n";
        return removed;
    } catch (const StoreUnavailableError& e) {
        std::cerr << "[engine] Clear failed for " << user_id << ": " << e.what() << "\n";
        publish_degraded(user_id, "clear", e.what());
        throw;
    }
}

uint32_t MemoryEngine::sweep_now() {
    try {
        return retention_->sweep_now();
    } catch (const StoreUnavailableError& e) {
        std::cerr << "[engine] Sweep failed: " << e.what() << "\n";
        publish_degraded({}, "sweep", e.what());
        return 0;
    }
}

bool MemoryEngine::wait_for_pending(const std::string& user_id,
                                    std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(tasks_mutex_);
    return tasks_cv_.wait_for(lock, timeout, [this, &user_id] {
        return pending_writes_.find(user_id) == pending_writes_.end();
    });
}

size_t MemoryEngine::pending_writes(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    auto it = pending_writes_.find(user_id);
    return it == pending_writes_.end() ? 0 : it->second;
}

// ── Factories ───────────────────────────────────────────────────

std::shared_ptr<StoreBackend> create_store_backend(const Config& config) {
    const auto& backend = config.store.backend;
    if (backend == "memory") {
        return std::make_shared<InMemoryStore>();
    }
    if (backend == "sqlite") {
        try {
            return std::make_shared<SqliteStore>(config.store_path());
        } catch (const StoreUnavailableError& e) {
            std::cerr << "[store] " << e.what() << "; falling back to 'none'\n";
            return std::make_shared<NoneStore>();
        }
    }
    if (backend != "none") {
        std::cerr << "[store] Unknown store backend '" << backend
                  << "'; falling back to 'none'\n";
    }
    return std::make_shared<NoneStore>();
}

std::unique_ptr<MemoryEngine> create_engine(const Config& config, HttpClient& http) {
    auto backend = create_store_backend(config);
    auto embedder = create_embedder(config, http);
    if (!embedder) {
        std::cerr << "[engine] Embeddings disabled; similarity lookup is off\n";
    }
    auto generator = create_text_generator(config, http);
    return std::make_unique<MemoryEngine>(std::move(backend), std::move(embedder),
                                          std::move(generator),
                                          EngineOptions::from_config(config));
}

} // namespace engram
