#include "memory_store.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <stdexcept>

namespace engram {

MemoryStore::MemoryStore(std::shared_ptr<StoreBackend> backend, StoreOptions options,
                         const Clock& clock)
    : backend_(std::move(backend)), options_(options), clock_(clock) {
    if (!backend_) {
        throw std::invalid_argument("MemoryStore requires a backend");
    }
    if (options_.dimensions == 0) {
        throw std::invalid_argument("MemoryStore: embedding dimension must be positive");
    }
    if (options_.retention.intervention_ttl_ms == 0 || options_.retention.reflection_ttl_ms == 0) {
        throw std::invalid_argument("MemoryStore: retention ttls must be positive");
    }
}

std::string MemoryStore::put(Intervention record) {
    validate_intervention(record, options_.dimensions);

    if (record.id.empty()) record.id = generate_id();
    if (record.created_at == 0) record.created_at = clock_.now_millis();
    if (record.ttl == 0) record.ttl = options_.retention.intervention_ttl_ms;

    backend_->put_intervention(record);
    return record.id;
}

std::string MemoryStore::put(Reflection record) {
    validate_reflection(record);

    record.insight_text = trim(record.insight_text);
    record.session_summary = truncate_utf8(record.session_summary, options_.summary_max_chars);
    if (record.id.empty()) record.id = generate_id();
    if (record.created_at == 0) record.created_at = clock_.now_millis();
    if (record.ttl == 0) record.ttl = options_.retention.reflection_ttl_ms;

    backend_->put_reflection(record);
    return record.id;
}

std::vector<ScoredIntervention> MemoryStore::query(
    const std::string& user_id, const Embedding& embedding, uint32_t k,
    const std::optional<std::vector<Outcome>>& outcome_filter) {
    validate_user_id(user_id);
    validate_embedding(embedding, options_.dimensions);
    if (k == 0) return {};
    // An explicitly empty filter admits nothing
    if (outcome_filter && outcome_filter->empty()) return {};

    static const std::vector<Outcome> all;
    auto records = backend_->scan_interventions(
        user_id, clock_.now_millis(), outcome_filter ? *outcome_filter : all);

    std::vector<ScoredIntervention> scored;
    scored.reserve(records.size());
    for (auto& record : records) {
        // Guard against rows that bypassed the write-time dimension check
        if (record.embedding.size() != embedding.size()) continue;
        double sim = cosine_similarity(embedding, record.embedding);
        scored.push_back({std::move(record), sim});
    }

    std::sort(scored.begin(), scored.end(),
              [](const ScoredIntervention& a, const ScoredIntervention& b) {
                  if (a.similarity != b.similarity) return a.similarity > b.similarity;
                  if (a.record.created_at != b.record.created_at)
                      return a.record.created_at > b.record.created_at;
                  return a.record.id < b.record.id;
              });

    if (scored.size() > k) scored.resize(k);
    return scored;
}

uint32_t MemoryStore::count(const std::string& user_id) {
    validate_user_id(user_id);
    return backend_->count_interventions(user_id, clock_.now_millis());
}

std::vector<Reflection> MemoryStore::recent_reflections(const std::string& user_id,
                                                        uint32_t limit) {
    validate_user_id(user_id);
    return backend_->recent_reflections(user_id, clock_.now_millis(), limit);
}

std::vector<Intervention> MemoryStore::interventions(const std::string& user_id) {
    validate_user_id(user_id);
    auto records = backend_->scan_interventions(user_id, clock_.now_millis(), {});
    std::sort(records.begin(), records.end(),
              [](const Intervention& a, const Intervention& b) {
                  if (a.created_at != b.created_at) return a.created_at > b.created_at;
                  return a.id < b.id;
              });
    return records;
}

MemoryStats MemoryStore::stats(const std::string& user_id) {
    validate_user_id(user_id);
    uint64_t now = clock_.now_millis();
    MemoryStats s;
    s.user_id = user_id;
    s.interventions = backend_->count_interventions(user_id, now);
    s.reflections = backend_->count_reflections(user_id, now);
    return s;
}

uint32_t MemoryStore::sweep() {
    return backend_->purge_expired(clock_.now_millis());
}

uint32_t MemoryStore::clear(const std::string& user_id) {
    validate_user_id(user_id);
    return backend_->delete_user(user_id);
}

} // namespace engram
